#pragma once
// Errors.hpp – Exception taxonomy for parsing, exporting and configuration.

#include <stdexcept>
#include <string>

namespace tiki {

// Base of every error thrown by the library.
class TikiError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Missing, unreadable or undecodable input source. Raised before parsing starts.
class FileAccessError : public TikiError {
public:
    using TikiError::TikiError;
};

// Structural violation in a document. Aborts the parse; no partial tree survives.
class SyntaxError : public TikiError {
public:
    SyntaxError(std::string message, size_t line, std::string line_text);

    [[nodiscard]] const std::string& message()  const noexcept { return message_; }
    [[nodiscard]] size_t             line()     const noexcept { return line_; }
    [[nodiscard]] const std::string& lineText() const noexcept { return line_text_; }

private:
    std::string message_;
    size_t      line_;
    std::string line_text_;
};

// Failure writing rendered output, or malformed JSON handed to the importer.
class ExportError : public TikiError {
public:
    using TikiError::TikiError;
};

// Invalid XML configuration file.
class ConfigLoadError : public TikiError {
public:
    using TikiError::TikiError;
};

} // namespace tiki
