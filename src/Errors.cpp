// Errors.cpp – SyntaxError message formatting.

#include "TikiLang/Errors.hpp"

namespace tiki {

static std::string formatSyntaxError(const std::string& message, size_t line,
                                     const std::string& line_text) {
    return "Line " + std::to_string(line) + ": " + message + "\n  > " + line_text;
}

SyntaxError::SyntaxError(std::string message, size_t line, std::string line_text)
    : TikiError(formatSyntaxError(message, line, line_text)),
      message_(std::move(message)),
      line_(line),
      line_text_(std::move(line_text)) {}

} // namespace tiki
