#pragma once
// Output.hpp – Writing rendered or exported text to a stream or a file.

#include "Errors.hpp"

#include <filesystem>
#include <ostream>
#include <string_view>

namespace tiki {

// Writes `text` followed by a newline and flushes.
// Throws ExportError if the stream ends up in a failed state.
void writeText(std::string_view text, std::ostream& out);

// Creates or truncates `path` and writes `text` followed by a newline.
// Throws ExportError if the file cannot be opened or written.
void writeTextFile(std::string_view text, const std::filesystem::path& path);

} // namespace tiki
