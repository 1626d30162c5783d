#pragma once
// JsonExport.hpp – JSON form of a document (nlohmann::ordered_json), both directions.
//
//   {
//     "format_version": "1.0",
//     "root": { "id": "", "title": "...", "description": "...", "expanded": true,
//               "metadata": { "mastery": 0.85, "see": "*1**2" },
//               "children": [ { ... }, ... ] }
//   }
//
// Object keys keep their insertion order, so metadata appears in the order it
// was written. References are written as plain JSON strings; on import any
// metadata string that starts with the marker character is read back as a
// Reference.

#include "Concept.hpp"
#include "Errors.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <istream>
#include <ostream>
#include <string>

namespace tiki {

using Json = nlohmann::ordered_json;

// ── Export ────────────────────────────────────────────────────────────────────
[[nodiscard]] Json toJson(const ConceptNode& node);
[[nodiscard]] Json toJson(const Document& doc);

// Pretty-printed (two-space indent) JSON text. Floats use the shortest form
// that reads back to the same value.
[[nodiscard]] std::string toJsonString(const Document& doc);

// Throws ExportError if the stream or file cannot be written.
void writeJson(const Document& doc, std::ostream& out);
void writeJson(const Document& doc, const std::filesystem::path& path);

// ── Import ────────────────────────────────────────────────────────────────────
// Throws ExportError on malformed JSON, a wrong shape, or an unsupported
// format_version.
[[nodiscard]] Document fromJson(const Json& value, char marker = '*');
[[nodiscard]] Document readJson(std::istream& in, char marker = '*');
[[nodiscard]] Document readJsonString(const std::string& text, char marker = '*');

} // namespace tiki
