#pragma once
// Metadata.hpp – Inline [key: value, ...] annotation parsing and formatting.
//
// Example:
//   std::string title = "Goal [priority: high, mastery: 85%, blocked]";
//   Metadata md = extractAnnotations(title, '*');
//   // title == "Goal"
//   // md == { priority: "high", mastery: 0.85, blocked: true }   (document order)

#include "Types.hpp"

#include <string>
#include <string_view>

namespace tiki {

// Infer the type of one literal (already trimmed).
// Order: "N%" → fraction, integer, decimal, boolean word, reference, string.
[[nodiscard]] MetadataValue parseLiteral(std::string_view value, char marker = '*');

// Parse the inside of one bracketed annotation ("a: 1, b=x, flag") into `out`.
// Later keys overwrite earlier ones.
void parseAnnotation(std::string_view body, Metadata& out, char marker = '*');

// Remove every non-empty [ ... ] span from `title`, parse each one, and trim
// the remaining title. Returns the merged metadata.
Metadata extractAnnotations(std::string& title, char marker = '*');

// Human-readable rendering of a value ("high", "42", "0.85", "true", "*1**2").
[[nodiscard]] std::string formatValue(const MetadataValue& value);

// Name of the held alternative: "string", "integer", "float", "boolean", "reference".
[[nodiscard]] const char* typeName(const MetadataValue& value) noexcept;

} // namespace tiki
