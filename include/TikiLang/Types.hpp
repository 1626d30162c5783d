#pragma once
// Types.hpp – Core value types shared by the Tiki parser, model and exporters.

#include <algorithm>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tiki {

// ─── Cross-reference to another concept (e.g. "*1**2") ───────────────────────
// Stored opaquely; the parser never resolves it against the tree.
struct Reference {
    std::string target;

    bool operator==(const Reference&) const = default;
};

// ─── Typed metadata literal ───────────────────────────────────────────────────
// Closed set of literal kinds accepted inside [key: value] annotations.
// Percentages ("85%") are stored as double fractions (0.85).
using MetadataValue = std::variant<std::string,   // plain text
                                   int64_t,       // integer literal
                                   double,        // float or percentage
                                   bool,          // true/yes/on, false/no/off, bare key
                                   Reference>;    // value starting with a marker

// ─── Metadata map ─────────────────────────────────────────────────────────────
// Keys keep the order they were first written in. Writing an existing key
// replaces its value in place.
class Metadata {
public:
    using value_type     = std::pair<std::string, MetadataValue>;
    using iterator       = std::vector<value_type>::iterator;
    using const_iterator = std::vector<value_type>::const_iterator;

    // Inserts a default (empty string) value at the end when `key` is new.
    MetadataValue& operator[](const std::string& key) {
        if (auto it = find(key); it != end()) return it->second;
        return entries_.emplace_back(key, MetadataValue{}).second;
    }

    [[nodiscard]] iterator find(const std::string& key) {
        return std::find_if(entries_.begin(), entries_.end(),
                            [&key](const value_type& e) { return e.first == key; });
    }
    [[nodiscard]] const_iterator find(const std::string& key) const {
        return std::find_if(entries_.begin(), entries_.end(),
                            [&key](const value_type& e) { return e.first == key; });
    }

    // Throws std::out_of_range for an unknown key.
    [[nodiscard]] const MetadataValue& at(const std::string& key) const {
        auto it = find(key);
        if (it == end()) throw std::out_of_range("metadata key not found: " + key);
        return it->second;
    }

    [[nodiscard]] size_t count(const std::string& key) const { return find(key) != end() ? 1 : 0; }
    [[nodiscard]] size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool   empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] iterator       begin() noexcept       { return entries_.begin(); }
    [[nodiscard]] iterator       end() noexcept         { return entries_.end(); }
    [[nodiscard]] const_iterator begin() const noexcept { return entries_.begin(); }
    [[nodiscard]] const_iterator end() const noexcept   { return entries_.end(); }

    // Order-sensitive: equal maps hold the same keys in the same order.
    bool operator==(const Metadata&) const = default;

private:
    std::vector<value_type> entries_;
};

// ─── Parser configuration ─────────────────────────────────────────────────────
struct ParseOptions {
    char        marker{'*'};              // structural marker character
    std::string fence{"```"};             // code fence token
    size_t      frontmatter_limit{10};    // "---" only opens frontmatter on lines 1..N
};

// ─── Styled rendering configuration ───────────────────────────────────────────
// Each style is an ANSI SGR parameter list ("1;36"), emitted as ESC[<sgr>m.
struct RenderStyle {
    std::string root{"1;36"};
    std::string normal{"97"};           // expanded, unselected concept
    std::string current{"30;103"};
    std::string collapsed{"2;36"};
    std::string guide{"94"};
    std::string description{"2;37"};
    std::string collapse_marker{"[+]"};
};

enum class ColorMode { Auto, Always, Never };

// ─── Complete tool configuration (loaded from XML via loadConfig()) ──────────
struct Config {
    ParseOptions parse;
    RenderStyle  style;
    ColorMode    color{ColorMode::Auto};
};

// Version tag written into and accepted from JSON exports.
inline constexpr const char* kFormatVersion = "1.0";

} // namespace tiki
