// Metadata.cpp – Literal type inference for inline concept annotations.

#include "TikiLang/Metadata.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace tiki {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static std::string_view trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return s;
}

static std::string toLower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Whole-string integer, optional sign. Out-of-range values are rejected.
static bool parseInt(std::string_view s, int64_t& out) {
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    if (s.empty()) return false;
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc{} && ptr == s.data() + s.size();
}

// Whole-string decimal number.
static bool parseDouble(std::string_view s, double& out) {
    if (s.empty() || std::isspace(static_cast<unsigned char>(s.front()))) return false;
    std::string buf(s);
    char* end = nullptr;
    out = std::strtod(buf.c_str(), &end);
    return end != buf.c_str() && *end == '\0';
}

// ─── Literal inference ────────────────────────────────────────────────────────

MetadataValue parseLiteral(std::string_view value, char marker) {
    value = trim(value);

    if (value.size() > 1 && value.back() == '%') {
        double pct = 0.0;
        if (parseDouble(trim(value.substr(0, value.size() - 1)), pct))
            return pct / 100.0;
    }

    if (value.find('.') == std::string_view::npos) {
        int64_t i = 0;
        if (parseInt(value, i)) return i;
    } else {
        double d = 0.0;
        if (parseDouble(value, d)) return d;
    }

    const std::string lower = toLower(value);
    if (lower == "true"  || lower == "yes" || lower == "on")  return true;
    if (lower == "false" || lower == "no"  || lower == "off") return false;

    if (!value.empty() && value.front() == marker)
        return Reference{std::string(value)};

    return std::string(value);
}

void parseAnnotation(std::string_view body, Metadata& out, char marker) {
    size_t start = 0;
    while (start <= body.size()) {
        size_t comma = body.find(',', start);
        if (comma == std::string_view::npos) comma = body.size();
        std::string_view pair = trim(body.substr(start, comma - start));
        start = comma + 1;

        if (pair.empty()) continue;

        size_t sep = pair.find(':');
        if (sep == std::string_view::npos) sep = pair.find('=');

        if (sep == std::string_view::npos) {
            out[std::string(pair)] = true; // bare flag
            continue;
        }

        std::string_view key = trim(pair.substr(0, sep));
        if (key.empty()) continue;
        out[std::string(key)] = parseLiteral(pair.substr(sep + 1), marker);
    }
}

Metadata extractAnnotations(std::string& title, char marker) {
    Metadata    md;
    std::string kept;
    size_t      pos = 0;

    while (pos < title.size()) {
        size_t open = title.find('[', pos);
        if (open == std::string::npos) break;
        size_t close = title.find(']', open + 1);
        if (close == std::string::npos) break;   // no later '[' can close either

        if (close == open + 1) {                 // "[]" is ordinary text
            kept.append(title, pos, close + 1 - pos);
            pos = close + 1;
            continue;
        }

        kept.append(title, pos, open - pos);
        parseAnnotation(std::string_view(title).substr(open + 1, close - open - 1), md, marker);
        pos = close + 1;
    }
    if (pos < title.size())
        kept.append(title, pos, std::string::npos);

    title = std::string(trim(kept));
    return md;
}

// ─── Formatting ───────────────────────────────────────────────────────────────

namespace {

struct ValueFormatter {
    std::string operator()(const std::string& s) const { return s; }
    std::string operator()(int64_t i) const { return std::to_string(i); }
    std::string operator()(double d) const {
        std::ostringstream os;
        os << d;
        return os.str();
    }
    std::string operator()(bool b) const { return b ? "true" : "false"; }
    std::string operator()(const Reference& r) const { return r.target; }
};

struct TypeNamer {
    const char* operator()(const std::string&) const noexcept { return "string"; }
    const char* operator()(int64_t) const noexcept { return "integer"; }
    const char* operator()(double) const noexcept { return "float"; }
    const char* operator()(bool) const noexcept { return "boolean"; }
    const char* operator()(const Reference&) const noexcept { return "reference"; }
};

} // namespace

std::string formatValue(const MetadataValue& value) {
    return std::visit(ValueFormatter{}, value);
}

const char* typeName(const MetadataValue& value) noexcept {
    return std::visit(TypeNamer{}, value);
}

} // namespace tiki
