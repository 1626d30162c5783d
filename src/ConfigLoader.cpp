// ConfigLoader.cpp – Parses the Tiki XML configuration into a Config.
// Uses pugixml for robust, zero-copy XML parsing.

#include "TikiLang/ConfigLoader.hpp"

#include <pugixml.hpp>

#include <cctype>
#include <charconv>
#include <cstring>
#include <string>

namespace tiki {

// ─── Small parsing helpers ────────────────────────────────────────────────────

static size_t parseSize(const char* s, const char* ctx) {
    size_t v = 0;
    auto [ptr, ec] = std::from_chars(s, s + std::strlen(s), v);
    if (ec != std::errc{} || *ptr != '\0')
        throw ConfigLoadError(std::string(ctx) + ": cannot parse count '" + s + "'");
    return v;
}

static ColorMode parseColorMode(const char* s) {
    if (!s || *s == '\0')              return ColorMode::Auto;
    if (strcmp(s, "auto")   == 0)      return ColorMode::Auto;
    if (strcmp(s, "always") == 0)      return ColorMode::Always;
    if (strcmp(s, "never")  == 0)      return ColorMode::Never;
    throw ConfigLoadError(std::string("Unknown color mode: '") + s + "'");
}

// SGR parameter lists are digits separated by ';' ("1;36", "30;103").
static bool isSgr(const char* s) {
    if (!s || *s == '\0') return false;
    for (const char* p = s; *p; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p)) && *p != ';')
            return false;
    }
    return true;
}

// ─── Parse the <Parser> element ───────────────────────────────────────────────

static void parseParserNode(pugi::xml_node node, ParseOptions& opt) {
    if (auto a = node.attribute("marker"); a) {
        const char* m = a.as_string();
        if (std::strlen(m) != 1 || std::isspace(static_cast<unsigned char>(*m)) ||
            std::isalnum(static_cast<unsigned char>(*m)) || *m == '[' || *m == ']')
            throw ConfigLoadError(std::string("<Parser marker> must be a single symbol, got '") + m + "'");
        opt.marker = *m;
    }

    if (auto a = node.attribute("fence"); a) {
        std::string fence = a.as_string();
        if (fence.empty() || fence.find_first_of(" \t") != std::string::npos)
            throw ConfigLoadError("<Parser fence> must be a non-empty token without spaces");
        opt.fence = std::move(fence);
    }

    if (auto a = node.attribute("frontmatter_limit"); a)
        opt.frontmatter_limit = parseSize(a.as_string(), "Parser.frontmatter_limit");
}

// ─── Parse the <Render> element ───────────────────────────────────────────────

static void parseRenderNode(pugi::xml_node node, Config& cfg) {
    if (auto a = node.attribute("collapse_marker"); a) cfg.style.collapse_marker = a.as_string();
    if (auto a = node.attribute("color");           a) cfg.color = parseColorMode(a.as_string());

    for (auto style : node.children("Style")) {
        std::string role = style.attribute("role").as_string("");
        const char* sgr  = style.attribute("sgr").as_string("");
        if (role.empty())
            throw ConfigLoadError("<Style> missing 'role'");
        if (!isSgr(sgr))
            throw ConfigLoadError("<Style role=\"" + role + "\"> has invalid sgr '" + sgr + "'");

        RenderStyle& s = cfg.style;
        if      (role == "root")        s.root        = sgr;
        else if (role == "concept")     s.normal      = sgr;
        else if (role == "current")     s.current     = sgr;
        else if (role == "collapsed")   s.collapsed   = sgr;
        else if (role == "guide")       s.guide       = sgr;
        else if (role == "description") s.description = sgr;
        else
            throw ConfigLoadError("Unknown style role: '" + role + "'");
    }
}

// ─── Shared document walk ─────────────────────────────────────────────────────

static Config parseDocument(const pugi::xml_document& doc) {
    pugi::xml_node root = doc.child("TikiConfig");
    if (!root)
        throw ConfigLoadError("XML root element must be <TikiConfig>");

    Config cfg;
    if (auto p = root.child("Parser")) parseParserNode(p, cfg.parse);
    if (auto r = root.child("Render")) parseRenderNode(r, cfg);
    return cfg;
}

// ─── Public entry points ──────────────────────────────────────────────────────

Config loadConfig(const std::filesystem::path& xml_path) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(xml_path.c_str());
    if (!result)
        throw ConfigLoadError("Failed to parse XML '" + xml_path.string() +
                              "': " + result.description());
    return parseDocument(doc);
}

Config loadConfigString(std::string_view xml) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(xml.data(), xml.size());
    if (!result)
        throw ConfigLoadError(std::string("Failed to parse XML: ") + result.description());
    return parseDocument(doc);
}

} // namespace tiki
