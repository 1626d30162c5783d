// Renderer.cpp – Tree layout, ASCII/ANSI rendering and concept detail text.

#include "TikiLang/Renderer.hpp"
#include "TikiLang/Metadata.hpp"

#include <algorithm>
#include <cctype>

namespace tiki {

namespace {

constexpr const char* kTee      = "├── ";
constexpr const char* kElbow    = "└── ";
constexpr const char* kPipe     = "│   ";
constexpr const char* kBlank    = "    ";

std::string labelFor(const ConceptNode& node, std::string_view collapse_marker) {
    std::string label = node.isRoot() ? node.title() : node.id() + " " + node.title();
    if (node.hasChildren() && !node.expanded() && !collapse_marker.empty()) {
        label += ' ';
        label += collapse_marker;
    }
    return label;
}

void layoutChildren(const ConceptNode& node, const std::string& prefix,
                    std::string_view collapse_marker, std::vector<TreeLine>& out) {
    const auto kids = node.children();
    for (size_t i = 0; i < kids.size(); ++i) {
        const ConceptNode& child = *kids[i];
        const bool last = (i + 1 == kids.size());

        out.push_back({&child, prefix + (last ? kElbow : kTee), labelFor(child, collapse_marker)});

        if (child.expanded() && child.hasChildren())
            layoutChildren(child, prefix + (last ? kBlank : kPipe), collapse_marker, out);
    }
}

bool hasVisibleText(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) { return !std::isspace(c); });
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
//  Layout / plain text
// ─────────────────────────────────────────────────────────────────────────────

std::vector<TreeLine> layoutTree(const ConceptNode& root, std::string_view collapse_marker) {
    std::vector<TreeLine> lines;
    lines.push_back({&root, std::string(), labelFor(root, collapse_marker)});
    if (root.expanded())
        layoutChildren(root, std::string(), collapse_marker, lines);
    return lines;
}

std::string renderAsciiTree(const ConceptNode& root, std::string_view collapse_marker) {
    std::string out;
    for (const auto& line : layoutTree(root, collapse_marker)) {
        if (!out.empty()) out += '\n';
        out += line.guide;
        out += line.label;
    }
    return out;
}

std::string renderConceptDetails(const ConceptNode& node) {
    std::string details = node.isRoot() ? node.title() : node.id() + ": " + node.title();
    details += "\n\n";
    details += hasVisibleText(node.description()) ? node.description() : kNoDescription;

    if (!node.metadata().empty()) {
        details += "\n";
        for (const auto& [key, value] : node.metadata())
            details += "\n" + key + ": " + formatValue(value);
    }
    return details;
}

// ─────────────────────────────────────────────────────────────────────────────
//  StyledRenderer
// ─────────────────────────────────────────────────────────────────────────────

std::string StyledRenderer::paint(const std::string& sgr, const std::string& text) const {
    if (!color_ || sgr.empty() || text.empty())
        return text;
    return "\x1b[" + sgr + "m" + text + "\x1b[0m";
}

const std::string& StyledRenderer::roleFor(const ConceptNode& node,
                                           const ConceptNode* current) const noexcept {
    if (current == &node)  return style_.current;
    if (node.isRoot())     return style_.root;
    if (!node.expanded())  return style_.collapsed;
    return style_.normal;
}

std::vector<std::string> StyledRenderer::renderLines(const ConceptNode& root,
                                                     const ConceptNode* current) const {
    std::vector<std::string> out;
    for (const auto& line : layoutTree(root, style_.collapse_marker))
        out.push_back(paint(style_.guide, line.guide) + paint(roleFor(*line.node, current), line.label));
    return out;
}

std::string StyledRenderer::render(const ConceptNode& root, const ConceptNode* current,
                                   const std::string& heading) const {
    std::string out;
    if (!heading.empty())
        out += paint("1", heading) + "\n\n";
    const auto lines = renderLines(root, current);
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i) out += '\n';
        out += lines[i];
    }
    return out;
}

} // namespace tiki
