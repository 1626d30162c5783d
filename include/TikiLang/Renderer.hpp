#pragma once
// Renderer.hpp – Read-only text renderings of a concept tree.
//
// Output shape (ASCII and styled share the same layout):
//   Root title
//   ├── *1 First
//   │   └── *1**1 Nested
//   └── *2 Second [+]          ← collapsed node with hidden children
//
// Traversal is depth-first pre-order in document order; a collapsed node's
// subtree is never visited.

#include "Concept.hpp"
#include "Types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tiki {

// ─── One visible line of the tree layout ─────────────────────────────────────
struct TreeLine {
    const ConceptNode* node{nullptr};
    std::string        guide;      // prefix + connector, e.g. "│   ├── "; empty for root
    std::string        label;      // "<id> <title>" (root: title) + optional collapse marker
};

// Visible lines in display order. lines[0] is always the root.
[[nodiscard]] std::vector<TreeLine> layoutTree(const ConceptNode& root,
                                               std::string_view collapse_marker = "[+]");

// Plain box-drawing tree, lines joined by '\n' (no trailing newline).
[[nodiscard]] std::string renderAsciiTree(const ConceptNode& root,
                                          std::string_view collapse_marker = "[+]");

// "<id>: <title>", blank line, description or a placeholder, then metadata.
[[nodiscard]] std::string renderConceptDetails(const ConceptNode& node);

inline constexpr const char* kNoDescription = "No description provided";

// ─────────────────────────────────────────────────────────────────────────────
//  StyledRenderer
// ─────────────────────────────────────────────────────────────────────────────
// Same layout as renderAsciiTree() with ANSI SGR styles per role:
//   root / current selection / expanded concept / collapsed concept / guides.
// With colour disabled the output is byte-identical to the ASCII rendering.
class StyledRenderer {
public:
    explicit StyledRenderer(RenderStyle style = {}, bool color = true)
        : style_(std::move(style)), color_(color) {}

    [[nodiscard]] const RenderStyle& style() const noexcept { return style_; }
    [[nodiscard]] bool               color() const noexcept { return color_; }

    // One styled string per visible node; `current` (may be null) is highlighted.
    [[nodiscard]] std::vector<std::string> renderLines(const ConceptNode& root,
                                                       const ConceptNode* current = nullptr) const;

    // Full tree, optionally preceded by a heading line and a blank line.
    [[nodiscard]] std::string render(const ConceptNode& root,
                                     const ConceptNode* current = nullptr,
                                     const std::string& heading = {}) const;

    // Wrap `text` in ESC[<sgr>m … ESC[0m when colour is on.
    [[nodiscard]] std::string paint(const std::string& sgr, const std::string& text) const;

private:
    [[nodiscard]] const std::string& roleFor(const ConceptNode& node,
                                             const ConceptNode* current) const noexcept;

    RenderStyle style_;
    bool        color_;
};

} // namespace tiki
