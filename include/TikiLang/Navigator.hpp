#pragma once
// Navigator.hpp – Toolkit-independent browse/search logic over a concept tree.
//
// A host UI (terminal session, test harness, …) drives a TreeBrowser through
// four capabilities and repaints from render():
//
//   Navigator nav(*doc.root);
//   nav.onSearch("parser");          // selects the first match
//   nav.onToggleExpand();            // collapses it
//   for (auto& line : nav.render()) std::cout << line << '\n';
//
// The only tree state ever modified is ConceptNode::expanded.

#include "Concept.hpp"
#include "Renderer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace tiki {

struct SearchResult {
    std::vector<const ConceptNode*> matches;   // pre-order
    std::string                     message;   // user-facing summary

    [[nodiscard]] size_t count() const noexcept { return matches.size(); }
    [[nodiscard]] bool   empty() const noexcept { return matches.empty(); }
};

// ─── Capabilities a UI needs from the navigation core ────────────────────────
class TreeBrowser {
public:
    virtual ~TreeBrowser() = default;

    // Visible tree, one display line per visible node (selection highlighted).
    [[nodiscard]] virtual std::vector<std::string> render() const = 0;

    // Select the node at a visible-line index. False if out of range.
    virtual bool onSelect(size_t visible_index) = 0;

    // Full-tree search; selects the first match when there is one.
    virtual SearchResult onSearch(std::string_view query) = 0;

    // Flip `expanded` on the selection; returns the new state.
    virtual bool onToggleExpand() = 0;
};

class Navigator : public TreeBrowser {
public:
    explicit Navigator(ConceptNode& root, StyledRenderer renderer = StyledRenderer{});

    // ── TreeBrowser ──────────────────────────────────────────────────────────
    [[nodiscard]] std::vector<std::string> render() const override;
    bool         onSelect(size_t visible_index) override;
    SearchResult onSearch(std::string_view query) override;
    bool         onToggleExpand() override;

    // ── Movement across visible nodes ────────────────────────────────────────
    void moveUp();
    void moveDown();
    void moveFirst();
    void moveLast();

    // Exact id match; expands collapsed ancestors so the node becomes visible.
    bool jumpToId(const std::string& id);

    // ── Queries ──────────────────────────────────────────────────────────────
    [[nodiscard]] const ConceptNode&              selected() const noexcept { return *selected_; }
    [[nodiscard]] size_t                          selectedIndex() const;
    [[nodiscard]] std::vector<const ConceptNode*> visibleNodes() const;

    // Case-insensitive substring match on title or id over the whole tree.
    // An empty query matches nothing.
    [[nodiscard]] std::vector<const ConceptNode*> search(std::string_view query) const;

    // Detail text of the current selection.
    [[nodiscard]] std::string details() const;

    [[nodiscard]] const StyledRenderer& renderer() const noexcept { return renderer_; }

private:
    // Expand every ancestor of `target`, then select it.
    bool reveal(const ConceptNode& target);

    ConceptNode&   root_;
    ConceptNode*   selected_;
    StyledRenderer renderer_;
};

} // namespace tiki
