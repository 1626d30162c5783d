// Navigator.cpp – Selection, expand/collapse and search over a concept tree.

#include "TikiLang/Navigator.hpp"

#include <algorithm>
#include <cctype>

namespace tiki {

namespace {

std::string lowered(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

void collectMatches(const ConceptNode& node, const std::string& needle,
                    std::vector<const ConceptNode*>& out) {
    if (lowered(node.title()).find(needle) != std::string::npos ||
        lowered(node.id()).find(needle) != std::string::npos)
        out.push_back(&node);
    for (const auto& child : node.children())
        collectMatches(*child, needle, out);
}

// Root-to-target chain (inclusive). Empty if target is not in the subtree.
bool pathTo(ConceptNode& node, const ConceptNode& target, std::vector<ConceptNode*>& path) {
    path.push_back(&node);
    if (&node == &target) return true;
    for (size_t i = 0; i < node.childCount(); ++i) {
        if (pathTo(node.child(i), target, path)) return true;
    }
    path.pop_back();
    return false;
}

} // namespace

Navigator::Navigator(ConceptNode& root, StyledRenderer renderer)
    : root_(root), selected_(&root), renderer_(std::move(renderer)) {}

// ─────────────────────────────────────────────────────────────────────────────
//  Queries
// ─────────────────────────────────────────────────────────────────────────────

std::vector<const ConceptNode*> Navigator::visibleNodes() const {
    std::vector<const ConceptNode*> nodes;
    for (const auto& line : layoutTree(root_, renderer_.style().collapse_marker))
        nodes.push_back(line.node);
    return nodes;
}

size_t Navigator::selectedIndex() const {
    const auto nodes = visibleNodes();
    auto it = std::find(nodes.begin(), nodes.end(), selected_);
    return it == nodes.end() ? 0 : static_cast<size_t>(std::distance(nodes.begin(), it));
}

std::vector<const ConceptNode*> Navigator::search(std::string_view query) const {
    std::vector<const ConceptNode*> matches;
    if (query.empty()) return matches;
    collectMatches(root_, lowered(query), matches);
    return matches;
}

std::string Navigator::details() const {
    return renderConceptDetails(*selected_);
}

// ─────────────────────────────────────────────────────────────────────────────
//  TreeBrowser
// ─────────────────────────────────────────────────────────────────────────────

std::vector<std::string> Navigator::render() const {
    return renderer_.renderLines(root_, selected_);
}

bool Navigator::onSelect(size_t visible_index) {
    const auto nodes = visibleNodes();
    if (visible_index >= nodes.size()) return false;
    return reveal(*nodes[visible_index]);
}

SearchResult Navigator::onSearch(std::string_view query) {
    SearchResult result;
    result.matches = search(query);
    if (result.empty()) {
        result.message = "No matches found for: '" + std::string(query) + "'";
        return result;
    }
    reveal(*result.matches.front());
    result.message = "Found " + std::to_string(result.count()) + " matches. Showing: " +
                     result.matches.front()->title();
    return result;
}

bool Navigator::onToggleExpand() {
    return selected_->toggleExpanded();
}

// ─────────────────────────────────────────────────────────────────────────────
//  Movement
// ─────────────────────────────────────────────────────────────────────────────

void Navigator::moveUp() {
    const size_t i = selectedIndex();
    if (i > 0) onSelect(i - 1);
}

void Navigator::moveDown() {
    onSelect(selectedIndex() + 1);
}

void Navigator::moveFirst() {
    onSelect(0);
}

void Navigator::moveLast() {
    onSelect(visibleNodes().size() - 1);
}

bool Navigator::jumpToId(const std::string& id) {
    const ConceptNode* target = root_.findById(id);
    return target != nullptr && reveal(*target);
}

bool Navigator::reveal(const ConceptNode& target) {
    std::vector<ConceptNode*> path;
    if (!pathTo(root_, target, path))
        return false;
    for (size_t i = 0; i + 1 < path.size(); ++i)
        path[i]->setExpanded(true);
    selected_ = path.back();
    return true;
}

} // namespace tiki
