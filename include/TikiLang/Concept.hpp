#pragma once
// Concept.hpp – Document model: the concept tree and the parsed document.
//
// Ownership:
//   Document ──owns──► root ConceptNode ──owns──► children (in document order)
//
// Children never point back at their parent. A non-root node can only be
// created through addChild() on a node that is already part of the tree.

#include "Types.hpp"

#include <memory>
#include <span>
#include <string>
#include <vector>

namespace tiki {

class ConceptNode {
public:
    ConceptNode(std::string id, std::string title);

    ConceptNode(const ConceptNode&)            = delete;
    ConceptNode& operator=(const ConceptNode&) = delete;

    // ── Identity & content ───────────────────────────────────────────────────
    [[nodiscard]] const std::string& id()          const noexcept { return id_; }
    [[nodiscard]] const std::string& title()       const noexcept { return title_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const Metadata&    metadata()    const noexcept { return metadata_; }

    void setDescription(std::string description) { description_ = std::move(description); }
    void setMetadata(Metadata metadata)          { metadata_ = std::move(metadata); }

    // ── Display state ────────────────────────────────────────────────────────
    [[nodiscard]] bool expanded() const noexcept { return expanded_; }
    void setExpanded(bool expanded) noexcept     { expanded_ = expanded; }
    bool toggleExpanded() noexcept               { return expanded_ = !expanded_; }

    // ── Structure ────────────────────────────────────────────────────────────
    // Creates a child owned by this node and returns it.
    ConceptNode& addChild(std::string id, std::string title);

    [[nodiscard]] std::span<const std::unique_ptr<ConceptNode>> children() const noexcept {
        return children_;
    }
    [[nodiscard]] size_t             childCount() const noexcept { return children_.size(); }
    [[nodiscard]] bool               hasChildren() const noexcept { return !children_.empty(); }
    [[nodiscard]] const ConceptNode& child(size_t i) const { return *children_.at(i); }
    [[nodiscard]] ConceptNode&       child(size_t i)       { return *children_.at(i); }

    // Number of asterisk groups in the id; 0 for the root.
    [[nodiscard]] size_t depth() const noexcept;
    [[nodiscard]] bool   isRoot() const noexcept { return id_.empty(); }

    // ── Read-only queries over the subtree rooted here ───────────────────────
    [[nodiscard]] size_t conceptCount() const noexcept;  // self + descendants
    [[nodiscard]] size_t maxDepth() const noexcept;      // deepest descendant depth
    [[nodiscard]] const ConceptNode* findById(const std::string& id) const;
    [[nodiscard]] ConceptNode*       findById(const std::string& id);

    // Title, then a blank line and the description when there is one.
    [[nodiscard]] std::string fullContent() const;

private:
    std::string id_;
    std::string title_;
    std::string description_;
    bool        expanded_{true};
    Metadata    metadata_;
    std::vector<std::unique_ptr<ConceptNode>> children_;
};

// ─── One parsed document ──────────────────────────────────────────────────────
struct Document {
    std::unique_ptr<ConceptNode> root;

    // Top-level keys of the YAML frontmatter block, if any.
    Metadata frontmatter;

    // Non-fatal parse diagnostics (bad frontmatter YAML, unterminated fence…).
    std::vector<std::string> warnings;
};

} // namespace tiki
