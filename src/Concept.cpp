// Concept.cpp – Concept tree construction and read-only queries.

#include "TikiLang/Concept.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

namespace tiki {

ConceptNode::ConceptNode(std::string id, std::string title)
    : id_(std::move(id)), title_(std::move(title)) {}

ConceptNode& ConceptNode::addChild(std::string id, std::string title) {
    children_.push_back(std::make_unique<ConceptNode>(std::move(id), std::move(title)));
    return *children_.back();
}

// An id is a sequence of [marker-run][digits] groups, so every run of
// non-digit characters starts a new level.
size_t ConceptNode::depth() const noexcept {
    size_t groups  = 0;
    bool   in_run  = false;
    for (char c : id_) {
        bool digit = std::isdigit(static_cast<unsigned char>(c)) != 0;
        if (!digit && !in_run) ++groups;
        in_run = !digit;
    }
    return groups;
}

size_t ConceptNode::conceptCount() const noexcept {
    size_t n = 1;
    for (const auto& c : children_)
        n += c->conceptCount();
    return n;
}

size_t ConceptNode::maxDepth() const noexcept {
    size_t d = depth();
    for (const auto& c : children_)
        d = std::max(d, c->maxDepth());
    return d;
}

const ConceptNode* ConceptNode::findById(const std::string& id) const {
    if (id_ == id) return this;
    for (const auto& c : children_) {
        if (const ConceptNode* hit = c->findById(id))
            return hit;
    }
    return nullptr;
}

ConceptNode* ConceptNode::findById(const std::string& id) {
    return const_cast<ConceptNode*>(std::as_const(*this).findById(id));
}

std::string ConceptNode::fullContent() const {
    std::string content = title_ + "\n";
    bool has_text = std::any_of(description_.begin(), description_.end(),
                                [](unsigned char c) { return !std::isspace(c); });
    if (has_text)
        content += "\n" + description_;
    return content;
}

} // namespace tiki
