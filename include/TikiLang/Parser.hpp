#pragma once
// Parser.hpp – Turns Tiki text into a validated concept tree.
//
// Usage example:
//   Parser parser;                                   // default ParseOptions
//   Document doc = parser.parseFile("notes.tiki");   // throws on failure
//   for (const auto& c : doc.root->children())
//       std::cout << c->id() << ' ' << c->title() << '\n';
//
// Input notation:
//   Root title                   ← first unmarked line, level 0, id ""
//   * Chapter                    ← level 1, id "*1"
//   ** Section [status: draft]   ← level 2, id "*1**1", metadata {status: "draft"}
//   Free text lines become the description of the concept above them.
//   *1**2 Other                  ← numbered form: level = number of marker runs

#include "Concept.hpp"
#include "Errors.hpp"
#include "Types.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace tiki {

// Nesting level of a marker token: the number of marker runs in the numbered
// form ("*1**2" → 2), or the run length for a bare run ("***" → 3).
// Returns 0 if the token does not start with the marker.
[[nodiscard]] size_t markerLevel(std::string_view token, char marker = '*') noexcept;

// ─────────────────────────────────────────────────────────────────────────────
//  HierarchyBuilder
// ─────────────────────────────────────────────────────────────────────────────
// Owns the tree under construction plus the per-parse numbering state:
//   counters_[i] – last number handed out at level i+1
//   stack_[i]    – most recent open concept at level i (stack_[0] = root)
// Errors are thrown as SyntaxError with line 0; the parser re-throws them with
// the offending line attached.
class HierarchyBuilder {
public:
    explicit HierarchyBuilder(char marker = '*') : marker_(marker) {}

    // Create the level-0 root. Fails if a root already exists.
    ConceptNode& addRoot(std::string title, Metadata metadata = {});

    // Create a concept at `level` (≥ 1) under the matching open ancestor.
    ConceptNode& addConcept(size_t level, std::string title, Metadata metadata = {});

    [[nodiscard]] bool   hasRoot() const noexcept { return root_ != nullptr; }
    [[nodiscard]] size_t openDepth() const noexcept { return stack_.empty() ? 0 : stack_.size() - 1; }

    // Hand the finished tree to the caller; the builder is empty afterwards.
    [[nodiscard]] std::unique_ptr<ConceptNode> release();

private:
    [[nodiscard]] std::string makeId(size_t level) const;

    char                         marker_;
    std::unique_ptr<ConceptNode> root_;
    std::vector<ConceptNode*>    stack_;
    std::vector<uint64_t>        counters_;
};

// ─────────────────────────────────────────────────────────────────────────────
//  Parser
// ─────────────────────────────────────────────────────────────────────────────
// Stateless between calls: every parse gets fresh scanner and numbering state,
// so one Parser may be reused for any number of documents.
class Parser {
public:
    Parser() = default;
    explicit Parser(ParseOptions options) : options_(std::move(options)) {}

    [[nodiscard]] const ParseOptions& options() const noexcept { return options_; }

    // Throws SyntaxError on any structural violation.
    [[nodiscard]] Document parse(std::istream& in) const;
    [[nodiscard]] Document parseString(std::string_view text) const;
    [[nodiscard]] Document parseLines(const std::vector<std::string>& lines) const;

    // Throws FileAccessError if the file is missing, unreadable or not UTF-8.
    [[nodiscard]] Document parseFile(const std::filesystem::path& path) const;

private:
    ParseOptions options_;
};

} // namespace tiki
