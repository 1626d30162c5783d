// test_model.cpp – Concept tree structure, queries and hierarchy numbering.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_model

#include "TikiLang/Concept.hpp"
#include "TikiLang/Parser.hpp"

#include <iostream>
#include <string>
#include <vector>

using namespace tiki;

static int failures = 0;

#define CHECK(cond, msg)                                                  \
    do {                                                                   \
        if (!(cond)) {                                                     \
            std::cerr << "FAIL [" << __LINE__ << "] " << (msg) << '\n';  \
            ++failures;                                                    \
        } else {                                                           \
            std::cout << "OK   " << (msg) << '\n';                        \
        }                                                                  \
    } while(0)

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: Hand-built tree and its read-only queries
// ─────────────────────────────────────────────────────────────────────────────
static void testTreeQueries() {
    std::cout << "\n=== Test: Tree queries ===\n";

    ConceptNode root("", "Project");
    ConceptNode& a  = root.addChild("*1", "Alpha");
    ConceptNode& a1 = a.addChild("*1**1", "Alpha one");
    a1.addChild("*1**1***1", "Deep");
    root.addChild("*2", "Beta");

    CHECK(root.isRoot(),                "empty id marks the root");
    CHECK(!a.isRoot(),                  "*1 is not the root");
    CHECK(root.depth() == 0,            "root depth 0");
    CHECK(a.depth() == 1,               "*1 depth 1");
    CHECK(a1.depth() == 2,              "*1**1 depth 2");
    CHECK(root.childCount() == 2,       "root has two children");
    CHECK(root.child(0).title() == "Alpha", "children keep insertion order");
    CHECK(root.child(1).title() == "Beta",  "second child is Beta");
    CHECK(root.conceptCount() == 5,     "conceptCount counts root and descendants");
    CHECK(a.conceptCount() == 3,        "subtree count of *1");
    CHECK(root.maxDepth() == 3,         "maxDepth reaches the deepest node");
    CHECK(root.child(1).maxDepth() == 1, "leaf maxDepth equals its own depth");

    const ConceptNode* hit = root.findById("*1**1***1");
    CHECK(hit && hit->title() == "Deep", "findById locates a nested node");
    CHECK(root.findById("*9") == nullptr, "findById returns null for unknown id");
    CHECK(root.findById("") == &root,     "findById(\"\") is the root");

    ConceptNode* mut = root.findById("*2");
    CHECK(mut != nullptr, "mutable findById");
    if (mut) {
        mut->setDescription("changed");
        CHECK(root.child(1).description() == "changed", "mutable lookup edits the tree");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: Display state and content
// ─────────────────────────────────────────────────────────────────────────────
static void testDisplayState() {
    std::cout << "\n=== Test: Display state ===\n";

    ConceptNode node("*1", "Topic");
    CHECK(node.expanded(),               "nodes start expanded");
    CHECK(node.toggleExpanded() == false, "toggle returns the new state (collapsed)");
    CHECK(!node.expanded(),              "node is collapsed");
    CHECK(node.toggleExpanded() == true, "second toggle expands again");

    CHECK(node.fullContent() == "Topic\n", "fullContent without description");
    node.setDescription("Body line\nSecond");
    CHECK(node.fullContent() == "Topic\n\nBody line\nSecond", "fullContent with description");
    node.setDescription("   ");
    CHECK(node.fullContent() == "Topic\n", "whitespace-only description is ignored");

    Metadata md;
    md["level"] = int64_t{3};
    node.setMetadata(md);
    CHECK(node.metadata().size() == 1, "metadata stored");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: HierarchyBuilder numbering
//  Levels 1, 2, 2, 1, 2 → *1, *1**1, *1**2, *2, *2**1
// ─────────────────────────────────────────────────────────────────────────────
static void testBuilderNumbering() {
    std::cout << "\n=== Test: Builder numbering ===\n";

    HierarchyBuilder b;
    b.addRoot("Root");
    CHECK(b.hasRoot(),        "root created");
    CHECK(b.openDepth() == 0, "only the root is open");

    const std::vector<size_t> levels = {1, 2, 2, 1, 2};
    const std::vector<std::string> expected = {"*1", "*1**1", "*1**2", "*2", "*2**1"};
    std::vector<std::string> ids;
    for (size_t i = 0; i < levels.size(); ++i)
        ids.push_back(b.addConcept(levels[i], "c" + std::to_string(i)).id());

    for (size_t i = 0; i < expected.size(); ++i)
        CHECK(ids[i] == expected[i], "id #" + std::to_string(i) + " = " + expected[i]);
    CHECK(b.openDepth() == 2, "open depth follows the last concept");

    // Returning to level 1 then descending restarts deeper counters.
    b.addConcept(3, "deep");
    CHECK(b.addConcept(1, "third").id() == "*3", "third top-level concept");
    CHECK(b.addConcept(2, "fresh").id() == "*3**1", "deeper counter reset to 1");

    auto root = b.release();
    CHECK(root && root->childCount() == 3, "released tree has three top-level concepts");
    CHECK(!b.hasRoot(), "builder is empty after release");
    if (root) {
        CHECK(root->child(1).child(0).child(0).id() == "*2**1***1", "level-3 id under *2**1");
        CHECK(root->child(1).child(0).child(0).depth() == 3, "id depth agrees with level");
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: HierarchyBuilder structural errors
// ─────────────────────────────────────────────────────────────────────────────
static void testBuilderErrors() {
    std::cout << "\n=== Test: Builder errors ===\n";

    auto throwsSyntax = [](auto&& fn, const std::string& needle) {
        try {
            fn();
        } catch (const SyntaxError& e) {
            return e.message().find(needle) != std::string::npos;
        }
        return false;
    };

    CHECK(throwsSyntax([] { HierarchyBuilder b; b.addConcept(1, "x"); }, "unmarked root"),
          "concept before root rejected");
    CHECK(throwsSyntax([] { HierarchyBuilder b; b.addRoot(""); }, "cannot be empty"),
          "empty root title rejected");
    CHECK(throwsSyntax([] { HierarchyBuilder b; b.addRoot("A"); b.addRoot("B"); }, "multiple root"),
          "second root rejected");
    CHECK(throwsSyntax([] { HierarchyBuilder b; b.addRoot("A"); b.addConcept(2, "x"); },
                       "found level 2, expected at most 1"),
          "level skip from root rejected");
    CHECK(throwsSyntax([] { HierarchyBuilder b; b.addRoot("A"); b.addConcept(1, ""); }, "cannot be empty"),
          "empty concept title rejected");

    HierarchyBuilder b('#');
    b.addRoot("Hash");
    CHECK(b.addConcept(1, "one").id() == "#1",      "custom marker in ids");
    CHECK(b.addConcept(2, "two").id() == "#1##1",   "custom marker nested id");
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main() {
    testTreeQueries();
    testDisplayState();
    testBuilderNumbering();
    testBuilderErrors();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
