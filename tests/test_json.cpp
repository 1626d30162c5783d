// test_json.cpp – JSON export shape, import validation and lossless round-trip.
//
// Compile with CMake:
//   cmake -B build && cmake --build build
//   ./build/test_json

#include "TikiLang/JsonExport.hpp"
#include "TikiLang/Output.hpp"
#include "TikiLang/Parser.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
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

// ─── Utility ─────────────────────────────────────────────────────────────────

// Structural equality over everything the JSON form carries.
static bool sameTree(const ConceptNode& a, const ConceptNode& b) {
    if (a.id() != b.id() || a.title() != b.title() || a.description() != b.description() ||
        a.expanded() != b.expanded() || a.metadata() != b.metadata() ||
        a.childCount() != b.childCount())
        return false;
    for (size_t i = 0; i < a.childCount(); ++i) {
        if (!sameTree(a.child(i), b.child(i))) return false;
    }
    return true;
}

static bool importFails(const std::string& text, const std::string& needle) {
    try {
        (void)readJsonString(text);
    } catch (const ExportError& e) {
        if (std::string(e.what()).find(needle) != std::string::npos) return true;
        std::cerr << "  unexpected message: " << e.what() << '\n';
    }
    return false;
}

static const char* kSample =
    "Manual [owner: core]\n"
    "Top-level description.\n"
    "* Goal [priority: high, mastery: 85%, blocked, count: 12, see: *2]\n"
    "Line one\n"
    "\n"
    "  indented \"quoted\" line\n"
    "** Detail [ratio: 0.1, big: -9007199254740993]\n"
    "* Unicode – ünïcödé ✓\n";

// ─────────────────────────────────────────────────────────────────────────────
//  Test 1: Export shape
// ─────────────────────────────────────────────────────────────────────────────
static void testExportShape() {
    std::cout << "\n=== Test: Export shape ===\n";

    Document doc = Parser().parseString(kSample);
    doc.root->child(1).setExpanded(false);
    const Json v = toJson(doc);

    CHECK(v.at("format_version") == "1.0",                 "format_version 1.0");
    CHECK(v.at("root").at("id") == "",                     "root id empty");
    CHECK(v.at("root").at("title") == "Manual",            "root title");
    CHECK(v.at("root").at("children").size() == 2,         "two children");

    const Json& goal = v.at("root").at("children").at(0);
    const Json& md   = goal.at("metadata");
    CHECK(goal.at("id") == "*1",                           "child id");
    CHECK(md.at("priority").is_string(),                   "string metadata → JSON string");
    CHECK(md.at("mastery").is_number_float() &&
              md.at("mastery").get<double>() == 0.85,      "percentage → JSON float");
    CHECK(md.at("blocked").is_boolean(),                   "flag → JSON bool");
    CHECK(md.at("count").is_number_integer() &&
              md.at("count").get<int64_t>() == 12,         "integer → JSON int");
    CHECK(md.at("see") == "*2",                            "reference → JSON string");
    CHECK(goal.at("expanded").get<bool>(),                 "expanded flag exported");
    CHECK(!v.at("root").at("children").at(1).at("expanded").get<bool>(),
          "collapsed flag exported");
    CHECK(v.at("root").at("children").at(1).at("children").is_array(),
          "leaf children is an empty array");

    const std::string text = toJsonString(doc);
    CHECK(text.find("\n  \"format_version\"") != std::string::npos, "two-space indentation");
    CHECK(text.find("ünïcödé ✓") != std::string::npos,  "UTF-8 emitted unescaped");
    CHECK(text.find("\"mastery\": 0.85,") != std::string::npos,
          "floats use the shortest exact form");
    CHECK(text.find("\"ratio\": 0.1,") != std::string::npos, "0.1 printed as written");

    Document empty;
    bool threw = false;
    try { (void)toJson(empty); } catch (const ExportError&) { threw = true; }
    CHECK(threw, "document without root cannot be exported");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 2: Lossless round-trip
// ─────────────────────────────────────────────────────────────────────────────
static void testRoundTrip(const fs::path& examples_dir) {
    std::cout << "\n=== Test: Round-trip ===\n";

    Document original = Parser().parseString(kSample);
    std::ostringstream os;
    writeJson(original, os);
    Document back = readJsonString(os.str());
    CHECK(sameTree(*original.root, *back.root), "inline sample survives export → import");

    const auto& md = back.root->child(0).metadata();
    CHECK(std::holds_alternative<Reference>(md.at("see")),  "reference restored from marker prefix");
    CHECK(std::holds_alternative<int64_t>(md.at("count")),  "integer restored as integer");
    CHECK(std::get<int64_t>(back.root->child(0).child(0).metadata().at("big")) == -9007199254740993LL,
          "64-bit integer beyond double precision survives");

    try {
        Document file = Parser().parseFile(examples_dir / "overview.tiki");
        Document again = readJsonString(toJsonString(file));
        CHECK(sameTree(*file.root, *again.root), "overview.tiki survives export → import");
    } catch (const std::exception& e) {
        std::cerr << "FAIL overview round-trip: " << e.what() << '\n';
        ++failures;
    }
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 3: Import validation
// ─────────────────────────────────────────────────────────────────────────────
static void testImportErrors() {
    std::cout << "\n=== Test: Import errors ===\n";

    CHECK(importFails("{ not json", "malformed JSON"),                 "malformed text");
    CHECK(importFails("[1, 2]", "must be an object"),                  "array document");
    CHECK(importFails(R"({"root": {}})", "format_version"),            "missing format_version");
    CHECK(importFails(R"({"format_version": "2.0", "root": {}})", "unsupported format_version"),
          "future format_version");
    CHECK(importFails(R"({"format_version": "1.0"})", "missing 'root'"), "missing root");
    CHECK(importFails(R"({"format_version": "1.0", "root": {"id": "", "title": "R"}})",
                      "missing 'description'"),
          "missing description");
    CHECK(importFails(R"({"format_version": "1.0",
                          "root": {"id": "", "title": "R", "description": "",
                                   "metadata": {"x": [1]}}})",
                      "unsupported metadata value type"),
          "array metadata value");
    CHECK(importFails(R"({"format_version": "1.0",
                          "root": {"id": "", "title": "R", "description": "",
                                   "children": [{"id": "*1", "description": ""}]}})",
                      "missing 'title'"),
          "child without title");
    CHECK(importFails(R"({"format_version": "1.0",
                          "root": {"id": "", "title": "R", "description": "",
                                   "metadata": {"n": 18446744073709551615}}})",
                      "out of range"),
          "uint64 beyond int64");

    Document minimal = readJsonString(
        R"({"format_version": "1.0", "root": {"id": "", "title": "Only", "description": ""}})");
    CHECK(minimal.root->title() == "Only" && minimal.root->expanded() &&
              !minimal.root->hasChildren(),
          "optional fields default");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 4: Metadata order
// ─────────────────────────────────────────────────────────────────────────────
static void testMetadataOrder() {
    std::cout << "\n=== Test: Metadata order ===\n";

    Document doc = Parser().parseString("Root\n* Task [priority: high, mastery: 85%, blocked]\n");
    const std::string text = toJsonString(doc);
    const auto p = text.find("\"priority\"");
    const auto m = text.find("\"mastery\"");
    const auto b = text.find("\"blocked\"");
    CHECK(p != std::string::npos && m != std::string::npos && b != std::string::npos,
          "all three keys exported");
    CHECK(p < m && m < b, "keys appear in the order they were written");

    const Json v = toJson(doc);
    auto it = v.at("root").at("children").at(0).at("metadata").begin();
    CHECK(it.key() == "priority", "first metadata key");
    ++it;
    CHECK(it.key() == "mastery",  "second metadata key");

    CHECK(text.find("\"format_version\"") < text.find("\"root\""),
          "format_version written before root");

    Document back = readJsonString(R"({"format_version": "1.0",
        "root": {"id": "", "title": "R", "description": "",
                 "metadata": {"zeta": 1, "alpha": 2, "mid": 3}}})");
    std::string keys;
    for (const auto& [key, value] : back.root->metadata())
        keys += key + ",";
    CHECK(keys == "zeta,alpha,mid,", "import keeps the JSON object order");
}

// ─────────────────────────────────────────────────────────────────────────────
//  Test 5: Writing to files
// ─────────────────────────────────────────────────────────────────────────────
static void testWriteFiles() {
    std::cout << "\n=== Test: Write files ===\n";

    const fs::path dir = fs::temp_directory_path() / "tiki_test_json";
    fs::create_directories(dir);
    const fs::path file = dir / "out.json";

    Document doc = Parser().parseString(kSample);
    writeJson(doc, file);
    std::ifstream in(file, std::ios::binary);
    std::stringstream buf;
    buf << in.rdbuf();
    CHECK(buf.str() == toJsonString(doc) + "\n", "file holds the JSON text plus a newline");
    in.close();

    writeTextFile("short", file);
    std::ifstream again(file, std::ios::binary);
    std::string first;
    std::getline(again, first);
    CHECK(first == "short" && again.peek() == std::char_traits<char>::eof(),
          "an existing file is truncated");
    again.close();

    bool threw = false;
    try { writeJson(doc, dir); } catch (const ExportError&) { threw = true; }
    CHECK(threw, "writing onto a directory raises ExportError");

    threw = false;
    try { writeTextFile("x", dir / "missing" / "out.txt"); } catch (const ExportError&) { threw = true; }
    CHECK(threw, "missing parent directory raises ExportError");

    std::ostringstream os;
    writeText("line", os);
    CHECK(os.str() == "line\n", "stream writer appends a newline");

    std::ostringstream bad;
    bad.setstate(std::ios::badbit);
    threw = false;
    try { writeText("line", bad); } catch (const ExportError&) { threw = true; }
    CHECK(threw, "failed stream raises ExportError");

    std::error_code ec;
    fs::remove_all(dir, ec);
}

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    fs::path examples_dir = (argc > 1)
        ? fs::path(argv[1])
        : fs::path(__FILE__).parent_path().parent_path() / "examples";

    testExportShape();
    testRoundTrip(examples_dir);
    testImportErrors();
    testMetadataOrder();
    testWriteFiles();

    std::cout << "\n──────────────────────────────────\n";
    if (failures == 0) {
        std::cout << "ALL TESTS PASSED\n";
    } else {
        std::cout << failures << " TEST(S) FAILED\n";
    }
    return failures == 0 ? 0 : 1;
}
