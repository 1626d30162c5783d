// Parser.cpp – Line scanner, hierarchy numbering and frontmatter loading.
// Uses yaml-cpp for the optional "---" frontmatter block.
//
// Scanner priority per physical line (after trailing-whitespace strip):
//   1. "---" frontmatter delimiter  (opening only within the line limit)
//   2. code fence toggle / fenced content (verbatim description text)
//   3. blank line
//   4. concept line (marked) or root line (first unmarked line)
//   5. description text

#include "TikiLang/Parser.hpp"
#include "TikiLang/Metadata.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

namespace tiki {

// ─────────────────────────────────────────────────────────────────────────────
//  HierarchyBuilder
// ─────────────────────────────────────────────────────────────────────────────

ConceptNode& HierarchyBuilder::addRoot(std::string title, Metadata metadata) {
    if (title.empty())
        throw SyntaxError("concept title cannot be empty", 0, "");
    if (root_)
        throw SyntaxError("multiple root concepts not allowed", 0, "");

    root_ = std::make_unique<ConceptNode>("", std::move(title));
    root_->setMetadata(std::move(metadata));
    stack_.assign(1, root_.get());
    counters_.clear();
    return *root_;
}

ConceptNode& HierarchyBuilder::addConcept(size_t level, std::string title, Metadata metadata) {
    if (level == 0)
        return addRoot(std::move(title), std::move(metadata));
    if (title.empty())
        throw SyntaxError("concept title cannot be empty", 0, "");
    if (!root_)
        throw SyntaxError("file must start with an unmarked root concept", 0, "");

    const size_t open = openDepth();
    if (level > open + 1)
        throw SyntaxError("invalid level jump: found level " + std::to_string(level) +
                          ", expected at most " + std::to_string(open + 1), 0, "");

    // Bump this level, forget everything below it.
    if (counters_.size() < level) counters_.resize(level, 0);
    ++counters_[level - 1];
    std::fill(counters_.begin() + static_cast<std::ptrdiff_t>(level), counters_.end(), 0);

    stack_.resize(level);
    ConceptNode& node = stack_.back()->addChild(makeId(level), std::move(title));
    node.setMetadata(std::move(metadata));
    stack_.push_back(&node);
    return node;
}

std::string HierarchyBuilder::makeId(size_t level) const {
    std::string id;
    for (size_t i = 0; i < level; ++i) {
        id.append(i + 1, marker_);
        id += std::to_string(counters_[i]);
    }
    return id;
}

std::unique_ptr<ConceptNode> HierarchyBuilder::release() {
    stack_.clear();
    counters_.clear();
    return std::move(root_);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Line scanner
// ─────────────────────────────────────────────────────────────────────────────

namespace {

enum class ScanState { Normal, InFrontmatter, InCodeBlock };

void rstripInPlace(std::string& s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))
        s.pop_back();
}

std::string trimmed(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) s.remove_prefix(1);
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back())))  s.remove_suffix(1);
    return std::string(s);
}

// Top-level YAML map → typed document metadata. Problems become warnings.
void loadFrontmatter(const std::vector<std::string>& lines, char marker, Document& doc) {
    std::string text;
    for (const auto& l : lines) {
        text += l;
        text += '\n';
    }

    try {
        YAML::Node node = YAML::Load(text);
        if (!node || node.IsNull())
            return;
        if (!node.IsMap()) {
            doc.warnings.emplace_back("frontmatter ignored: not a key/value mapping");
            return;
        }
        for (const auto& kv : node) {
            const std::string key = kv.first.as<std::string>();
            const YAML::Node& val = kv.second;
            if (val.IsScalar()) {
                doc.frontmatter[key] = parseLiteral(val.Scalar(), marker);
            } else if (val.IsNull()) {
                doc.frontmatter[key] = std::string();
            } else {
                YAML::Emitter em;
                em << YAML::Flow << val;
                doc.frontmatter[key] = std::string(em.c_str());
            }
        }
    } catch (const YAML::Exception& ex) {
        doc.warnings.emplace_back(std::string("frontmatter ignored: ") + ex.what());
    }
}

class LineScanner {
public:
    explicit LineScanner(const ParseOptions& opt) : opt_(opt), builder_(opt.marker) {}

    void feed(std::string line) {
        ++line_no_;
        rstripInPlace(line);

        // ── 1. Frontmatter ───────────────────────────────────────────────────
        if (state_ != ScanState::InCodeBlock && line == "---") {
            if (state_ == ScanState::InFrontmatter) {
                state_ = ScanState::Normal;
                loadFrontmatter(frontmatter_, opt_.marker, doc_);
                frontmatter_.clear();
                return;
            }
            if (line_no_ <= opt_.frontmatter_limit) {
                state_ = ScanState::InFrontmatter;
                frontmatter_line_ = line_no_;
                return;
            }
        }
        if (state_ == ScanState::InFrontmatter) {
            frontmatter_.push_back(std::move(line));
            return;
        }

        // ── 2. Code fences ───────────────────────────────────────────────────
        const bool fence = !opt_.fence.empty() &&
                           line.compare(0, opt_.fence.size(), opt_.fence) == 0;
        if (fence || state_ == ScanState::InCodeBlock) {
            if (fence) {
                state_ = (state_ == ScanState::InCodeBlock) ? ScanState::Normal
                                                           : ScanState::InCodeBlock;
                if (state_ == ScanState::InCodeBlock) fence_line_ = line_no_;
            }
            if (current_) {
                pending_.push_back(std::move(line));
            } else if (!dropped_fence_warned_) {
                doc_.warnings.push_back("line " + std::to_string(line_no_) +
                                        ": fenced content before the root concept dropped");
                dropped_fence_warned_ = true;
            }
            return;
        }

        // ── 3. Blank lines ───────────────────────────────────────────────────
        if (line.empty()) {
            if (current_ && !pending_.empty())
                pending_.emplace_back();
            return;
        }

        // ── 4. Concept / root lines ──────────────────────────────────────────
        try {
            if (line.front() == opt_.marker) {
                if (!builder_.hasRoot())
                    throw SyntaxError("file must start with an unmarked root concept", 0, "");

                // A concept token is followed by whitespace, or is a bare marker
                // run ("**" alone still fails below with an empty title).
                const size_t tok_end = std::min(line.find_first_of(" \t"), line.size());
                const std::string_view token = std::string_view(line).substr(0, tok_end);
                const bool concept_line = tok_end < line.size() ||
                                          token.find_first_not_of(opt_.marker) == std::string_view::npos;
                if (concept_line) {
                    std::string title  = trimmed(std::string_view(line).substr(tok_end));
                    Metadata    md     = extractAnnotations(title, opt_.marker);
                    const size_t level = markerLevel(token, opt_.marker);

                    finalizeDescription();
                    current_ = &builder_.addConcept(level, std::move(title), std::move(md));
                    return;
                }
            }

            if (!current_) {
                std::string title = trimmed(line);
                Metadata    md    = extractAnnotations(title, opt_.marker);
                current_ = &builder_.addRoot(std::move(title), std::move(md));
                return;
            }
        } catch (const SyntaxError& e) {
            throw SyntaxError(e.message(), line_no_, line);
        }

        // ── 5. Description text ──────────────────────────────────────────────
        pending_.push_back(std::move(line));
    }

    Document finish() {
        finalizeDescription();

        if (state_ == ScanState::InCodeBlock)
            doc_.warnings.push_back("line " + std::to_string(fence_line_) +
                                    ": code fence never closed");
        if (state_ == ScanState::InFrontmatter)
            doc_.warnings.push_back("line " + std::to_string(frontmatter_line_) +
                                    ": frontmatter never closed");

        if (!builder_.hasRoot())
            throw SyntaxError("no valid concepts found", std::max<size_t>(line_no_, 1), "");

        doc_.root = builder_.release();
        return std::move(doc_);
    }

private:
    void finalizeDescription() {
        if (current_ && !pending_.empty()) {
            std::string text;
            for (size_t i = 0; i < pending_.size(); ++i) {
                if (i) text += '\n';
                text += pending_[i];
            }
            rstripInPlace(text);
            current_->setDescription(std::move(text));
        }
        pending_.clear();
    }

    const ParseOptions&      opt_;
    HierarchyBuilder         builder_;
    Document                 doc_;
    ScanState                state_{ScanState::Normal};
    size_t                   line_no_{0};
    size_t                   fence_line_{0};
    size_t                   frontmatter_line_{0};
    bool                     dropped_fence_warned_{false};
    ConceptNode*             current_{nullptr};
    std::vector<std::string> pending_;
    std::vector<std::string> frontmatter_;
};

// Strict UTF-8 well-formedness check (no overlongs, no surrogates).
bool isValidUtf8(std::string_view s) {
    size_t i = 0;
    while (i < s.size()) {
        const auto c = static_cast<unsigned char>(s[i]);
        size_t   len = 0;
        uint32_t cp  = 0;
        if (c < 0x80)                { ++i; continue; }
        else if ((c & 0xE0) == 0xC0) { len = 2; cp = c & 0x1F; }
        else if ((c & 0xF0) == 0xE0) { len = 3; cp = c & 0x0F; }
        else if ((c & 0xF8) == 0xF0) { len = 4; cp = c & 0x07; }
        else return false;

        if (i + len > s.size()) return false;
        for (size_t k = 1; k < len; ++k) {
            const auto cc = static_cast<unsigned char>(s[i + k]);
            if ((cc & 0xC0) != 0x80) return false;
            cp = (cp << 6) | (cc & 0x3F);
        }
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000))
            return false;
        if (cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
            return false;
        i += len;
    }
    return true;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
//  Parser
// ─────────────────────────────────────────────────────────────────────────────

size_t markerLevel(std::string_view token, char marker) noexcept {
    if (token.empty() || token.front() != marker)
        return 0;

    const bool markers_only = std::all_of(token.begin(), token.end(),
                                          [marker](char c) { return c == marker; });
    if (markers_only)
        return token.size();

    size_t runs   = 0;
    bool   in_run = false;
    for (char c : token) {
        const bool m = (c == marker);
        if (m && !in_run) ++runs;
        in_run = m;
    }
    return runs;
}

Document Parser::parseLines(const std::vector<std::string>& lines) const {
    LineScanner scanner(options_);
    for (const auto& l : lines)
        scanner.feed(l);
    return scanner.finish();
}

Document Parser::parse(std::istream& in) const {
    LineScanner scanner(options_);
    std::string line;
    while (std::getline(in, line))
        scanner.feed(std::move(line));
    if (in.bad())
        throw FileAccessError("read error while parsing input stream");
    return scanner.finish();
}

Document Parser::parseString(std::string_view text) const {
    LineScanner scanner(options_);
    size_t start = 0;
    while (true) {
        const size_t nl = text.find('\n', start);
        scanner.feed(std::string(text.substr(start, nl - start)));
        if (nl == std::string_view::npos) break;
        start = nl + 1;
    }
    return scanner.finish();
}

Document Parser::parseFile(const std::filesystem::path& path) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec))
        throw FileAccessError("File not found: " + path.string());

    std::ifstream in(path, std::ios::binary);
    if (!in)
        throw FileAccessError("Cannot open file: " + path.string());

    std::string content{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    if (in.bad())
        throw FileAccessError("Read error: " + path.string());

    if (content.compare(0, 3, "\xEF\xBB\xBF") == 0)
        content.erase(0, 3);
    if (!isValidUtf8(content))
        throw FileAccessError("File encoding error: " + path.string() + " is not valid UTF-8");

    return parseString(content);
}

} // namespace tiki
