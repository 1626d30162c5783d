// JsonExport.cpp – Document ⇄ JSON using nlohmann::ordered_json.

#include "TikiLang/JsonExport.hpp"
#include "TikiLang/Output.hpp"
#include "TikiLang/Types.hpp"

#include <limits>
#include <sstream>

namespace tiki {

// ─────────────────────────────────────────────────────────────────────────────
//  Export
// ─────────────────────────────────────────────────────────────────────────────

namespace {

struct JsonValueBuilder {
    Json operator()(const std::string& s) const { return s; }
    Json operator()(int64_t i) const { return i; }
    Json operator()(double d) const { return d; }
    Json operator()(bool b) const { return b; }
    Json operator()(const Reference& r) const { return r.target; }
};

} // namespace

Json toJson(const ConceptNode& node) {
    Json v = Json::object();
    v["id"]          = node.id();
    v["title"]       = node.title();
    v["description"] = node.description();
    v["expanded"]    = node.expanded();

    Json md = Json::object();
    for (const auto& [key, value] : node.metadata())
        md[key] = std::visit(JsonValueBuilder{}, value);
    v["metadata"] = std::move(md);

    Json kids = Json::array();
    for (const auto& child : node.children())
        kids.push_back(toJson(*child));
    v["children"] = std::move(kids);
    return v;
}

Json toJson(const Document& doc) {
    if (!doc.root)
        throw ExportError("cannot export a document without a root concept");
    Json v = Json::object();
    v["format_version"] = kFormatVersion;
    v["root"]           = toJson(*doc.root);
    return v;
}

std::string toJsonString(const Document& doc) {
    const Json v = toJson(doc);
    try {
        return v.dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw ExportError(std::string("cannot serialise document: ") + e.what());
    }
}

void writeJson(const Document& doc, std::ostream& out) {
    writeText(toJsonString(doc), out);
}

void writeJson(const Document& doc, const std::filesystem::path& path) {
    writeTextFile(toJsonString(doc), path);
}

// ─────────────────────────────────────────────────────────────────────────────
//  Import
// ─────────────────────────────────────────────────────────────────────────────

namespace {

const Json& member(const Json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end())
        throw ExportError(where + ": missing '" + key + "'");
    return *it;
}

std::string stringMember(const Json& obj, const char* key, const std::string& where) {
    const Json& v = member(obj, key, where);
    if (!v.is_string())
        throw ExportError(where + ": '" + key + "' must be a string");
    return v.get<std::string>();
}

MetadataValue metadataFromJson(const Json& v, char marker, const std::string& where) {
    if (v.is_string()) {
        std::string s = v.get<std::string>();
        if (!s.empty() && s.front() == marker)
            return Reference{std::move(s)};
        return s;
    }
    if (v.is_boolean())
        return v.get<bool>();
    // Non-negative literals parse as unsigned; is_number_integer() covers both.
    if (v.is_number_unsigned()) {
        const auto u = v.get<uint64_t>();
        if (u > static_cast<uint64_t>(std::numeric_limits<int64_t>::max()))
            throw ExportError(where + ": integer metadata out of range");
        return static_cast<int64_t>(u);
    }
    if (v.is_number_integer())
        return v.get<int64_t>();
    if (v.is_number_float())
        return v.get<double>();
    throw ExportError(where + ": unsupported metadata value type");
}

void fillNode(ConceptNode& node, const Json& v, char marker) {
    const std::string where = "node '" + node.id() + "'";

    node.setDescription(stringMember(v, "description", where));

    if (auto it = v.find("expanded"); it != v.end()) {
        if (!it->is_boolean())
            throw ExportError(where + ": 'expanded' must be a boolean");
        node.setExpanded(it->get<bool>());
    }

    if (auto it = v.find("metadata"); it != v.end()) {
        if (!it->is_object())
            throw ExportError(where + ": 'metadata' must be an object");
        Metadata out;
        for (const auto& item : it->items())
            out[item.key()] = metadataFromJson(item.value(), marker,
                                               where + " metadata '" + item.key() + "'");
        node.setMetadata(std::move(out));
    }

    if (auto it = v.find("children"); it != v.end()) {
        if (!it->is_array())
            throw ExportError(where + ": 'children' must be an array");
        for (const auto& kid : *it) {
            if (!kid.is_object())
                throw ExportError(where + ": child is not an object");
            ConceptNode& child = node.addChild(stringMember(kid, "id", where + " child"),
                                               stringMember(kid, "title", where + " child"));
            fillNode(child, kid, marker);
        }
    }
}

} // namespace

Document fromJson(const Json& value, char marker) {
    if (!value.is_object())
        throw ExportError("JSON document must be an object");

    const std::string version = stringMember(value, "format_version", "document");
    if (version != kFormatVersion)
        throw ExportError("unsupported format_version '" + version + "'");

    const Json& root = member(value, "root", "document");
    if (!root.is_object())
        throw ExportError("document: 'root' must be an object");

    Document doc;
    doc.root = std::make_unique<ConceptNode>(stringMember(root, "id", "root"),
                                             stringMember(root, "title", "root"));
    fillNode(*doc.root, root, marker);
    return doc;
}

Document readJson(std::istream& in, char marker) {
    Json value;
    try {
        value = Json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw ExportError(std::string("malformed JSON: ") + e.what());
    }
    return fromJson(value, marker);
}

Document readJsonString(const std::string& text, char marker) {
    std::istringstream in(text);
    return readJson(in, marker);
}

} // namespace tiki
