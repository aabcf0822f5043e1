#include "doc/AdfReader.hpp"

#include <climits>
#include <cmath>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using json = nlohmann::json;

namespace doc {

static std::string string_or(const json& j, const char* key, const std::string& def) {
    if (!j.is_object() || !j.contains(key)) return def;
    const json& v = j.at(key);
    if (!v.is_string()) return def;
    return v.get<std::string>();
}

static const json* attrs_of(const json& node) {
    if (!node.contains("attrs")) return nullptr;
    const json& a = node.at("attrs");
    return a.is_object() ? &a : nullptr;
}

static std::string attr_string(const json& node, const char* key) {
    const json* a = attrs_of(node);
    return a ? string_or(*a, key, "") : std::string();
}

static int attr_int(const json& node, const char* key, int def) {
    const json* a = attrs_of(node);
    if (!a || !a->contains(key)) return def;
    const json& v = a->at(key);
    // out-of-range or fractional values fall back to the default
    if (v.is_number_unsigned()) {
        const std::uint64_t u = v.get<std::uint64_t>();
        return u <= static_cast<std::uint64_t>(INT_MAX) ? static_cast<int>(u) : def;
    }
    if (v.is_number_integer()) {
        const std::int64_t i = v.get<std::int64_t>();
        return (i >= INT_MIN && i <= INT_MAX) ? static_cast<int>(i) : def;
    }
    if (v.is_number_float()) {
        const double d = v.get<double>();
        if (!std::isfinite(d) || d != std::trunc(d) || d < INT_MIN || d > INT_MAX) return def;
        return static_cast<int>(d);
    }
    return def;
}

static std::vector<Mark> read_marks(const json& node) {
    std::vector<Mark> marks;
    if (!node.contains("marks") || !node.at("marks").is_array()) return marks;

    for (const auto& m : node.at("marks")) {
        const std::string type = string_or(m, "type", "");
        if (type == "strong") {
            marks.push_back(mark(MarkKind::Bold));
        } else if (type == "em") {
            marks.push_back(mark(MarkKind::Italic));
        } else if (type == "code") {
            marks.push_back(mark(MarkKind::Code));
        } else if (type == "strike") {
            marks.push_back(mark(MarkKind::Strike));
        } else if (type == "link") {
            const std::string href = attr_string(m, "href");
            if (!href.empty()) marks.push_back(link_mark(href));
        }
        // underline, textColor, subsup, ...: no Markdown equivalent, dropped
    }
    return marks;
}

static Node read_node(const json& j);

static std::vector<Node> read_children(const json& node) {
    std::vector<Node> out;
    if (!node.contains("content")) return out;

    const json& content = node.at("content");
    if (!content.is_array()) {
        out.push_back(make_unknown("malformed_content"));
        return out;
    }

    out.reserve(content.size());
    for (const auto& c : content) out.push_back(read_node(c));
    return out;
}

static Node read_node(const json& j) {
    if (!j.is_object()) return make_unknown(j.type_name());

    const std::string type = string_or(j, "type", "");

    if (type == "text") {
        return make_text(string_or(j, "text", ""), read_marks(j));
    }
    if (type == "paragraph")   return make_block(NodeKind::Paragraph, read_children(j));
    if (type == "heading")     return make_heading(attr_int(j, "level", 1), read_children(j));
    if (type == "bulletList")  return make_block(NodeKind::BulletList, read_children(j));
    if (type == "orderedList") return make_block(NodeKind::OrderedList, read_children(j));
    if (type == "listItem")    return make_block(NodeKind::ListItem, read_children(j));
    if (type == "blockquote")  return make_block(NodeKind::Blockquote, read_children(j));
    if (type == "panel")       return make_block(NodeKind::Panel, read_children(j));
    if (type == "rule")        return make_block(NodeKind::Rule);
    if (type == "hardBreak")   return make_block(NodeKind::HardBreak);

    if (type == "codeBlock") {
        Node n = make_block(NodeKind::CodeBlock, read_children(j));
        const std::string lang = attr_string(j, "language");
        if (!lang.empty()) n.language = lang;
        return n;
    }
    if (type == "mention") {
        std::string label = attr_string(j, "text");
        if (label.empty()) label = attr_string(j, "id");
        return make_mention(std::move(label));
    }
    if (type == "emoji") {
        Node n = make_block(NodeKind::Emoji);
        n.text = attr_string(j, "text");
        if (n.text.empty()) n.text = attr_string(j, "shortName");
        return n;
    }
    if (type == "inlineCard" || type == "blockCard") {
        Node n = make_block(NodeKind::InlineCard);
        n.text = attr_string(j, "url");
        return n;
    }

    return make_unknown(type.empty() ? "untyped" : type);
}

Document read_adf(const json& adf) {
    Document d;

    if (adf.is_array()) {
        for (const auto& n : adf) d.blocks.push_back(read_node(n));
        return d;
    }
    if (adf.is_null()) return d;
    if (!adf.is_object()) {
        d.blocks.push_back(make_unknown(adf.type_name()));
        return d;
    }

    const std::string type = string_or(adf, "type", "doc");
    if (type != "doc") {
        // a bare node where a document was expected
        d.blocks.push_back(read_node(adf));
        return d;
    }

    d.blocks = read_children(adf);
    return d;
}

Document read_adf_string(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::parse_error&) {
        Document d;
        d.blocks.push_back(make_unknown("invalid_json"));
        return d;
    }
    return read_adf(j);
}

Document read_plain_text(const std::string& text) {
    Document d;

    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string::npos) end = text.size();
        std::string line = text.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
        start = end + 1;
    }

    Node para = make_block(NodeKind::Paragraph);
    auto flush = [&]() {
        if (!para.children.empty()) d.blocks.push_back(std::move(para));
        para = make_block(NodeKind::Paragraph);
    };

    for (const auto& line : lines) {
        if (line.find_first_not_of(" \t") == std::string::npos) {
            flush();
            continue;
        }
        if (!para.children.empty()) para.children.push_back(make_block(NodeKind::HardBreak));
        para.children.push_back(make_text(line));
    }
    flush();

    return d;
}

}  // namespace doc
