#include "doc/Document.hpp"

#include <utility>

namespace doc {

bool is_inline(NodeKind kind) {
    switch (kind) {
        case NodeKind::Text:
        case NodeKind::HardBreak:
        case NodeKind::Mention:
        case NodeKind::Emoji:
        case NodeKind::InlineCard:
            return true;
        default:
            return false;
    }
}

const char* kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Paragraph:   return "paragraph";
        case NodeKind::Heading:     return "heading";
        case NodeKind::BulletList:  return "bulletList";
        case NodeKind::OrderedList: return "orderedList";
        case NodeKind::ListItem:    return "listItem";
        case NodeKind::CodeBlock:   return "codeBlock";
        case NodeKind::Blockquote:  return "blockquote";
        case NodeKind::Panel:       return "panel";
        case NodeKind::Rule:        return "rule";
        case NodeKind::HardBreak:   return "hardBreak";
        case NodeKind::Text:        return "text";
        case NodeKind::Mention:     return "mention";
        case NodeKind::Emoji:       return "emoji";
        case NodeKind::InlineCard:  return "inlineCard";
        default:                    return "unknown";
    }
}

Node make_text(std::string content, std::vector<Mark> marks) {
    Node n;
    n.kind = NodeKind::Text;
    n.text = std::move(content);
    n.marks = std::move(marks);
    return n;
}

Node make_block(NodeKind kind, std::vector<Node> children) {
    Node n;
    n.kind = kind;
    n.children = std::move(children);
    return n;
}

Node make_heading(int level, std::vector<Node> children) {
    Node n = make_block(NodeKind::Heading, std::move(children));
    n.level = level;
    return n;
}

Node make_code_block(std::string content, std::optional<std::string> language) {
    Node n;
    n.kind = NodeKind::CodeBlock;
    n.language = std::move(language);
    if (!content.empty()) n.children.push_back(make_text(std::move(content)));
    return n;
}

Node make_mention(std::string label) {
    Node n;
    n.kind = NodeKind::Mention;
    n.text = std::move(label);
    return n;
}

Node make_unknown(std::string raw) {
    Node n;
    n.kind = NodeKind::Unknown;
    n.raw = std::move(raw);
    return n;
}

Mark mark(MarkKind kind) {
    Mark m;
    m.kind = kind;
    return m;
}

Mark link_mark(std::string href) {
    Mark m;
    m.kind = MarkKind::Link;
    m.href = std::move(href);
    return m;
}

}  // namespace doc
