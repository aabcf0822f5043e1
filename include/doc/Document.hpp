#pragma once

#include <optional>
#include <string>
#include <vector>

namespace doc {

// Unknown is the catch-all: anything the reader does not recognise (or
// cannot make sense of) ends up here instead of failing the sync.
enum class NodeKind {
    Paragraph,
    Heading,
    BulletList,
    OrderedList,
    ListItem,
    CodeBlock,
    Blockquote,
    Panel,
    Rule,
    HardBreak,
    Text,
    Mention,
    Emoji,
    InlineCard,
    Unknown,
};

enum class MarkKind { Bold, Italic, Code, Strike, Link };

struct Mark {
    MarkKind kind = MarkKind::Bold;
    std::string href;                     // Link only
};

struct Node {
    NodeKind kind = NodeKind::Unknown;
    int level = 0;                        // Heading
    std::optional<std::string> language;  // CodeBlock
    std::string text;                     // Text content, Mention label, Emoji text, InlineCard url
    std::string raw;                      // Unknown: the original node type
    std::vector<Mark> marks;              // Text
    std::vector<Node> children;
};

struct Document {
    std::vector<Node> blocks;

    bool empty() const { return blocks.empty(); }
};

bool is_inline(NodeKind kind);
const char* kind_name(NodeKind kind);

Node make_text(std::string content, std::vector<Mark> marks = {});
Node make_block(NodeKind kind, std::vector<Node> children = {});
Node make_heading(int level, std::vector<Node> children);
Node make_code_block(std::string content, std::optional<std::string> language = std::nullopt);
Node make_mention(std::string label);
Node make_unknown(std::string raw);

Mark mark(MarkKind kind);
Mark link_mark(std::string href);

}  // namespace doc
