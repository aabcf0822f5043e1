#include "doc/MarkdownRenderer.hpp"

#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

namespace doc {

static const char* HARD_BREAK = "\\\n";

static std::string render_blocks(const std::vector<Node>& nodes, RenderReport* report);
static std::string render_block(const Node& node, RenderReport* report);
static std::string render_list(const Node& list, size_t depth, RenderReport* report);

static void note_unknown(RenderReport* report, const std::string& raw) {
    if (report) report->unknown_kinds.push_back(raw.empty() ? "untyped" : raw);
}

static std::string unknown_comment(const std::string& raw) {
    // keep the comment well-formed whatever the tracker sent as a type name
    std::string safe;
    safe.reserve(raw.size());
    for (unsigned char c : raw) {
        if (std::isalnum(c) || c == '_' || c == '.' || c == ':') safe.push_back(static_cast<char>(c));
    }
    if (safe.empty()) safe = "untyped";
    return "<!-- unsupported: " + safe + " -->";
}

static size_t longest_backtick_run(const std::string& s) {
    size_t best = 0;
    size_t cur = 0;
    for (char c : s) {
        if (c == '`') {
            ++cur;
            best = std::max(best, cur);
        } else {
            cur = 0;
        }
    }
    return best;
}

// Plain text must never open a fence: runs of three or more ` or ~ are escaped.
static std::string escape_fence_runs(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    size_t i = 0;
    while (i < s.size()) {
        const char c = s[i];
        if (c != '`' && c != '~') {
            out.push_back(c);
            ++i;
            continue;
        }
        size_t j = i;
        while (j < s.size() && s[j] == c) ++j;
        const size_t run = j - i;
        for (size_t k = 0; k < run; ++k) {
            if (run >= 3) out.push_back('\\');
            out.push_back(c);
        }
        i = j;
    }
    return out;
}

// A line starting with ``` or ~~~ opens a fence. Backtick runs only do so
// when no other backtick follows on the line.
static bool opens_fence(const std::string& line, size_t first) {
    const char c = line[first];
    if (c != '`' && c != '~') return false;

    size_t end = first;
    while (end < line.size() && line[end] == c) ++end;
    if (end - first < 3) return false;
    return c == '~' || line.find('`', end) == std::string::npos;
}

// Runs on joined inline output, after marks: delimiters and neighbouring
// nodes can build a fence opener that no single text node contains.
static std::string guard_line_starts(const std::string& s) {
    std::string out;
    out.reserve(s.size() + 2);
    size_t start = 0;
    while (start < s.size()) {
        size_t end = s.find('\n', start);
        if (end == std::string::npos) end = s.size();
        const std::string line = s.substr(start, end - start);

        const size_t first = line.find_first_not_of(' ');
        if (first != std::string::npos && opens_fence(line, first)) {
            out.append(line, 0, first);
            out += '\\';
            out.append(line, first, std::string::npos);
        } else {
            out += line;
        }
        if (end < s.size()) out += '\n';
        start = end + 1;
    }
    return out;
}

// Code spans stay on one line; CommonMark reads a line ending inside one as a space.
static std::string fold_line_endings(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '\r') {
            if (i + 1 < s.size() && s[i + 1] == '\n') continue;
            out += ' ';
        } else {
            out += s[i] == '\n' ? ' ' : s[i];
        }
    }
    return out;
}

static std::string code_span(const std::string& raw) {
    const std::string s = fold_line_endings(raw);
    const std::string fence(longest_backtick_run(s) + 1, '`');
    const bool pad = s.front() == '`' || s.back() == '`';
    if (pad) return fence + " " + s + " " + fence;
    return fence + s + fence;
}

// "**x **" is not emphasis in CommonMark, so surrounding whitespace stays outside.
static std::string wrap_emphasis(const std::string& s, const std::string& delim) {
    size_t a = 0;
    while (a < s.size() && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    size_t b = s.size();
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;

    if (a == b) return s;
    return s.substr(0, a) + delim + s.substr(a, b - a) + delim + s.substr(b);
}

std::string link_destination(const std::string& href) {
    const bool needs_angle = href.find_first_of(" ()<>") != std::string::npos;
    if (!needs_angle) return href;

    std::string out = "<";
    for (char c : href) {
        switch (c) {
            case '<': out += "%3C"; break;
            case '>': out += "%3E"; break;
            default:  out += c;     break;
        }
    }
    out += ">";
    return out;
}

std::string escape_link_label(const std::string& label) {
    std::string out;
    out.reserve(label.size());
    for (char c : label) {
        if (c == '[' || c == ']' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

std::string render_text(const Node& text_node) {
    if (text_node.text.empty()) return "";

    bool bold = false;
    bool italic = false;
    bool code = false;
    bool strike = false;
    const Mark* link = nullptr;

    for (const auto& m : text_node.marks) {
        switch (m.kind) {
            case MarkKind::Bold:   bold = true;   break;
            case MarkKind::Italic: italic = true; break;
            case MarkKind::Code:   code = true;   break;
            case MarkKind::Strike: strike = true; break;
            case MarkKind::Link:
                if (!link && !m.href.empty()) link = &m;
                break;
        }
    }

    // innermost first: code, strike, italic, bold, then the link around everything
    std::string s = code ? code_span(text_node.text) : escape_fence_runs(text_node.text);
    if (strike) s = wrap_emphasis(s, "~~");
    if (italic) s = wrap_emphasis(s, "_");
    if (bold)   s = wrap_emphasis(s, "**");
    if (link)   s = "[" + s + "](" + link_destination(link->href) + ")";
    return s;
}

static void collect_code_text(const Node& node, std::string& out) {
    if (node.kind == NodeKind::Text) {
        out += node.text;
        return;
    }
    if (node.kind == NodeKind::HardBreak) {
        out += "\n";
        return;
    }
    for (const auto& c : node.children) collect_code_text(c, out);
}

static std::string render_inline(const std::vector<Node>& nodes, const std::string& hard_break,
                                 RenderReport* report) {
    std::string out;
    for (const auto& n : nodes) {
        switch (n.kind) {
            case NodeKind::Text:
                out += render_text(n);
                break;
            case NodeKind::HardBreak:
                out += hard_break;
                break;
            case NodeKind::Mention:
                if (!n.text.empty()) out += "**" + escape_fence_runs(n.text) + "**";
                break;
            case NodeKind::Emoji:
                out += escape_fence_runs(n.text);
                break;
            case NodeKind::InlineCard:
                if (!n.text.empty()) out += "[" + escape_link_label(n.text) + "](" + link_destination(n.text) + ")";
                break;
            case NodeKind::CodeBlock: {
                std::string code;
                collect_code_text(n, code);
                if (!code.empty()) out += code_span(code);
                break;
            }
            case NodeKind::Rule:
                break;
            case NodeKind::Unknown:
                note_unknown(report, n.raw);
                out += unknown_comment(n.raw);
                break;
            default:
                // block node where only inline content is allowed: keep its text
                out += render_inline(n.children, hard_break, report);
                break;
        }
    }
    return guard_line_starts(out);
}

static std::string prefix_lines(const std::string& s, const std::string& prefix, const std::string& blank_prefix) {
    std::string out;
    size_t start = 0;
    while (start < s.size()) {
        size_t end = s.find('\n', start);
        if (end == std::string::npos) end = s.size();
        const std::string line = s.substr(start, end - start);
        out += line.empty() ? blank_prefix : prefix + line;
        out += "\n";
        start = end + 1;
    }
    return out;
}

static std::string render_code_block(const Node& node) {
    std::string content;
    collect_code_text(node, content);

    const std::string fence(std::max<size_t>(3, longest_backtick_run(content) + 1), '`');

    std::string lang;
    if (node.language) {
        for (char c : *node.language) {
            if (std::isspace(static_cast<unsigned char>(c))) {
                if (lang.empty()) continue;
                break;
            }
            if (c != '`') lang.push_back(c);
        }
    }

    std::string out = fence + lang + "\n";
    if (!content.empty()) {
        out += content;
        if (content.back() != '\n') out += "\n";
    }
    out += fence + "\n";
    return out;
}

static std::string render_quote(const Node& node, RenderReport* report) {
    const std::string inner = render_blocks(node.children, report);
    if (inner.empty()) return ">\n";
    return prefix_lines(inner, "> ", ">");
}

static bool is_list(NodeKind kind) {
    return kind == NodeKind::BulletList || kind == NodeKind::OrderedList;
}

static std::string render_list_item(const Node& item, const std::string& bullet, size_t depth,
                                    RenderReport* report) {
    const std::string indent(depth * 2, ' ');
    const std::string nested_indent = indent + "  ";
    const std::string hard_break = std::string(HARD_BREAK) + nested_indent;

    std::vector<Node> wrapped;
    if (item.kind != NodeKind::ListItem) wrapped.push_back(item);
    const std::vector<Node>& children = item.kind == NodeKind::ListItem ? item.children : wrapped;

    std::string line;
    std::string tail;
    std::vector<Node> pending;

    auto add_piece = [&](const std::string& piece, bool separate) {
        if (piece.empty()) return;
        if (tail.empty()) {
            if (separate && !line.empty()) line += " ";
            line += piece;
        } else {
            // without the blank line it would continue the nested item's paragraph
            tail += "\n" + prefix_lines(piece + "\n", nested_indent, "");
        }
    };

    auto flush_pending = [&]() {
        if (pending.empty()) return;
        add_piece(render_inline(pending, hard_break, report), false);
        pending.clear();
    };

    for (const auto& c : children) {
        if (is_inline(c.kind) || c.kind == NodeKind::Unknown) {
            pending.push_back(c);
            continue;
        }
        flush_pending();

        if (c.kind == NodeKind::Paragraph) {
            add_piece(render_inline(c.children, hard_break, report), true);
        } else if (is_list(c.kind)) {
            tail += render_list(c, depth + 1, report);
        } else {
            tail += prefix_lines(render_block(c, report), nested_indent, "");
        }
    }
    flush_pending();

    std::string out = indent + bullet;
    if (!line.empty()) out += " " + line;
    out += "\n";
    out += tail;
    return out;
}

static std::string render_list(const Node& list, size_t depth, RenderReport* report) {
    const bool ordered = list.kind == NodeKind::OrderedList;
    std::string out;
    size_t n = 1;
    for (const auto& item : list.children) {
        const std::string bullet = ordered ? std::to_string(n++) + "." : "-";
        out += render_list_item(item, bullet, depth, report);
    }
    return out;
}

static std::string render_block(const Node& node, RenderReport* report) {
    switch (node.kind) {
        case NodeKind::Paragraph: {
            const std::string body = render_inline(node.children, HARD_BREAK, report);
            if (body.empty()) return "";
            return body + "\n";
        }
        case NodeKind::Heading: {
            const int level = std::min(6, std::max(1, node.level));
            const std::string hashes(static_cast<size_t>(level), '#');
            const std::string body = render_inline(node.children, " ", report);
            if (body.empty()) return hashes + "\n";
            return hashes + " " + body + "\n";
        }
        case NodeKind::BulletList:
        case NodeKind::OrderedList:
            return render_list(node, 0, report);
        case NodeKind::ListItem:
            return render_list_item(node, "-", 0, report);
        case NodeKind::CodeBlock:
            return render_code_block(node);
        case NodeKind::Blockquote:
        case NodeKind::Panel:
            return render_quote(node, report);
        case NodeKind::Rule:
            return "***\n";
        case NodeKind::Unknown:
            note_unknown(report, node.raw);
            return unknown_comment(node.raw) + "\n";
        default: {
            const std::string body = render_inline({node}, HARD_BREAK, report);
            if (body.empty()) return "";
            return body + "\n";
        }
    }
}

// Blocks are separated by one blank line; runs of inline nodes sitting at
// block level are rendered as one implicit paragraph.
static std::string render_blocks(const std::vector<Node>& nodes, RenderReport* report) {
    std::vector<std::string> parts;
    std::vector<Node> pending;

    auto flush_pending = [&]() {
        if (pending.empty()) return;
        const std::string body = render_inline(pending, HARD_BREAK, report);
        if (!body.empty()) parts.push_back(body + "\n");
        pending.clear();
    };

    for (const auto& n : nodes) {
        if (is_inline(n.kind)) {
            pending.push_back(n);
            continue;
        }
        flush_pending();
        std::string block = render_block(n, report);
        if (!block.empty()) parts.push_back(std::move(block));
    }
    flush_pending();

    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += "\n";
        out += parts[i];
    }
    return out;
}

std::string render_markdown(const Document& document) {
    return render_blocks(document.blocks, nullptr);
}

std::string render_markdown(const Document& document, RenderReport* report) {
    return render_blocks(document.blocks, report);
}

}  // namespace doc
