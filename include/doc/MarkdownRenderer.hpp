#pragma once

#include <string>
#include <vector>

#include "doc/Document.hpp"

namespace doc {

// What the renderer had to drop. Rendering itself never fails; callers use
// this to log the nodes that were replaced by an "unsupported" comment.
struct RenderReport {
    std::vector<std::string> unknown_kinds;   // in document order, repeats kept

    bool clean() const { return unknown_kinds.empty(); }
};

std::string render_markdown(const Document& document);
std::string render_markdown(const Document& document, RenderReport* report);

// Inline rendering of a single text node with its marks applied.
std::string render_text(const Node& text_node);

// Link pieces shared with other Markdown writers. Destinations with spaces,
// parentheses or angle brackets are wrapped in <...>.
std::string link_destination(const std::string& href);
std::string escape_link_label(const std::string& label);

}  // namespace doc
