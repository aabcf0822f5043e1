#include <catch2/catch.hpp>

#include "doc/Document.hpp"

using namespace doc;

TEST_CASE("is_inline: only leaf-like content counts as inline", "[unit][doc]") {
    REQUIRE(is_inline(NodeKind::Text));
    REQUIRE(is_inline(NodeKind::HardBreak));
    REQUIRE(is_inline(NodeKind::Mention));
    REQUIRE(is_inline(NodeKind::Emoji));
    REQUIRE(is_inline(NodeKind::InlineCard));

    REQUIRE_FALSE(is_inline(NodeKind::Paragraph));
    REQUIRE_FALSE(is_inline(NodeKind::BulletList));
    REQUIRE_FALSE(is_inline(NodeKind::CodeBlock));
    REQUIRE_FALSE(is_inline(NodeKind::Unknown));
}

TEST_CASE("kind_name: uses the tracker's node type names", "[unit][doc]") {
    REQUIRE(std::string(kind_name(NodeKind::BulletList)) == "bulletList");
    REQUIRE(std::string(kind_name(NodeKind::HardBreak)) == "hardBreak");
    REQUIRE(std::string(kind_name(NodeKind::Unknown)) == "unknown");
}

TEST_CASE("make_code_block: empty content has no children", "[unit][doc]") {
    const Node empty = make_code_block("");
    REQUIRE(empty.kind == NodeKind::CodeBlock);
    REQUIRE(empty.children.empty());
    REQUIRE_FALSE(empty.language.has_value());

    const Node code = make_code_block("x = 1", std::string("python"));
    REQUIRE(code.children.size() == 1);
    REQUIRE(code.children[0].text == "x = 1");
    REQUIRE(code.language.value() == "python");
}

TEST_CASE("make_unknown keeps the raw type name", "[unit][doc]") {
    const Node n = make_unknown("mediaSingle");
    REQUIRE(n.kind == NodeKind::Unknown);
    REQUIRE(n.raw == "mediaSingle");
}
