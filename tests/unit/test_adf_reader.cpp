#include <catch2/catch.hpp>

#include "doc/AdfReader.hpp"
#include "doc/MarkdownRenderer.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace doc;

TEST_CASE("read_adf: paragraphs, headings and marks", "[unit][adf]") {
    const json adf = json::parse(R"({
        "type": "doc", "version": 1,
        "content": [
            {"type": "heading", "attrs": {"level": 2}, "content": [{"type": "text", "text": "Goal"}]},
            {"type": "paragraph", "content": [
                {"type": "text", "text": "ship ", "marks": []},
                {"type": "text", "text": "it", "marks": [{"type": "strong"}, {"type": "underline"}]},
                {"type": "text", "text": " now", "marks": [{"type": "link", "attrs": {"href": "https://x.io"}}]}
            ]}
        ]
    })");

    const Document d = read_adf(adf);
    REQUIRE(d.blocks.size() == 2);
    REQUIRE(d.blocks[0].kind == NodeKind::Heading);
    REQUIRE(d.blocks[0].level == 2);

    const Node& p = d.blocks[1];
    REQUIRE(p.children.size() == 3);
    REQUIRE(p.children[1].marks.size() == 1);   // underline has no Markdown form
    REQUIRE(p.children[1].marks[0].kind == MarkKind::Bold);
    REQUIRE(p.children[2].marks[0].href == "https://x.io");

    REQUIRE(render_markdown(d) == "## Goal\n\nship **it**[ now](https://x.io)\n");
}

TEST_CASE("read_adf: lists, code blocks and quotes", "[unit][adf]") {
    const json adf = json::parse(R"({
        "type": "doc",
        "content": [
            {"type": "orderedList", "content": [
                {"type": "listItem", "content": [{"type": "paragraph", "content": [{"type": "text", "text": "a"}]}]},
                {"type": "listItem", "content": [{"type": "paragraph", "content": [{"type": "text", "text": "b"}]}]}
            ]},
            {"type": "codeBlock", "attrs": {"language": "bash"}, "content": [{"type": "text", "text": "make"}]},
            {"type": "blockquote", "content": [{"type": "paragraph", "content": [{"type": "text", "text": "q"}]}]}
        ]
    })");

    REQUIRE(render_markdown(read_adf(adf)) == "1. a\n2. b\n\n```bash\nmake\n```\n\n> q\n");
}

TEST_CASE("read_adf: mentions, emoji and cards", "[unit][adf]") {
    const json adf = json::parse(R"({
        "type": "doc",
        "content": [{"type": "paragraph", "content": [
            {"type": "mention", "attrs": {"id": "abc", "text": "@Sam"}},
            {"type": "mention", "attrs": {"id": "xyz"}},
            {"type": "emoji", "attrs": {"shortName": ":smile:"}},
            {"type": "inlineCard", "attrs": {"url": "https://x.io/A-2"}}
        ]}]
    })");

    const Document d = read_adf(adf);
    const Node& p = d.blocks.at(0);
    REQUIRE(p.children.at(0).text == "@Sam");
    REQUIRE(p.children.at(1).text == "xyz");
    REQUIRE(p.children.at(2).text == ":smile:");
    REQUIRE(p.children.at(3).kind == NodeKind::InlineCard);
    REQUIRE(p.children.at(3).text == "https://x.io/A-2");
}

TEST_CASE("read_adf: unrecognised and malformed nodes become Unknown", "[unit][adf]") {
    const json adf = json::parse(R"({
        "type": "doc",
        "content": [
            {"type": "mediaSingle", "content": [{"type": "media"}]},
            {"no_type": true},
            42,
            {"type": "paragraph", "content": "not an array"}
        ]
    })");

    const Document d = read_adf(adf);
    REQUIRE(d.blocks.size() == 4);
    REQUIRE(d.blocks[0].kind == NodeKind::Unknown);
    REQUIRE(d.blocks[0].raw == "mediaSingle");
    REQUIRE(d.blocks[1].raw == "untyped");
    REQUIRE(d.blocks[2].raw == "number");
    REQUIRE(d.blocks[3].children.at(0).raw == "malformed_content");

    RenderReport report;
    render_markdown(d, &report);
    REQUIRE(report.unknown_kinds.size() == 4);
}

TEST_CASE("read_adf: heading levels outside int range fall back to 1", "[unit][adf]") {
    const json adf = json::parse(R"({
        "type": "doc",
        "content": [
            {"type": "heading", "attrs": {"level": 1e300}, "content": [{"type": "text", "text": "huge"}]},
            {"type": "heading", "attrs": {"level": 2.5}, "content": [{"type": "text", "text": "fraction"}]},
            {"type": "heading", "attrs": {"level": 3.0}, "content": [{"type": "text", "text": "whole"}]},
            {"type": "heading", "attrs": {"level": 10000000000}, "content": [{"type": "text", "text": "big"}]},
            {"type": "heading", "attrs": {"level": 18446744073709551615}, "content": [{"type": "text", "text": "max"}]},
            {"type": "heading", "attrs": {"level": "2"}, "content": [{"type": "text", "text": "string"}]}
        ]
    })");

    const Document d = read_adf(adf);
    REQUIRE(d.blocks.size() == 6);
    REQUIRE(d.blocks[0].level == 1);
    REQUIRE(d.blocks[1].level == 1);
    REQUIRE(d.blocks[2].level == 3);
    REQUIRE(d.blocks[3].level == 1);
    REQUIRE(d.blocks[4].level == 1);
    REQUIRE(d.blocks[5].level == 1);

    REQUIRE(render_markdown(d) == "# huge\n\n# fraction\n\n### whole\n\n# big\n\n# max\n\n# string\n");
}

TEST_CASE("read_adf: null is an empty document", "[unit][adf]") {
    REQUIRE(read_adf(json()).empty());
}

TEST_CASE("read_adf_string: invalid JSON does not throw", "[unit][adf]") {
    const Document d = read_adf_string("{not json");
    REQUIRE(d.blocks.size() == 1);
    REQUIRE(d.blocks[0].raw == "invalid_json");
}

TEST_CASE("read_plain_text: blank lines split paragraphs", "[unit][adf]") {
    const Document d = read_plain_text("line one\r\nline two\n\n\nsecond para\n");
    REQUIRE(d.blocks.size() == 2);
    REQUIRE(render_markdown(d) == "line one\\\nline two\n\nsecond para\n");
}

TEST_CASE("read_plain_text: whitespace only is empty", "[unit][adf]") {
    REQUIRE(read_plain_text(" \n\t\n").empty());
}
