#include <catch2/catch_test_macros.hpp>
#include "core/block.hpp"
#include "core/markdown.hpp"

using namespace folio;
using namespace folio::markdown;

TEST_CASE("heading_level_of recognizes ATX headings", "[markdown]") {
    REQUIRE(heading_level_of("# Title") == 1);
    REQUIRE(heading_level_of("### Deep\nbody") == 3);
    REQUIRE(heading_level_of("###### Six") == 6);

    REQUIRE_FALSE(heading_level_of("####### Seven").has_value());
    REQUIRE_FALSE(heading_level_of("#hashtag").has_value());
    REQUIRE_FALSE(heading_level_of("#").has_value());
    REQUIRE_FALSE(heading_level_of("Plain text").has_value());
}

TEST_CASE("with_heading_level rewrites the marker", "[markdown]") {
    REQUIRE(with_heading_level("### Methods", 2) == "## Methods");
    REQUIRE(with_heading_level("# Intro\nmore", 3) == "### Intro\nmore");
    REQUIRE(with_heading_level("Paragraph", 2) == "Paragraph");
    REQUIRE(with_heading_level("## Keep", 0) == "## Keep");
}

TEST_CASE("detect_block_type", "[markdown]") {
    REQUIRE(detect_block_type("## Heading") == BlockType::Heading);
    REQUIRE(detect_block_type("```cpp\nint x;\n```") == BlockType::CodeBlock);
    REQUIRE(detect_block_type("- one\n- two") == BlockType::BulletList);
    REQUIRE(detect_block_type("1. first") == BlockType::OrderedList);
    REQUIRE(detect_block_type("> quoted") == BlockType::Blockquote);
    REQUIRE(detect_block_type("---") == BlockType::HorizontalRule);
    REQUIRE(detect_block_type("| a | b |") == BlockType::Table);
    REQUIRE(detect_block_type("![alt](img.png)") == BlockType::Image);
    REQUIRE(detect_block_type(kSectionBreakMarker) == BlockType::SectionBreak);
    REQUIRE(detect_block_type("<!-- ::auto-bibliography:: -->") == BlockType::Bibliography);
    REQUIRE(detect_block_type("Just words.") == BlockType::Paragraph);
}

TEST_CASE("is_bibliography_heading", "[markdown]") {
    REQUIRE(is_bibliography_heading("# References"));
    REQUIRE(is_bibliography_heading("## Bibliography\n"));
    REQUIRE_FALSE(is_bibliography_heading("### References"));
    REQUIRE_FALSE(is_bibliography_heading("# Referees"));
}

TEST_CASE("strip_markdown_syntax removes markup", "[markdown]") {
    REQUIRE(strip_markdown_syntax("## A **bold** _move_") == "A bold move");
    REQUIRE(strip_markdown_syntax("See [the docs](http://x.y) now") == "See the docs now");
    REQUIRE(strip_markdown_syntax("![img](a.png)text") == "text");
    REQUIRE(strip_markdown_syntax("snake_case_name") == "snake_case_name");
    REQUIRE(strip_markdown_syntax("Note<!-- hidden --> here") == "Note here");
}

TEST_CASE("word_count counts plain words", "[markdown]") {
    REQUIRE(word_count("") == 0);
    REQUIRE(word_count("# Two words") == 2);
    REQUIRE(word_count("- one\n- two three") == 3);
    REQUIRE(word_count("A [link text](url) here[^1]") == 4);
    REQUIRE(word_count("---") == 0);
}

TEST_CASE("extract_text_content by type", "[markdown]") {
    REQUIRE(extract_text_content("## The Title", BlockType::Heading) == "The Title");
    REQUIRE(extract_text_content("```\ncode here\n```", BlockType::CodeBlock) == "code here");
    REQUIRE(extract_text_content("![A cat](cat.png)", BlockType::Image) == "A cat");
    REQUIRE(extract_text_content("---", BlockType::HorizontalRule).empty());
}

TEST_CASE("Block type and status names", "[markdown][blocks]") {
    REQUIRE(parse_block_type(type_name(BlockType::OrderedList)) == BlockType::OrderedList);
    REQUIRE(parse_block_type("list_item") == BlockType::BulletList);
    REQUIRE_FALSE(parse_block_type("widget").has_value());

    REQUIRE(parse_status("review") == SectionStatus::Review);
    REQUIRE(next_status(SectionStatus::Final) == SectionStatus::Next);
    REQUIRE(parse_goal_type("nonsense") == GoalType::Approx);
}
