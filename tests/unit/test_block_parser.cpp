#include <catch2/catch_test_macros.hpp>
#include "core/anchor_codec.hpp"
#include "core/block_parser.hpp"
#include "core/content_assembler.hpp"

using namespace folio;
using namespace folio::parser;

TEST_CASE("split_fragments splits on blank lines", "[parser]") {
    auto fragments = split_fragments("# Title\n\nFirst para\nstill first\n\n\n  Second  \n");

    REQUIRE(fragments.size() == 3);
    REQUIRE(fragments[0].text == "# Title");
    REQUIRE(fragments[1].text == "First para\nstill first");
    REQUIRE(fragments[2].text == "Second");
    REQUIRE(fragments[2].line_start == 34u);
    REQUIRE(fragments[2].offset == 36u);
}

TEST_CASE("split_fragments keeps fenced code whole", "[parser]") {
    auto fragments = split_fragments("```\nline one\n\nline two\n```\n\nAfter");

    REQUIRE(fragments.size() == 2);
    REQUIRE(fragments[0].text == "```\nline one\n\nline two\n```");
    REQUIRE(fragments[1].text == "After");
}

TEST_CASE("parse types blocks and numbers them from 1", "[parser]") {
    auto blocks = parse("# Book\n\nOpening words here.\n\n## Part\n\n- a\n- b", "proj");

    REQUIRE(blocks.size() == 4);
    REQUIRE(blocks[0].type == BlockType::Heading);
    REQUIRE(blocks[0].heading_level == 1);
    REQUIRE(blocks[0].text_content == "Book");
    REQUIRE(blocks[1].type == BlockType::Paragraph);
    REQUIRE(blocks[1].word_count == 3);
    REQUIRE(blocks[2].heading_level == 2);
    REQUIRE(blocks[3].type == BlockType::BulletList);

    for (size_t i = 0; i < blocks.size(); ++i) {
        REQUIRE(blocks[i].sort_order == static_cast<double>(i + 1));
        REQUIRE(blocks[i].project_id == "proj");
        REQUIRE(is_anchor_safe_id(blocks[i].id));
    }
}

TEST_CASE("parse flags the bibliography region", "[parser]") {
    auto blocks = parse("# Body\n\ntext\n\n# References\n\n[1] A paper.\n\n# Appendix", "p");

    REQUIRE_FALSE(blocks[1].is_bibliography);
    REQUIRE(blocks[2].is_bibliography);
    REQUIRE(blocks[3].is_bibliography);
    REQUIRE_FALSE(blocks[4].is_bibliography);
}

TEST_CASE("parse turns section breaks into pseudo-sections", "[parser]") {
    auto blocks = parse("# A\n\n<!-- ::break:: -->\n\nafter the break", "p");

    REQUIRE(blocks[1].type == BlockType::SectionBreak);
    REQUIRE(blocks[1].is_pseudo_section);
    REQUIRE(blocks[1].is_section_root());
    REQUIRE(blocks[1].word_count == 0);
}

TEST_CASE("parse restores identities from anchors", "[parser]") {
    const BlockId intro = generate_block_id();
    const BlockId methods = generate_block_id();
    const std::string clean = "# Intro\n\nBody.\n\n## Methods\n\nMore.";

    const std::vector<anchors::AnchorTarget> targets{{intro, 0, false}, {methods, 16, false}};
    auto extracted = anchors::extract(anchors::inject(clean, targets));
    auto blocks = parse(extracted.text, "p", extracted.anchors);

    REQUIRE(blocks.size() == 4);
    REQUIRE(blocks[0].id == intro);
    REQUIRE(blocks[2].id == methods);
    REQUIRE(blocks[1].id != intro);
    REQUIRE(blocks[3].id != methods);
}

TEST_CASE("a duplicated anchor only names the first block", "[parser]") {
    const BlockId id = generate_block_id();
    const auto anchor = anchors::make_anchor(id);
    auto extracted = anchors::extract(anchor + "# One\n\n" + anchor + "# Two");
    auto blocks = parse(extracted.text, "p", extracted.anchors);

    REQUIRE(blocks.size() == 2);
    REQUIRE(blocks[0].id == id);
    REQUIRE(blocks[1].id != id);
}

TEST_CASE("parse of assembled blocks reproduces the text", "[parser]") {
    const std::string text = "# Title\n\nOne.\n\n## Sub\n\n```\ncode\n\nmore\n```";
    auto blocks = parse(text, "p");
    REQUIRE(assemble(blocks).text == text);
}
