#include <catch2/catch_test_macros.hpp>
#include "core/content_assembler.hpp"

using namespace folio;

namespace {

Block block(const std::string& id, double order, const std::string& fragment,
            BlockType type = BlockType::Paragraph) {
    Block b;
    b.id = id;
    b.sort_order = order;
    b.type = type;
    b.markdown_fragment = fragment;
    if (type == BlockType::Heading) b.heading_level = 1;
    return b;
}

} // namespace

TEST_CASE("assemble joins fragments with a blank line", "[assembler]") {
    auto doc = assemble({
        block("h", 1, "# Title", BlockType::Heading),
        block("p", 2, "Body text."),
        block("q", 3, "More."),
    });

    REQUIRE(doc.text == "# Title\n\nBody text.\n\nMore.");
    REQUIRE(doc.order == std::vector<BlockId>{"h", "p", "q"});
    REQUIRE(doc.offset_of("h") == 0u);
    REQUIRE(doc.offset_of("p") == 9u);
    REQUIRE(doc.offset_of("q") == 21u);
    REQUIRE_FALSE(doc.offset_of("missing").has_value());
}

TEST_CASE("assemble sorts by sort order regardless of input order", "[assembler]") {
    auto doc = assemble({
        block("c", 3.0, "C"),
        block("a", 1.0, "A"),
        block("b", 2.5, "B"),
    });
    REQUIRE(doc.text == "A\n\nB\n\nC");
}

TEST_CASE("assemble puts a heading first on a sort order tie", "[assembler]") {
    auto doc = assemble({
        block("p", 2.0, "para"),
        block("h", 2.0, "## Head", BlockType::Heading),
    });
    REQUIRE(doc.order.front() == "h");
    REQUIRE(doc.text == "## Head\n\npara");
}

TEST_CASE("assemble of nothing is empty", "[assembler]") {
    auto doc = assemble({});
    REQUIRE(doc.text.empty());
    REQUIRE(doc.offsets.empty());
}

TEST_CASE("assemble counts offsets in bytes", "[assembler]") {
    auto doc = assemble({
        block("a", 1, "Caf\xC3\xA9"),
        block("b", 2, "next"),
    });
    REQUIRE(doc.offset_of("b") == 7u);
}
