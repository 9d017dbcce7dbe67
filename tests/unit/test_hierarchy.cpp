#include <catch2/catch_test_macros.hpp>
#include "core/hierarchy.hpp"

using namespace folio;
using namespace folio::hierarchy;

namespace {

Section section(const std::string& id, int level) {
    Section s;
    s.id = id;
    s.header_level = level;
    s.title = id;
    s.markdown = std::string(static_cast<size_t>(level), '#') + " " + id;
    return s;
}

Section pseudo(const std::string& id, int level) {
    Section s;
    s.id = id;
    s.header_level = level;
    s.markdown = "<!-- ::break:: -->";
    s.is_pseudo_section = true;
    return s;
}

std::vector<int> levels(const SectionList& sections) {
    std::vector<int> out;
    for (const auto& s : sections) out.push_back(s.header_level);
    return out;
}

} // namespace

TEST_CASE("enforce caps a skipped level", "[hierarchy]") {
    auto result = enforce({section("A", 1), section("B", 3)});

    REQUIRE(levels(result.sections) == std::vector<int>{1, 2});
    REQUIRE(result.sections[1].markdown == "## B");
    REQUIRE(result.converged);
    REQUIRE(result.changed);
}

TEST_CASE("enforce forces the first section to level 1", "[hierarchy]") {
    auto result = enforce({section("A", 3), section("B", 4), section("C", 2)});
    REQUIRE(levels(result.sections) == std::vector<int>{1, 2, 2});
}

TEST_CASE("enforce leaves a valid outline alone", "[hierarchy]") {
    SectionList valid{section("A", 1), section("B", 2), section("C", 3), section("D", 1), section("E", 2)};
    auto result = enforce(valid);

    REQUIRE(result.sections == valid);
    REQUIRE_FALSE(result.changed);
    REQUIRE(result.passes == 1);
}

TEST_CASE("enforce validates against the corrected predecessor", "[hierarchy]") {
    // 1, 4, 5: the 5 is checked against the already-fixed 2, not the original 4.
    auto result = enforce({section("A", 1), section("B", 4), section("C", 5)});
    REQUIRE(levels(result.sections) == std::vector<int>{1, 2, 3});
}

TEST_CASE("pseudo-sections follow their predecessor", "[hierarchy]") {
    auto result = enforce({section("A", 1), section("B", 2), pseudo("P", 1)});
    REQUIRE(levels(result.sections) == std::vector<int>{1, 2, 2});
    REQUIRE(result.sections[2].markdown == "<!-- ::break:: -->");
}

TEST_CASE("enforce of an empty list", "[hierarchy]") {
    auto result = enforce({});
    REQUIRE(result.sections.empty());
    REQUIRE(result.converged);
}

TEST_CASE("max_passes_for scales with the section count", "[hierarchy]") {
    REQUIRE(max_passes_for(0) == 10);
    REQUIRE(max_passes_for(9) == 10);
    REQUIRE(max_passes_for(30) == 31);
}

TEST_CASE("has_violations", "[hierarchy]") {
    REQUIRE_FALSE(has_violations({}));
    REQUIRE_FALSE(has_violations({section("A", 1), section("B", 2), section("C", 1)}));
    REQUIRE(has_violations({section("A", 2)}));
    REQUIRE(has_violations({section("A", 1), section("B", 3)}));
    REQUIRE(has_violations({section("A", 1), section("B", 2), pseudo("P", 1)}));
}

TEST_CASE("recalculate_parents uses the nearest shallower section", "[hierarchy]") {
    SectionList list{section("A", 1), section("B", 2), section("C", 3), section("D", 2), section("E", 1)};
    recalculate_parents(list);

    REQUIRE_FALSE(list[0].parent_id.has_value());
    REQUIRE(list[1].parent_id == "A");
    REQUIRE(list[2].parent_id == "B");
    REQUIRE(list[3].parent_id == "A");
    REQUIRE_FALSE(list[4].parent_id.has_value());
}
