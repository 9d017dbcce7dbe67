#include <catch2/catch_test_macros.hpp>
#include "core/hierarchy.hpp"
#include "core/reorder.hpp"

using namespace folio;
using namespace folio::reorder;

namespace {

Section section(const std::string& id, int level) {
    Section s;
    s.id = id;
    s.header_level = level;
    s.title = id;
    s.markdown = std::string(static_cast<size_t>(level), '#') + " " + id;
    return s;
}

SectionList outline(std::initializer_list<std::pair<const char*, int>> entries) {
    SectionList list;
    for (const auto& [id, level] : entries) list.push_back(section(id, level));
    hierarchy::recalculate_parents(list);
    return list;
}

std::vector<BlockId> ids(const SectionList& sections) {
    std::vector<BlockId> out;
    for (const auto& s : sections) out.push_back(s.id);
    return out;
}

std::vector<int> levels(const SectionList& sections) {
    std::vector<int> out;
    for (const auto& s : sections) out.push_back(s.header_level);
    return out;
}

ReorderRequest drop(const std::string& id, std::optional<BlockId> after, int level = 0) {
    ReorderRequest r;
    r.section_id = id;
    r.target_section_id = std::move(after);
    r.new_level = level;
    return r;
}

} // namespace

TEST_CASE("dropping a section onto itself is rejected", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 2}});
    auto result = plan_reorder(sections, drop("A", BlockId{"A"}));

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidRequest);
}

TEST_CASE("a section cannot become its own parent", "[reorder]") {
    auto request = drop("A", std::nullopt);
    request.new_parent_id = "A";
    REQUIRE(validate(request).is_err());
}

TEST_CASE("moving a top-level section up keeps the outline valid", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 2}, {"C", 3}, {"D", 1}});
    auto plan = plan_reorder(sections, drop("D", BlockId{"A"})).unwrap();

    REQUIRE(ids(plan.sections) == std::vector<BlockId>{"A", "D", "B", "C"});
    REQUIRE(levels(plan.sections) == std::vector<int>{1, 1, 2, 3});
    REQUIRE(plan.converged);
    REQUIRE(plan.promoted_ids.empty());
}

TEST_CASE("children left behind by a moved parent are promoted", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 2}, {"C", 3}, {"D", 1}});
    auto plan = plan_reorder(sections, drop("A", BlockId{"D"})).unwrap();

    REQUIRE(ids(plan.sections) == std::vector<BlockId>{"B", "C", "D", "A"});
    REQUIRE(levels(plan.sections) == std::vector<int>{1, 2, 1, 1});
    REQUIRE(plan.promoted_ids == std::vector<BlockId>{"B"});
    REQUIRE(plan.sections[0].markdown == "# B");
}

TEST_CASE("a move can change the level", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 1}, {"C", 1}});
    auto plan = plan_reorder(sections, drop("C", BlockId{"A"}, 2)).unwrap();

    REQUIRE(ids(plan.sections) == std::vector<BlockId>{"A", "C", "B"});
    REQUIRE(levels(plan.sections) == std::vector<int>{1, 2, 1});
    REQUIRE(plan.sections[1].parent_id == "A");
    REQUIRE(plan.sections[1].markdown == "## C");
}

TEST_CASE("moving to the start without a target", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 1}});
    auto plan = plan_reorder(sections, drop("B", std::nullopt)).unwrap();
    REQUIRE(ids(plan.sections) == std::vector<BlockId>{"B", "A"});
}

TEST_CASE("an over-deep move is corrected by enforcement", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 1}});
    auto plan = plan_reorder(sections, drop("B", BlockId{"A"}, 4)).unwrap();
    REQUIRE(levels(plan.sections) == std::vector<int>{1, 2});
}

TEST_CASE("a vanished drop target reports a missing section", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 1}});
    auto result = plan_reorder(sections, drop("A", BlockId{"Z"}));
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::SectionMissing);
}

TEST_CASE("subtree moves carry descendants and shift levels", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 2}, {"C", 3}, {"D", 1}, {"E", 2}});

    ReorderRequest request = drop("B", BlockId{"E"}, 3);
    request.is_subtree_drag = true;
    request.child_ids = {"C"};

    auto plan = plan_reorder(sections, request).unwrap();
    REQUIRE(ids(plan.sections) == std::vector<BlockId>{"A", "D", "E", "B", "C"});
    REQUIRE(levels(plan.sections) == std::vector<int>{1, 1, 2, 3, 4});
    REQUIRE(plan.sections[3].parent_id == "E");
    REQUIRE(plan.sections[4].parent_id == "B");
}

TEST_CASE("a subtree cannot be dropped inside itself", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 2}, {"C", 3}});

    ReorderRequest request = drop("A", BlockId{"C"});
    request.is_subtree_drag = true;
    request.child_ids = {"B", "C"};

    auto result = plan_reorder(sections, request);
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::InvalidRequest);
}

TEST_CASE("a subtree moved to the start shifts every member", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 2}, {"C", 3}});

    ReorderRequest request = drop("B", std::nullopt, 1);
    request.is_subtree_drag = true;
    request.child_ids = {"C"};

    auto moved = move_subtree(sections, request).unwrap();
    REQUIRE(ids(moved) == std::vector<BlockId>{"B", "C", "A"});
    REQUIRE(levels(moved) == std::vector<int>{1, 2, 1});
}

TEST_CASE("renumber assigns index order and offsets", "[reorder]") {
    auto sections = outline({{"A", 1}, {"B", 2}});
    sections[0].sort_order = 7.5;
    renumber(sections);

    REQUIRE(sections[0].sort_order == 0.0);
    REQUIRE(sections[1].sort_order == 1.0);
    REQUIRE(sections[0].start_offset == 0u);
    REQUIRE(sections[1].start_offset == sections[0].markdown.size() + 2);
}
