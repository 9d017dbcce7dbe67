#include "core/block.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace folio {

namespace {

constexpr std::array<std::pair<BlockType, std::string_view>, 11> kTypeNames = {{
    {BlockType::Paragraph, "paragraph"},
    {BlockType::Heading, "heading"},
    {BlockType::BulletList, "bullet_list"},
    {BlockType::OrderedList, "ordered_list"},
    {BlockType::Blockquote, "blockquote"},
    {BlockType::CodeBlock, "code_block"},
    {BlockType::HorizontalRule, "horizontal_rule"},
    {BlockType::SectionBreak, "section_break"},
    {BlockType::Bibliography, "bibliography"},
    {BlockType::Table, "table"},
    {BlockType::Image, "image"},
}};

constexpr std::array<std::pair<SectionStatus, std::string_view>, 5> kStatusNames = {{
    {SectionStatus::Next, "next"},
    {SectionStatus::Writing, "writing"},
    {SectionStatus::Waiting, "waiting"},
    {SectionStatus::Review, "review"},
    {SectionStatus::Final, "final"},
}};

} // anonymous namespace

std::string_view type_name(BlockType type) noexcept {
    for (const auto& [t, name] : kTypeNames) {
        if (t == type) return name;
    }
    return "paragraph";
}

std::optional<BlockType> parse_block_type(std::string_view name) noexcept {
    for (const auto& [t, n] : kTypeNames) {
        if (n == name) return t;
    }
    // Older rows used list_item for single list entries
    if (name == "list_item") return BlockType::BulletList;
    return std::nullopt;
}

std::string_view status_name(SectionStatus status) noexcept {
    for (const auto& [s, name] : kStatusNames) {
        if (s == status) return name;
    }
    return "next";
}

std::optional<SectionStatus> parse_status(std::string_view name) noexcept {
    for (const auto& [s, n] : kStatusNames) {
        if (n == name) return s;
    }
    return std::nullopt;
}

SectionStatus next_status(SectionStatus status) noexcept {
    switch (status) {
        case SectionStatus::Next: return SectionStatus::Writing;
        case SectionStatus::Writing: return SectionStatus::Waiting;
        case SectionStatus::Waiting: return SectionStatus::Review;
        case SectionStatus::Review: return SectionStatus::Final;
        case SectionStatus::Final: return SectionStatus::Next;
    }
    return SectionStatus::Next;
}

std::string_view goal_type_name(GoalType type) noexcept {
    switch (type) {
        case GoalType::Approx: return "approx";
        case GoalType::Min: return "min";
        case GoalType::Max: return "max";
    }
    return "approx";
}

GoalType parse_goal_type(std::string_view name) noexcept {
    if (name == "min") return GoalType::Min;
    if (name == "max") return GoalType::Max;
    return GoalType::Approx;
}

void sort_by_document_order(std::vector<Block>& blocks) {
    std::stable_sort(blocks.begin(), blocks.end(), [](const Block& a, const Block& b) {
        if (a.sort_order != b.sort_order) return a.sort_order < b.sort_order;
        int ra = a.type == BlockType::Heading ? 0 : 1;
        int rb = b.type == BlockType::Heading ? 0 : 1;
        return ra < rb;
    });
}

} // namespace folio
