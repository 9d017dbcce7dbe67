#pragma once

#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace folio {

enum class BlockType {
    Paragraph,
    Heading,
    BulletList,
    OrderedList,
    Blockquote,
    CodeBlock,
    HorizontalRule,
    SectionBreak,
    Bibliography,
    Table,
    Image
};

enum class SectionStatus { Next, Writing, Waiting, Review, Final };

enum class GoalType { Approx, Min, Max };

/**
 * Block - the persisted unit of document content.
 *
 * Ordering is by sort_order; ties are broken with headings first. A heading
 * block with a heading_level identifies a section.
 */
struct Block {
    BlockId id;
    ProjectId project_id;
    std::optional<BlockId> parent_id;
    double sort_order{0.0};
    BlockType type{BlockType::Paragraph};
    std::string text_content;
    std::string markdown_fragment;
    std::optional<int> heading_level;
    std::optional<SectionStatus> status;
    std::vector<std::string> tags;
    std::optional<int> word_goal;
    GoalType goal_type{GoalType::Approx};
    int word_count{0};
    bool is_bibliography{false};
    bool is_pseudo_section{false};
    Timestamp created_at;
    Timestamp updated_at;

    [[nodiscard]] bool is_heading() const noexcept {
        return type == BlockType::Heading && heading_level.has_value();
    }

    [[nodiscard]] bool is_section_root() const noexcept {
        return is_heading() || is_pseudo_section;
    }

    bool operator==(const Block&) const = default;
};

[[nodiscard]] std::string_view type_name(BlockType type) noexcept;
[[nodiscard]] std::optional<BlockType> parse_block_type(std::string_view name) noexcept;

[[nodiscard]] std::string_view status_name(SectionStatus status) noexcept;
[[nodiscard]] std::optional<SectionStatus> parse_status(std::string_view name) noexcept;

// next -> writing -> waiting -> review -> final -> next
[[nodiscard]] SectionStatus next_status(SectionStatus status) noexcept;

[[nodiscard]] std::string_view goal_type_name(GoalType type) noexcept;
[[nodiscard]] GoalType parse_goal_type(std::string_view name) noexcept;

/**
 * Sort blocks by (sort_order, headings first). Stable for equal keys.
 */
void sort_by_document_order(std::vector<Block>& blocks);

} // namespace folio
