#pragma once

#include "core/block.hpp"

#include <optional>
#include <string>
#include <vector>

namespace folio {

/**
 * Section - outline projection of a heading block (or pseudo-section) and,
 * implicitly, the body blocks that follow it.
 *
 * parent_id and start_offset are derived: parent_id from order and level,
 * start_offset from the current assembly.
 */
struct Section {
    BlockId id;
    std::optional<BlockId> parent_id;
    double sort_order{0.0};
    int header_level{1};
    std::string title;
    std::string markdown;
    std::optional<SectionStatus> status;
    std::vector<std::string> tags;
    std::optional<int> word_goal;
    GoalType goal_type{GoalType::Approx};
    int word_count{0};
    size_t start_offset{0};
    bool is_pseudo_section{false};
    bool is_bibliography{false};

    bool operator==(const Section&) const = default;
};

using SectionList = std::vector<Section>;

/**
 * Derive the section list from a project's blocks.
 *
 * Bibliography sections sort last. Pseudo-sections take the level of the
 * nearest preceding heading. word_count sums the section's own body blocks;
 * start_offset comes from assembling all blocks. Parents are recalculated.
 */
[[nodiscard]] SectionList sections_from_blocks(std::vector<Block> blocks);

[[nodiscard]] std::optional<size_t> index_of(const SectionList& sections, const BlockId& id);

[[nodiscard]] const Section* find_section(const SectionList& sections, const BlockId& id);

} // namespace folio
