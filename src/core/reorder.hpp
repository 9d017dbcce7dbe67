#pragma once

#include "core/hierarchy.hpp"
#include "core/result.hpp"
#include "core/section.hpp"

#include <optional>
#include <vector>

namespace folio::reorder {

/**
 * A drag-and-drop move. The section lands immediately after
 * `target_section_id`, or at the start when there is no target.
 * `new_level <= 0` keeps the current level on single-node moves.
 */
struct ReorderRequest {
    BlockId section_id;
    std::optional<BlockId> target_section_id;
    int new_level{0};
    std::optional<BlockId> new_parent_id;
    bool is_subtree_drag{false};
    std::vector<BlockId> child_ids;  // descendants carried along, document order
};

/**
 * Finalized order: sort_order is the index, parents recalculated, hierarchy
 * enforced. Nothing is persisted yet.
 */
struct ReorderPlan {
    SectionList sections;
    std::vector<BlockId> promoted_ids;
    int enforcement_passes{0};
    bool converged{true};
};

/**
 * Reject self-parenting and dropping a section onto itself.
 * Errors carry ErrorKind::InvalidRequest.
 */
[[nodiscard]] Result<void, Error> validate(const ReorderRequest& request);

/**
 * Promote direct children of `moved_id` that would end up before the moved
 * section's new position. A promoted child takes the moved section's
 * original level. Must run before the moved section is removed.
 * Returns the promoted ids.
 */
std::vector<BlockId> promote_orphaned_children(SectionList& sections,
                                               size_t from_index,
                                               const std::optional<BlockId>& target_id);

[[nodiscard]] Result<SectionList, Error> move_single(SectionList sections,
                                                     const ReorderRequest& request,
                                                     std::vector<BlockId>* promoted = nullptr);

[[nodiscard]] Result<SectionList, Error> move_subtree(SectionList sections,
                                                      const ReorderRequest& request);

/**
 * sort_order = index, start_offset by running fragment length, parents
 * recalculated.
 */
void renumber(SectionList& sections);

/**
 * Full pipeline shared by both request shapes: move, renumber, recalculate
 * parents, enforce.
 */
[[nodiscard]] Result<ReorderPlan, Error> plan_reorder(SectionList sections,
                                                      const ReorderRequest& request);

/**
 * renumber + enforce for an order produced elsewhere (hierarchy repair).
 */
[[nodiscard]] ReorderPlan finalize(SectionList sections);

} // namespace folio::reorder
