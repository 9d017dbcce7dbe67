#pragma once

#include "core/block.hpp"
#include "core/result.hpp"
#include "core/section.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace folio::storage {

/**
 * New fragment and level for a heading touched by a reorder or enforcement.
 */
struct HeadingUpdate {
    std::string markdown_fragment;
    int heading_level{1};
};

using HeadingUpdates = std::unordered_map<BlockId, HeadingUpdate>;

/**
 * Field updates for the legacy sections table. Unset fields are left alone.
 */
struct SectionUpdates {
    std::optional<std::string> title;
    std::optional<int> header_level;
    std::optional<int> sort_order;
    std::optional<std::string> markdown;
    std::optional<size_t> start_offset;
    std::optional<std::optional<BlockId>> parent_id;
};

struct SectionChange {
    enum class Kind { Upsert, Delete };

    Kind kind{Kind::Upsert};
    BlockId id;
    SectionUpdates updates;
};

/**
 * Block-level diff reported by the structured surface.
 */
struct BlockInsert {
    std::string temp_id;
    std::string markdown_fragment;
    std::optional<BlockId> after_block_id;
};

struct BlockUpdate {
    BlockId id;
    std::string markdown_fragment;
};

struct BlockChanges {
    std::vector<BlockUpdate> updates;
    std::vector<BlockInsert> inserts;
    std::vector<BlockId> deletes;

    [[nodiscard]] bool empty() const noexcept {
        return updates.empty() && inserts.empty() && deletes.empty();
    }
};

// temp id -> permanent id
using IdMapping = std::unordered_map<std::string, BlockId>;

/**
 * BlockStore - durable, ordered block collection.
 *
 * Every mutating call is atomic and, once committed, reports the project id
 * to the change listener. Readers outside the coordinator may fetch; only the
 * coordinator (or a headless tool with no coordinator running) writes.
 */
class BlockStore {
public:
    using ChangeListener = std::function<void(const ProjectId&)>;

    virtual ~BlockStore() = default;

    // Document order: sort_order, headings first on ties.
    [[nodiscard]] virtual Result<std::vector<Block>, Error> fetch_blocks(const ProjectId& project_id) = 0;
    [[nodiscard]] virtual Result<std::optional<Block>, Error> fetch_block(const BlockId& id) = 0;

    /**
     * Full replacement after a cold re-parse. Heading ids and metadata
     * survive by id, or by title when the incoming id is unknown.
     */
    [[nodiscard]] virtual Result<void, Error> replace_blocks(std::vector<Block> blocks,
                                                             const ProjectId& project_id) = 0;

    /**
     * Replace the non-bibliography blocks in [start, end) with `blocks`,
     * shifting later blocks when the new content does not fit, then renumber
     * the whole project 1..n.
     */
    [[nodiscard]] virtual Result<void, Error> replace_blocks_in_range(std::vector<Block> blocks,
                                                                      const ProjectId& project_id,
                                                                      double start,
                                                                      std::optional<double> end) = 0;

    /**
     * Rewrite the order of every block to follow `sections`: blocks before
     * the first section keep the front, each section carries its body blocks.
     * Heading fragments and levels come from `heading_updates`.
     */
    [[nodiscard]] virtual Result<void, Error> reorder_all_blocks(const SectionList& sections,
                                                                 const ProjectId& project_id,
                                                                 const HeadingUpdates& heading_updates) = 0;

    [[nodiscard]] virtual Result<void, Error> update_block_status(const BlockId& id,
                                                                  std::optional<SectionStatus> status) = 0;
    [[nodiscard]] virtual Result<void, Error> update_block_word_goal(const BlockId& id,
                                                                     std::optional<int> goal) = 0;
    [[nodiscard]] virtual Result<void, Error> update_block_goal_type(const BlockId& id, GoalType type) = 0;
    [[nodiscard]] virtual Result<void, Error> update_block_tags(const BlockId& id,
                                                                const std::vector<std::string>& tags) = 0;

    // Legacy outline mirror
    [[nodiscard]] virtual Result<void, Error> apply_section_changes(const std::vector<SectionChange>& changes,
                                                                    const ProjectId& project_id) = 0;

    [[nodiscard]] virtual Result<IdMapping, Error> apply_editor_changes(const BlockChanges& changes,
                                                                        const ProjectId& project_id) = 0;

    // Midpoint insert; renumbers the project first when the gap is exhausted.
    [[nodiscard]] virtual Result<void, Error> move_block(const BlockId& id,
                                                         const std::optional<BlockId>& after_id) = 0;

    [[nodiscard]] virtual Result<void, Error> normalize_sort_orders(const ProjectId& project_id) = 0;

    void set_change_listener(ChangeListener listener) { listener_ = std::move(listener); }

protected:
    void notify_changed(const ProjectId& project_id) const {
        if (listener_) listener_(project_id);
    }

private:
    ChangeListener listener_;
};

/**
 * Persist a finalized section order: reorder_all_blocks with the sections'
 * fragments and levels, then mirror order and levels into the legacy table.
 * Shared by drag reorder, hierarchy repair and the command line.
 */
[[nodiscard]] Result<void, Error> persist_section_order(BlockStore& store,
                                                        const ProjectId& project_id,
                                                        const SectionList& sections);

} // namespace folio::storage
