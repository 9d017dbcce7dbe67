#pragma once

#include "storage/block_store.hpp"
#include "storage/database.hpp"

#include <functional>
#include <optional>
#include <vector>

namespace folio::storage {

/**
 * SqliteBlockStore - BlockStore over the `blocks` and `sections` tables.
 *
 * Holds a reference to a migrated Database owned by the session.
 */
class SqliteBlockStore : public BlockStore {
public:
    explicit SqliteBlockStore(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::vector<Block>, Error> fetch_blocks(const ProjectId& project_id) override;
    [[nodiscard]] Result<std::optional<Block>, Error> fetch_block(const BlockId& id) override;

    [[nodiscard]] Result<void, Error> replace_blocks(std::vector<Block> blocks,
                                                     const ProjectId& project_id) override;
    [[nodiscard]] Result<void, Error> replace_blocks_in_range(std::vector<Block> blocks,
                                                              const ProjectId& project_id,
                                                              double start,
                                                              std::optional<double> end) override;
    [[nodiscard]] Result<void, Error> reorder_all_blocks(const SectionList& sections,
                                                         const ProjectId& project_id,
                                                         const HeadingUpdates& heading_updates) override;

    [[nodiscard]] Result<void, Error> update_block_status(const BlockId& id,
                                                          std::optional<SectionStatus> status) override;
    [[nodiscard]] Result<void, Error> update_block_word_goal(const BlockId& id,
                                                             std::optional<int> goal) override;
    [[nodiscard]] Result<void, Error> update_block_goal_type(const BlockId& id, GoalType type) override;
    [[nodiscard]] Result<void, Error> update_block_tags(const BlockId& id,
                                                        const std::vector<std::string>& tags) override;

    [[nodiscard]] Result<void, Error> apply_section_changes(const std::vector<SectionChange>& changes,
                                                            const ProjectId& project_id) override;
    [[nodiscard]] Result<IdMapping, Error> apply_editor_changes(const BlockChanges& changes,
                                                                const ProjectId& project_id) override;

    [[nodiscard]] Result<void, Error> move_block(const BlockId& id,
                                                 const std::optional<BlockId>& after_id) override;
    [[nodiscard]] Result<void, Error> normalize_sort_orders(const ProjectId& project_id) override;

    // Smallest gap between neighbours before a midpoint insert renumbers.
    static constexpr double kMinSortGap = 1e-9;

private:
    Database& db_;

    [[nodiscard]] Result<std::vector<Block>, Error> load_blocks(const ProjectId& project_id);
    [[nodiscard]] Result<void, Error> insert_block(const Block& block);
    [[nodiscard]] Result<void, Error> delete_block(const BlockId& id, const ProjectId& project_id);
    [[nodiscard]] Result<void, Error> set_sort_order(const BlockId& id, double sort_order);
    [[nodiscard]] Result<void, Error> renumber(const ProjectId& project_id);
    [[nodiscard]] Result<double, Error> sort_order_after(const ProjectId& project_id,
                                                         const std::optional<BlockId>& after_id,
                                                         const std::optional<BlockId>& exclude_id);
    [[nodiscard]] Result<void, Error> update_section_metadata(
        const BlockId& id,
        const char* column,
        const std::function<Result<void, Error>(Statement&)>& bind_value);
};

} // namespace folio::storage
