#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"

#include <string>
#include <vector>

namespace folio::storage {

struct Migration {
    int version;
    std::string name;
    std::string up_sql;
};

inline const std::vector<Migration> ALL_MIGRATIONS = {
    {
        .version = 1,
        .name = "blocks",
        .up_sql = R"SQL(
            CREATE TABLE IF NOT EXISTS blocks (
                id TEXT PRIMARY KEY,
                project_id TEXT NOT NULL,
                parent_id TEXT,
                sort_order REAL NOT NULL,
                block_type TEXT NOT NULL,
                text_content TEXT NOT NULL DEFAULT '',
                markdown_fragment TEXT NOT NULL DEFAULT '',
                heading_level INTEGER,
                status TEXT,
                tags TEXT,
                word_goal INTEGER,
                goal_type TEXT NOT NULL DEFAULT 'approx',
                word_count INTEGER NOT NULL DEFAULT 0,
                is_bibliography INTEGER NOT NULL DEFAULT 0,
                is_pseudo_section INTEGER NOT NULL DEFAULT 0,
                created_at INTEGER NOT NULL,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_blocks_project_order ON blocks(project_id, sort_order);
        )SQL"
    },
    {
        .version = 2,
        .name = "legacy_sections",
        .up_sql = R"SQL(
            -- Outline mirror kept for older readers; written through apply_section_changes only
            CREATE TABLE IF NOT EXISTS sections (
                id TEXT PRIMARY KEY,
                project_id TEXT NOT NULL,
                parent_id TEXT,
                sort_order INTEGER NOT NULL DEFAULT 0,
                header_level INTEGER NOT NULL DEFAULT 1,
                title TEXT NOT NULL DEFAULT '',
                markdown_content TEXT NOT NULL DEFAULT '',
                start_offset INTEGER NOT NULL DEFAULT 0,
                updated_at INTEGER NOT NULL
            );
            CREATE INDEX IF NOT EXISTS idx_sections_project ON sections(project_id, sort_order);
        )SQL"
    }
};

/**
 * MigrationRunner - brings a database up to the schema this build expects.
 *
 * Pending migrations run in one transaction. A database written by a newer
 * build (version above latest_version()) is refused rather than downgraded.
 */
class MigrationRunner {
public:
    explicit MigrationRunner(Database& db) : db_(db) {}

    // Number of migrations applied.
    [[nodiscard]] Result<int, Error> migrate();
    [[nodiscard]] Result<int, Error> migrate_to(int target_version);
    [[nodiscard]] Result<int, Error> current_version();

    [[nodiscard]] static int latest_version() {
        return ALL_MIGRATIONS.empty() ? 0 : ALL_MIGRATIONS.back().version;
    }

private:
    Database& db_;

    [[nodiscard]] Result<void, Error> ensure_migrations_table();
    [[nodiscard]] Result<void, Error> run_migration(const Migration& m);
};

[[nodiscard]] inline Result<void, Error> initialize_database(Database& db) {
    MigrationRunner runner(db);
    auto applied = runner.migrate();
    if (applied.is_err()) {
        return Result<void, Error>::err(applied.unwrap_err());
    }
    return Result<void, Error>::ok();
}

} // namespace folio::storage
