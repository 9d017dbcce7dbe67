#pragma once

#include "core/result.hpp"
#include "storage/database.hpp"
#include "storage/sqlite_block_store.hpp"

#include <memory>
#include <string>

namespace folio::sync {

/**
 * DocumentSession - one open project: database connection, block store and
 * project id. Owned by main (or a test) and passed by reference to whoever
 * needs the store; there is no global instance.
 */
class DocumentSession {
    struct Key {
        explicit Key() = default;
    };

public:
    // Reached only through open() and open_memory().
    DocumentSession(Key, storage::Database db, ProjectId project_id);
    DocumentSession(const DocumentSession&) = delete;
    DocumentSession& operator=(const DocumentSession&) = delete;

    // Opens (creating if needed) and migrates the database at `path`.
    [[nodiscard]] static Result<std::unique_ptr<DocumentSession>, Error> open(const std::string& path,
                                                                              ProjectId project_id);

    [[nodiscard]] static Result<std::unique_ptr<DocumentSession>, Error> open_memory(ProjectId project_id);

    [[nodiscard]] storage::BlockStore& store() { return store_; }
    [[nodiscard]] const ProjectId& project_id() const { return project_id_; }

private:
    [[nodiscard]] static Result<std::unique_ptr<DocumentSession>, Error> from_database(
        Result<storage::Database, Error> opened, ProjectId project_id);

    storage::Database db_;
    storage::SqliteBlockStore store_;
    ProjectId project_id_;
};

} // namespace folio::sync
