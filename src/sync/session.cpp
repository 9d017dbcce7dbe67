#include "sync/session.hpp"
#include "storage/migrations.hpp"
#include "sync/logging.hpp"

namespace folio::sync {

DocumentSession::DocumentSession(Key, storage::Database db, ProjectId project_id)
    : db_(std::move(db))
    , store_(db_)
    , project_id_(std::move(project_id)) {}

Result<std::unique_ptr<DocumentSession>, Error> DocumentSession::from_database(
    Result<storage::Database, Error> opened, ProjectId project_id) {
    using R = Result<std::unique_ptr<DocumentSession>, Error>;
    if (opened.is_err()) {
        return R::err(opened.unwrap_err());
    }

    auto db = std::move(opened).unwrap();
    storage::MigrationRunner runner(db);
    auto migrated = runner.migrate();
    if (migrated.is_err()) {
        qCWarning(folioStoreLog) << "schema migration failed:" << QString::fromStdString(migrated.unwrap_err().message);
        return R::err(migrated.unwrap_err());
    }
    if (migrated.unwrap() > 0) {
        qCInfo(folioStoreLog) << "applied" << migrated.unwrap() << "schema migrations, now at version"
                              << storage::MigrationRunner::latest_version();
    }

    qCDebug(folioStoreLog) << "session opened for project" << QString::fromStdString(project_id);
    return R::ok(std::make_unique<DocumentSession>(Key{}, std::move(db), std::move(project_id)));
}

Result<std::unique_ptr<DocumentSession>, Error> DocumentSession::open(const std::string& path,
                                                                      ProjectId project_id) {
    return from_database(storage::Database::open(path), std::move(project_id));
}

Result<std::unique_ptr<DocumentSession>, Error> DocumentSession::open_memory(ProjectId project_id) {
    return from_database(storage::Database::open_memory(), std::move(project_id));
}

} // namespace folio::sync
