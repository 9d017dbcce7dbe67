#include "storage/migrations.hpp"
#include "core/types.hpp"

namespace folio::storage {

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS folio_schema (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensure_result = ensure_migrations_table();
    if (ensure_result.is_err()) {
        return Result<int, Error>::err(ensure_result.unwrap_err());
    }

    auto stmt_result = db_.prepare("SELECT COALESCE(MAX(version), 0) FROM folio_schema;");
    if (stmt_result.is_err()) {
        return Result<int, Error>::err(stmt_result.unwrap_err());
    }

    auto stmt = std::move(stmt_result).unwrap();
    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<int, Error>::err(step_result.unwrap_err());
    }
    return Result<int, Error>::ok(stmt.column_int(0));
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    auto exec_result = db_.execute(m.up_sql);
    if (exec_result.is_err()) {
        const auto& cause = exec_result.unwrap_err();
        return Result<void, Error>::err(Error::store(
            "schema migration " + std::to_string(m.version) + " (" + m.name + ") failed: " + cause.message,
            cause.code));
    }

    auto stmt_result = db_.prepare(
        "INSERT INTO folio_schema (version, name, applied_at) VALUES (?, ?, ?);");
    if (stmt_result.is_err()) {
        return Result<void, Error>::err(stmt_result.unwrap_err());
    }
    auto stmt = std::move(stmt_result).unwrap();

    auto bound = stmt.bind_int(1, m.version)
        .and_then([&] { return stmt.bind_text(2, m.name); })
        .and_then([&] { return stmt.bind_int64(3, Timestamp::now().millis()); });
    if (bound.is_err()) {
        return bound;
    }

    auto step_result = stmt.step();
    if (step_result.is_err()) {
        return Result<void, Error>::err(step_result.unwrap_err());
    }
    return Result<void, Error>::ok();
}

Result<int, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<int, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<int, Error>::err(current_result.unwrap_err());
    }

    const int current = current_result.unwrap();
    if (current > latest_version()) {
        return Result<int, Error>::err(Error::store(
            "database schema version " + std::to_string(current) + " is newer than this build supports (" +
            std::to_string(latest_version()) + ")"));
    }
    if (current >= target_version) {
        return Result<int, Error>::ok(0);
    }

    int applied = 0;
    auto result = db_.transaction([&]() -> Result<void, Error> {
        for (const auto& m : ALL_MIGRATIONS) {
            if (m.version <= current || m.version > target_version) continue;
            auto ran = run_migration(m);
            if (ran.is_err()) {
                return ran;
            }
            ++applied;
        }
        return Result<void, Error>::ok();
    });
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }
    return Result<int, Error>::ok(applied);
}

} // namespace folio::storage
