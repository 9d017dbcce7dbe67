#include "storage/database.hpp"

namespace folio::storage {

namespace {

// Another process (the command line tool, a second window) may hold the
// write lock for the length of one transaction.
constexpr int kBusyTimeoutMs = 5000;

Result<void, Error> bound(int rc, int index, const char* kind) {
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error::store(
            std::string("cannot bind ") + kind + " to parameter " + std::to_string(index), rc));
    }
    return Result<void, Error>::ok();
}

bool is_memory_path(const std::string& path) {
    return path.empty() || path == ":memory:";
}

} // anonymous namespace

// ============================================================================
// Statement
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    const int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                                     static_cast<int>(text.size()), SQLITE_TRANSIENT);
    return bound(rc, index, "text");
}

Result<void, Error> Statement::bind_int(int index, int value) {
    return bound(sqlite3_bind_int(stmt_.get(), index, value), index, "int");
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    return bound(sqlite3_bind_int64(stmt_.get(), index, value), index, "int64");
}

Result<void, Error> Statement::bind_double(int index, double value) {
    return bound(sqlite3_bind_double(stmt_.get(), index, value), index, "double");
}

Result<void, Error> Statement::bind_null(int index) {
    return bound(sqlite3_bind_null(stmt_.get(), index), index, "null");
}

Result<void, Error> Statement::bind_optional_text(int index, const std::optional<std::string>& text) {
    return text ? bind_text(index, *text) : bind_null(index);
}

Result<void, Error> Statement::bind_optional_int(int index, std::optional<int> value) {
    return value ? bind_int(index, *value) : bind_null(index);
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    int size = sqlite3_column_bytes(stmt_.get(), index);
    return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(size));
}

int Statement::column_int(int index) const {
    return sqlite3_column_int(stmt_.get(), index);
}

int64_t Statement::column_int64(int index) const {
    return sqlite3_column_int64(stmt_.get(), index);
}

double Statement::column_double(int index) const {
    return sqlite3_column_double(stmt_.get(), index);
}

bool Statement::column_is_null(int index) const {
    return sqlite3_column_type(stmt_.get(), index) == SQLITE_NULL;
}

std::optional<std::string> Statement::column_optional_text(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_text(index);
}

std::optional<int> Statement::column_optional_int(int index) const {
    if (column_is_null(index)) return std::nullopt;
    return column_int(index);
}

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    std::string message = db ? sqlite3_errmsg(db) : "step failed";
    if (const char* sql = sqlite3_sql(stmt_.get())) {
        message += " in: ";
        message += sql;
    }
    return Result<bool, Error>::err(Error::store(std::move(message), rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(Error::store("cannot reset statement", rc));
    }
    sqlite3_clear_bindings(stmt_.get());
    return Result<void, Error>::ok();
}

// ============================================================================
// Database
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        other.db_ = nullptr;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* handle = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    int rc = sqlite3_open_v2(is_memory_path(path) ? ":memory:" : path.c_str(), &handle, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = "cannot open " + path + ": " + (handle ? sqlite3_errmsg(handle) : "out of memory");
        if (handle) sqlite3_close(handle);
        return Result<Database, Error>::err(Error::store(error, rc));
    }
    sqlite3_busy_timeout(handle, kBusyTimeoutMs);

    Database db(handle);
    // WAL for file databases only.
    std::string pragmas = "PRAGMA foreign_keys = ON;";
    if (!is_memory_path(path)) pragmas += " PRAGMA journal_mode = WAL; PRAGMA synchronous = NORMAL;";
    auto configured = db.execute(pragmas);
    if (configured.is_err()) {
        return Result<Database, Error>::err(configured.unwrap_err());
    }
    return Result<Database, Error>::ok(std::move(db));
}

Result<Database, Error> Database::open_memory() {
    return open(":memory:");
}

void Database::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(Error::store(last_error() + " in: " + sql, rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : last_error();
        sqlite3_free(error_msg);
        return Result<void, Error>::err(Error::store(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    return execute("BEGIN IMMEDIATE TRANSACTION;");
}

Result<void, Error> Database::commit() {
    return execute("COMMIT;");
}

Result<void, Error> Database::rollback() {
    return execute("ROLLBACK;");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "database is closed";
}

} // namespace folio::storage
