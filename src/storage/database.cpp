#include "storage/database.hpp"

namespace tinsel::storage {

namespace {

Error storage_error(std::string message, int rc) {
    return Error{std::move(message), ErrorKind::StorageFailure, rc};
}

} // namespace

// ============================================================================
// Statement implementation
// ============================================================================

Result<void, Error> Statement::bind_text(int index, std::string_view text) {
    int rc = sqlite3_bind_text(stmt_.get(), index, text.data(),
                               static_cast<int>(text.size()), SQLITE_TRANSIENT);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(storage_error("Failed to bind text", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_int64(int index, int64_t value) {
    int rc = sqlite3_bind_int64(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(storage_error("Failed to bind int64", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_double(int index, double value) {
    int rc = sqlite3_bind_double(stmt_.get(), index, value);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(storage_error("Failed to bind double", rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Statement::bind_null(int index) {
    int rc = sqlite3_bind_null(stmt_.get(), index);
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(storage_error("Failed to bind null", rc));
    }
    return Result<void, Error>::ok();
}

std::string Statement::column_text(int index) const {
    const unsigned char* text = sqlite3_column_text(stmt_.get(), index);
    if (!text) return "";
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(sqlite3_column_bytes(stmt_.get(), index)));
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

Result<bool, Error> Statement::step() {
    int rc = sqlite3_step(stmt_.get());
    if (rc == SQLITE_ROW) {
        return Result<bool, Error>::ok(true);
    }
    if (rc == SQLITE_DONE) {
        return Result<bool, Error>::ok(false);
    }
    sqlite3* db = sqlite3_db_handle(stmt_.get());
    return Result<bool, Error>::err(storage_error(
        std::string("Step failed: ") + (db ? sqlite3_errmsg(db) : sqlite3_errstr(rc)), rc));
}

Result<void, Error> Statement::reset() {
    int rc = sqlite3_reset(stmt_.get());
    if (rc != SQLITE_OK) {
        return Result<void, Error>::err(storage_error("Reset failed", rc));
    }
    return Result<void, Error>::ok();
}

// ============================================================================
// Database implementation
// ============================================================================

Database::~Database() {
    close();
}

Database::Database(Database&& other) noexcept : db_(other.db_), depth_(other.depth_) {
    other.db_ = nullptr;
    other.depth_ = 0;
}

Database& Database::operator=(Database&& other) noexcept {
    if (this != &other) {
        close();
        db_ = other.db_;
        depth_ = other.depth_;
        other.db_ = nullptr;
        other.depth_ = 0;
    }
    return *this;
}

Result<Database, Error> Database::open(const std::string& path) {
    sqlite3* raw = nullptr;
    int rc = sqlite3_open_v2(path.c_str(), &raw,
                             SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = raw ? sqlite3_errmsg(raw) : sqlite3_errstr(rc);
        if (raw) sqlite3_close(raw);
        return Result<Database, Error>::err(
            Error{"Cannot open store at " + path + ": " + error, ErrorKind::StoreUnavailable, rc});
    }

    Database db(raw);
    sqlite3_busy_timeout(raw, 5000);

    // sqlite opens lazily; touching the file here surfaces an unusable
    // medium (directory, read-only mount) before any migration runs.
    for (const char* pragma : {"PRAGMA journal_mode = WAL;", "PRAGMA foreign_keys = ON;",
                               "SELECT count(*) FROM sqlite_master;"}) {
        auto result = db.execute(pragma);
        if (result.is_err()) {
            const auto& error = result.unwrap_err();
            return Result<Database, Error>::err(
                Error{"Cannot open store at " + path + ": " + error.message,
                      ErrorKind::StoreUnavailable, error.code});
        }
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
        depth_ = 0;
    }
}

Result<Statement, Error> Database::prepare(const std::string& sql) {
    if (!db_) {
        return Result<Statement, Error>::err(Error{"Database not open", ErrorKind::StoreUnavailable});
    }
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(),
                                static_cast<int>(sql.size()), &stmt, nullptr);
    if (rc != SQLITE_OK) {
        return Result<Statement, Error>::err(storage_error(last_error(), rc));
    }
    return Result<Statement, Error>::ok(Statement(stmt));
}

Result<void, Error> Database::execute(const std::string& sql) {
    if (!db_) {
        return Result<void, Error>::err(Error{"Database not open", ErrorKind::StoreUnavailable});
    }
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string error = error_msg ? error_msg : sqlite3_errstr(rc);
        sqlite3_free(error_msg);
        return Result<void, Error>::err(storage_error(error, rc));
    }
    return Result<void, Error>::ok();
}

Result<void, Error> Database::begin_transaction() {
    auto result = depth_ == 0
        ? execute("BEGIN IMMEDIATE;")
        : execute("SAVEPOINT sp" + std::to_string(depth_) + ";");
    if (result.is_ok()) {
        ++depth_;
    }
    return result;
}

Result<void, Error> Database::commit() {
    if (depth_ == 0) {
        return Result<void, Error>::err(storage_error("No active transaction", SQLITE_MISUSE));
    }
    --depth_;
    auto result = depth_ == 0
        ? execute("COMMIT;")
        : execute("RELEASE sp" + std::to_string(depth_) + ";");
    if (result.is_err()) {
        ++depth_;
    }
    return result;
}

Result<void, Error> Database::rollback() {
    if (depth_ == 0) {
        return Result<void, Error>::err(storage_error("No active transaction", SQLITE_MISUSE));
    }
    --depth_;
    if (depth_ == 0) {
        return execute("ROLLBACK;");
    }
    const auto name = "sp" + std::to_string(depth_);
    return execute("ROLLBACK TO " + name + "; RELEASE " + name + ";");
}

int Database::changes() const {
    return sqlite3_changes(db_);
}

std::string Database::last_error() const {
    return db_ ? sqlite3_errmsg(db_) : "Database not open";
}

} // namespace tinsel::storage
