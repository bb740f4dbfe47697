#pragma once

#include "core/result.hpp"
#include <sqlite3.h>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace tinsel::storage {

/**
 * SQLite statement wrapper with RAII.
 */
class Statement {
public:
    Statement() = default;
    explicit Statement(sqlite3_stmt* stmt) : stmt_(stmt, sqlite3_finalize) {}

    [[nodiscard]] sqlite3_stmt* get() const { return stmt_.get(); }
    [[nodiscard]] explicit operator bool() const { return stmt_ != nullptr; }

    // Bind helpers
    [[nodiscard]] Result<void, Error> bind_text(int index, std::string_view text);
    [[nodiscard]] Result<void, Error> bind_int64(int index, int64_t value);
    [[nodiscard]] Result<void, Error> bind_double(int index, double value);
    [[nodiscard]] Result<void, Error> bind_null(int index);

    [[nodiscard]] Result<void, Error> bind(int index, std::string_view text) { return bind_text(index, text); }
    [[nodiscard]] Result<void, Error> bind(int index, const std::string& text) { return bind_text(index, text); }
    [[nodiscard]] Result<void, Error> bind(int index, const char* text) { return bind_text(index, text); }
    [[nodiscard]] Result<void, Error> bind(int index, int64_t value) { return bind_int64(index, value); }
    [[nodiscard]] Result<void, Error> bind(int index, int value) { return bind_int64(index, value); }
    [[nodiscard]] Result<void, Error> bind(int index, double value) { return bind_double(index, value); }
    [[nodiscard]] Result<void, Error> bind(int index, std::nullopt_t) { return bind_null(index); }

    template<typename T>
    [[nodiscard]] Result<void, Error> bind(int index, const std::optional<T>& value) {
        return value ? bind(index, *value) : bind_null(index);
    }

    /**
     * Bind every argument in order, starting at parameter 1.
     * Stops at the first failing bind.
     */
    template<typename... Args>
    [[nodiscard]] Result<void, Error> bind_all(const Args&... args) {
        int index = 0;
        Result<void, Error> result = Result<void, Error>::ok();
        ((result = result.is_ok() ? bind(++index, args) : result), ...);
        return result;
    }

    // Column getters
    [[nodiscard]] std::string column_text(int index) const;
    [[nodiscard]] int column_int(int index) const;
    [[nodiscard]] int64_t column_int64(int index) const;
    [[nodiscard]] double column_double(int index) const;
    [[nodiscard]] bool column_is_null(int index) const;

    [[nodiscard]] std::optional<std::string> column_optional_text(int index) const {
        if (column_is_null(index)) return std::nullopt;
        return column_text(index);
    }

    [[nodiscard]] std::optional<double> column_optional_double(int index) const {
        if (column_is_null(index)) return std::nullopt;
        return column_double(index);
    }

    // Execute
    [[nodiscard]] Result<bool, Error> step();  // Returns true if there's a row
    [[nodiscard]] Result<void, Error> reset();

private:
    std::shared_ptr<sqlite3_stmt> stmt_;
};

/**
 * Database - SQLite database wrapper.
 *
 * Provides:
 * - RAII connection management
 * - Nestable transactions (outermost BEGIN, inner SAVEPOINTs)
 * - Error handling via Result type
 *
 * A Database is not internally synchronized; LocalStore serializes access.
 */
class Database {
public:
    Database() = default;
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;
    Database(Database&& other) noexcept;
    Database& operator=(Database&& other) noexcept;

    /**
     * Open (or create) a database file. A medium that cannot be acquired
     * fails with ErrorKind::StoreUnavailable.
     */
    [[nodiscard]] static Result<Database, Error> open(const std::string& path);

    /**
     * Open an in-memory database (for testing).
     */
    [[nodiscard]] static Result<Database, Error> open_memory();

    [[nodiscard]] bool is_open() const { return db_ != nullptr; }

    void close();

    [[nodiscard]] sqlite3* handle() const { return db_; }

    [[nodiscard]] Result<Statement, Error> prepare(const std::string& sql);

    /**
     * Execute one or more SQL statements without results.
     */
    [[nodiscard]] Result<void, Error> execute(const std::string& sql);

    /**
     * Prepare, bind and run a statement that returns no rows.
     */
    template<typename... Args>
    [[nodiscard]] Result<void, Error> run(const std::string& sql, const Args&... args) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }
        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(args...);
        if (bind_result.is_err()) {
            return bind_result;
        }
        auto step_result = stmt.step();
        if (step_result.is_err()) {
            return Result<void, Error>::err(step_result.unwrap_err());
        }
        return Result<void, Error>::ok();
    }

    /**
     * Execute a query and process each row with a callback.
     */
    template<typename F, typename... Args>
    [[nodiscard]] Result<void, Error> query(const std::string& sql, F&& callback, const Args&... args) {
        auto stmt_result = prepare(sql);
        if (stmt_result.is_err()) {
            return Result<void, Error>::err(stmt_result.unwrap_err());
        }

        auto stmt = std::move(stmt_result).unwrap();
        auto bind_result = stmt.bind_all(args...);
        if (bind_result.is_err()) {
            return bind_result;
        }
        while (true) {
            auto step_result = stmt.step();
            if (step_result.is_err()) {
                return Result<void, Error>::err(step_result.unwrap_err());
            }
            if (!step_result.unwrap()) break;
            callback(stmt);
        }

        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> begin_transaction();
    [[nodiscard]] Result<void, Error> commit();
    [[nodiscard]] Result<void, Error> rollback();

    [[nodiscard]] bool in_transaction() const { return depth_ > 0; }

    /**
     * Execute a function within a transaction.
     * Commits on success, rolls back on failure. Nested calls become
     * savepoints of the enclosing transaction.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());

        auto begin_result = begin_transaction();
        if (begin_result.is_err()) {
            return ResultType::err(begin_result.unwrap_err());
        }

        auto result = f();

        if (result.is_err()) {
            auto rollback_result = rollback();
            if (rollback_result.is_err()) {
                auto error = result.unwrap_err();
                error.message += " (rollback failed: " + rollback_result.unwrap_err().message + ")";
                return ResultType::err(std::move(error));
            }
            return result;
        }

        auto commit_result = commit();
        if (commit_result.is_err()) {
            return ResultType::err(commit_result.unwrap_err());
        }

        return result;
    }

    [[nodiscard]] int changes() const;

    [[nodiscard]] std::string last_error() const;

private:
    explicit Database(sqlite3* db) : db_(db) {}

    sqlite3* db_ = nullptr;
    int depth_ = 0;
};

} // namespace tinsel::storage
