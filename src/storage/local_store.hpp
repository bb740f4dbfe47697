#pragma once

#include "storage/database.hpp"
#include "storage/maintenance.hpp"
#include "storage/record_repository.hpp"
#include "storage/records.hpp"
#include "core/result.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinsel::storage {

/**
 * LocalStore - the on-device system of record.
 *
 * Owns one SQLite connection. Every call is serialized on an internal
 * recursive mutex, so a transaction() body may call back into the store.
 * open() migrates the schema to the latest version before returning.
 */
class LocalStore {
public:
    /**
     * `path` is a file path or ":memory:".
     */
    explicit LocalStore(std::string path);

    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    /**
     * Open and migrate. Idempotent: later calls return the cached outcome
     * of a successful open. Fails with StoreUnavailable or MigrationFailed.
     */
    [[nodiscard]] Result<void, Error> open();

    [[nodiscard]] bool is_open() const;

    [[nodiscard]] const std::string& path() const { return path_; }

    [[nodiscard]] Result<std::optional<Record>, Error> get(Table table, const RecordKey& key);
    [[nodiscard]] Result<void, Error> put(const Record& record);

    /**
     * Upsert a batch into one table, all-or-nothing.
     */
    [[nodiscard]] Result<void, Error> bulk_upsert(Table table, const std::vector<Record>& records);

    [[nodiscard]] Result<void, Error> remove(Table table, const RecordKey& key);
    [[nodiscard]] Result<void, Error> clear(Table table);
    [[nodiscard]] Result<int64_t, Error> count(Table table);
    [[nodiscard]] Result<std::vector<Record>, Error> scan_ordered(Table table, std::string_view index_field);

    [[nodiscard]] Result<std::vector<PendingOp>, Error> pending_due(Timestamp threshold);
    [[nodiscard]] Result<std::vector<PendingOp>, Error> pending_for_target(
        const std::string& table, const std::optional<std::string>& key);

    /**
     * Clear every table in one transaction.
     */
    [[nodiscard]] Result<void, Error> reset();

    /**
     * Re-normalize stored jobs and pending job payloads.
     */
    [[nodiscard]] Result<CleanupCounts, Error> cleanup();

    [[nodiscard]] Result<int, Error> schema_version();

    /**
     * Run `f` inside one transaction; nested calls become savepoints.
     * `f` returns a Result and may use the store freely.
     */
    template<typename F>
    [[nodiscard]] auto transaction(F&& f) -> decltype(f()) {
        using ResultType = decltype(f());
        std::lock_guard lock(mutex_);
        if (!db_.is_open()) {
            return ResultType::err(not_open());
        }
        return db_.transaction(std::forward<F>(f));
    }

private:
    [[nodiscard]] static Error not_open();

    // Runs `f(repo)` under the lock once the store is open.
    template<typename T, typename F>
    [[nodiscard]] Result<T, Error> with_repository(F&& f) {
        std::lock_guard lock(mutex_);
        if (!db_.is_open()) {
            return Result<T, Error>::err(not_open());
        }
        RecordRepository repo(db_);
        return f(repo);
    }

    std::string path_;
    Database db_;
    mutable std::recursive_mutex mutex_;
};

} // namespace tinsel::storage
