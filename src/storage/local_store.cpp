#include "storage/local_store.hpp"

#include "storage/migrations.hpp"
#include "core/logging.hpp"

namespace tinsel::storage {

LocalStore::LocalStore(std::string path) : path_(std::move(path)) {}

Error LocalStore::not_open() {
    return Error{"Local store is not open", ErrorKind::StoreUnavailable};
}

Result<void, Error> LocalStore::open() {
    std::lock_guard lock(mutex_);
    if (db_.is_open()) {
        return Result<void, Error>::ok();
    }

    auto opened = Database::open(path_);
    if (opened.is_err()) {
        qCWarning(tinselStoreLog) << "store unavailable:"
                                  << QString::fromStdString(opened.unwrap_err().message);
        return Result<void, Error>::err(opened.unwrap_err());
    }

    auto db = std::move(opened).unwrap();
    MigrationRunner runner(db);
    auto migrated = runner.migrate();
    if (migrated.is_err()) {
        return migrated;
    }

    db_ = std::move(db);
    qCDebug(tinselStoreLog) << "store open at" << QString::fromStdString(path_)
                            << "schema version" << MigrationRunner::latest_version();
    return Result<void, Error>::ok();
}

bool LocalStore::is_open() const {
    std::lock_guard lock(mutex_);
    return db_.is_open();
}

Result<std::optional<Record>, Error> LocalStore::get(Table table, const RecordKey& key) {
    return with_repository<std::optional<Record>>([&](RecordRepository& repo) {
        return repo.get(table, key);
    });
}

Result<void, Error> LocalStore::put(const Record& record) {
    return with_repository<void>([&](RecordRepository& repo) {
        return repo.put(record);
    });
}

Result<void, Error> LocalStore::bulk_upsert(Table table, const std::vector<Record>& records) {
    for (const auto& record : records) {
        if (table_of(record) != table) {
            return Result<void, Error>::err(Error{
                std::string("Record does not belong to table ") + table_name(table),
                ErrorKind::ValidationRejected});
        }
    }
    return transaction([&]() -> Result<void, Error> {
        RecordRepository repo(db_);
        for (const auto& record : records) {
            auto result = repo.put(record);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<void, Error> LocalStore::remove(Table table, const RecordKey& key) {
    return with_repository<void>([&](RecordRepository& repo) {
        return repo.remove(table, key);
    });
}

Result<void, Error> LocalStore::clear(Table table) {
    return with_repository<void>([&](RecordRepository& repo) {
        return repo.clear(table);
    });
}

Result<int64_t, Error> LocalStore::count(Table table) {
    return with_repository<int64_t>([&](RecordRepository& repo) {
        return repo.count(table);
    });
}

Result<std::vector<Record>, Error> LocalStore::scan_ordered(Table table, std::string_view index_field) {
    return with_repository<std::vector<Record>>([&](RecordRepository& repo) {
        return repo.scan(table, index_field);
    });
}

Result<std::vector<PendingOp>, Error> LocalStore::pending_due(Timestamp threshold) {
    return with_repository<std::vector<PendingOp>>([&](RecordRepository& repo) {
        return repo.pending_due(threshold);
    });
}

Result<std::vector<PendingOp>, Error> LocalStore::pending_for_target(
    const std::string& table,
    const std::optional<std::string>& key
) {
    return with_repository<std::vector<PendingOp>>([&](RecordRepository& repo) {
        return repo.pending_for_target(table, key);
    });
}

Result<void, Error> LocalStore::reset() {
    return transaction([&]() -> Result<void, Error> {
        RecordRepository repo(db_);
        for (auto table : {Table::Jobs, Table::Policy, Table::State, Table::PendingOps}) {
            auto result = repo.clear(table);
            if (result.is_err()) {
                return result;
            }
        }
        return Result<void, Error>::ok();
    });
}

Result<CleanupCounts, Error> LocalStore::cleanup() {
    return transaction([&]() {
        RecordRepository repo(db_);
        return cleanup_records(repo);
    });
}

Result<int, Error> LocalStore::schema_version() {
    std::lock_guard lock(mutex_);
    if (!db_.is_open()) {
        return Result<int, Error>::err(not_open());
    }
    MigrationRunner runner(db_);
    return runner.current_version();
}

} // namespace tinsel::storage
