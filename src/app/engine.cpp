#include "app/engine.hpp"

#include "core/logging.hpp"
#include "core/types.hpp"

namespace tinsel::app {

using storage::AppStateRecord;
using storage::PolicyRecord;
using storage::Record;
using storage::Table;

Engine::Engine(storage::LocalStore& store,
               sync::RemoteBackend& remote,
               const LegacySource& legacy,
               LegacyKeys legacy_keys,
               sync::RetryPolicy retry)
    : store_(store)
    , bootstrapper_(store, legacy, std::move(legacy_keys))
    , outbox_(store, remote, retry) {}

BootstrapResult Engine::bootstrap_app_data(const AppDataSnapshot& fallback) {
    auto result = bootstrapper_.bootstrap(fallback);
    qCInfo(tinselBootstrapLog) << "bootstrapped from" << source_name(result.source) << "with"
                               << result.snapshot.jobs.size() << "jobs";
    return result;
}

Result<void, Error> Engine::persist_jobs(const std::vector<Job>& jobs) {
    if (jobs.empty()) {
        return store_.clear(Table::Jobs);
    }
    const auto now = Timestamp::now();
    std::vector<Record> records;
    records.reserve(jobs.size());
    for (const auto& job : jobs) {
        records.emplace_back(storage::make_job_record(job, now));
    }
    return store_.bulk_upsert(Table::Jobs, records);
}

Result<void, Error> Engine::persist_policy(const Policy& policy) {
    return store_.put(PolicyRecord{
        .key = std::string(storage::kPolicyKey),
        .policy = policy,
        .updated_at = Timestamp::now()
    });
}

Result<void, Error> Engine::persist_active_date(const std::string& date) {
    return store_.put(AppStateRecord{
        .key = std::string(storage::kActiveDateKey),
        .value = QString::fromStdString(date),
        .updated_at = Timestamp::now()
    });
}

Result<void, Error> Engine::persist_user(const std::optional<User>& user) {
    if (!user) {
        return store_.remove(Table::State, std::string(storage::kCurrentUserKey));
    }
    return store_.put(AppStateRecord{
        .key = std::string(storage::kCurrentUserKey),
        .value = user_to_json(*user),
        .updated_at = Timestamp::now()
    });
}

Result<storage::PendingOp, Error> Engine::enqueue_sync_op(const sync::SyncMutation& mutation) {
    return outbox_.enqueue(mutation);
}

Result<sync::ProcessReport, Error> Engine::process_pending_queue(bool force) {
    return outbox_.process_pending_queue(force);
}

Result<storage::CleanupCounts, Error> Engine::cleanup_data() {
    return store_.cleanup();
}

} // namespace tinsel::app
