#pragma once

#include "app/bootstrapper.hpp"
#include "app/legacy_source.hpp"
#include "core/job.hpp"
#include "core/result.hpp"
#include "storage/local_store.hpp"
#include "sync/outbox.hpp"
#include "sync/remote_backend.hpp"

#include <optional>
#include <string>
#include <vector>

namespace tinsel::app {

/**
 * Engine - the caller-facing surface of the offline store.
 *
 * Holds references to a store, a remote backend and a legacy source that
 * the caller constructs once and keeps alive for the engine's lifetime.
 * bootstrap_app_data() should complete before any persist_* call.
 */
class Engine {
public:
    Engine(storage::LocalStore& store,
           sync::RemoteBackend& remote,
           const LegacySource& legacy,
           LegacyKeys legacy_keys = {},
           sync::RetryPolicy retry = {});

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    [[nodiscard]] BootstrapResult bootstrap_app_data(const AppDataSnapshot& fallback);

    /**
     * Replace the stored jobs. An empty list clears the table; otherwise
     * the jobs are upserted in one transaction.
     */
    [[nodiscard]] Result<void, Error> persist_jobs(const std::vector<Job>& jobs);

    [[nodiscard]] Result<void, Error> persist_policy(const Policy& policy);
    [[nodiscard]] Result<void, Error> persist_active_date(const std::string& date);

    /**
     * nullopt removes the stored user.
     */
    [[nodiscard]] Result<void, Error> persist_user(const std::optional<User>& user);

    [[nodiscard]] Result<storage::PendingOp, Error> enqueue_sync_op(const sync::SyncMutation& mutation);
    [[nodiscard]] Result<sync::ProcessReport, Error> process_pending_queue(bool force = false);

    [[nodiscard]] Result<storage::CleanupCounts, Error> cleanup_data();

    [[nodiscard]] storage::LocalStore& store() { return store_; }
    [[nodiscard]] sync::Outbox& outbox() { return outbox_; }

private:
    storage::LocalStore& store_;
    Bootstrapper bootstrapper_;
    sync::Outbox outbox_;
};

} // namespace tinsel::app
