#pragma once

#include "core/result.hpp"
#include "core/sanitize.hpp"
#include "core/types.hpp"
#include "storage/local_store.hpp"
#include "storage/records.hpp"
#include "sync/backoff.hpp"
#include "sync/remote_backend.hpp"

#include <QVariantMap>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace tinsel::sync {

/**
 * SyncMutation - a caller's request to replicate a local change.
 *
 * Payload shape per type:
 *   job.add / job.update   {job: {...}}
 *   job.delete             {jobId: <integer>}
 *   policy.update          {policy: {...}}
 *   put                    any object, written to table/key
 *   delete                 ignored, removes table/key
 *   custom                 any object, acknowledged without a write
 *
 * `table` and `key` are only read for put and delete; the other types
 * derive their target from the payload.
 */
struct SyncMutation {
    storage::OpType type = storage::OpType::Custom;
    std::string table;
    std::optional<std::string> key;
    QVariantMap payload;
};

struct OpReport {
    std::string op_id;
    std::string target;
    sanitize::Report report;
};

struct ProcessReport {
    int delivered = 0;
    int failed = 0;
    int skipped_in_flight = 0;
    std::vector<OpReport> reports;
};

/**
 * Outbox - durable queue of pending remote writes.
 *
 * enqueue() only records the op; delivery happens in
 * process_pending_queue(), which drains ops in creation order per target
 * (table/key) and holds at most one in-flight delivery per target across
 * concurrent callers. A failed op is rescheduled with backoff and blocks
 * the rest of its target until the next pass.
 */
class Outbox {
public:
    Outbox(storage::LocalStore& store, RemoteBackend& remote, RetryPolicy retry = {});

    Outbox(const Outbox&) = delete;
    Outbox& operator=(const Outbox&) = delete;

    /**
     * Validate and persist a mutation. ValidationRejected leaves the queue
     * untouched.
     */
    [[nodiscard]] Result<storage::PendingOp, Error> enqueue(const SyncMutation& mutation);

    /**
     * Deliver every op whose next_at has passed, or every op when `force`
     * is set. Remote failures are absorbed into the report; only local
     * store failures are returned as errors.
     */
    [[nodiscard]] Result<ProcessReport, Error> process_pending_queue(bool force = false);

    [[nodiscard]] Result<int64_t, Error> pending_count();

    /**
     * Time of the most recent successful delivery, if any.
     */
    [[nodiscard]] Result<std::optional<Timestamp>, Error> last_sync_at();

    [[nodiscard]] const RetryPolicy& retry_policy() const { return retry_; }

private:
    class TargetClaim;

    // Send one op. The sanitize report of the outbound payload is
    // appended to `report` when non-empty.
    [[nodiscard]] Result<void, Error> deliver(const storage::PendingOp& op, ProcessReport& report);

    [[nodiscard]] Result<void, Error> reschedule(const storage::PendingOp& op, const Error& cause);

    [[nodiscard]] Timestamp next_created_at();

    storage::LocalStore& store_;
    RemoteBackend& remote_;
    RetryPolicy retry_;

    std::mutex mutex_;
    std::set<std::string> in_flight_;
    Timestamp last_created_;
};

} // namespace tinsel::sync
