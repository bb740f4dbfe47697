#include "sync/outbox.hpp"

#include "core/job_schema.hpp"
#include "core/logging.hpp"

#include <QJsonObject>
#include <QVariant>
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>

namespace tinsel::sync {

using storage::OpType;
using storage::PendingOp;
using storage::Table;

namespace {

constexpr const char* kJobsCollection = "jobs";
constexpr const char* kConfigCollection = "config";
constexpr const char* kPolicyDocument = "policy";

Error rejected(std::string message) {
    return Error{std::move(message), ErrorKind::ValidationRejected};
}

bool is_map(const QVariant& value) {
    const auto id = value.metaType().id();
    return id == QMetaType::QVariantMap || id == QMetaType::QVariantHash ||
           id == QMetaType::QJsonObject;
}

QVariantMap to_map(const QVariant& value) {
    if (value.metaType().id() == QMetaType::QJsonObject) {
        return value.toJsonObject().toVariantMap();
    }
    return value.toMap();
}

// Integer job id from a numeric value; strings are not accepted.
std::optional<int64_t> integer_id(const QVariant& value) {
    switch (value.metaType().id()) {
        case QMetaType::Int:
        case QMetaType::UInt:
        case QMetaType::LongLong:
        case QMetaType::ULongLong: {
            if (!is_valid_job_id(value.toDouble())) return std::nullopt;
            return value.toLongLong();
        }
        case QMetaType::Double:
        case QMetaType::Float: {
            const double d = value.toDouble();
            if (std::isfinite(d) && std::trunc(d) == d && is_valid_job_id(d)) return static_cast<int64_t>(d);
            return std::nullopt;
        }
        default:
            return std::nullopt;
    }
}

QJsonObject to_json(const QVariant& sanitized) {
    return QJsonObject::fromVariantMap(sanitized.toMap());
}

std::string doc_path_for(const QVariantMap& job) {
    const auto id = job.value(QStringLiteral("id"));
    const auto text = id.isValid() ? id.toString() : QString();
    return "jobs/" + (text.isEmpty() ? std::string("unknown") : text.toStdString());
}

Result<PendingOp, Error> build_job_write(const SyncMutation& mutation, PendingOp op) {
    const auto raw = mutation.payload.value(QStringLiteral("job"));
    if (!is_map(raw)) {
        return Result<PendingOp, Error>::err(rejected(
            std::string(storage::op_type_name(mutation.type)) + " requires a job object"));
    }
    const auto job = to_map(raw);
    auto prepared = schema::prepare_job_for_remote(job, doc_path_for(job));
    if (prepared.is_err()) {
        return Result<PendingOp, Error>::err(prepared.unwrap_err());
    }
    const auto& ready = prepared.unwrap();
    for (const auto& warning : ready.warnings) {
        qCWarning(tinselSanitizeLog) << QString::fromStdString(warning);
    }
    auto cleaned = sanitize::safe_serialize(ready.data);
    op.table = kJobsCollection;
    op.key = std::to_string(ready.id());
    op.payload = QJsonObject{{QStringLiteral("job"), to_json(cleaned.value)}};
    return Result<PendingOp, Error>::ok(std::move(op));
}

Result<PendingOp, Error> build_op(const SyncMutation& mutation, PendingOp op) {
    const auto& payload = mutation.payload;
    switch (mutation.type) {
        case OpType::JobAdd:
        case OpType::JobUpdate:
            return build_job_write(mutation, std::move(op));
        case OpType::JobDelete: {
            const auto id = integer_id(payload.value(QStringLiteral("jobId")));
            if (!id) {
                return Result<PendingOp, Error>::err(rejected("job.delete requires an integer jobId"));
            }
            op.table = kJobsCollection;
            op.key = std::to_string(*id);
            op.payload = QJsonObject{{QStringLiteral("jobId"), static_cast<qint64>(*id)}};
            return Result<PendingOp, Error>::ok(std::move(op));
        }
        case OpType::PolicyUpdate: {
            const auto policy = payload.value(QStringLiteral("policy"));
            if (!is_map(policy)) {
                return Result<PendingOp, Error>::err(rejected("policy.update requires a policy object"));
            }
            auto stripped = sanitize::strip_undefined(to_map(policy));
            op.table = kConfigCollection;
            op.key = kPolicyDocument;
            op.payload = QJsonObject{{QStringLiteral("policy"), to_json(stripped.value)}};
            return Result<PendingOp, Error>::ok(std::move(op));
        }
        case OpType::Put: {
            if (mutation.table.empty() || !mutation.key || mutation.key->empty()) {
                return Result<PendingOp, Error>::err(rejected("put requires a table and a key"));
            }
            auto cleaned = sanitize::safe_serialize(payload);
            op.table = mutation.table;
            op.key = mutation.key;
            op.payload = to_json(cleaned.value);
            return Result<PendingOp, Error>::ok(std::move(op));
        }
        case OpType::Delete: {
            if (mutation.table.empty() || !mutation.key || mutation.key->empty()) {
                return Result<PendingOp, Error>::err(rejected("delete requires a table and a key"));
            }
            op.table = mutation.table;
            op.key = mutation.key;
            return Result<PendingOp, Error>::ok(std::move(op));
        }
        case OpType::Custom: {
            auto cleaned = sanitize::safe_serialize(payload);
            op.table = mutation.table.empty() ? std::string("custom") : mutation.table;
            op.key = mutation.key;
            op.payload = to_json(cleaned.value);
            return Result<PendingOp, Error>::ok(std::move(op));
        }
    }
    return Result<PendingOp, Error>::err(rejected("unsupported operation type"));
}

} // namespace

/**
 * Exclusive hold on one target for the lifetime of a delivery run.
 */
class Outbox::TargetClaim {
public:
    TargetClaim(Outbox& outbox, std::string target) : outbox_(outbox), target_(std::move(target)) {
        std::lock_guard lock(outbox_.mutex_);
        acquired_ = outbox_.in_flight_.insert(target_).second;
    }

    ~TargetClaim() {
        if (!acquired_) return;
        std::lock_guard lock(outbox_.mutex_);
        outbox_.in_flight_.erase(target_);
    }

    TargetClaim(const TargetClaim&) = delete;
    TargetClaim& operator=(const TargetClaim&) = delete;

    [[nodiscard]] bool acquired() const { return acquired_; }

private:
    Outbox& outbox_;
    std::string target_;
    bool acquired_ = false;
};

Outbox::Outbox(storage::LocalStore& store, RemoteBackend& remote, RetryPolicy retry)
    : store_(store), remote_(remote), retry_(retry) {}

Timestamp Outbox::next_created_at() {
    // Strictly increasing, so two ops enqueued in the same millisecond keep
    // their order.
    std::lock_guard lock(mutex_);
    const auto now = Timestamp::now();
    last_created_ = now > last_created_ ? now : last_created_ + Timestamp::Duration(1);
    return last_created_;
}

Result<PendingOp, Error> Outbox::enqueue(const SyncMutation& mutation) {
    const auto created = next_created_at();
    PendingOp op{
        .id = Uuid::generate().to_string(),
        .type = mutation.type,
        .attempt = 0,
        .next_at = created,
        .created_at = created,
        .updated_at = created
    };

    auto built = build_op(mutation, std::move(op));
    if (built.is_err()) {
        const auto& error = built.unwrap_err();
        qCWarning(tinselSyncLog) << "rejected" << storage::op_type_name(mutation.type) << "op:"
                                 << QString::fromStdString(error.message);
        for (const auto& issue : error.issues) {
            qCWarning(tinselSyncLog) << "  " << QString::fromStdString(issue.path.empty() ? "(root)" : issue.path)
                                     << QString::fromStdString(issue.message);
        }
        return built;
    }

    auto pending = std::move(built).unwrap();
    auto stored = store_.put(pending);
    if (stored.is_err()) {
        return Result<PendingOp, Error>::err(stored.unwrap_err());
    }
    qCDebug(tinselSyncLog) << "queued" << storage::op_type_name(pending.type)
                           << QString::fromStdString(pending.target())
                           << QString::fromStdString(pending.id);
    return Result<PendingOp, Error>::ok(std::move(pending));
}

Result<void, Error> Outbox::deliver(const PendingOp& op, ProcessReport& report) {
    auto session = remote_.ensure_session();
    if (session.is_err()) {
        return session;
    }

    const auto op_id = QString::fromStdString(op.id);
    const auto now = static_cast<qint64>(Timestamp::now().millis());

    auto note = [&](const sanitize::Report& sanitized) {
        if (sanitized.empty()) return;
        qCInfo(tinselSanitizeLog) << QString::fromStdString(op.target()) << sanitized.describe();
        report.reports.push_back(OpReport{op.id, op.target(), sanitized});
    };

    switch (op.type) {
        case OpType::JobAdd:
        case OpType::JobUpdate: {
            const auto job = op.payload.value(QStringLiteral("job"));
            if (!job.isObject()) {
                // Cleanup drops job payloads that no longer validate.
                qCWarning(tinselSyncLog) << "op" << op_id << "has no job; acknowledging";
                return Result<void, Error>::ok();
            }
            auto prepared = schema::prepare_job_for_remote(
                job.toObject().toVariantMap(), "jobs/" + op.key.value_or("unknown"));
            if (prepared.is_err()) {
                return Result<void, Error>::err(prepared.unwrap_err());
            }
            auto& ready = prepared.unwrap();
            auto cleaned = sanitize::safe_serialize(ready.data);
            ready.report.merge(cleaned.report);
            note(ready.report);

            auto document = to_json(cleaned.value);
            const auto crew = document.value(QStringLiteral("crew")).toString();
            document.insert(QStringLiteral("bothCrews"), crew == QString::fromUtf8(kBothCrews.data(), kBothCrews.size()));
            document.insert(QStringLiteral("updatedAt"), now);
            document.insert(QStringLiteral("lastOpId"), op_id);
            return remote_.put(kJobsCollection, std::to_string(ready.id()), document, true);
        }
        case OpType::JobDelete:
            return remote_.remove(kJobsCollection, op.key.value_or(std::string{}));
        case OpType::PolicyUpdate: {
            auto stripped = sanitize::strip_undefined(
                op.payload.value(QStringLiteral("policy")).toObject().toVariantMap());
            note(stripped.report);
            auto document = to_json(stripped.value);
            document.insert(QStringLiteral("updatedAt"), now);
            document.insert(QStringLiteral("lastOpId"), op_id);
            return remote_.put(kConfigCollection, kPolicyDocument, document, true);
        }
        case OpType::Put: {
            auto cleaned = sanitize::safe_serialize(op.payload.toVariantMap());
            note(cleaned.report);
            return remote_.put(op.table, op.key.value_or(std::string{}), to_json(cleaned.value), true);
        }
        case OpType::Delete:
            return remote_.remove(op.table, op.key.value_or(std::string{}));
        case OpType::Custom:
            qCDebug(tinselSyncLog) << "custom op" << op_id << "acknowledged";
            return Result<void, Error>::ok();
    }
    return Result<void, Error>::err(Error{"unsupported operation type", ErrorKind::RemoteWriteFailed});
}

Result<void, Error> Outbox::reschedule(const PendingOp& op, const Error& cause) {
    const auto now = Timestamp::now();
    PendingOp retry = op;
    retry.attempt = op.attempt + 1;
    retry.next_at = now + retry_.delay(retry.attempt);
    retry.updated_at = now;
    qCWarning(tinselSyncLog) << "op" << QString::fromStdString(op.id)
                             << QString::fromStdString(op.target()) << "failed (attempt"
                             << retry.attempt << "):" << QString::fromStdString(cause.message)
                             << "retry in" << (retry.next_at - now).count() << "ms";
    return store_.put(retry);
}

Result<ProcessReport, Error> Outbox::process_pending_queue(bool force) {
    const auto threshold = force ? Timestamp(std::numeric_limits<int64_t>::max()) : Timestamp::now();
    auto due = store_.pending_due(threshold);
    if (due.is_err()) {
        return Result<ProcessReport, Error>::err(due.unwrap_err());
    }

    // Targets in order of their oldest due op.
    std::vector<std::pair<std::string, std::optional<std::string>>> targets;
    std::map<std::string, int> due_per_target;
    for (const auto& op : due.unwrap()) {
        if (due_per_target[op.target()]++ == 0) {
            targets.emplace_back(op.table, op.key);
        }
    }

    ProcessReport report;
    for (const auto& [table, key] : targets) {
        const auto target = table + "/" + key.value_or(std::string{});
        TargetClaim claim(*this, target);
        if (!claim.acquired()) {
            report.skipped_in_flight += due_per_target[target];
            continue;
        }

        // Re-read under the claim: another pass may have delivered some.
        auto ops = store_.pending_for_target(table, key);
        if (ops.is_err()) {
            return Result<ProcessReport, Error>::err(ops.unwrap_err());
        }
        for (const auto& op : ops.unwrap()) {
            if (op.next_at > threshold) {
                break;
            }
            auto delivered = deliver(op, report);
            if (delivered.is_err()) {
                ++report.failed;
                auto rescheduled = reschedule(op, delivered.unwrap_err());
                if (rescheduled.is_err()) {
                    return Result<ProcessReport, Error>::err(rescheduled.unwrap_err());
                }
                break;
            }

            auto removed = store_.remove(Table::PendingOps, op.id);
            if (removed.is_err()) {
                return Result<ProcessReport, Error>::err(removed.unwrap_err());
            }
            ++report.delivered;
            auto synced = store_.put(storage::AppStateRecord{
                .key = std::string(storage::kLastSyncKey),
                .value = static_cast<qint64>(Timestamp::now().millis()),
                .updated_at = Timestamp::now()
            });
            if (synced.is_err()) {
                return Result<ProcessReport, Error>::err(synced.unwrap_err());
            }
        }
    }

    if (report.delivered || report.failed) {
        qCInfo(tinselSyncLog) << "queue pass:" << report.delivered << "delivered,"
                              << report.failed << "failed," << report.skipped_in_flight
                              << "skipped in flight";
    }
    return Result<ProcessReport, Error>::ok(std::move(report));
}

Result<int64_t, Error> Outbox::pending_count() {
    return store_.count(Table::PendingOps);
}

Result<std::optional<Timestamp>, Error> Outbox::last_sync_at() {
    auto record = store_.get(Table::State, std::string(storage::kLastSyncKey));
    if (record.is_err()) {
        return Result<std::optional<Timestamp>, Error>::err(record.unwrap_err());
    }
    std::optional<Timestamp> at;
    if (record.unwrap()) {
        if (const auto* state = std::get_if<storage::AppStateRecord>(&*record.unwrap())) {
            if (state->value.isDouble()) {
                at = Timestamp(state->value.toInteger());
            }
        }
    }
    return Result<std::optional<Timestamp>, Error>::ok(at);
}

} // namespace tinsel::sync
