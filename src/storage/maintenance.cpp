#include "storage/maintenance.hpp"

#include "core/job_schema.hpp"
#include "core/logging.hpp"
#include "core/sanitize.hpp"

#include <type_traits>

namespace tinsel::storage {

namespace {

JobRecord cleaned_job(const JobRecord& record) {
    auto normalized = schema::normalize_job(record.job);
    Job job = normalized.is_ok()
        ? std::move(normalized).unwrap()
        : schema::trim_job_strings(record.job);
    if (normalized.is_err()) {
        qCWarning(tinselStoreLog) << "job" << record.job.id << "kept with trimmed strings:"
                                  << QString::fromStdString(normalized.unwrap_err().message);
    }
    return make_job_record(std::move(job), record.updated_at);
}

PendingOp cleaned_op(const PendingOp& op) {
    PendingOp out = op;
    const auto job = op.payload.value(QStringLiteral("job"));
    if (job.isObject()) {
        const auto job_id = job.toObject().value(QStringLiteral("id"));
        const auto doc_path = "store/pending/" +
            (job_id.isUndefined() ? op.id : job_id.toVariant().toString().toStdString());
        auto prepared = schema::prepare_job_for_remote(job.toObject().toVariantMap(), doc_path);
        if (prepared.is_ok()) {
            out.payload.insert(QStringLiteral("job"),
                               QJsonObject::fromVariantMap(prepared.unwrap().data));
        } else {
            out.payload.remove(QStringLiteral("job"));
        }
    }
    auto cleaned = sanitize::safe_serialize(out.payload.toVariantMap());
    out.payload = QJsonObject::fromVariantMap(cleaned.value.toMap());
    return out;
}

} // namespace

std::optional<Record> cleaned_record(const Record& record) {
    return std::visit([](const auto& r) -> std::optional<Record> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, JobRecord>) {
            return cleaned_job(r);
        } else if constexpr (std::is_same_v<T, PendingOp>) {
            if (r.type == OpType::JobAdd || r.type == OpType::JobUpdate ||
                r.payload.contains(QStringLiteral("job"))) {
                return cleaned_op(r);
            }
            return std::nullopt;
        } else if constexpr (std::is_same_v<T, PolicyRecord> || std::is_same_v<T, AppStateRecord>) {
            return std::nullopt;
        } else {
            static_assert(always_false_v<T>, "unhandled record kind");
        }
    }, record);
}

Result<CleanupCounts, Error> cleanup_records(RecordRepository& records) {
    CleanupCounts counts;
    for (auto table : {Table::Jobs, Table::PendingOps}) {
        auto scanned = records.scan(table, table == Table::Jobs ? "id" : "createdAt");
        if (scanned.is_err()) {
            return Result<CleanupCounts, Error>::err(scanned.unwrap_err());
        }
        for (const auto& record : scanned.unwrap()) {
            auto cleaned = cleaned_record(record);
            if (!cleaned) continue;
            if (*cleaned != record) {
                auto put = records.put(*cleaned);
                if (put.is_err()) {
                    return Result<CleanupCounts, Error>::err(put.unwrap_err());
                }
            }
            ++(table == Table::Jobs ? counts.jobs : counts.pending);
        }
    }
    if (counts.jobs || counts.pending) {
        qCInfo(tinselStoreLog) << "cleanup normalized" << counts.jobs << "jobs and"
                               << counts.pending << "pending ops";
    }
    return Result<CleanupCounts, Error>::ok(counts);
}

} // namespace tinsel::storage
