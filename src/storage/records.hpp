#pragma once

#include "core/job.hpp"
#include "core/types.hpp"

#include <QJsonObject>
#include <QJsonValue>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace tinsel::storage {

/**
 * The four persisted tables.
 */
enum class Table {
    Jobs,
    Policy,
    State,
    PendingOps
};

[[nodiscard]] const char* table_name(Table table);
[[nodiscard]] std::optional<Table> table_from_name(std::string_view name);

inline constexpr std::string_view kPolicyKey = "org";

// Well-known state keys.
inline constexpr std::string_view kActiveDateKey = "activeDate";
inline constexpr std::string_view kCurrentUserKey = "currentUser";
inline constexpr std::string_view kLastSyncKey = "sync:lastSuccess";

/**
 * JobRecord - a job row. `both_crews` is derived from the crew on write.
 */
struct JobRecord {
    Job job;
    bool both_crews = false;
    Timestamp updated_at;

    bool operator==(const JobRecord&) const = default;
};

/**
 * PolicyRecord - the singleton policy row, keyed "org".
 */
struct PolicyRecord {
    std::string key{kPolicyKey};
    Policy policy;
    Timestamp updated_at;

    bool operator==(const PolicyRecord&) const = default;
};

/**
 * AppStateRecord - a generic key/value cell (activeDate, currentUser, ...).
 */
struct AppStateRecord {
    std::string key;
    QJsonValue value;
    Timestamp updated_at;

    bool operator==(const AppStateRecord&) const = default;
};

enum class OpType {
    JobAdd,
    JobUpdate,
    JobDelete,
    PolicyUpdate,
    Put,
    Delete,
    Custom
};

[[nodiscard]] const char* op_type_name(OpType type);
[[nodiscard]] std::optional<OpType> op_type_from_name(std::string_view name);

/**
 * PendingOp - an outbox entry. Only attempt/next_at/updated_at change after
 * it is written; `queue_id` is kept for records migrated from the legacy
 * outbox layout.
 */
struct PendingOp {
    std::string id;
    OpType type = OpType::Custom;
    std::string table;
    std::optional<std::string> key;
    QJsonObject payload;
    int attempt = 0;
    Timestamp next_at;
    Timestamp created_at;
    Timestamp updated_at;
    std::optional<std::string> queue_id;

    // "table/key", the unit of ordering for delivery.
    [[nodiscard]] std::string target() const {
        return table + "/" + key.value_or(std::string{});
    }

    bool operator==(const PendingOp&) const = default;
};

template<typename>
inline constexpr bool always_false_v = false;

using Record = std::variant<JobRecord, PolicyRecord, AppStateRecord, PendingOp>;
using RecordKey = std::variant<int64_t, std::string>;

[[nodiscard]] Table table_of(const Record& record);
[[nodiscard]] RecordKey key_of(const Record& record);
[[nodiscard]] std::string key_to_string(const RecordKey& key);

/**
 * Build a job row, deriving both_crews from the crew name.
 */
[[nodiscard]] JobRecord make_job_record(Job job, Timestamp updated_at);

} // namespace tinsel::storage
