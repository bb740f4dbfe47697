#include "storage/records.hpp"

#include <array>
#include <type_traits>
#include <utility>

namespace tinsel::storage {

namespace {

constexpr std::array<std::pair<OpType, std::string_view>, 7> kOpTypeNames{{
    {OpType::JobAdd, "job.add"},
    {OpType::JobUpdate, "job.update"},
    {OpType::JobDelete, "job.delete"},
    {OpType::PolicyUpdate, "policy.update"},
    {OpType::Put, "put"},
    {OpType::Delete, "delete"},
    {OpType::Custom, "custom"},
}};

} // namespace

const char* table_name(Table table) {
    switch (table) {
        case Table::Jobs: return "jobs";
        case Table::Policy: return "policy";
        case Table::State: return "state";
        case Table::PendingOps: return "pendingOps";
    }
    return "unknown";
}

std::optional<Table> table_from_name(std::string_view name) {
    for (auto table : {Table::Jobs, Table::Policy, Table::State, Table::PendingOps}) {
        if (name == table_name(table)) return table;
    }
    return std::nullopt;
}

const char* op_type_name(OpType type) {
    for (const auto& [candidate, name] : kOpTypeNames) {
        if (candidate == type) return name.data();
    }
    return "custom";
}

std::optional<OpType> op_type_from_name(std::string_view name) {
    for (const auto& [type, candidate] : kOpTypeNames) {
        if (candidate == name) return type;
    }
    return std::nullopt;
}

Table table_of(const Record& record) {
    return std::visit([](const auto& r) -> Table {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, JobRecord>) return Table::Jobs;
        else if constexpr (std::is_same_v<T, PolicyRecord>) return Table::Policy;
        else if constexpr (std::is_same_v<T, AppStateRecord>) return Table::State;
        else if constexpr (std::is_same_v<T, PendingOp>) return Table::PendingOps;
        else static_assert(always_false_v<T>, "unhandled record kind");
    }, record);
}

RecordKey key_of(const Record& record) {
    return std::visit([](const auto& r) -> RecordKey {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, JobRecord>) return r.job.id;
        else if constexpr (std::is_same_v<T, PolicyRecord>) return r.key;
        else if constexpr (std::is_same_v<T, AppStateRecord>) return r.key;
        else if constexpr (std::is_same_v<T, PendingOp>) return r.id;
        else static_assert(always_false_v<T>, "unhandled record kind");
    }, record);
}

std::string key_to_string(const RecordKey& key) {
    if (const auto* id = std::get_if<int64_t>(&key)) {
        return std::to_string(*id);
    }
    return std::get<std::string>(key);
}

JobRecord make_job_record(Job job, Timestamp updated_at) {
    const bool both = job.both_crews();
    return JobRecord{
        .job = std::move(job),
        .both_crews = both,
        .updated_at = updated_at
    };
}

} // namespace tinsel::storage
