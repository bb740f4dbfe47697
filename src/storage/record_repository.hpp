#pragma once

#include "storage/database.hpp"
#include "storage/records.hpp"
#include "core/result.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tinsel::storage {

/**
 * RecordRepository - row mapping for the four record tables.
 *
 * Holds no state beyond the connection; callers provide synchronization
 * and transaction boundaries.
 */
class RecordRepository {
public:
    explicit RecordRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Record>, Error> get(Table table, const RecordKey& key);

    /**
     * Upsert by primary key.
     */
    [[nodiscard]] Result<void, Error> put(const Record& record);

    [[nodiscard]] Result<void, Error> remove(Table table, const RecordKey& key);
    [[nodiscard]] Result<void, Error> clear(Table table);
    [[nodiscard]] Result<int64_t, Error> count(Table table);

    /**
     * All records of a table ordered by an indexed field (ties broken by
     * primary key). Unknown fields are rejected.
     */
    [[nodiscard]] Result<std::vector<Record>, Error> scan(Table table, std::string_view index_field);

    /**
     * Pending operations with next_at <= threshold, oldest first.
     */
    [[nodiscard]] Result<std::vector<PendingOp>, Error> pending_due(Timestamp threshold);

    /**
     * Pending operations for one (table, key) target, oldest first.
     */
    [[nodiscard]] Result<std::vector<PendingOp>, Error> pending_for_target(
        const std::string& table,
        const std::optional<std::string>& key);

    /**
     * Indexed fields accepted by scan() for a table.
     */
    [[nodiscard]] static std::vector<std::string_view> index_fields(Table table);

private:
    Database& db_;

    [[nodiscard]] static JobRecord row_to_job(const Statement& stmt);
    [[nodiscard]] static PolicyRecord row_to_policy(const Statement& stmt);
    [[nodiscard]] static AppStateRecord row_to_state(const Statement& stmt);
    [[nodiscard]] static PendingOp row_to_pending_op(const Statement& stmt);
    [[nodiscard]] static Record row_to_record(Table table, const Statement& stmt);
};

// Scalar JSON values round-trip through a one-element array.
[[nodiscard]] std::string encode_json_value(const QJsonValue& value);
[[nodiscard]] QJsonValue decode_json_value(const std::string& text);

[[nodiscard]] std::string encode_json_object(const QJsonObject& object);
[[nodiscard]] QJsonObject decode_json_object(const std::string& text);

} // namespace tinsel::storage
