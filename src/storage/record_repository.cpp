#include "storage/record_repository.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <charconv>
#include <type_traits>

namespace tinsel::storage {

namespace {

struct TableSql {
    const char* name;
    const char* primary_key;
    const char* columns;
};

TableSql sql_for(Table table) {
    switch (table) {
        case Table::Jobs:
            return {"jobs", "id",
                    "id, date, crew, client, scope, notes, address, neighborhood, zip, "
                    "house_tier, rehang_price, lifetime_spend, vip, both_crews, materials, updated_at"};
        case Table::Policy:
            return {"policy", "key", "key, value, updated_at"};
        case Table::State:
            return {"state", "key", "key, value, updated_at"};
        case Table::PendingOps:
            return {"pending_ops", "id",
                    "id, type, target_table, target_key, payload, attempt, "
                    "next_at, created_at, updated_at, queue_id"};
    }
    return {"", "", ""};
}

// Index field (record field name) -> column.
std::optional<std::string_view> index_column(Table table, std::string_view field) {
    switch (table) {
        case Table::Jobs:
            if (field == "id") return "id";
            if (field == "date") return "date";
            if (field == "crew") return "crew";
            if (field == "updatedAt") return "updated_at";
            break;
        case Table::Policy:
        case Table::State:
            if (field == "key") return "key";
            break;
        case Table::PendingOps:
            if (field == "id") return "id";
            if (field == "type") return "type";
            if (field == "table") return "target_table";
            if (field == "createdAt") return "created_at";
            if (field == "nextAt") return "next_at";
            if (field == "updatedAt") return "updated_at";
            break;
    }
    return std::nullopt;
}

Result<std::string, Error> text_key(Table table, const RecordKey& key) {
    if (table == Table::Jobs) {
        return Result<std::string, Error>::err(Error{"internal: text key for jobs", ErrorKind::Unknown});
    }
    return Result<std::string, Error>::ok(key_to_string(key));
}

Result<int64_t, Error> job_key(const RecordKey& key) {
    if (const auto* id = std::get_if<int64_t>(&key)) {
        return Result<int64_t, Error>::ok(*id);
    }
    const auto& text = std::get<std::string>(key);
    int64_t id = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), id);
    if (ec != std::errc{} || end != text.data() + text.size()) {
        return Result<int64_t, Error>::err(
            Error{"Job key must be an integer: " + text, ErrorKind::ValidationRejected});
    }
    return Result<int64_t, Error>::ok(id);
}

// Runs `sql` with the record key bound as parameter 1.
template<typename F>
Result<void, Error> with_key(Table table, const RecordKey& key, F&& f) {
    if (table == Table::Jobs) {
        auto id = job_key(key);
        if (id.is_err()) return Result<void, Error>::err(id.unwrap_err());
        return f(id.unwrap());
    }
    auto text = text_key(table, key);
    if (text.is_err()) return Result<void, Error>::err(text.unwrap_err());
    return f(text.unwrap());
}

std::optional<std::string> materials_text(const std::optional<Materials>& materials) {
    if (!materials) return std::nullopt;
    return encode_json_object(materials_to_json(*materials));
}

} // namespace

std::string encode_json_value(const QJsonValue& value) {
    return QJsonDocument(QJsonArray{value}).toJson(QJsonDocument::Compact).toStdString();
}

QJsonValue decode_json_value(const std::string& text) {
    const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(text));
    if (!doc.isArray() || doc.array().isEmpty()) return QJsonValue(QJsonValue::Null);
    return doc.array().at(0);
}

std::string encode_json_object(const QJsonObject& object) {
    return QJsonDocument(object).toJson(QJsonDocument::Compact).toStdString();
}

QJsonObject decode_json_object(const std::string& text) {
    return QJsonDocument::fromJson(QByteArray::fromStdString(text)).object();
}

std::vector<std::string_view> RecordRepository::index_fields(Table table) {
    switch (table) {
        case Table::Jobs: return {"id", "date", "crew", "updatedAt"};
        case Table::Policy:
        case Table::State: return {"key"};
        case Table::PendingOps: return {"id", "type", "table", "createdAt", "nextAt", "updatedAt"};
    }
    return {};
}

JobRecord RecordRepository::row_to_job(const Statement& stmt) {
    std::optional<Materials> materials;
    if (!stmt.column_is_null(14)) {
        materials = materials_from_json(decode_json_object(stmt.column_text(14)));
    }
    return JobRecord{
        .job = Job{
            .id = stmt.column_int64(0),
            .date = stmt.column_text(1),
            .crew = stmt.column_text(2),
            .client = stmt.column_text(3),
            .scope = stmt.column_text(4),
            .notes = stmt.column_optional_text(5),
            .address = stmt.column_optional_text(6),
            .neighborhood = stmt.column_optional_text(7),
            .zip = stmt.column_optional_text(8),
            .house_tier = stmt.column_optional_double(9),
            .rehang_price = stmt.column_optional_double(10),
            .lifetime_spend = stmt.column_optional_double(11),
            .vip = stmt.column_int(12) != 0,
            .materials = materials
        },
        .both_crews = stmt.column_int(13) != 0,
        .updated_at = Timestamp(stmt.column_int64(15))
    };
}

PolicyRecord RecordRepository::row_to_policy(const Statement& stmt) {
    return PolicyRecord{
        .key = stmt.column_text(0),
        .policy = policy_from_json(decode_json_value(stmt.column_text(1))).value_or(Policy{}),
        .updated_at = Timestamp(stmt.column_int64(2))
    };
}

AppStateRecord RecordRepository::row_to_state(const Statement& stmt) {
    return AppStateRecord{
        .key = stmt.column_text(0),
        .value = decode_json_value(stmt.column_text(1)),
        .updated_at = Timestamp(stmt.column_int64(2))
    };
}

PendingOp RecordRepository::row_to_pending_op(const Statement& stmt) {
    return PendingOp{
        .id = stmt.column_text(0),
        .type = op_type_from_name(stmt.column_text(1)).value_or(OpType::Custom),
        .table = stmt.column_text(2),
        .key = stmt.column_optional_text(3),
        .payload = decode_json_object(stmt.column_text(4)),
        .attempt = stmt.column_int(5),
        .next_at = Timestamp(stmt.column_int64(6)),
        .created_at = Timestamp(stmt.column_int64(7)),
        .updated_at = Timestamp(stmt.column_int64(8)),
        .queue_id = stmt.column_optional_text(9)
    };
}

Record RecordRepository::row_to_record(Table table, const Statement& stmt) {
    switch (table) {
        case Table::Jobs: return row_to_job(stmt);
        case Table::Policy: return row_to_policy(stmt);
        case Table::State: return row_to_state(stmt);
        case Table::PendingOps: return row_to_pending_op(stmt);
    }
    return row_to_state(stmt);
}

Result<std::optional<Record>, Error> RecordRepository::get(Table table, const RecordKey& key) {
    const auto sql = sql_for(table);
    const auto query = std::string("SELECT ") + sql.columns + " FROM " + sql.name +
                       " WHERE " + sql.primary_key + " = ?;";

    std::optional<Record> found;
    auto result = with_key(table, key, [&](const auto& bound) {
        return db_.query(query, [&](Statement& stmt) {
            found = row_to_record(table, stmt);
        }, bound);
    });
    if (result.is_err()) {
        return Result<std::optional<Record>, Error>::err(result.unwrap_err());
    }
    return Result<std::optional<Record>, Error>::ok(std::move(found));
}

Result<void, Error> RecordRepository::put(const Record& record) {
    return std::visit([this](const auto& r) -> Result<void, Error> {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, JobRecord>) {
            const auto& job = r.job;
            return db_.run(R"SQL(
                INSERT OR REPLACE INTO jobs (id, date, crew, client, scope, notes, address,
                    neighborhood, zip, house_tier, rehang_price, lifetime_spend, vip,
                    both_crews, materials, updated_at)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
            )SQL",
                job.id, job.date, job.crew, job.client, job.scope,
                job.notes, job.address, job.neighborhood, job.zip,
                job.house_tier, job.rehang_price, job.lifetime_spend,
                job.vip ? 1 : 0, r.both_crews ? 1 : 0,
                materials_text(job.materials), r.updated_at.millis());
        } else if constexpr (std::is_same_v<T, PolicyRecord>) {
            return db_.run(
                "INSERT OR REPLACE INTO policy (key, value, updated_at) VALUES (?, ?, ?);",
                r.key, encode_json_value(policy_to_json(r.policy)), r.updated_at.millis());
        } else if constexpr (std::is_same_v<T, AppStateRecord>) {
            return db_.run(
                "INSERT OR REPLACE INTO state (key, value, updated_at) VALUES (?, ?, ?);",
                r.key, encode_json_value(r.value), r.updated_at.millis());
        } else if constexpr (std::is_same_v<T, PendingOp>) {
            return db_.run(R"SQL(
                INSERT OR REPLACE INTO pending_ops (id, type, target_table, target_key, payload,
                    attempt, next_at, created_at, updated_at, queue_id)
                VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);
            )SQL",
                r.id, op_type_name(r.type), r.table, r.key, encode_json_object(r.payload),
                r.attempt, r.next_at.millis(), r.created_at.millis(), r.updated_at.millis(),
                r.queue_id);
        } else {
            static_assert(always_false_v<T>, "unhandled record kind");
        }
    }, record);
}

Result<void, Error> RecordRepository::remove(Table table, const RecordKey& key) {
    const auto sql = sql_for(table);
    const auto statement = std::string("DELETE FROM ") + sql.name + " WHERE " +
                           sql.primary_key + " = ?;";
    return with_key(table, key, [&](const auto& bound) {
        return db_.run(statement, bound);
    });
}

Result<void, Error> RecordRepository::clear(Table table) {
    return db_.execute(std::string("DELETE FROM ") + sql_for(table).name + ";");
}

Result<int64_t, Error> RecordRepository::count(Table table) {
    int64_t total = 0;
    auto result = db_.query(std::string("SELECT COUNT(*) FROM ") + sql_for(table).name + ";",
                            [&](Statement& stmt) { total = stmt.column_int64(0); });
    if (result.is_err()) {
        return Result<int64_t, Error>::err(result.unwrap_err());
    }
    return Result<int64_t, Error>::ok(total);
}

Result<std::vector<Record>, Error> RecordRepository::scan(Table table, std::string_view index_field) {
    const auto column = index_column(table, index_field);
    if (!column) {
        return Result<std::vector<Record>, Error>::err(Error{
            std::string("No index \"") + std::string(index_field) + "\" on table " + table_name(table),
            ErrorKind::ValidationRejected});
    }

    const auto sql = sql_for(table);
    const auto query = std::string("SELECT ") + sql.columns + " FROM " + sql.name +
                       " ORDER BY " + std::string(*column) + ", " + sql.primary_key + ";";

    std::vector<Record> records;
    auto result = db_.query(query, [&](Statement& stmt) {
        records.push_back(row_to_record(table, stmt));
    });
    if (result.is_err()) {
        return Result<std::vector<Record>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<Record>, Error>::ok(std::move(records));
}

Result<std::vector<PendingOp>, Error> RecordRepository::pending_due(Timestamp threshold) {
    std::vector<PendingOp> ops;
    auto result = db_.query(
        std::string("SELECT ") + sql_for(Table::PendingOps).columns +
            " FROM pending_ops WHERE next_at <= ? ORDER BY created_at, id;",
        [&](Statement& stmt) { ops.push_back(row_to_pending_op(stmt)); },
        threshold.millis());
    if (result.is_err()) {
        return Result<std::vector<PendingOp>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<PendingOp>, Error>::ok(std::move(ops));
}

Result<std::vector<PendingOp>, Error> RecordRepository::pending_for_target(
    const std::string& table,
    const std::optional<std::string>& key
) {
    std::vector<PendingOp> ops;
    auto result = db_.query(
        std::string("SELECT ") + sql_for(Table::PendingOps).columns +
            " FROM pending_ops WHERE target_table = ? AND target_key IS ?"
            " ORDER BY created_at, id;",
        [&](Statement& stmt) { ops.push_back(row_to_pending_op(stmt)); },
        table, key);
    if (result.is_err()) {
        return Result<std::vector<PendingOp>, Error>::err(result.unwrap_err());
    }
    return Result<std::vector<PendingOp>, Error>::ok(std::move(ops));
}

} // namespace tinsel::storage
