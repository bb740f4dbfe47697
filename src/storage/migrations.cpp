#include "storage/migrations.hpp"

#include "storage/maintenance.hpp"
#include "storage/record_repository.hpp"
#include "storage/records.hpp"
#include "core/job_schema.hpp"
#include "core/logging.hpp"
#include "core/types.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <utility>

namespace tinsel::storage {

namespace {

constexpr const char* kInitialSchema = R"SQL(
    CREATE TABLE IF NOT EXISTS jobs (
        id INTEGER PRIMARY KEY,
        date TEXT NOT NULL,
        crew TEXT NOT NULL DEFAULT '',
        client TEXT NOT NULL DEFAULT '',
        scope TEXT NOT NULL DEFAULT '',
        notes TEXT,
        address TEXT,
        neighborhood TEXT,
        zip TEXT,
        house_tier REAL,
        rehang_price REAL,
        lifetime_spend REAL,
        vip INTEGER NOT NULL DEFAULT 0,
        both_crews INTEGER NOT NULL DEFAULT 0,
        materials TEXT,
        updated_at INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS idx_jobs_date ON jobs(date);
    CREATE INDEX IF NOT EXISTS idx_jobs_crew ON jobs(crew);
    CREATE INDEX IF NOT EXISTS idx_jobs_updated ON jobs(updated_at);

    CREATE TABLE IF NOT EXISTS policy (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL,
        updated_at INTEGER NOT NULL
    );

    CREATE TABLE IF NOT EXISTS state (
        key TEXT PRIMARY KEY,
        value TEXT NOT NULL,
        updated_at INTEGER NOT NULL
    );

    -- Outbox, first layout: keyed by queue_id, ordered by ts.
    CREATE TABLE IF NOT EXISTS pending_ops (
        queue_id TEXT PRIMARY KEY,
        kind TEXT,
        target_table TEXT,
        target_key TEXT,
        payload TEXT,
        ts INTEGER
    );
    CREATE INDEX IF NOT EXISTS idx_pending_ops_table ON pending_ops(target_table);
    CREATE INDEX IF NOT EXISTS idx_pending_ops_ts ON pending_ops(ts);
)SQL";

constexpr const char* kPendingOpsTable = R"SQL(
    CREATE TABLE pending_ops_next (
        id TEXT PRIMARY KEY,
        type TEXT NOT NULL,
        target_table TEXT NOT NULL,
        target_key TEXT,
        payload TEXT NOT NULL,
        attempt INTEGER NOT NULL DEFAULT 0,
        next_at INTEGER NOT NULL,
        created_at INTEGER NOT NULL,
        updated_at INTEGER NOT NULL,
        queue_id TEXT
    );
)SQL";

constexpr const char* kPendingOpsIndexes = R"SQL(
    CREATE INDEX IF NOT EXISTS idx_pending_ops_target ON pending_ops(target_table, target_key);
    CREATE INDEX IF NOT EXISTS idx_pending_ops_created ON pending_ops(created_at);
    CREATE INDEX IF NOT EXISTS idx_pending_ops_next ON pending_ops(next_at);
)SQL";

struct LegacyOp {
    std::optional<std::string> queue_id;
    std::optional<std::string> kind;
    std::optional<std::string> table;
    std::optional<std::string> key;
    std::optional<std::string> payload;
    std::optional<int64_t> ts;
};

Result<bool, Error> has_column(Database& db, const std::string& table, const std::string& column) {
    bool found = false;
    auto result = db.query("PRAGMA table_info(" + table + ");", [&](Statement& stmt) {
        if (stmt.column_text(1) == column) found = true;
    });
    if (result.is_err()) {
        return Result<bool, Error>::err(result.unwrap_err());
    }
    return Result<bool, Error>::ok(found);
}

QJsonObject legacy_payload(const LegacyOp& op) {
    QJsonValue body;
    if (op.payload) {
        const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(*op.payload));
        if (doc.isObject()) return doc.object();
        if (doc.isArray()) body = doc.array();
    }
    QJsonObject wrapped{
        {QStringLiteral("table"), op.table ? QJsonValue(QString::fromStdString(*op.table)) : QJsonValue()},
        {QStringLiteral("key"), op.key ? QJsonValue(QString::fromStdString(*op.key)) : QJsonValue()},
    };
    if (!body.isUndefined()) {
        wrapped.insert(QStringLiteral("payload"), body);
    }
    return wrapped;
}

QJsonObject normalized_materials_json(const QJsonValue& value) {
    return materials_to_json(schema::normalize_materials(value.toVariant()));
}

} // namespace

Result<void, Error> reshape_pending_ops(Database& db) {
    auto legacy_layout = has_column(db, "pending_ops", "kind");
    if (legacy_layout.is_err()) {
        return Result<void, Error>::err(legacy_layout.unwrap_err());
    }
    if (!legacy_layout.unwrap()) {
        return Result<void, Error>::ok();
    }

    std::vector<LegacyOp> legacy;
    auto read = db.query(R"SQL(
        SELECT queue_id, kind, target_table, target_key, payload, ts
        FROM pending_ops ORDER BY ts IS NULL, ts, queue_id;
    )SQL", [&](Statement& stmt) {
        legacy.push_back(LegacyOp{
            .queue_id = stmt.column_optional_text(0),
            .kind = stmt.column_optional_text(1),
            .table = stmt.column_optional_text(2),
            .key = stmt.column_optional_text(3),
            .payload = stmt.column_optional_text(4),
            .ts = stmt.column_is_null(5) ? std::nullopt : std::optional<int64_t>(stmt.column_int64(5))
        });
    });
    if (read.is_err()) {
        return read;
    }

    auto created = db.execute(kPendingOpsTable);
    if (created.is_err()) {
        return created;
    }

    // Fresh timestamps, strictly increasing in legacy order so that
    // created_at keeps the original delivery order.
    const auto now = Timestamp::now();
    for (size_t i = 0; i < legacy.size(); ++i) {
        const auto& op = legacy[i];
        const auto stamp = now + Timestamp::Duration(static_cast<int64_t>(i));
        const auto id = op.queue_id.value_or(
            op.table.value_or("op") + "-" + std::to_string(op.ts.value_or(now.millis())));
        const auto type = op.kind
            ? op_type_from_name(*op.kind).value_or(OpType::Custom)
            : OpType::Custom;

        auto inserted = db.run(R"SQL(
            INSERT OR REPLACE INTO pending_ops_next (id, type, target_table, target_key, payload,
                attempt, next_at, created_at, updated_at, queue_id)
            VALUES (?, ?, ?, ?, ?, 0, ?, ?, ?, ?);
        )SQL",
            id, op_type_name(type), op.table.value_or(std::string{}), op.key,
            encode_json_object(legacy_payload(op)),
            now.millis(), stamp.millis(), stamp.millis(), id);
        if (inserted.is_err()) {
            return inserted;
        }
    }

    auto swapped = db.execute(
        "DROP TABLE pending_ops; ALTER TABLE pending_ops_next RENAME TO pending_ops;");
    if (swapped.is_err()) {
        return swapped;
    }
    qCInfo(tinselMigrationsLog) << "reshaped" << legacy.size() << "legacy pending ops";
    return db.execute(kPendingOpsIndexes);
}

Result<void, Error> normalize_stored_materials(Database& db) {
    std::vector<std::pair<int64_t, std::string>> jobs;
    auto read_jobs = db.query("SELECT id, materials FROM jobs WHERE materials IS NOT NULL;",
                              [&](Statement& stmt) {
        const auto doc = QJsonDocument::fromJson(QByteArray::fromStdString(stmt.column_text(1)));
        const auto normalized = normalized_materials_json(doc.isObject() ? QJsonValue(doc.object()) : QJsonValue());
        jobs.emplace_back(stmt.column_int64(0), encode_json_object(normalized));
    });
    if (read_jobs.is_err()) {
        return read_jobs;
    }
    for (const auto& [id, materials] : jobs) {
        auto updated = db.run("UPDATE jobs SET materials = ? WHERE id = ?;", materials, id);
        if (updated.is_err()) {
            return updated;
        }
    }

    std::vector<std::pair<std::string, std::string>> states;
    auto read_state = db.query("SELECT key, value FROM state;", [&](Statement& stmt) {
        auto value = decode_json_value(stmt.column_text(1));
        if (!value.isObject() || !value.toObject().contains(QStringLiteral("materials"))) return;
        auto object = value.toObject();
        object.insert(QStringLiteral("materials"),
                      normalized_materials_json(object.value(QStringLiteral("materials"))));
        states.emplace_back(stmt.column_text(0), encode_json_value(object));
    });
    if (read_state.is_err()) {
        return read_state;
    }
    for (const auto& [key, value] : states) {
        auto updated = db.run("UPDATE state SET value = ? WHERE key = ?;", value, key);
        if (updated.is_err()) {
            return updated;
        }
    }

    std::vector<std::pair<std::string, std::string>> payloads;
    auto read_ops = db.query("SELECT id, payload FROM pending_ops;", [&](Statement& stmt) {
        auto payload = decode_json_object(stmt.column_text(1));
        auto job = payload.value(QStringLiteral("job")).toObject();
        if (!job.contains(QStringLiteral("materials"))) return;
        job.insert(QStringLiteral("materials"),
                   normalized_materials_json(job.value(QStringLiteral("materials"))));
        payload.insert(QStringLiteral("job"), job);
        payloads.emplace_back(stmt.column_text(0), encode_json_object(payload));
    });
    if (read_ops.is_err()) {
        return read_ops;
    }
    for (const auto& [id, payload] : payloads) {
        auto updated = db.run("UPDATE pending_ops SET payload = ? WHERE id = ?;", payload, id);
        if (updated.is_err()) {
            return updated;
        }
    }
    return Result<void, Error>::ok();
}

const std::vector<Migration>& all_migrations() {
    static const std::vector<Migration> migrations = {
        {
            .version = 1,
            .name = "initial_schema",
            .up_sql = kInitialSchema,
            .rewrite = nullptr
        },
        {
            .version = 2,
            .name = "pending_ops_reshape",
            .up_sql = "",
            .rewrite = reshape_pending_ops
        },
        {
            .version = 3,
            .name = "materials_normalization",
            .up_sql = "",
            .rewrite = normalize_stored_materials
        },
        {
            .version = 4,
            .name = "data_cleanup",
            .up_sql = "",
            .rewrite = [](Database& db) -> Result<void, Error> {
                RecordRepository records(db);
                auto cleaned = cleanup_records(records);
                if (cleaned.is_err()) {
                    return Result<void, Error>::err(cleaned.unwrap_err());
                }
                return Result<void, Error>::ok();
            }
        },
    };
    return migrations;
}

Result<void, Error> MigrationRunner::ensure_migrations_table() {
    return db_.execute(R"SQL(
        CREATE TABLE IF NOT EXISTS schema_migrations (
            version INTEGER PRIMARY KEY,
            name TEXT NOT NULL,
            applied_at INTEGER NOT NULL
        );
    )SQL");
}

Result<int, Error> MigrationRunner::current_version() {
    auto ensure_result = ensure_migrations_table();
    if (ensure_result.is_err()) {
        return Result<int, Error>::err(ensure_result.unwrap_err());
    }

    int version = 0;
    auto result = db_.query("SELECT COALESCE(MAX(version), 0) FROM schema_migrations;",
                            [&](Statement& stmt) { version = stmt.column_int(0); });
    if (result.is_err()) {
        return Result<int, Error>::err(result.unwrap_err());
    }
    return Result<int, Error>::ok(version);
}

Result<void, Error> MigrationRunner::set_version(const Migration& m) {
    return db_.run("INSERT INTO schema_migrations (version, name, applied_at) VALUES (?, ?, ?);",
                   m.version, m.name, Timestamp::now().millis());
}

Result<void, Error> MigrationRunner::run_migration(const Migration& m) {
    if (!m.up_sql.empty()) {
        auto exec_result = db_.execute(m.up_sql);
        if (exec_result.is_err()) {
            return exec_result;
        }
    }
    if (m.rewrite) {
        auto rewrite_result = m.rewrite(db_);
        if (rewrite_result.is_err()) {
            return rewrite_result;
        }
    }
    return set_version(m);
}

Result<void, Error> MigrationRunner::migrate() {
    return migrate_to(latest_version());
}

Result<void, Error> MigrationRunner::migrate_to(int target_version) {
    auto current_result = current_version();
    if (current_result.is_err()) {
        return Result<void, Error>::err(
            current_result.unwrap_err().with_kind(ErrorKind::MigrationFailed));
    }

    const int current = current_result.unwrap();
    for (const auto& m : all_migrations()) {
        if (m.version <= current || m.version > target_version) continue;

        auto result = db_.transaction([&]() { return run_migration(m); });
        if (result.is_err()) {
            const auto& cause = result.unwrap_err();
            qCCritical(tinselMigrationsLog) << "migration" << m.version
                                            << QString::fromStdString(m.name) << "failed:"
                                            << QString::fromStdString(cause.message);
            return Result<void, Error>::err(Error{
                "Migration " + std::to_string(m.version) + " (" + m.name + ") failed: " + cause.message,
                ErrorKind::MigrationFailed, cause.code});
        }
        qCInfo(tinselMigrationsLog) << "applied migration" << m.version << QString::fromStdString(m.name);
    }
    return Result<void, Error>::ok();
}

} // namespace tinsel::storage
