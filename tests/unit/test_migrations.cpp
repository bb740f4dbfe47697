#include <catch2/catch_test_macros.hpp>
#include "storage/database.hpp"
#include "storage/migrations.hpp"
#include "storage/record_repository.hpp"

#include <QTemporaryDir>

using namespace tinsel;
using namespace tinsel::storage;

namespace {

Database legacy_db_with_queued_put() {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);
    REQUIRE(runner.migrate_to(1).is_ok());
    REQUIRE(db.execute(R"SQL(
        INSERT INTO pending_ops (queue_id, kind, target_table, target_key, payload, ts)
        VALUES ('abc', 'put', 'jobs', '123', '{"id":123,"crew":"Crew Alpha"}', 1700000000000);
    )SQL").is_ok());
    return db;
}

std::vector<PendingOp> all_ops(Database& db) {
    RecordRepository repo(db);
    std::vector<PendingOp> ops;
    for (auto& record : repo.scan(Table::PendingOps, "createdAt").unwrap()) {
        ops.push_back(std::get<PendingOp>(record));
    }
    return ops;
}

} // namespace

TEST_CASE("Fresh database migrates to the latest version", "[migrations]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);

    REQUIRE(runner.current_version().unwrap() == 0);
    REQUIRE(runner.migrate().is_ok());
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    REQUIRE(MigrationRunner::latest_version() == 4);
}

TEST_CASE("Migrations are listed in increasing version order", "[migrations]") {
    const auto& migrations = all_migrations();
    REQUIRE_FALSE(migrations.empty());
    for (size_t i = 1; i < migrations.size(); ++i) {
        REQUIRE(migrations[i].version == migrations[i - 1].version + 1);
    }
}

TEST_CASE("Legacy queued operation is reshaped into a pending op", "[migrations]") {
    auto db = legacy_db_with_queued_put();
    MigrationRunner runner(db);
    REQUIRE(runner.migrate().is_ok());

    auto ops = all_ops(db);
    REQUIRE(ops.size() == 1);
    const auto& op = ops.front();

    REQUIRE(op.id == "abc");
    REQUIRE(op.queue_id == std::optional<std::string>("abc"));
    REQUIRE(op.type == OpType::Put);
    REQUIRE(op.table == "jobs");
    REQUIRE(op.key == std::optional<std::string>("123"));
    REQUIRE(op.attempt == 0);
    REQUIRE(op.next_at.millis() > 0);
    REQUIRE(op.created_at.millis() > 0);
    REQUIRE(op.updated_at.millis() > 0);
    REQUIRE(op.created_at.millis() != 1700000000000);
    REQUIRE(op.payload.value(QStringLiteral("crew")).toString() == QStringLiteral("Crew Alpha"));
}

TEST_CASE("Running the upgrade twice leaves pending ops unchanged", "[migrations]") {
    auto db = legacy_db_with_queued_put();
    MigrationRunner runner(db);
    REQUIRE(runner.migrate().is_ok());
    const auto once = all_ops(db);

    REQUIRE(runner.migrate().is_ok());
    REQUIRE(all_ops(db) == once);

    // The reshape step itself is a no-op on the current layout.
    REQUIRE(reshape_pending_ops(db).is_ok());
    REQUIRE(all_ops(db) == once);
}

TEST_CASE("Unknown legacy kinds become custom ops", "[migrations]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);
    REQUIRE(runner.migrate_to(1).is_ok());
    REQUIRE(db.execute(R"SQL(
        INSERT INTO pending_ops (queue_id, kind, target_table, target_key, payload, ts)
        VALUES ('k1', 'kudos.react', 'kudos', 'x', '[1,2]', 5),
               ('k2', NULL, 'notes', NULL, NULL, 6);
    )SQL").is_ok());
    REQUIRE(runner.migrate().is_ok());

    auto ops = all_ops(db);
    REQUIRE(ops.size() == 2);
    REQUIRE(ops[0].id == "k1");
    REQUIRE(ops[0].type == OpType::Custom);
    REQUIRE(ops[0].payload.value(QStringLiteral("payload")).isArray());
    REQUIRE(ops[1].id == "k2");
    REQUIRE(ops[1].type == OpType::Custom);
    REQUIRE_FALSE(ops[1].key.has_value());
    REQUIRE(ops[0].created_at < ops[1].created_at);
}

TEST_CASE("Materials are normalized by the version 3 step", "[migrations]") {
    auto db = Database::open_memory().unwrap();
    MigrationRunner runner(db);
    REQUIRE(runner.migrate_to(2).is_ok());
    REQUIRE(db.execute(R"SQL(
        INSERT INTO jobs (id, date, crew, client, scope, house_tier, vip, both_crews, materials, updated_at)
        VALUES (1, '2024-12-01', 'Crew Alpha', 'A', 'B', 2, 0, 0,
                '{"extCords":"12.257","malePlugs":-3,"femalePlugs":"2.9","timers":1}', 1);
    )SQL").is_ok());
    REQUIRE(runner.migrate().is_ok());

    RecordRepository repo(db);
    auto job = std::get<JobRecord>(*repo.get(Table::Jobs, int64_t{1}).unwrap()).job;
    REQUIRE(job.materials.has_value());
    REQUIRE(job.materials->z_wire_ft == 12.26);
    REQUIRE(job.materials->male_plugs == 0);
    REQUIRE(job.materials->female_plugs == 2);
    REQUIRE(job.materials->timers == 1);
}

TEST_CASE("A failing migration is reported as MigrationFailed", "[migrations]") {
    auto db = Database::open_memory().unwrap();
    // A pre-existing view named like a table blocks the initial schema.
    REQUIRE(db.execute("CREATE VIEW jobs AS SELECT 1 AS id;").is_ok());

    MigrationRunner runner(db);
    auto result = runner.migrate();
    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().kind == ErrorKind::MigrationFailed);
    REQUIRE(runner.current_version().unwrap() == 0);
}

TEST_CASE("Migrated file store reopens at the latest version", "[migrations]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = dir.filePath(QStringLiteral("m.db")).toStdString();
    {
        auto db = Database::open(path).unwrap();
        MigrationRunner runner(db);
        REQUIRE(runner.migrate().is_ok());
    }
    auto db = Database::open(path).unwrap();
    MigrationRunner runner(db);
    REQUIRE(runner.current_version().unwrap() == MigrationRunner::latest_version());
    REQUIRE(runner.migrate().is_ok());
}
