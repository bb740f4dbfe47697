#include <catch2/catch_test_macros.hpp>
#include "app/bootstrapper.hpp"
#include "app/legacy_source.hpp"
#include "storage/database.hpp"
#include "storage/local_store.hpp"

#include <QSettings>
#include <QTemporaryDir>
#include <map>

using namespace tinsel;
using namespace tinsel::app;
using namespace tinsel::storage;

namespace {

class MapLegacySource final : public LegacySource {
public:
    std::optional<QString> read(const std::string& key) const override {
        auto it = slots.find(key);
        if (it == slots.end()) return std::nullopt;
        return it->second;
    }

    std::map<std::string, QString> slots;
};

const QString kLegacyJobs = QStringLiteral(
    R"([{"id":99,"date":"2024-12-20","crew":"Crew Alpha","client":"Legacy Client","scope":"Rehang",)"
    R"("houseTier":2,"materials":{"zWireFt":40,"malePlugs":2,"femalePlugs":2,"timers":1}}])");
const QString kLegacyPolicy = QStringLiteral(
    R"({"cutoffDateISO":"2024-12-15","blockedClients":["Nope LLC"],"maxJobsPerDay":3})");

AppDataSnapshot fallback_snapshot() {
    AppDataSnapshot snapshot;
    snapshot.active_date = "2024-12-01";
    snapshot.policy.cutoff_date_iso = "2024-12-31";
    return snapshot;
}

MapLegacySource populated_legacy() {
    MapLegacySource legacy;
    legacy.slots["sonl.jobs.v1"] = kLegacyJobs;
    legacy.slots["sonl.policy.v1"] = kLegacyPolicy;
    legacy.slots["sonl.activeDate.v1"] = QStringLiteral(R"("2024-12-20")");
    legacy.slots["sonl.user.v1"] = QStringLiteral(R"({"name":"Sam","role":"dispatcher"})");
    return legacy;
}

} // namespace

TEST_CASE("first launch imports the legacy slots, later launches read the store", "[bootstrap]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto db_path = dir.filePath(QStringLiteral("tinsel.db")).toStdString();
    auto legacy = populated_legacy();

    {
        LocalStore store(db_path);
        Bootstrapper bootstrapper(store, legacy);
        auto result = bootstrapper.bootstrap(fallback_snapshot());

        REQUIRE(result.source == BootstrapSource::LegacyFlatStorage);
        REQUIRE(std::string(source_name(result.source)) == "legacy-localStorage");
        REQUIRE(result.store_available);
        REQUIRE(result.snapshot.jobs.size() == 1);
        REQUIRE(result.snapshot.jobs[0].id == 99);
        REQUIRE(result.snapshot.policy.cutoff_date_iso == "2024-12-15");
        REQUIRE(result.snapshot.policy.max_jobs_per_day == 3);
        REQUIRE(result.snapshot.active_date == "2024-12-20");
        REQUIRE(result.snapshot.user == std::optional<User>(User{.name = "Sam", .role = "dispatcher"}));
        REQUIRE(store.count(Table::Jobs).unwrap() == 1);
    }

    // The legacy slots are not consulted again once the store has jobs.
    legacy.slots["sonl.jobs.v1"] = QStringLiteral("[]");
    legacy.slots["sonl.activeDate.v1"] = QStringLiteral(R"("2030-01-01")");

    LocalStore store(db_path);
    Bootstrapper bootstrapper(store, legacy);
    auto result = bootstrapper.bootstrap(fallback_snapshot());

    REQUIRE(result.source == BootstrapSource::LocalStore);
    REQUIRE(std::string(source_name(result.source)) == "dexie");
    REQUIRE(result.store_available);
    REQUIRE(result.snapshot.jobs.size() == 1);
    REQUIRE(result.snapshot.jobs[0].id == 99);
    REQUIRE(result.snapshot.jobs[0].client == "Legacy Client");
    REQUIRE(result.snapshot.jobs[0].materials.has_value());
    REQUIRE(result.snapshot.jobs[0].materials->timers == 1);
    REQUIRE(result.snapshot.policy.cutoff_date_iso == "2024-12-15");
    REQUIRE(result.snapshot.policy.blocked_clients == std::vector<std::string>{"Nope LLC"});
    REQUIRE(result.snapshot.active_date == "2024-12-20");
    REQUIRE(result.snapshot.user.has_value());
}

TEST_CASE("missing or corrupt legacy slots fall back per field", "[bootstrap]") {
    MapLegacySource legacy;
    legacy.slots["sonl.jobs.v1"] = QStringLiteral("{not json");
    legacy.slots["sonl.policy.v1"] = QStringLiteral("42");
    legacy.slots["sonl.activeDate.v1"] = QStringLiteral(R"("2024-12-05")");

    LocalStore store(":memory:");
    Bootstrapper bootstrapper(store, legacy);
    auto result = bootstrapper.bootstrap(fallback_snapshot());

    REQUIRE(result.source == BootstrapSource::LegacyFlatStorage);
    REQUIRE(result.snapshot.jobs.empty());
    REQUIRE(result.snapshot.policy.cutoff_date_iso == "2024-12-31");
    REQUIRE(result.snapshot.active_date == "2024-12-05");
    REQUIRE_FALSE(result.snapshot.user.has_value());
}

TEST_CASE("legacy jobs without a numeric id are skipped", "[bootstrap]") {
    MapLegacySource legacy;
    legacy.slots["sonl.jobs.v1"] = QStringLiteral(
        R"([{"id":"x","date":"2024-12-20"},7,{"id":5,"date":"2024-12-21","crew":"Crew Beta","client":"C","scope":"S"}])");

    LocalStore store(":memory:");
    Bootstrapper bootstrapper(store, legacy);
    auto snapshot = bootstrapper.read_legacy(fallback_snapshot());

    REQUIRE(snapshot.jobs.size() == 1);
    REQUIRE(snapshot.jobs[0].id == 5);
}

TEST_CASE("an unavailable store yields the fallback", "[bootstrap]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    // A directory cannot be opened as a database file.
    LocalStore store(dir.path().toStdString());
    auto legacy = populated_legacy();
    Bootstrapper bootstrapper(store, legacy);
    auto result = bootstrapper.bootstrap(fallback_snapshot());

    REQUIRE(result.source == BootstrapSource::Fallback);
    REQUIRE(std::string(source_name(result.source)) == "fallback");
    REQUIRE_FALSE(result.store_available);
    REQUIRE(result.snapshot == fallback_snapshot());
}

TEST_CASE("a read failure after open falls back with the store still available", "[bootstrap]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto db_path = dir.filePath(QStringLiteral("tinsel.db")).toStdString();

    LocalStore store(db_path);
    REQUIRE(store.open().is_ok());
    {
        auto side = Database::open(db_path).unwrap();
        REQUIRE(side.run("DROP TABLE jobs;").is_ok());
    }

    auto legacy = populated_legacy();
    Bootstrapper bootstrapper(store, legacy);
    auto result = bootstrapper.bootstrap(fallback_snapshot());

    REQUIRE(result.source == BootstrapSource::Fallback);
    REQUIRE(result.store_available);
    REQUIRE(result.snapshot == fallback_snapshot());

    // Tables other than jobs still accept writes.
    REQUIRE(store.is_open());
    REQUIRE(store.put(AppStateRecord{
        .key = std::string(kActiveDateKey),
        .value = QStringLiteral("2024-12-02"),
        .updated_at = Timestamp::now()
    }).is_ok());
}

TEST_CASE("a failed legacy import falls back and writes nothing", "[bootstrap]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto db_path = dir.filePath(QStringLiteral("tinsel.db")).toStdString();

    LocalStore store(db_path);
    REQUIRE(store.open().is_ok());
    {
        auto side = Database::open(db_path).unwrap();
        REQUIRE(side.run(
            "CREATE TRIGGER reject_policy BEFORE INSERT ON policy "
            "BEGIN SELECT RAISE(ABORT, 'policy is read-only'); END;").is_ok());
    }

    auto legacy = populated_legacy();
    Bootstrapper bootstrapper(store, legacy);
    auto result = bootstrapper.bootstrap(fallback_snapshot());

    REQUIRE(result.source == BootstrapSource::Fallback);
    REQUIRE(result.store_available);
    REQUIRE(result.snapshot == fallback_snapshot());
    // The import is one transaction, so the jobs written before the policy roll back.
    REQUIRE(store.count(Table::Jobs).unwrap() == 0);
}

TEST_CASE("SettingsLegacySource reads JSON slots from an INI file", "[bootstrap]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto ini = dir.filePath(QStringLiteral("legacy.ini"));
    {
        QSettings settings(ini, QSettings::IniFormat);
        settings.setValue(QStringLiteral("sonl.jobs.v1"), kLegacyJobs);
        settings.setValue(QStringLiteral("sonl.policy.v1"), kLegacyPolicy);
        settings.sync();
        REQUIRE(settings.status() == QSettings::NoError);
    }

    SettingsLegacySource legacy(ini);
    REQUIRE(legacy.read("sonl.jobs.v1") == std::optional<QString>(kLegacyJobs));
    REQUIRE_FALSE(legacy.read("sonl.user.v1").has_value());

    LocalStore store(":memory:");
    Bootstrapper bootstrapper(store, legacy);
    auto result = bootstrapper.bootstrap(fallback_snapshot());

    REQUIRE(result.source == BootstrapSource::LegacyFlatStorage);
    REQUIRE(result.snapshot.jobs.size() == 1);
    REQUIRE(result.snapshot.jobs[0].id == 99);
    REQUIRE(result.snapshot.policy.cutoff_date_iso == "2024-12-15");
    REQUIRE(result.snapshot.active_date == "2024-12-01");
}

TEST_CASE("parse_json_text accepts bare scalars", "[bootstrap]") {
    REQUIRE(parse_json_text(QStringLiteral("\"2024-12-01\""))->toString() == QStringLiteral("2024-12-01"));
    REQUIRE(parse_json_text(QStringLiteral("null"))->isNull());
    REQUIRE(parse_json_text(QStringLiteral("3"))->toInt() == 3);
    REQUIRE_FALSE(parse_json_text(QStringLiteral("1, 2")).has_value());
    REQUIRE_FALSE(parse_json_text(QStringLiteral("{")).has_value());
}
