#include <catch2/catch_test_macros.hpp>
#include "app/config.hpp"

#include <QSettings>
#include <QTemporaryDir>

using namespace tinsel::app;
using namespace std::chrono_literals;

namespace {

QString write_ini(const QTemporaryDir& dir, const QVariantMap& values) {
    const auto path = dir.filePath(QStringLiteral("tinsel.ini"));
    QSettings settings(path, QSettings::IniFormat);
    for (auto it = values.cbegin(); it != values.cend(); ++it) {
        settings.setValue(it.key(), it.value());
    }
    settings.sync();
    return path;
}

} // namespace

TEST_CASE("load_config reads every section", "[config]") {
    qunsetenv("TINSEL_DB_PATH");
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const auto path = write_ini(dir, {
        {QStringLiteral("store/path"), QStringLiteral("/var/lib/tinsel/jobs.db")},
        {QStringLiteral("legacy/path"), QStringLiteral("/var/lib/tinsel/legacy.ini")},
        {QStringLiteral("legacy/jobs_key"), QStringLiteral("old.jobs")},
        {QStringLiteral("sync/base_retry_ms"), 250},
        {QStringLiteral("sync/max_retry_ms"), 60000},
        {QStringLiteral("sync/jitter"), false},
        {QStringLiteral("remote/project_id"), QStringLiteral(" demo ")},
        {QStringLiteral("remote/api_key"), QStringLiteral("key")},
        {QStringLiteral("remote/timeout_ms"), 5000},
        {QStringLiteral("log/file"), QStringLiteral("/tmp/tinsel.log")},
    });

    const auto config = load_config(path);
    REQUIRE(config.store_path == QStringLiteral("/var/lib/tinsel/jobs.db"));
    REQUIRE(config.legacy_path == QStringLiteral("/var/lib/tinsel/legacy.ini"));
    REQUIRE(config.legacy_keys.jobs == "old.jobs");
    REQUIRE(config.legacy_keys.policy == LegacyKeys{}.policy);
    REQUIRE(config.retry.base == 250ms);
    REQUIRE(config.retry.max == 60000ms);
    REQUIRE_FALSE(config.retry.jitter);
    REQUIRE(config.remote.project_id == QStringLiteral("demo"));
    REQUIRE(config.remote.api_key == QStringLiteral("key"));
    REQUIRE(config.remote.timeout == 5000ms);
    REQUIRE(config.log_file == QStringLiteral("/tmp/tinsel.log"));
}

TEST_CASE("load_config clamps bad retry settings", "[config]") {
    qunsetenv("TINSEL_DB_PATH");
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SECTION("non-positive delays use the defaults") {
        const auto config = load_config(write_ini(dir, {
            {QStringLiteral("sync/base_retry_ms"), -5},
            {QStringLiteral("sync/max_retry_ms"), 0},
            {QStringLiteral("remote/timeout_ms"), -1},
        }));
        REQUIRE(config.retry.base == 1000ms);
        REQUIRE(config.retry.max == 300000ms);
        REQUIRE(config.remote.timeout == 15000ms);
    }

    SECTION("a huge base still yields bounded delays") {
        const auto config = load_config(write_ini(dir, {
            {QStringLiteral("sync/base_retry_ms"), QStringLiteral("10000000000000")},
            {QStringLiteral("sync/jitter"), false},
        }));
        REQUIRE(config.retry.max >= config.retry.base);
        REQUIRE(config.retry.delay(20) == config.retry.max);
    }

    SECTION("max never falls below base") {
        const auto config = load_config(write_ini(dir, {
            {QStringLiteral("sync/base_retry_ms"), 8000},
            {QStringLiteral("sync/max_retry_ms"), 2000},
        }));
        REQUIRE(config.retry.base == 8000ms);
        REQUIRE(config.retry.max == 8000ms);
    }
}

TEST_CASE("TINSEL_DB_PATH overrides the configured store path", "[config]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());
    const auto path = write_ini(dir, {{QStringLiteral("store/path"), QStringLiteral("/from/ini.db")}});

    qputenv("TINSEL_DB_PATH", QByteArrayLiteral("/from/env.db"));
    const auto config = load_config(path);
    qunsetenv("TINSEL_DB_PATH");

    REQUIRE(config.store_path == QStringLiteral("/from/env.db"));
    REQUIRE(load_config(path).store_path == QStringLiteral("/from/ini.db"));
}

TEST_CASE("an empty store path falls back to the data directory", "[config]") {
    qunsetenv("TINSEL_DB_PATH");
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    const auto config = load_config(write_ini(dir, {{QStringLiteral("sync/jitter"), true}}));
    REQUIRE(config.store_path == default_store_path());
    REQUIRE(config.store_path.endsWith(QStringLiteral("tinsel.db")));
    REQUIRE(config.retry.jitter);
}
