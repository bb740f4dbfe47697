#include "app/config.hpp"

#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QtGlobal>
#include <algorithm>

namespace tinsel::app {

namespace {

constexpr const char* kSettingsStorePath = "store/path";
constexpr const char* kSettingsLegacyPath = "legacy/path";
constexpr const char* kSettingsLegacyJobsKey = "legacy/jobs_key";
constexpr const char* kSettingsLegacyPolicyKey = "legacy/policy_key";
constexpr const char* kSettingsLegacyActiveDateKey = "legacy/active_date_key";
constexpr const char* kSettingsLegacyUserKey = "legacy/user_key";
constexpr const char* kSettingsBaseRetry = "sync/base_retry_ms";
constexpr const char* kSettingsMaxRetry = "sync/max_retry_ms";
constexpr const char* kSettingsJitter = "sync/jitter";
constexpr const char* kSettingsProjectId = "remote/project_id";
constexpr const char* kSettingsApiKey = "remote/api_key";
constexpr const char* kSettingsTimeout = "remote/timeout_ms";
constexpr const char* kSettingsLogFile = "log/file";

constexpr const char* kEnvDbPath = "TINSEL_DB_PATH";

constexpr qint64 kDefaultBaseRetryMs = 1000;
constexpr qint64 kDefaultMaxRetryMs = 300000;
constexpr qint64 kDefaultTimeoutMs = 15000;

qint64 normalize_delay(qint64 value, qint64 fallback) {
    return value <= 0 ? fallback : value;
}

QVariant read(const QSettings& settings, const char* key, const QVariant& fallback) {
    return settings.value(QString::fromLatin1(key), fallback);
}

std::string read_key(const QSettings& settings, const char* key, const std::string& fallback) {
    const auto value = read(settings, key, QString{}).toString().trimmed();
    return value.isEmpty() ? fallback : value.toStdString();
}

} // namespace

QString default_store_path() {
    const auto dir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dir.isEmpty() ? QDir::currentPath() : dir).filePath(QStringLiteral("tinsel.db"));
}

EngineConfig load_config(const QSettings& settings) {
    EngineConfig config;

    config.store_path = read(settings, kSettingsStorePath, QString{}).toString();
    const auto env_path = qEnvironmentVariable(kEnvDbPath);
    if (!env_path.isEmpty()) {
        config.store_path = env_path;
    }
    if (config.store_path.isEmpty()) {
        config.store_path = default_store_path();
    }

    config.legacy_path = read(settings, kSettingsLegacyPath, QString{}).toString();
    const LegacyKeys defaults;
    config.legacy_keys = LegacyKeys{
        .jobs = read_key(settings, kSettingsLegacyJobsKey, defaults.jobs),
        .policy = read_key(settings, kSettingsLegacyPolicyKey, defaults.policy),
        .active_date = read_key(settings, kSettingsLegacyActiveDateKey, defaults.active_date),
        .user = read_key(settings, kSettingsLegacyUserKey, defaults.user)
    };

    const auto base = normalize_delay(
        read(settings, kSettingsBaseRetry, kDefaultBaseRetryMs).toLongLong(), kDefaultBaseRetryMs);
    const auto max = std::max(base, normalize_delay(
        read(settings, kSettingsMaxRetry, kDefaultMaxRetryMs).toLongLong(), kDefaultMaxRetryMs));
    config.retry = sync::RetryPolicy{
        .base = std::chrono::milliseconds(base),
        .max = std::chrono::milliseconds(max),
        .jitter = read(settings, kSettingsJitter, true).toBool()
    };

    config.remote.project_id = read(settings, kSettingsProjectId, QString{}).toString().trimmed();
    config.remote.api_key = read(settings, kSettingsApiKey, QString{}).toString().trimmed();
    config.remote.timeout = std::chrono::milliseconds(normalize_delay(
        read(settings, kSettingsTimeout, kDefaultTimeoutMs).toLongLong(), kDefaultTimeoutMs));

    config.log_file = read(settings, kSettingsLogFile, QString{}).toString();
    return config;
}

EngineConfig load_config(const QString& ini_path) {
    if (ini_path.isEmpty()) {
        QSettings settings;
        return load_config(settings);
    }
    QSettings settings(ini_path, QSettings::IniFormat);
    return load_config(settings);
}

} // namespace tinsel::app
