#pragma once

#include "app/bootstrapper.hpp"
#include "sync/backoff.hpp"
#include "sync/firestore_backend.hpp"

#include <QString>

class QSettings;

namespace tinsel::app {

/**
 * EngineConfig - everything the engine reads from settings.
 */
struct EngineConfig {
    QString store_path;
    QString legacy_path;
    LegacyKeys legacy_keys;
    sync::RetryPolicy retry;
    sync::FirestoreConfig remote;
    QString log_file;
};

/**
 * Read the config from `settings`. TINSEL_DB_PATH, when set, replaces
 * store/path. Out-of-range numbers are clamped.
 */
[[nodiscard]] EngineConfig load_config(const QSettings& settings);

/**
 * Same, from an INI file, or from the application's default settings when
 * `ini_path` is empty.
 */
[[nodiscard]] EngineConfig load_config(const QString& ini_path = {});

/**
 * Default database location under the application data directory.
 */
[[nodiscard]] QString default_store_path();

} // namespace tinsel::app
