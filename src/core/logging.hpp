#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(tinselStoreLog)
Q_DECLARE_LOGGING_CATEGORY(tinselMigrationsLog)
Q_DECLARE_LOGGING_CATEGORY(tinselBootstrapLog)
Q_DECLARE_LOGGING_CATEGORY(tinselSyncLog)
Q_DECLARE_LOGGING_CATEGORY(tinselSanitizeLog)
Q_DECLARE_LOGGING_CATEGORY(tinselRemoteLog)

namespace tinsel {

// Installs a Qt message handler that appends every message to `path`
// (parent directories are created). An empty path keeps the default handler.
void install_file_logging(const QString& path);

} // namespace tinsel
