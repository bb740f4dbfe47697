#include "core/logging.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QDebug>
#include <QMutex>
#include <QMutexLocker>

Q_LOGGING_CATEGORY(tinselStoreLog, "tinsel.store")
Q_LOGGING_CATEGORY(tinselMigrationsLog, "tinsel.migrations")
Q_LOGGING_CATEGORY(tinselBootstrapLog, "tinsel.bootstrap")
Q_LOGGING_CATEGORY(tinselSyncLog, "tinsel.sync")
Q_LOGGING_CATEGORY(tinselSanitizeLog, "tinsel.sanitize")
Q_LOGGING_CATEGORY(tinselRemoteLog, "tinsel.remote")

namespace tinsel {
namespace {

const char* level_tag(QtMsgType type) {
    switch (type) {
        case QtDebugMsg: return "D";
        case QtInfoMsg: return "I";
        case QtWarningMsg: return "W";
        case QtCriticalMsg: return "C";
        case QtFatalMsg: return "F";
    }
    return "?";
}

struct LoggerState {
    QMutex mu;
    QFile file;
    QtMessageHandler previous = nullptr;
};

LoggerState& state() {
    static LoggerState s{};
    return s;
}

void message_handler(QtMsgType type,
                     const QMessageLogContext& ctx,
                     const QString& msg) {
    auto& s = state();
    QMutexLocker lock(&s.mu);

    const auto ts = QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs);
    const auto cat = ctx.category ? QString::fromLatin1(ctx.category) : QString{};
    const auto line = QStringLiteral("%1 %2 %3 %4\n")
                          .arg(ts, QString::fromLatin1(level_tag(type)), cat, msg);

    if (s.file.isOpen()) {
        s.file.write(line.toUtf8());
        s.file.flush();
    }
    if (s.previous) {
        s.previous(type, ctx, msg);
    }
}

} // namespace

void install_file_logging(const QString& path) {
    if (path.isEmpty()) {
        return;
    }

    auto& s = state();
    {
        QMutexLocker lock(&s.mu);
        QDir().mkpath(QFileInfo(path).absolutePath());
        if (s.file.isOpen()) {
            s.file.close();
        }
        s.file.setFileName(path);
        if (!s.file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            qWarning() << "install_file_logging: cannot open" << path << s.file.errorString();
            return;
        }
    }

    qSetMessagePattern(QStringLiteral("%{category} %{message}"));
    auto previous = qInstallMessageHandler(message_handler);
    if (previous != message_handler) {
        QMutexLocker lock(&s.mu);
        s.previous = previous;
    }
}

} // namespace tinsel
