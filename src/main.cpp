#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDate>
#include <QJsonDocument>
#include <QJsonObject>
#include <QLoggingCategory>
#include <QTextStream>

#include "app/config.hpp"
#include "app/engine.hpp"
#include "app/legacy_source.hpp"
#include "core/logging.hpp"
#include "storage/local_store.hpp"
#include "sync/firestore_backend.hpp"

namespace {

void print(const QJsonObject& json, bool as_json, const QString& text) {
    if (as_json) {
        QTextStream(stdout) << QJsonDocument(json).toJson(QJsonDocument::Compact) << '\n';
    } else {
        QTextStream(stdout) << text << '\n';
    }
}

int fail(const tinsel::Error& error) {
    QTextStream(stderr) << "error (" << tinsel::kind_name(error.kind) << "): "
                        << QString::fromStdString(error.message) << '\n';
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("tinsel");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("Tinsel");
    app.setOrganizationDomain("tinsel.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Offline job store and sync queue"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption configOption(
        QStringList{QStringLiteral("config")},
        QStringLiteral("Read settings from this INI file."),
        QStringLiteral("ini"));
    parser.addOption(configOption);

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets TINSEL_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption logOption(
        QStringList{QStringLiteral("log")},
        QStringLiteral("Append log output to this file."),
        QStringLiteral("file"));
    parser.addOption(logOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption forceOption(
        QStringList{QStringLiteral("force")},
        QStringLiteral("For 'sync': ignore retry backoff and send every pending op."));
    parser.addOption(forceOption);

    const QCommandLineOption verboseOption(
        QStringList{QStringLiteral("verbose")},
        QStringLiteral("Enable debug logging."));
    parser.addOption(verboseOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("bootstrap, status, sync or cleanup."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("TINSEL_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(verboseOption)) {
        QLoggingCategory::setFilterRules(QStringLiteral("tinsel.*.debug=true\n"));
    }

    const auto config = tinsel::app::load_config(parser.value(configOption));
    tinsel::install_file_logging(parser.isSet(logOption) ? parser.value(logOption) : config.log_file);

    const auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const auto command = positional.first();
    const bool asJson = parser.isSet(jsonOption);

    tinsel::storage::LocalStore store(config.store_path.toStdString());
    tinsel::sync::FirestoreRestBackend remote(config.remote);
    tinsel::app::SettingsLegacySource legacy(config.legacy_path);
    tinsel::app::Engine engine(store, remote, legacy, config.legacy_keys, config.retry);

    if (command == QStringLiteral("bootstrap")) {
        tinsel::AppDataSnapshot fallback;
        fallback.active_date = QDate::currentDate().toString(Qt::ISODate).toStdString();
        const auto result = engine.bootstrap_app_data(fallback);
        const auto source = QString::fromLatin1(tinsel::app::source_name(result.source));
        const auto jobs = static_cast<qint64>(result.snapshot.jobs.size());
        print(QJsonObject{
                  {QStringLiteral("source"), source},
                  {QStringLiteral("storeAvailable"), result.store_available},
                  {QStringLiteral("jobs"), jobs},
                  {QStringLiteral("activeDate"), QString::fromStdString(result.snapshot.active_date)}},
              asJson,
              QStringLiteral("%1: %2 jobs (store %3)")
                  .arg(source)
                  .arg(jobs)
                  .arg(result.store_available ? QStringLiteral("available") : QStringLiteral("unavailable")));
        return result.store_available ? 0 : 1;
    }

    auto opened = store.open();
    if (opened.is_err()) {
        return fail(opened.unwrap_err());
    }

    if (command == QStringLiteral("status")) {
        auto pending = engine.outbox().pending_count();
        if (pending.is_err()) return fail(pending.unwrap_err());
        auto version = store.schema_version();
        if (version.is_err()) return fail(version.unwrap_err());
        auto lastSync = engine.outbox().last_sync_at();
        if (lastSync.is_err()) return fail(lastSync.unwrap_err());

        const auto last = lastSync.unwrap()
            ? QJsonValue(static_cast<qint64>(lastSync.unwrap()->millis()))
            : QJsonValue(QJsonValue::Null);
        print(QJsonObject{
                  {QStringLiteral("pending"), static_cast<qint64>(pending.unwrap())},
                  {QStringLiteral("schemaVersion"), version.unwrap()},
                  {QStringLiteral("lastSyncAt"), last}},
              asJson,
              QStringLiteral("pending ops: %1\nschema version: %2\nlast sync: %3")
                  .arg(pending.unwrap())
                  .arg(version.unwrap())
                  .arg(last.isNull() ? QStringLiteral("never") : QString::number(last.toInteger())));
        return 0;
    }

    if (command == QStringLiteral("sync")) {
        auto report = engine.process_pending_queue(parser.isSet(forceOption));
        if (report.is_err()) return fail(report.unwrap_err());
        const auto& r = report.unwrap();
        print(QJsonObject{
                  {QStringLiteral("delivered"), r.delivered},
                  {QStringLiteral("failed"), r.failed},
                  {QStringLiteral("skippedInFlight"), r.skipped_in_flight},
                  {QStringLiteral("sanitized"), static_cast<qint64>(r.reports.size())}},
              asJson,
              QStringLiteral("delivered %1, failed %2, skipped %3")
                  .arg(r.delivered)
                  .arg(r.failed)
                  .arg(r.skipped_in_flight));
        return r.failed == 0 ? 0 : 2;
    }

    if (command == QStringLiteral("cleanup")) {
        auto counts = engine.cleanup_data();
        if (counts.is_err()) return fail(counts.unwrap_err());
        print(QJsonObject{
                  {QStringLiteral("jobs"), counts.unwrap().jobs},
                  {QStringLiteral("pending"), counts.unwrap().pending}},
              asJson,
              QStringLiteral("normalized %1 jobs, %2 pending ops")
                  .arg(counts.unwrap().jobs)
                  .arg(counts.unwrap().pending));
        return 0;
    }

    QTextStream(stderr) << "unknown command: " << command << '\n';
    return 1;
}
