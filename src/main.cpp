#include <QCoreApplication>
#include <QCommandLineParser>
#include <QDir>
#include <QFileInfo>
#include <QMetaObject>
#include <QTextStream>
#include <QUrl>
#include <chrono>

#include "cli/commands.hpp"
#include "config/settings.hpp"
#include "layout/grid_layout.hpp"
#include "network/http_sink.hpp"
#include "storage/database.hpp"
#include "support/logging.hpp"
#include "sync/offline_engine.hpp"

namespace {

int fail(const offgrid::Error& error) {
    QTextStream(stderr) << QString::fromStdString(error.describe()) << QLatin1Char('\n');
    return 1;
}

int fail(const QString& message) {
    QTextStream(stderr) << message << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);

    app.setApplicationName("offgrid");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("offgrid");
    app.setOrganizationDomain("offgrid.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral(
        "Offline mutation queue of the dashboard.\n\n"
        "Commands:\n"
        "  pending                              list queued mutations\n"
        "  enqueue <type> <op> <id> [payload]   queue a mutation\n"
        "  sync                                 replay the queue against --endpoint\n"
        "  clear                                drop every queued mutation\n"
        "  place <w> <h> | place <preset>       first free slot in the pending layout"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override queue database path."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption endpointOption(
        QStringList{QStringLiteral("endpoint")},
        QStringLiteral("Base URL of the dashboard API (overrides sync/endpoint)."),
        QStringLiteral("url"));
    parser.addOption(endpointOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON (for commands that support it)."));
    parser.addOption(jsonOption);

    const QCommandLineOption logFileOption(
        QStringList{QStringLiteral("log-file")},
        QStringLiteral("Also append log output to this file."),
        QStringLiteral("path"));
    parser.addOption(logFileOption);

    const QCommandLineOption debugSyncOption(
        QStringList{QStringLiteral("debug-sync")},
        QStringLiteral("Enable sync debug logging (also sets OFFGRID_DEBUG_SYNC=1)."));
    parser.addOption(debugSyncOption);

    parser.addPositionalArgument(QStringLiteral("command"),
                                 QStringLiteral("Command to run (e.g. 'pending')."));

    parser.process(app);

    if (parser.isSet(debugSyncOption)) {
        qputenv("OFFGRID_DEBUG_SYNC", "1");
    }
    if (offgrid::support::sync_debug_enabled()) {
        offgrid::support::enable_sync_debug_output();
    }
    if (parser.isSet(logFileOption)) {
        offgrid::support::install_file_logging(parser.value(logFileOption));
    }

    auto positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(1);
    }
    const auto command = positional.takeFirst();

    auto settings = offgrid::config::EngineSettings::load();
    if (parser.isSet(dbPathOption)) {
        settings.queue_path = parser.value(dbPathOption);
    }
    if (parser.isSet(endpointOption)) {
        settings.endpoint = parser.value(endpointOption);
    }

    const auto queuePath = settings.resolved_queue_path();
    if (!QDir().mkpath(QFileInfo(queuePath).absolutePath())) {
        return fail(QStringLiteral("Cannot create directory for %1").arg(queuePath));
    }
    auto db_result = offgrid::storage::Database::open(queuePath.toStdString());
    if (db_result.is_err()) {
        return fail(db_result.unwrap_err());
    }
    auto db = std::move(db_result).unwrap();

    const bool syncing = command == QStringLiteral("sync");
    if (syncing && settings.endpoint.isEmpty()) {
        return fail(QStringLiteral("sync needs --endpoint or the sync/endpoint setting"));
    }

    offgrid::network::HttpRemoteSink sink(QUrl(settings.endpoint));
    sink.set_transfer_timeout(std::chrono::milliseconds(settings.request_timeout_ms));

    auto options = settings.engine_options();
    options.start_online = false;
    offgrid::sync::OfflineEngine engine(db, sink, options);

    const auto bounds = settings.grid_bounds();
    engine.set_layout_source([bounds]() {
        return offgrid::sync::LayoutSnapshot{{}, bounds};
    });

    auto init = engine.initialize();
    if (init.is_err()) {
        return fail(init.unwrap_err());
    }

    if (command == QStringLiteral("pending")) {
        const auto records = engine.pending_mutations();
        QTextStream(stdout) << (parser.isSet(jsonOption)
            ? offgrid::cli::format_pending_records_json(records)
            : offgrid::cli::format_pending_records(records));
        return 0;
    }

    if (command == QStringLiteral("enqueue")) {
        auto record = offgrid::cli::parse_enqueue_args(positional);
        if (record.is_err()) {
            return fail(record.unwrap_err());
        }
        auto delta = engine.enqueue(std::move(record).unwrap());
        if (delta.is_err()) {
            return fail(delta.unwrap_err());
        }
        QTextStream(stdout) << QStringLiteral("queued (%1%2), %3 pending\n")
                                   .arg(delta.unwrap() >= 0 ? QStringLiteral("+") : QString{})
                                   .arg(delta.unwrap())
                                   .arg(engine.pendingCount());
        return 0;
    }

    if (command == QStringLiteral("clear")) {
        auto cleared = engine.clear_pending();
        if (cleared.is_err()) {
            return fail(cleared.unwrap_err());
        }
        QTextStream(stdout) << QStringLiteral("queue cleared\n");
        return 0;
    }

    if (command == QStringLiteral("place")) {
        auto size = offgrid::cli::parse_place_args(positional);
        if (size.is_err()) {
            return fail(size.unwrap_err());
        }
        const auto layout = engine.effective_layout();
        auto position = offgrid::layout::find_next_available_position(
            layout.widgets, size.unwrap(), layout.bounds);
        if (position.is_err()) {
            return fail(position.unwrap_err());
        }
        if (!position.unwrap()) {
            QTextStream(stdout) << QStringLiteral("none\n");
            return 2;
        }
        QTextStream(stdout) << QStringLiteral("%1 %2\n")
                                   .arg(position.unwrap()->x)
                                   .arg(position.unwrap()->y);
        return 0;
    }

    if (syncing) {
        int exitCode = 0;
        // The CLI has no connectivity probe: asking to sync means online.
        engine.deliver(offgrid::sync::ConnectivityChanged{true});
        engine.sync_now([&](const offgrid::sync::SyncResult& result) {
            QTextStream(stdout) << offgrid::cli::format_sync_result(result)
                                << QStringLiteral("%1 pending\n").arg(engine.pendingCount());
            exitCode = (result.failed > 0 || result.retrying > 0) ? 3 : 0;
            QMetaObject::invokeMethod(&app, [&]() { app.exit(exitCode); }, Qt::QueuedConnection);
        });
        return app.exec();
    }

    return fail(QStringLiteral("unknown command '%1'").arg(command));
}
