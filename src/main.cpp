#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QSettings>
#include <QTextStream>

#include "cli/inspect_format.hpp"
#include "core/logging.hpp"
#include "storage/database.hpp"
#include "storage/executor.hpp"
#include "storage/migrations.hpp"
#include "storage/remote_clients_and_tabs.hpp"
#include "storage/store_config.hpp"

namespace {

int report_error(const QString& what, const tabsync::Error& error) {
    QTextStream(stderr) << what << QStringLiteral(": ")
                        << QString::fromStdString(error.message) << QLatin1Char('\n');
    return 1;
}

} // namespace

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName("tabsync");
    app.setApplicationVersion("0.1.0");
    app.setOrganizationName("tabsync");
    app.setOrganizationDomain("tabsync.local");

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Inspect and reset the synced tabs store"));
    parser.addHelpOption();
    parser.addVersionOption();

    const QCommandLineOption dbPathOption(
        QStringList{QStringLiteral("db")},
        QStringLiteral("Override database path (sets TABSYNC_DB_PATH for this run)."),
        QStringLiteral("path"));
    parser.addOption(dbPathOption);

    const QCommandLineOption jsonOption(
        QStringList{QStringLiteral("json")},
        QStringLiteral("Output JSON."));
    parser.addOption(jsonOption);

    const QCommandLineOption guidsOption(
        QStringList{QStringLiteral("guids")},
        QStringLiteral("Include client GUIDs and device ids in output."));
    parser.addOption(guidsOption);

    const QCommandLineOption historyOption(
        QStringList{QStringLiteral("history")},
        QStringLiteral("Include tab history in output."));
    parser.addOption(historyOption);

    const QCommandLineOption localOption(
        QStringList{QStringLiteral("local")},
        QStringLiteral("For 'list': show this device's tabs instead of remote clients."));
    parser.addOption(localOption);

    const QCommandLineOption guidOption(
        QStringList{QStringLiteral("guid")},
        QStringLiteral("Client GUID for 'delete-client'."),
        QStringLiteral("guid"));
    parser.addOption(guidOption);

    const QCommandLineOption debugStorageOption(
        QStringList{QStringLiteral("debug-storage")},
        QStringLiteral("Enable storage debug logging (also sets TABSYNC_DEBUG_STORAGE=1)."));
    parser.addOption(debugStorageOption);

    parser.addPositionalArgument(
        QStringLiteral("command"),
        QStringLiteral("list | wipe-remote | wipe-tabs | clear | delete-client (default: list)."));
    parser.process(app);

    if (parser.isSet(dbPathOption)) {
        qputenv("TABSYNC_DB_PATH", parser.value(dbPathOption).toUtf8());
    }
    if (parser.isSet(debugStorageOption)) {
        qputenv("TABSYNC_DEBUG_STORAGE", "1");
    }

    QSettings settings;
    auto config = tabsync::storage::StoreConfig::load(settings);
    config.apply_environment();

    tabsync::set_storage_debug_logging(config.debug_logging);
    if (!config.log_file_path.isEmpty() && !tabsync::install_file_logging(config.log_file_path)) {
        QTextStream(stderr) << "Cannot open log file " << config.log_file_path << '\n';
    }

    QDir().mkpath(QFileInfo(config.database_path).absolutePath());
    auto db_result = tabsync::storage::Database::open(config.database_path.toStdString());
    if (db_result.is_err()) {
        return report_error(QStringLiteral("Failed to open database"), db_result.unwrap_err());
    }
    auto db = std::move(db_result).unwrap();

    auto migrate_result = tabsync::storage::initialize_database(db);
    if (migrate_result.is_err()) {
        return report_error(QStringLiteral("Failed to migrate database"), migrate_result.unwrap_err());
    }

    tabsync::storage::Executor executor(db);
    tabsync::storage::RemoteClientsAndTabs store(executor, config.decode_failure_policy);

    const auto positional = parser.positionalArguments();
    const auto command = positional.isEmpty() ? QStringLiteral("list") : positional.first();

    const tabsync::cli::FormatOptions opts{
        .includeGuids = parser.isSet(guidsOption),
        .includeHistory = parser.isSet(historyOption)
    };

    if (command == QStringLiteral("list")) {
        if (parser.isSet(localOption)) {
            auto result = store.get_tabs_for_client(std::nullopt).result();
            if (result.is_err()) {
                return report_error(QStringLiteral("Failed to read local tabs"), result.unwrap_err());
            }
            QTextStream(stdout) << (parser.isSet(jsonOption)
                ? tabsync::cli::format_tabs_json(result.unwrap(), opts)
                : tabsync::cli::format_tabs(result.unwrap(), opts));
            return 0;
        }

        auto result = store.get_clients_and_tabs().result();
        if (result.is_err()) {
            return report_error(QStringLiteral("Failed to read clients"), result.unwrap_err());
        }
        QTextStream(stdout) << (parser.isSet(jsonOption)
            ? tabsync::cli::format_clients_and_tabs_json(result.unwrap(), opts)
            : tabsync::cli::format_clients_and_tabs(result.unwrap(), opts));
        return 0;
    }

    tabsync::storage::Deferred<void> pending;
    if (command == QStringLiteral("wipe-remote")) {
        pending = store.wipe_remote_tabs();
    } else if (command == QStringLiteral("wipe-tabs")) {
        pending = store.wipe_tabs();
    } else if (command == QStringLiteral("clear")) {
        pending = store.clear();
    } else if (command == QStringLiteral("delete-client")) {
        if (!parser.isSet(guidOption)) {
            QTextStream(stderr) << "delete-client requires --guid\n";
            return 2;
        }
        pending = store.delete_client(parser.value(guidOption).toStdString());
    } else {
        QTextStream(stderr) << "Unknown command: " << command << '\n';
        parser.showHelp(2);
    }

    const auto result = pending.result();
    if (result.is_err()) {
        return report_error(QStringLiteral("Command '%1' failed").arg(command), result.unwrap_err());
    }
    return 0;
}
