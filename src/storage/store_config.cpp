#include "storage/store_config.hpp"

#include <QDir>
#include <QStandardPaths>
#include <QtGlobal>

namespace tabsync::storage {

namespace {

const QString kDatabasePathKey = QStringLiteral("storage/databasePath");
const QString kDecodePolicyKey = QStringLiteral("storage/decodeFailurePolicy");
const QString kDebugKey = QStringLiteral("logging/debug");
const QString kLogFileKey = QStringLiteral("logging/filePath");

} // namespace

QString default_database_path() {
    const auto dataPath = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (dataPath.isEmpty()) {
        return QStringLiteral("tabsync.db");
    }
    return QDir(dataPath).filePath(QStringLiteral("tabsync.db"));
}

QString to_string(DecodeFailurePolicy policy) {
    switch (policy) {
        case DecodeFailurePolicy::SkipRow: return QStringLiteral("skip");
        case DecodeFailurePolicy::FailQuery: return QStringLiteral("fail");
    }
    return QStringLiteral("skip");
}

DecodeFailurePolicy parse_decode_failure_policy(const QString& value) {
    if (value.trimmed().compare(QStringLiteral("fail"), Qt::CaseInsensitive) == 0) {
        return DecodeFailurePolicy::FailQuery;
    }
    return DecodeFailurePolicy::SkipRow;
}

StoreConfig StoreConfig::load(const QSettings& settings) {
    StoreConfig config;
    config.database_path = settings.value(kDatabasePathKey, default_database_path()).toString();
    config.decode_failure_policy = parse_decode_failure_policy(
        settings.value(kDecodePolicyKey, QStringLiteral("skip")).toString());
    config.debug_logging = settings.value(kDebugKey, false).toBool();
    config.log_file_path = settings.value(kLogFileKey).toString();
    return config;
}

void StoreConfig::save(QSettings& settings) const {
    settings.setValue(kDatabasePathKey, database_path);
    settings.setValue(kDecodePolicyKey, to_string(decode_failure_policy));
    settings.setValue(kDebugKey, debug_logging);
    if (log_file_path.isEmpty()) {
        settings.remove(kLogFileKey);
    } else {
        settings.setValue(kLogFileKey, log_file_path);
    }
}

void StoreConfig::apply_environment() {
    const auto overridePath = qEnvironmentVariable("TABSYNC_DB_PATH");
    if (!overridePath.isEmpty()) {
        database_path = overridePath;
    }
    if (qEnvironmentVariableIsSet("TABSYNC_DEBUG_STORAGE")) {
        debug_logging = qEnvironmentVariableIntValue("TABSYNC_DEBUG_STORAGE") != 0;
    }
}

} // namespace tabsync::storage
