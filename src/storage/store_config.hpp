#pragma once

#include "storage/codecs.hpp"
#include <QSettings>
#include <QString>

namespace tabsync::storage {

/**
 * StoreConfig - Where the tab store lives and how it behaves.
 *
 * Settings keys:
 *   storage/databasePath         database file (default: <AppData>/tabsync.db)
 *   storage/decodeFailurePolicy  "skip" (default) or "fail"
 *   logging/debug                enable tabsync.storage debug output
 *   logging/filePath             append log lines to this file when set
 *
 * Environment overrides, applied last:
 *   TABSYNC_DB_PATH, TABSYNC_DEBUG_STORAGE
 */
struct StoreConfig {
    QString database_path;
    DecodeFailurePolicy decode_failure_policy = DecodeFailurePolicy::SkipRow;
    bool debug_logging = false;
    QString log_file_path;

    [[nodiscard]] static StoreConfig load(const QSettings& settings);

    void save(QSettings& settings) const;

    // Override fields from TABSYNC_* environment variables.
    void apply_environment();
};

[[nodiscard]] QString default_database_path();

[[nodiscard]] QString to_string(DecodeFailurePolicy policy);

// Unknown values fall back to SkipRow.
[[nodiscard]] DecodeFailurePolicy parse_decode_failure_policy(const QString& value);

} // namespace tabsync::storage
