#pragma once

#include <QLoggingCategory>
#include <QString>

// "tabsync.storage": statement traces (debug), decode skips, insert
// anomalies and transaction failures (warning).
Q_DECLARE_LOGGING_CATEGORY(tabsyncStorageLog)

namespace tabsync {

// Installs a Qt message handler that appends every message to `path`
// (and still forwards it to stderr). Returns false if the file can't be opened.
bool install_file_logging(const QString& path);

// Enables or disables debug output for tabsync.storage.
void set_storage_debug_logging(bool enabled);

} // namespace tabsync
