#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(folioSyncLog)
Q_DECLARE_LOGGING_CATEGORY(folioStoreLog)
Q_DECLARE_LOGGING_CATEGORY(folioCliLog)

namespace folio::sync {

// Installs a Qt message handler that appends timestamped lines to the log file.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Turns on folio.sync debug output (FOLIO_DEBUG_SYNC=1 or --debug-sync).
void enable_sync_debug_logging();

[[nodiscard]] bool sync_debug_requested();

} // namespace folio::sync
