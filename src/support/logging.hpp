#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(offgridSyncLog)
Q_DECLARE_LOGGING_CATEGORY(offgridQueueLog)
Q_DECLARE_LOGGING_CATEGORY(offgridStorageLog)
Q_DECLARE_LOGGING_CATEGORY(offgridNetLog)

namespace offgrid::support {

// True when OFFGRID_DEBUG_SYNC is set in the environment.
[[nodiscard]] bool sync_debug_enabled();

// Turns on debug output of the offgrid.* categories. Called at startup when
// sync_debug_enabled() or the CLI asked for it.
void enable_sync_debug_output();

// Installs a Qt message handler that appends timestamped, level-tagged lines
// to `path`, or to default_log_file_path() when `path` is empty. Messages
// are still forwarded to stderr.
void install_file_logging(const QString& path = QString{});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

} // namespace offgrid::support
