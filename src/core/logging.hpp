#pragma once

#include <QLoggingCategory>
#include <QString>

namespace duet {

Q_DECLARE_LOGGING_CATEGORY(transportLog)
Q_DECLARE_LOGGING_CATEGORY(sessionLog)

// Installs a Qt message handler that appends every log line to `path`
// (or default_log_file_path() when empty) and then forwards to the
// previously installed handler, so console output is kept.
void install_file_logging(const QString& path = QString{});

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

// Enables the debug level of the duet.* categories.
void enable_debug_logging();

} // namespace duet
