#pragma once

#include <QLoggingCategory>
#include <QString>

namespace pagetree::ui {

Q_DECLARE_LOGGING_CATEGORY(lcTree)
Q_DECLARE_LOGGING_CATEGORY(lcHistory)
Q_DECLARE_LOGGING_CATEGORY(lcStorage)

// Installs a Qt message handler that appends every message to the log file.
// Warnings and above are also passed to the handler it replaces.
void install_file_logging();

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

} // namespace pagetree::ui
