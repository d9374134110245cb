#pragma once

#include <QLoggingCategory>
#include <QString>

namespace tether {

Q_DECLARE_LOGGING_CATEGORY(tetherContextLog)
Q_DECLARE_LOGGING_CATEGORY(tetherStoreLog)
Q_DECLARE_LOGGING_CATEGORY(tetherBusLog)
Q_DECLARE_LOGGING_CATEGORY(tetherRepositoryLog)

namespace app {

struct StoreConfig;

// Installs a Qt message handler that appends "<time> <level> <category> <message>"
// lines to `path`, or to default_log_file_path() when `path` is empty.
void install_file_logging(const QString& path = QString{});

// File logging to config.log_file_path when set; otherwise Qt's default
// handler is restored.
void configure_logging(const StoreConfig& config);

// Returns the default log file path (may be empty if unavailable).
QString default_log_file_path();

} // namespace app
} // namespace tether
