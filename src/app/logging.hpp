#pragma once

#include <QString>

namespace quire::app {

// Installs a Qt message handler that appends to the log file. The file is
// QUIRE_LOG_FILE if set, else logs/quire.log under the app-local data dir.
void install_file_logging();

// Returns the log file path in effect (may be empty if unavailable).
QString log_file_path();

} // namespace quire::app
