#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lanpeerApp)

namespace lanpeer {

// Installs the process-wide Qt message handler. Lines go to stderr, and to
// LANPEER_LOG_FILE as well when that variable names a writable file.
// Verbosity comes from LANPEER_LOG (error|warn|info|debug|trace, default info).
// Call once, after the env file is loaded.
void install_logging();

// Filter rules for a LANPEER_LOG level. Unknown levels fall back to info.
[[nodiscard]] QString filter_rules_for_level(const QString& level);

} // namespace lanpeer
