#pragma once

#include <QLoggingCategory>
#include <QString>

Q_DECLARE_LOGGING_CATEGORY(lumenDiscoveryLog)
Q_DECLARE_LOGGING_CATEGORY(lumenConnectionLog)

namespace lumen {

// Installs a Qt message handler that writes every message to stderr, plus to
// LUMEN_LOG_FILE when that is set. Calling it again re-reads the environment
// and restarts the clock.
void install_log_handler();

// Enables debug output for every lumen.* category. Also honoured at startup
// through LUMEN_DEBUG_DISCOVERY=1.
void enable_debug_logging();

// Path taken from LUMEN_LOG_FILE (empty when file logging is off).
[[nodiscard]] QString log_file_path();

/**
 * One log line as the handler writes it:
 *
 *   +  1234ms warning discovery: receive failed: ...
 *
 * The time is relative to install_log_handler(), which is what matters when
 * reading a discovery window. The "lumen." prefix is dropped from our own
 * categories; foreign ones (qt.network, default) are kept whole.
 */
[[nodiscard]] QString format_log_line(QtMsgType type,
                                      const char* category,
                                      const QString& message,
                                      qint64 elapsed_ms);

} // namespace lumen
