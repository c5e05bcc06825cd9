/**
 * @file log.hpp
 * @brief Logging interface for blockio
 *
 * The library never writes to stdout or stderr. Messages go to a single
 * process-wide handler; with no handler installed (the default) they are
 * dropped.
 *
 * Example:
 * @code
 *   blockio::set_log_handler([](blockio::LogLevel level, std::string_view msg) {
 *       std::cerr << "[" << blockio::log_level_name(level) << "] " << msg << "\n";
 *   });
 *
 *   blockio::Engine engine;
 *   blockio::log_emit(blockio::LogLevel::Info, "engine started");
 *   // ... library and app logs dispatched to the handler ...
 *
 *   blockio::clear_log_handler();
 * @endcode
 */

#ifndef BLOCKIO_LOG_HPP
#define BLOCKIO_LOG_HPP

#include <functional>
#include <string_view>

namespace blockio {

/// Log severity levels (match syslog priorities 1:1)
enum class LogLevel {
    Error = 3,   ///< Error condition
    Warning = 4, ///< Warning condition
    Notice = 5,  ///< Normal but significant
    Info = 6,    ///< Informational
    Debug = 7    ///< Debug-level
};

/// Return a short name for the given log level ("ERR", "WARN", etc.)
[[nodiscard]] inline const char *log_level_name(LogLevel level) noexcept {
    switch (level) {
    case LogLevel::Error:
        return "ERR";
    case LogLevel::Warning:
        return "WARN";
    case LogLevel::Notice:
        return "NOTICE";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Debug:
        return "DEBUG";
    default:
        return "???";
    }
}

/// Log handler callback type
using LogHandler = std::function<void(LogLevel, std::string_view)>;

/// Install a process-wide log handler.
///
/// Replaces any previously installed handler. The handler is called from
/// whichever thread emits the log message, including engine workers.
/// Calls are serialized.
void set_log_handler(LogHandler handler);

/// Remove the current log handler.
///
/// After this call the library is silent (default state).
void clear_log_handler() noexcept;

/// Emit a log message through the registered handler (if any).
///
/// No-op when no handler is installed. Thread-safe.
void log_emit(LogLevel level, std::string_view msg);

} // namespace blockio

#endif // BLOCKIO_LOG_HPP
