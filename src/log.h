/**
 * @file log.h
 * @brief Internal logging infrastructure
 *
 * Formats library messages and hands them to the handler installed with
 * blockio::set_log_handler(). Default handler is empty (silent), in which
 * case nothing is formatted.
 */

#ifndef BLOCKIO_LOG_H
#define BLOCKIO_LOG_H

#include <blockio/log.hpp>

namespace blockio::detail {

/**
 * Emit a printf-style log message through the registered handler (if any).
 *
 * No-op when no handler is registered.
 */
void log_printf(LogLevel level, const char *fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace blockio::detail

#endif /* BLOCKIO_LOG_H */
