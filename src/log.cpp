/**
 * @file log.cpp
 * @brief Process-wide log handler
 */

#include "log.h"

#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>
#include <utility>

namespace blockio {

namespace {

std::mutex log_mutex;
LogHandler log_handler_fn;
std::atomic<bool> log_enabled{false};

void dispatch(LogLevel level, std::string_view msg) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (log_handler_fn) {
        log_handler_fn(level, msg);
    }
}

} // namespace

void set_log_handler(LogHandler handler) {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_handler_fn = std::move(handler);
    log_enabled.store(static_cast<bool>(log_handler_fn), std::memory_order_release);
}

void clear_log_handler() noexcept {
    std::lock_guard<std::mutex> lock(log_mutex);
    log_enabled.store(false, std::memory_order_release);
    log_handler_fn = nullptr;
}

void log_emit(LogLevel level, std::string_view msg) {
    if (!log_enabled.load(std::memory_order_acquire)) return;
    dispatch(level, msg);
}

namespace detail {

void log_printf(LogLevel level, const char *fmt, ...) {
    // Fast path: skip formatting if nobody listens
    if (!log_enabled.load(std::memory_order_acquire)) return;

    char buf[512];
    va_list ap;
    va_start(ap, fmt);
    int n = vsnprintf(buf, sizeof(buf), fmt, ap);
    va_end(ap);
    if (n < 0) return;

    // Messages longer than the stack buffer are truncated
    dispatch(level, std::string_view(buf, static_cast<size_t>(n) < sizeof(buf)
                                              ? static_cast<size_t>(n)
                                              : sizeof(buf) - 1));
}

} // namespace detail

} // namespace blockio
