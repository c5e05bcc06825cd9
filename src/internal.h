/**
 * @file internal.h
 * @brief Shared internal utilities
 *
 * Internal header - not part of public API.
 * Common utilities used across multiple internal modules.
 */

#ifndef BLOCKIO_INTERNAL_H
#define BLOCKIO_INTERNAL_H

#include <cstddef>
#include <cstdint>
#include <time.h>

namespace blockio::detail {

/**
 * Get monotonic time in nanoseconds.
 *
 * Uses CLOCK_MONOTONIC for consistent timing that is immune to
 * system clock adjustments.
 *
 * @return Current time in nanoseconds
 */
inline int64_t get_time_ns() noexcept {
    struct timespec ts;
    if (clock_gettime(CLOCK_MONOTONIC, &ts) != 0) {
        return 0; /* Should never happen for CLOCK_MONOTONIC on Linux */
    }
    return static_cast<int64_t>(ts.tv_sec) * 1000000000LL + ts.tv_nsec;
}

inline bool is_power_of_two(size_t v) noexcept {
    return v != 0 && (v & (v - 1)) == 0;
}

/** @p align must be a power of two */
inline bool is_aligned(uintptr_t v, size_t align) noexcept {
    return (v & (align - 1)) == 0;
}

} // namespace blockio::detail

#endif // BLOCKIO_INTERNAL_H
