/**
 * @file stats.hpp
 * @brief Statistics class for blockio
 */

#ifndef BLOCKIO_STATS_HPP
#define BLOCKIO_STATS_HPP

#include <blockio/fwd.hpp>

#include <cstddef>
#include <cstdint>

namespace blockio {

/**
 * Engine statistics snapshot
 *
 * Provides read-only access to engine metrics. Counters are cumulative
 * since engine construction.
 */
class Stats {
  public:
    /**
     * Get total operations accepted by submit_read()/submit_write()
     * @return Number of submitted operations
     */
    [[nodiscard]] int64_t ops_submitted() const noexcept { return ops_submitted_; }

    /**
     * Get total operations completed (successfully or not)
     * @return Number of completed operations
     */
    [[nodiscard]] int64_t ops_completed() const noexcept { return ops_completed_; }

    /**
     * Get total operations that completed with an IoError
     * @return Number of failed operations
     */
    [[nodiscard]] int64_t ops_failed() const noexcept { return ops_failed_; }

    [[nodiscard]] int64_t bytes_read() const noexcept { return bytes_read_; }
    [[nodiscard]] int64_t bytes_written() const noexcept { return bytes_written_; }

    /**
     * Get total bytes transferred
     * @return Bytes read plus bytes written
     */
    [[nodiscard]] int64_t bytes_transferred() const noexcept {
        return bytes_read_ + bytes_written_;
    }

    /**
     * Get current in-flight operation count
     * @return Operations holding a queue slot
     */
    [[nodiscard]] int current_in_flight() const noexcept { return current_in_flight_; }

    /**
     * Get in-flight high-water mark
     * @return Largest in-flight count observed, never above queue_depth()
     */
    [[nodiscard]] int peak_in_flight() const noexcept { return peak_in_flight_; }

    [[nodiscard]] int queue_depth() const noexcept { return queue_depth_; }
    [[nodiscard]] size_t registered_buffers() const noexcept { return registered_buffers_; }
    [[nodiscard]] size_t pinned_bytes() const noexcept { return pinned_bytes_; }

  private:
    friend class Engine;

    int64_t ops_submitted_ = 0;
    int64_t ops_completed_ = 0;
    int64_t ops_failed_ = 0;
    int64_t bytes_read_ = 0;
    int64_t bytes_written_ = 0;
    int current_in_flight_ = 0;
    int peak_in_flight_ = 0;
    int queue_depth_ = 0;
    size_t registered_buffers_ = 0;
    size_t pinned_bytes_ = 0;
};

} // namespace blockio

#endif // BLOCKIO_STATS_HPP
