/**
 * @file options.hpp
 * @brief Options builder class for blockio
 */

#ifndef BLOCKIO_OPTIONS_HPP
#define BLOCKIO_OPTIONS_HPP

#include <cstddef>
#include <string>
#include <utility>

namespace blockio {

/**
 * Behavior of submit_read()/submit_write() when every queue slot is taken
 */
enum class SubmitPolicy {
    Block, ///< Wait for a completing operation to free a slot (default)
    Fail   ///< Throw QueueFullError immediately
};

/**
 * Engine configuration options
 *
 * Uses builder pattern for fluent configuration.
 *
 * Example:
 * @code
 * blockio::Options opts;
 * opts.block_size(2 << 20)
 *     .queue_depth(64)
 *     .thread_count(16);
 *
 * blockio::Engine engine(opts);
 * @endcode
 */
class Options {
  public:
    static constexpr size_t DEFAULT_BLOCK_SIZE = 1 << 20;
    static constexpr int DEFAULT_QUEUE_DEPTH = 128;
    static constexpr int DEFAULT_THREAD_COUNT = 1;
    static constexpr size_t DEFAULT_BUFFER_ALIGNMENT = 4096;
    static constexpr unsigned DEFAULT_RING_ENTRIES = 8;

    /**
     * Initialize with default options
     */
    Options() = default;

    /**
     * Set I/O block size
     *
     * Requests larger than one block are split into sequential positioned
     * transfers of this size.
     *
     * @param bytes Block size (default: 1 MiB, must be a power of two)
     * @return Reference to this for chaining
     * @note Validated at engine creation time; invalid values cause Engine() to fail
     */
    Options &block_size(size_t bytes) noexcept {
        block_size_ = bytes;
        return *this;
    }

    /**
     * Set maximum number of outstanding operations
     * @param depth Queue depth (default: 128, must be >= 1)
     * @return Reference to this for chaining
     */
    Options &queue_depth(int depth) noexcept {
        queue_depth_ = depth;
        return *this;
    }

    /**
     * Set number of worker threads
     * @param count Worker threads (default: 1, must be >= 1)
     * @return Reference to this for chaining
     */
    Options &thread_count(int count) noexcept {
        thread_count_ = count;
        return *this;
    }

    /**
     * Open files with O_DIRECT
     *
     * Buffers, offsets and lengths must then be multiples of
     * buffer_alignment().
     *
     * @param enable True to bypass the page cache
     * @return Reference to this for chaining
     */
    Options &direct_io(bool enable = true) noexcept {
        direct_io_ = enable;
        return *this;
    }

    /**
     * Set behavior when the queue is full
     * @param policy Submit policy (default: Block)
     * @return Reference to this for chaining
     */
    Options &submit_policy(SubmitPolicy policy) noexcept {
        submit_policy_ = policy;
        return *this;
    }

    /**
     * Set buffer alignment
     * @param align Buffer alignment in bytes (default: 4096)
     * @return Reference to this for chaining
     */
    Options &buffer_alignment(size_t align) noexcept {
        buffer_alignment_ = align;
        return *this;
    }

    /**
     * Lock registered buffers into RAM
     * @param enable True to mlock() buffers on registration (default)
     * @return Reference to this for chaining
     */
    Options &pin_buffers(bool enable = true) noexcept {
        pin_buffers_ = enable;
        return *this;
    }

    /**
     * Set io_uring entries per worker
     *
     * Bounds how many chunks of one request a worker keeps in flight.
     *
     * @param entries Ring size (default: 8, valid range: 1-4096)
     * @return Reference to this for chaining
     */
    Options &ring_entries(unsigned entries) noexcept {
        ring_entries_ = entries;
        return *this;
    }

    /**
     * Directory used to verify O_DIRECT support at engine creation
     *
     * Only consulted when direct_io() is enabled. Empty skips the probe.
     *
     * @param dir Directory on the target filesystem
     * @return Reference to this for chaining
     */
    Options &probe_directory(std::string dir) {
        probe_directory_ = std::move(dir);
        return *this;
    }

    // Getters
    [[nodiscard]] size_t block_size() const noexcept { return block_size_; }
    [[nodiscard]] int queue_depth() const noexcept { return queue_depth_; }
    [[nodiscard]] int thread_count() const noexcept { return thread_count_; }
    [[nodiscard]] bool direct_io() const noexcept { return direct_io_; }
    [[nodiscard]] SubmitPolicy submit_policy() const noexcept { return submit_policy_; }
    [[nodiscard]] size_t buffer_alignment() const noexcept { return buffer_alignment_; }
    [[nodiscard]] bool pin_buffers() const noexcept { return pin_buffers_; }
    [[nodiscard]] unsigned ring_entries() const noexcept { return ring_entries_; }
    [[nodiscard]] const std::string &probe_directory() const noexcept { return probe_directory_; }

  private:
    size_t block_size_ = DEFAULT_BLOCK_SIZE;
    int queue_depth_ = DEFAULT_QUEUE_DEPTH;
    int thread_count_ = DEFAULT_THREAD_COUNT;
    bool direct_io_ = false;
    SubmitPolicy submit_policy_ = SubmitPolicy::Block;
    size_t buffer_alignment_ = DEFAULT_BUFFER_ALIGNMENT;
    bool pin_buffers_ = true;
    unsigned ring_entries_ = DEFAULT_RING_ENTRIES;
    std::string probe_directory_;
};

} // namespace blockio

#endif // BLOCKIO_OPTIONS_HPP
