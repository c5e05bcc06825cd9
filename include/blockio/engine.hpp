/**
 * @file engine.hpp
 * @brief Main Engine class for blockio
 */

#ifndef BLOCKIO_ENGINE_HPP
#define BLOCKIO_ENGINE_HPP

#include <blockio/fwd.hpp>
#include <blockio/error.hpp>
#include <blockio/options.hpp>
#include <blockio/buffer.hpp>
#include <blockio/request.hpp>
#include <blockio/stats.hpp>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>
#include <sys/types.h>

namespace blockio {

/**
 * Asynchronous block I/O engine
 *
 * Owns a buffer registry, a bounded request queue and a pool of worker
 * threads. Each worker pulls one request at a time and moves its byte
 * range in block_size() chunks through its own io_uring ring.
 * Non-copyable and non-movable.
 *
 * @par Destruction Behavior
 * The destructor calls shutdown(): queued and in-flight operations run to
 * completion before the workers are joined. Results that were never
 * collected with wait() are discarded.
 *
 * Example:
 * @code
 * blockio::Engine engine(blockio::Options().block_size(1 << 20).thread_count(4));
 * auto buf = engine.allocate_buffer(8 << 20);
 *
 * engine.submit_write(buf, "/mnt/nvme/test/a.swap", 0);
 * for (const auto &r : engine.wait()) {
 *     if (!r.success) std::cerr << r.error->message() << "\n";
 * }
 * @endcode
 */
class Engine {
  public:
    /**
     * Create engine with default options
     * @throws EngineInitError on failure
     */
    Engine();

    /**
     * Create engine with custom options
     * @param opts Configuration options
     * @throws EngineInitError if options are invalid or workers cannot start
     */
    explicit Engine(const Options &opts);

    /**
     * Create a heap-allocated engine
     *
     * @param block_size  Transfer chunk size (positive power of two)
     * @param queue_depth Maximum outstanding operations
     * @param num_threads Worker threads
     * @param direct_io   Open files with O_DIRECT
     * @return Owning pointer to the engine
     * @throws EngineInitError on invalid parameters
     */
    [[nodiscard]] static std::unique_ptr<Engine> open(size_t block_size, int queue_depth,
                                                      int num_threads, bool direct_io);

    // Non-copyable and non-movable: workers hold a pointer to the core.
    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;
    Engine(Engine &&) = delete;
    Engine &operator=(Engine &&) = delete;

    /**
     * Destructor - drains outstanding operations
     */
    ~Engine();

    // =========================================================================
    // Buffer Management
    // =========================================================================

    /**
     * Allocate an aligned, registered (and pinned) buffer
     *
     * @param size Buffer size in bytes
     * @return RAII buffer object
     * @throws AlignmentError if direct I/O is on and size is not aligned
     * @throws Error on allocation failure or after shutdown
     */
    [[nodiscard]] Buffer allocate_buffer(size_t size);

    /**
     * Register caller-owned memory
     *
     * The memory stays owned by the caller and must outlive every operation
     * that references it.
     *
     * @param ptr  Start of the region
     * @param size Region size in bytes
     * @return Handle for submit_read()/submit_write()
     * @throws AlignmentError if direct I/O is on and ptr or size is not aligned
     * @throws Error (EINVAL) for a null pointer or zero size
     */
    [[nodiscard]] BufferHandle register_buffer(void *ptr, size_t size);

    /**
     * Unregister a buffer
     *
     * @param handle Handle returned by register_buffer()
     * @throws Error (EINVAL) for an unknown handle, (EBUSY) while an
     *         operation still references the buffer
     */
    void release_buffer(BufferHandle handle);

    // =========================================================================
    // Core I/O Operations
    // =========================================================================

    /**
     * Submit async write of the whole buffer
     *
     * Creates the file if needed; never truncates it.
     *
     * @param buf    Registered buffer to write from
     * @param path   Target file
     * @param offset File offset
     * @return Operation handle
     * @throws QueueFullError if the queue is full under SubmitPolicy::Fail
     * @throws AlignmentError if direct I/O is on and offset is not aligned
     * @throws Error on invalid arguments or after shutdown
     */
    [[nodiscard]] OperationHandle submit_write(BufferHandle buf, const std::string &path,
                                               off_t offset);

    /**
     * Submit async write of the first @p len bytes of the buffer
     */
    [[nodiscard]] OperationHandle submit_write(BufferHandle buf, const std::string &path,
                                               off_t offset, size_t len);

    /**
     * Submit async read filling the whole buffer
     *
     * @param buf    Registered buffer to read into
     * @param path   Source file
     * @param offset File offset
     * @return Operation handle
     * @throws QueueFullError if the queue is full under SubmitPolicy::Fail
     * @throws AlignmentError if direct I/O is on and offset is not aligned
     * @throws Error on invalid arguments or after shutdown
     */
    [[nodiscard]] OperationHandle submit_read(BufferHandle buf, const std::string &path,
                                              off_t offset);

    /**
     * Submit async read of @p len bytes into the start of the buffer
     */
    [[nodiscard]] OperationHandle submit_read(BufferHandle buf, const std::string &path,
                                              off_t offset, size_t len);

    // =========================================================================
    // Completion
    // =========================================================================

    /**
     * Wait for every operation submitted so far
     *
     * Blocks until all operations submitted before the call have completed,
     * then returns their results ordered by handle. Returned results are
     * consumed.
     *
     * @return Results of completed, not yet collected operations
     */
    std::vector<OperationResult> wait();

    /**
     * Wait for one operation
     *
     * @param handle Operation to wait for
     * @return Its result (consumed)
     * @throws Error (ENOENT) if the handle is unknown or already collected
     */
    OperationResult wait(OperationHandle handle);

    /**
     * Drain and stop the engine
     *
     * Lets every queued operation complete, joins the workers and releases
     * all registered buffers. Further submissions throw Error(ESHUTDOWN).
     * Results stay available to wait(). Idempotent.
     */
    void shutdown();

    // =========================================================================
    // Statistics
    // =========================================================================

    /**
     * Get engine statistics snapshot
     *
     * @return Stats object with current metrics
     */
    [[nodiscard]] Stats get_stats() const;

    /**
     * Get current number of operations holding a queue slot
     * @return In-flight count
     */
    [[nodiscard]] int in_flight() const noexcept;

    /**
     * Get the options the engine was created with
     */
    [[nodiscard]] const Options &options() const noexcept;

    /**
     * Check if engine accepts submissions
     * @return False after shutdown()
     */
    [[nodiscard]] explicit operator bool() const noexcept;

  private:
    OperationHandle submit(Direction dir, BufferHandle buf, const std::string &path,
                           off_t offset, size_t len, bool whole_buffer);

    std::unique_ptr<detail::EngineCore> core_;
};

} // namespace blockio

#endif // BLOCKIO_ENGINE_HPP
