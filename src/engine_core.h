/**
 * @file engine_core.h
 * @brief State shared by the Engine facade and its workers
 *
 * Internal header - not part of public API.
 */

#ifndef BLOCKIO_ENGINE_CORE_H
#define BLOCKIO_ENGINE_CORE_H

#include "buffer_registry.h"
#include "completion_tracker.h"
#include "request_queue.h"
#include "worker_pool.h"

#include <blockio/options.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>

namespace blockio::detail {

class EngineCore {
  public:
    /**
     * Validate @p opts, probe O_DIRECT and start the workers
     *
     * @throws EngineInitError
     */
    explicit EngineCore(const Options &opts);

    /** Runs shutdown() */
    ~EngineCore();

    EngineCore(const EngineCore &) = delete;
    EngineCore &operator=(const EngineCore &) = delete;

    /** Completion path, called on a worker thread */
    void on_complete(const IoRequest &req, const WorkerResult &res) noexcept;

    /** Drain, join workers, drop registrations. Idempotent. */
    void shutdown() noexcept;

    const Options opts;
    std::shared_ptr<BufferRegistry> registry;
    RequestQueue queue;
    CompletionTracker tracker;

    std::atomic<bool> running{false};
    std::atomic<int64_t> ops_submitted{0};
    std::atomic<int64_t> ops_failed{0};
    std::atomic<int64_t> bytes_read{0};
    std::atomic<int64_t> bytes_written{0};

  private:
    std::mutex shutdown_lock_;
    bool stopped_ = false;
    std::unique_ptr<WorkerPool> pool_; ///< Last: joined before the rest is destroyed
};

/**
 * Check option ranges
 *
 * @throws EngineInitError(EINVAL) naming the offending option
 */
void validate_options(const Options &opts);

/**
 * Check that @p dir accepts O_DIRECT opens
 *
 * Creates, opens and removes a temporary file in @p dir.
 *
 * @throws EngineInitError with the errno of the failing step
 */
void probe_direct_io(const std::string &dir);

} // namespace blockio::detail

#endif /* BLOCKIO_ENGINE_CORE_H */
