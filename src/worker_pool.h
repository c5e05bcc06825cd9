/**
 * @file worker_pool.h
 * @brief Worker threads draining the request queue
 *
 * Internal header - not part of public API.
 */

#ifndef BLOCKIO_WORKER_POOL_H
#define BLOCKIO_WORKER_POOL_H

#include "block_ring.h"
#include "request_queue.h"

#include <cstddef>
#include <functional>
#include <memory>
#include <thread>
#include <vector>

namespace blockio::detail {

/** Outcome of one request as seen by the worker that ran it */
struct WorkerResult {
    size_t bytes = 0;
    int error = 0; ///< Positive errno, 0 on success
    off_t error_offset = 0;
};

class WorkerPool {
  public:
    /** Called on the worker thread once a request is done */
    using CompletionFn = std::function<void(const IoRequest &, const WorkerResult &)>;

    /**
     * Create one ring per worker and start the threads
     *
     * @throws EngineInitError if a ring cannot be created
     */
    WorkerPool(RequestQueue &queue, int threads, unsigned ring_entries, size_t block_size,
               bool direct_io, CompletionFn on_complete);

    /** Joins the workers; the queue must be closed first */
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    /** Wait for every worker to exit (after RequestQueue::close()) */
    void join() noexcept;

    [[nodiscard]] int size() const noexcept { return static_cast<int>(rings_.size()); }

  private:
    void run(BlockRing &ring) noexcept;
    WorkerResult execute(BlockRing &ring, const IoRequest &req) noexcept;

    RequestQueue &queue_;
    const size_t block_size_;
    const bool direct_io_;
    CompletionFn on_complete_;
    std::vector<std::unique_ptr<BlockRing>> rings_;
    std::vector<std::thread> threads_;
};

} // namespace blockio::detail

#endif /* BLOCKIO_WORKER_POOL_H */
