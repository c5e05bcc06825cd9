/**
 * @file worker_pool.cpp
 * @brief Worker threads draining the request queue
 */

#include "worker_pool.h"
#include "log.h"

#include <blockio/error.hpp>

#include <cerrno>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>
#include <utility>

namespace blockio::detail {

WorkerPool::WorkerPool(RequestQueue &queue, int threads, unsigned ring_entries,
                       size_t block_size, bool direct_io, CompletionFn on_complete)
    : queue_(queue), block_size_(block_size), direct_io_(direct_io),
      on_complete_(std::move(on_complete)) {
    // Rings first: a setup failure must not leave threads behind
    rings_.reserve(static_cast<size_t>(threads));
    for (int i = 0; i < threads; i++) {
        rings_.push_back(std::make_unique<BlockRing>(ring_entries));
    }

    threads_.reserve(rings_.size());
    try {
        for (auto &ring : rings_) {
            BlockRing *r = ring.get();
            threads_.emplace_back([this, r] { run(*r); });
        }
    } catch (const std::system_error &e) {
        queue_.close();
        join();
        throw EngineInitError(e.code().value(), "worker thread creation");
    }
}

WorkerPool::~WorkerPool() {
    join();
}

void WorkerPool::join() noexcept {
    for (auto &t : threads_) {
        if (t.joinable()) {
            t.join();
        }
    }
}

void WorkerPool::run(BlockRing &ring) noexcept {
    while (auto req = queue_.pop()) {
        WorkerResult result = execute(ring, *req);
        on_complete_(*req, result);
    }
}

WorkerResult WorkerPool::execute(BlockRing &ring, const IoRequest &req) noexcept {
    WorkerResult result;

    int flags = req.direction == Direction::Write ? (O_WRONLY | O_CREAT) : O_RDONLY;
    if (direct_io_) {
        flags |= O_DIRECT;
    }
    flags |= O_CLOEXEC;

    int fd = ::open(req.path.c_str(), flags, 0644);
    if (fd < 0) {
        result.error = errno;
        result.error_offset = req.offset;
        return result;
    }

    TransferResult xfer = ring.transfer(req.direction, fd, req.buffer, req.len, req.offset,
                                        block_size_);
    result.bytes = xfer.bytes;
    result.error = xfer.error;
    result.error_offset = xfer.error_offset;

    if (::close(fd) < 0 && result.error == 0 && req.direction == Direction::Write) {
        // Deferred writeback errors surface here
        result.error = errno;
        result.error_offset = req.offset;
    }
    return result;
}

} // namespace blockio::detail
