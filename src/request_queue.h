/**
 * @file request_queue.h
 * @brief Bounded FIFO of pending I/O requests
 *
 * Internal header - not part of public API.
 *
 * Queue depth is enforced with slots: a submitter takes a slot before
 * pushing and the worker returns it once the request has completed, so
 * the slot count equals submitted-but-not-completed requests.
 */

#ifndef BLOCKIO_REQUEST_QUEUE_H
#define BLOCKIO_REQUEST_QUEUE_H

#include <blockio/buffer.hpp>
#include <blockio/request.hpp>

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <sys/types.h>

namespace blockio::detail {

/**
 * Request context
 *
 * Immutable from submission until completion.
 */
struct IoRequest {
    uint64_t id;                ///< Operation id (OperationHandle)
    Direction direction;        ///< Read or write
    std::string path;           ///< Target file
    off_t offset;               ///< File offset
    void *buffer;               ///< I/O buffer
    size_t len;                 ///< I/O size
    BufferHandle buffer_handle; ///< Registry entry holding an I/O reference
    int64_t submit_time_ns;     ///< Submission timestamp
};

class RequestQueue {
  public:
    /** @param depth Maximum slots (>= 1) */
    explicit RequestQueue(int depth) noexcept;

    RequestQueue(const RequestQueue &) = delete;
    RequestQueue &operator=(const RequestQueue &) = delete;

    /**
     * Take a slot
     *
     * @param block Wait for a free slot instead of failing
     * @return false if no slot is free and @p block is false
     * @throws Error(ESHUTDOWN) once close() has been called
     */
    bool acquire_slot(bool block);

    /** Return a slot taken by acquire_slot() */
    void release_slot() noexcept;

    /**
     * Append a request (caller holds a slot)
     *
     * @throws Error(ESHUTDOWN) once close() has been called
     */
    void push(IoRequest req);

    /**
     * Remove the oldest request, blocking while the queue is empty
     *
     * @return std::nullopt once the queue is closed and drained
     */
    std::optional<IoRequest> pop();

    /**
     * Refuse new slots and requests and wake all waiters
     *
     * Requests already queued are still handed out by pop().
     */
    void close() noexcept;

    [[nodiscard]] int depth() const noexcept { return depth_; }
    [[nodiscard]] int in_flight() const noexcept;
    [[nodiscard]] int peak_in_flight() const noexcept;

  private:
    const int depth_;

    mutable std::mutex lock_;
    std::condition_variable slot_cv_; ///< Signaled when a slot frees up
    std::condition_variable item_cv_; ///< Signaled when a request is queued
    std::deque<IoRequest> items_;
    int in_flight_ = 0;
    int peak_in_flight_ = 0;
    bool closed_ = false;
};

} // namespace blockio::detail

#endif /* BLOCKIO_REQUEST_QUEUE_H */
