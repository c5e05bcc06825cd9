/**
 * @file completion_tracker.h
 * @brief Per-operation completion state and wait support
 *
 * Internal header - not part of public API.
 */

#ifndef BLOCKIO_COMPLETION_TRACKER_H
#define BLOCKIO_COMPLETION_TRACKER_H

#include <blockio/request.hpp>

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace blockio::detail {

/**
 * Tracks every operation from submission until its result is collected.
 *
 * Ids are allocated here, in increasing order. Workers publish results
 * with complete(); callers collect them with wait_all() / wait_one().
 */
class CompletionTracker {
  public:
    CompletionTracker() = default;

    CompletionTracker(const CompletionTracker &) = delete;
    CompletionTracker &operator=(const CompletionTracker &) = delete;

    /** Allocate an id and register it as pending */
    uint64_t begin(Direction dir);

    /** Forget an id whose request never reached the queue */
    void abandon(uint64_t id) noexcept;

    /** Publish the result of @p id and wake waiters */
    void complete(uint64_t id, OperationResult result);

    /**
     * Block until every id allocated before the call is complete, then
     * collect all completed results up to that id
     */
    std::vector<OperationResult> wait_all();

    /**
     * Block until @p id is complete and collect its result
     *
     * @throws Error(ENOENT) if @p id is unknown or already collected
     */
    OperationResult wait_one(uint64_t id);

    /** Completion counter */
    [[nodiscard]] uint64_t completed() const;

  private:
    struct Slot {
        bool done;
        OperationResult result;
    };

    mutable std::mutex lock_;
    std::condition_variable done_cv_;
    std::map<uint64_t, Slot> slots_; ///< Ordered so wait_all() can scan a prefix
    uint64_t next_id_ = 1;
    uint64_t completed_ = 0;
};

} // namespace blockio::detail

#endif /* BLOCKIO_COMPLETION_TRACKER_H */
