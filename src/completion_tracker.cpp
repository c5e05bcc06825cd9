/**
 * @file completion_tracker.cpp
 * @brief Per-operation completion state and wait support
 */

#include "completion_tracker.h"

#include <blockio/error.hpp>

#include <cerrno>
#include <utility>

namespace blockio::detail {

uint64_t CompletionTracker::begin(Direction dir) {
    std::lock_guard<std::mutex> lock(lock_);
    uint64_t id = next_id_++;
    OperationResult pending;
    pending.handle = OperationHandle(id);
    pending.direction = dir;
    slots_.emplace(id, Slot{false, std::move(pending)});
    return id;
}

void CompletionTracker::abandon(uint64_t id) noexcept {
    {
        std::lock_guard<std::mutex> lock(lock_);
        slots_.erase(id);
    }
    // A wait_all() may be blocked on this id
    done_cv_.notify_all();
}

void CompletionTracker::complete(uint64_t id, OperationResult result) {
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto it = slots_.find(id);
        if (it != slots_.end()) {
            it->second.done = true;
            it->second.result = std::move(result);
        }
        completed_++;
    }
    done_cv_.notify_all();
}

std::vector<OperationResult> CompletionTracker::wait_all() {
    std::unique_lock<std::mutex> lock(lock_);
    const uint64_t last = next_id_ - 1;

    done_cv_.wait(lock, [this, last] {
        for (auto it = slots_.begin(); it != slots_.end() && it->first <= last; ++it) {
            if (!it->second.done) return false;
        }
        return true;
    });

    std::vector<OperationResult> results;
    auto it = slots_.begin();
    while (it != slots_.end() && it->first <= last) {
        results.push_back(std::move(it->second.result));
        it = slots_.erase(it);
    }
    return results;
}

OperationResult CompletionTracker::wait_one(uint64_t id) {
    std::unique_lock<std::mutex> lock(lock_);
    auto it = slots_.find(id);
    if (it == slots_.end()) {
        throw Error(ENOENT, "wait: unknown operation handle");
    }

    done_cv_.wait(lock, [this, id] {
        auto cur = slots_.find(id);
        return cur == slots_.end() || cur->second.done;
    });

    // A concurrent wait_all() may have collected it meanwhile
    it = slots_.find(id);
    if (it == slots_.end()) {
        throw Error(ENOENT, "wait: operation collected by another waiter");
    }
    OperationResult result = std::move(it->second.result);
    slots_.erase(it);
    return result;
}

uint64_t CompletionTracker::completed() const {
    std::lock_guard<std::mutex> lock(lock_);
    return completed_;
}

} // namespace blockio::detail
