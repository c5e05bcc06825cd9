/**
 * @file request_queue.cpp
 * @brief Bounded FIFO of pending I/O requests
 */

#include "request_queue.h"

#include <blockio/error.hpp>

#include <algorithm>
#include <cerrno>
#include <utility>

namespace blockio::detail {

RequestQueue::RequestQueue(int depth) noexcept : depth_(depth) {}

bool RequestQueue::acquire_slot(bool block) {
    std::unique_lock<std::mutex> lock(lock_);
    if (block) {
        slot_cv_.wait(lock, [this] { return closed_ || in_flight_ < depth_; });
    }
    if (closed_) {
        throw Error(ESHUTDOWN, "submit");
    }
    if (in_flight_ >= depth_) {
        return false;
    }
    in_flight_++;
    peak_in_flight_ = std::max(peak_in_flight_, in_flight_);
    return true;
}

void RequestQueue::release_slot() noexcept {
    {
        std::lock_guard<std::mutex> lock(lock_);
        in_flight_--;
    }
    slot_cv_.notify_one();
}

void RequestQueue::push(IoRequest req) {
    {
        std::lock_guard<std::mutex> lock(lock_);
        if (closed_) {
            throw Error(ESHUTDOWN, "submit");
        }
        items_.push_back(std::move(req));
    }
    item_cv_.notify_one();
}

std::optional<IoRequest> RequestQueue::pop() {
    std::unique_lock<std::mutex> lock(lock_);
    item_cv_.wait(lock, [this] { return closed_ || !items_.empty(); });
    if (items_.empty()) {
        return std::nullopt;
    }
    IoRequest req = std::move(items_.front());
    items_.pop_front();
    return req;
}

void RequestQueue::close() noexcept {
    {
        std::lock_guard<std::mutex> lock(lock_);
        closed_ = true;
    }
    slot_cv_.notify_all();
    item_cv_.notify_all();
}

int RequestQueue::in_flight() const noexcept {
    std::lock_guard<std::mutex> lock(lock_);
    return in_flight_;
}

int RequestQueue::peak_in_flight() const noexcept {
    std::lock_guard<std::mutex> lock(lock_);
    return peak_in_flight_;
}

} // namespace blockio::detail
