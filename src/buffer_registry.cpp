/**
 * @file buffer_registry.cpp
 * @brief Registry of aligned, pinned I/O buffers
 */

#include "buffer_registry.h"
#include "internal.h"
#include "log.h"

#include <blockio/error.hpp>

#include <cerrno>
#include <cstdlib>
#include <sys/mman.h>

namespace blockio::detail {

BufferRegistry::BufferRegistry(size_t alignment, bool direct_io, bool pin) noexcept
    : alignment_(alignment), direct_io_(direct_io), pin_(pin) {}

BufferRegistry::~BufferRegistry() {
    close();
}

BufferHandle BufferRegistry::insert_locked(void *ptr, size_t size) {
    if (closed_) {
        throw Error(ESHUTDOWN, "register buffer");
    }

    bool pinned = false;
    if (pin_) {
        if (mlock(ptr, size) == 0) {
            pinned = true;
            pinned_bytes_ += size;
        } else {
            log_printf(LogLevel::Warning, "mlock(%zu bytes) failed: %s; buffer stays unpinned",
                       size, std::generic_category().message(errno).c_str());
        }
    }

    uint64_t id = next_id_++;
    entries_.emplace(id, Entry{ptr, size, pinned, 0});
    return BufferHandle(id);
}

void BufferRegistry::unpin(const Entry &entry) noexcept {
    if (!entry.pinned) return;
    munlock(entry.ptr, entry.size);
    pinned_bytes_ -= entry.size;
}

BufferHandle BufferRegistry::register_buffer(void *ptr, size_t size) {
    if (!ptr || size == 0) {
        throw Error(EINVAL, "register buffer");
    }
    if (direct_io_ && (!is_aligned(reinterpret_cast<uintptr_t>(ptr), alignment_) ||
                       !is_aligned(size, alignment_))) {
        throw AlignmentError("buffer address and size must be multiples of " +
                             std::to_string(alignment_) + " for direct I/O");
    }

    std::lock_guard<std::mutex> lock(lock_);
    return insert_locked(ptr, size);
}

void BufferRegistry::release(BufferHandle handle) {
    std::lock_guard<std::mutex> lock(lock_);
    auto it = entries_.find(handle.id());
    if (it == entries_.end()) {
        throw Error(EINVAL, "release buffer: unknown handle");
    }
    if (it->second.in_use > 0) {
        throw Error(EBUSY, "release buffer: operations outstanding");
    }
    unpin(it->second);
    entries_.erase(it);
}

BufferRegistry::Allocation BufferRegistry::allocate(size_t size) {
    if (size == 0) {
        throw Error(EINVAL, "allocate buffer");
    }
    if (direct_io_ && !is_aligned(size, alignment_)) {
        throw AlignmentError("buffer size must be a multiple of " + std::to_string(alignment_) +
                             " for direct I/O");
    }

    size_t rounded = (size + alignment_ - 1) & ~(alignment_ - 1);
    void *ptr = nullptr;
    int rc = posix_memalign(&ptr, alignment_, rounded);
    if (rc != 0) {
        throw Error(rc, "posix_memalign");
    }

    try {
        std::lock_guard<std::mutex> lock(lock_);
        BufferHandle handle = insert_locked(ptr, size);
        return Allocation{ptr, size, handle, entries_.at(handle.id()).pinned};
    } catch (...) {
        free(ptr);
        throw;
    }
}

bool BufferRegistry::free_allocation(BufferHandle handle, void *ptr) noexcept {
    {
        std::lock_guard<std::mutex> lock(lock_);
        auto it = entries_.find(handle.id());
        if (it != entries_.end()) {
            if (it->second.in_use > 0) {
                return false;
            }
            unpin(it->second);
            entries_.erase(it);
        }
    }
    free(ptr);
    return true;
}

BufferRegistry::Region BufferRegistry::acquire(BufferHandle handle) {
    std::lock_guard<std::mutex> lock(lock_);
    if (closed_) {
        throw Error(ESHUTDOWN, "submit");
    }
    auto it = entries_.find(handle.id());
    if (it == entries_.end()) {
        throw Error(EINVAL, "unknown buffer handle");
    }
    it->second.in_use++;
    return Region{it->second.ptr, it->second.size};
}

void BufferRegistry::release_io(BufferHandle handle) noexcept {
    std::lock_guard<std::mutex> lock(lock_);
    auto it = entries_.find(handle.id());
    if (it != entries_.end() && it->second.in_use > 0) {
        it->second.in_use--;
    }
}

void BufferRegistry::close() noexcept {
    std::lock_guard<std::mutex> lock(lock_);
    closed_ = true;
    for (const auto &[id, entry] : entries_) {
        unpin(entry);
    }
    entries_.clear();
}

size_t BufferRegistry::count() const {
    std::lock_guard<std::mutex> lock(lock_);
    return entries_.size();
}

size_t BufferRegistry::pinned_bytes() const {
    std::lock_guard<std::mutex> lock(lock_);
    return pinned_bytes_;
}

} // namespace blockio::detail
