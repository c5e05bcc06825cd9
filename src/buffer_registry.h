/**
 * @file buffer_registry.h
 * @brief Registry of aligned, pinned I/O buffers
 *
 * Internal header - not part of public API.
 *
 * Every buffer used as an I/O source or sink is registered here first.
 * The registry validates alignment for direct I/O, locks pages into RAM,
 * and counts outstanding operations per buffer so that a buffer cannot be
 * released while the kernel may still touch it.
 */

#ifndef BLOCKIO_BUFFER_REGISTRY_H
#define BLOCKIO_BUFFER_REGISTRY_H

#include <blockio/buffer.hpp>

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <unordered_map>

namespace blockio::detail {

class BufferRegistry {
  public:
    /** Memory region of a registered buffer */
    struct Region {
        void *ptr;
        size_t size;
    };

    /** Result of allocate() */
    struct Allocation {
        void *ptr;
        size_t size;
        BufferHandle handle;
        bool pinned;
    };

    /**
     * @param alignment Required alignment (power of two)
     * @param direct_io Enforce alignment on registration
     * @param pin       mlock() registered regions
     */
    BufferRegistry(size_t alignment, bool direct_io, bool pin) noexcept;

    /** Unlocks every region still registered */
    ~BufferRegistry();

    BufferRegistry(const BufferRegistry &) = delete;
    BufferRegistry &operator=(const BufferRegistry &) = delete;

    /**
     * Register caller-owned memory
     *
     * @throws AlignmentError, Error(EINVAL) for null/empty, Error(ESHUTDOWN) after close()
     */
    BufferHandle register_buffer(void *ptr, size_t size);

    /**
     * Unregister a buffer
     *
     * @throws Error(EINVAL) unknown handle, Error(EBUSY) while in use
     */
    void release(BufferHandle handle);

    /**
     * Allocate aligned memory and register it
     *
     * Size is rounded up to the alignment for the allocation itself; the
     * registered size is the requested one.
     *
     * @throws AlignmentError, Error(ENOMEM), Error(ESHUTDOWN)
     */
    Allocation allocate(size_t size);

    /**
     * Unregister (if still registered) and free memory from allocate()
     *
     * @return false if the buffer is still referenced by an operation; the
     *         memory is then left allocated
     */
    bool free_allocation(BufferHandle handle, void *ptr) noexcept;

    /**
     * Take an I/O reference on a buffer
     *
     * @throws Error(EINVAL) for an unknown handle, Error(ESHUTDOWN) after close()
     */
    Region acquire(BufferHandle handle);

    /** Drop an I/O reference taken by acquire() */
    void release_io(BufferHandle handle) noexcept;

    /**
     * Drop every registration and refuse new ones
     *
     * Caller guarantees no operation is outstanding.
     */
    void close() noexcept;

    [[nodiscard]] size_t count() const;
    [[nodiscard]] size_t pinned_bytes() const;
    [[nodiscard]] size_t alignment() const noexcept { return alignment_; }

  private:
    struct Entry {
        void *ptr;
        size_t size;
        bool pinned;
        int in_use;
    };

    BufferHandle insert_locked(void *ptr, size_t size);
    void unpin(const Entry &entry) noexcept;

    const size_t alignment_;
    const bool direct_io_;
    const bool pin_;

    mutable std::mutex lock_;
    std::unordered_map<uint64_t, Entry> entries_;
    uint64_t next_id_ = 1;
    size_t pinned_bytes_ = 0;
    bool closed_ = false;
};

} // namespace blockio::detail

#endif /* BLOCKIO_BUFFER_REGISTRY_H */
