/**
 * @file buffer.hpp
 * @brief BufferHandle and Buffer classes for blockio
 */

#ifndef BLOCKIO_BUFFER_HPP
#define BLOCKIO_BUFFER_HPP

#include <blockio/fwd.hpp>
#include <blockio/error.hpp>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>

namespace blockio {

/**
 * Handle to a buffer registered with an engine
 *
 * This is a value type with no ownership semantics. A default-constructed
 * handle is invalid.
 */
class BufferHandle {
  public:
    BufferHandle() noexcept = default;

    /**
     * Construct from a raw registry id
     * @param id Registry id (0 = invalid)
     */
    explicit BufferHandle(uint64_t id) noexcept : id_(id) {}

    [[nodiscard]] uint64_t id() const noexcept { return id_; }

    [[nodiscard]] explicit operator bool() const noexcept { return id_ != 0; }

    friend bool operator==(BufferHandle a, BufferHandle b) noexcept { return a.id_ == b.id_; }
    friend bool operator!=(BufferHandle a, BufferHandle b) noexcept { return a.id_ != b.id_; }

  private:
    uint64_t id_ = 0;
};

/**
 * RAII buffer allocated and registered by an engine
 *
 * The memory is aligned to Options::buffer_alignment() and, when
 * Options::pin_buffers() is set, locked into RAM. Destruction unregisters
 * the buffer and frees the memory. Move-only (cannot be copied).
 *
 * A Buffer may outlive its Engine; the destructor then only frees memory.
 *
 * Example:
 * @code
 * auto buffer = engine.allocate_buffer(1 << 20);
 * engine.submit_write(buffer, "/mnt/nvme/a.swap", 0);
 * engine.wait();
 * // buffer automatically released when it goes out of scope
 * @endcode
 */
class Buffer {
  public:
    /**
     * Default constructor - creates empty buffer
     */
    Buffer() noexcept = default;

    Buffer(Buffer &&other) noexcept
        : registry_(std::move(other.registry_)), ptr_(other.ptr_), size_(other.size_),
          handle_(other.handle_), pinned_(other.pinned_) {
        other.ptr_ = nullptr;
        other.size_ = 0;
        other.handle_ = BufferHandle();
        other.pinned_ = false;
    }

    Buffer &operator=(Buffer &&other) noexcept {
        if (this != &other) {
            release_internal();
            registry_ = std::move(other.registry_);
            ptr_ = other.ptr_;
            size_ = other.size_;
            handle_ = other.handle_;
            pinned_ = other.pinned_;
            other.ptr_ = nullptr;
            other.size_ = 0;
            other.handle_ = BufferHandle();
            other.pinned_ = false;
        }
        return *this;
    }

    // Non-copyable
    Buffer(const Buffer &) = delete;
    Buffer &operator=(const Buffer &) = delete;

    /**
     * Destructor - unregisters and frees the memory
     */
    ~Buffer() { release_internal(); }

    /**
     * Get buffer data pointer
     * @return Pointer to buffer data
     */
    [[nodiscard]] void *data() noexcept { return ptr_; }

    /**
     * Get buffer data pointer (const)
     * @return Const pointer to buffer data
     */
    [[nodiscard]] const void *data() const noexcept { return ptr_; }

    /**
     * Get buffer size
     * @return Buffer size in bytes
     */
    [[nodiscard]] size_t size() const noexcept { return size_; }

    /**
     * Get registry handle for submit_read()/submit_write()
     * @return Handle, invalid for an empty buffer
     */
    [[nodiscard]] BufferHandle handle() const noexcept { return handle_; }

    /**
     * Check if the pages were locked into RAM
     * @return True if mlock() succeeded at allocation
     */
    [[nodiscard]] bool pinned() const noexcept { return pinned_; }

    /**
     * Get buffer as span of bytes
     * @return std::span over buffer contents
     * @throws Error if buffer is null
     */
    [[nodiscard]] std::span<std::byte> span() {
        if (!ptr_) {
            throw Error(EINVAL, "Buffer is null");
        }
        return {static_cast<std::byte *>(ptr_), size_};
    }

    /**
     * Get buffer as const span of bytes
     * @return std::span over buffer contents (const)
     * @throws Error if buffer is null
     */
    [[nodiscard]] std::span<const std::byte> span() const {
        if (!ptr_) {
            throw Error(EINVAL, "Buffer is null");
        }
        return {static_cast<const std::byte *>(ptr_), size_};
    }

    /**
     * Get buffer as span of specific type
     * @tparam T Element type (must be trivially copyable)
     * @return std::span of T elements
     * @throws Error if buffer is null
     * @note Trailing bytes smaller than sizeof(T) are excluded from the span
     */
    template <typename T>
        requires std::is_trivially_copyable_v<T>
    [[nodiscard]] std::span<T> as() {
        if (!ptr_) {
            throw Error(EINVAL, "Buffer is null");
        }
        return {static_cast<T *>(ptr_), size_ / sizeof(T)};
    }

    /**
     * Implicit conversion to BufferHandle for submission
     */
    operator BufferHandle() const noexcept { return handle_; }

    /**
     * Check if buffer is valid (non-null)
     * @return True if buffer has valid data
     */
    [[nodiscard]] explicit operator bool() const noexcept { return ptr_ != nullptr; }

  private:
    friend class Engine;

    // Private constructor for Engine::allocate_buffer
    Buffer(std::shared_ptr<detail::BufferRegistry> registry, void *ptr, size_t size,
           BufferHandle handle, bool pinned) noexcept
        : registry_(std::move(registry)), ptr_(ptr), size_(size), handle_(handle),
          pinned_(pinned) {}

    void release_internal() noexcept;

    std::shared_ptr<detail::BufferRegistry> registry_;
    void *ptr_ = nullptr;
    size_t size_ = 0;
    BufferHandle handle_;
    bool pinned_ = false;
};

} // namespace blockio

#endif // BLOCKIO_BUFFER_HPP
