/**
 * @file request.hpp
 * @brief Operation handle and result types for blockio
 */

#ifndef BLOCKIO_REQUEST_HPP
#define BLOCKIO_REQUEST_HPP

#include <blockio/error.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>

namespace blockio {

/**
 * Transfer direction of an operation
 */
enum class Direction { Read, Write };

/// Return "read" or "write"
[[nodiscard]] inline const char *direction_name(Direction dir) noexcept {
    return dir == Direction::Read ? "read" : "write";
}

/**
 * Handle to a submitted operation
 *
 * Returned by Engine::submit_read()/submit_write(). Ids are unique per
 * engine and increase in submission order. A default-constructed handle
 * is invalid.
 */
class OperationHandle {
  public:
    OperationHandle() noexcept = default;

    /**
     * Construct from a raw id
     *
     * Typically you don't construct handles directly - they are
     * returned by Engine submit methods.
     *
     * @param id Operation id (0 = invalid)
     */
    explicit OperationHandle(uint64_t id) noexcept : id_(id) {}

    /**
     * Get the operation id
     * @return Id, or 0 if invalid
     */
    [[nodiscard]] uint64_t id() const noexcept { return id_; }

    /**
     * Check if handle is valid
     * @return True if id is non-zero
     */
    [[nodiscard]] explicit operator bool() const noexcept { return id_ != 0; }

    friend bool operator==(OperationHandle a, OperationHandle b) noexcept { return a.id_ == b.id_; }
    friend bool operator!=(OperationHandle a, OperationHandle b) noexcept { return a.id_ != b.id_; }
    friend bool operator<(OperationHandle a, OperationHandle b) noexcept { return a.id_ < b.id_; }

  private:
    uint64_t id_ = 0;
};

/**
 * Outcome of one operation, as reported by Engine::wait()
 */
struct OperationResult {
    OperationHandle handle;
    Direction direction = Direction::Read;
    bool success = false;
    size_t bytes_transferred = 0; ///< Bytes moved before completion or failure
    int64_t latency_ns = 0;       ///< Submission to completion
    std::optional<IoError> error; ///< Set only when success is false
};

} // namespace blockio

#endif // BLOCKIO_REQUEST_HPP
