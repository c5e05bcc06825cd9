/**
 * @file error.hpp
 * @brief Error types for blockio
 *
 * Synchronous failures (construction, registration, submission) are thrown
 * as Error or one of its subclasses. Failures of the I/O itself are never
 * thrown: they are reported as an IoError inside the OperationResult that
 * wait() returns.
 */

#ifndef BLOCKIO_ERROR_HPP
#define BLOCKIO_ERROR_HPP

#include <cerrno>
#include <exception>
#include <string>
#include <string_view>
#include <system_error>
#include <sys/types.h>

namespace blockio {

/**
 * Exception class for blockio errors
 *
 * Wraps errno values with optional context message.
 */
class Error : public std::exception {
  public:
    /**
     * Construct error from errno value
     *
     * @param err Error code (positive errno value)
     * @param context Optional context message
     */
    explicit Error(int err, std::string_view context = {}) : code_(err) {
        // std::generic_category().message() is thread-safe, strerror() is not
        std::string errmsg = std::generic_category().message(err);
        if (context.empty()) {
            message_ = std::move(errmsg);
        } else {
            message_ = std::string(context) + ": " + errmsg;
        }
    }

    /**
     * Get the error code
     * @return Positive errno value
     */
    [[nodiscard]] int code() const noexcept { return code_; }

    /**
     * Get human-readable error message
     * @return Error message string
     */
    [[nodiscard]] const char *what() const noexcept override { return message_.c_str(); }

    // Convenience predicates
    [[nodiscard]] bool is_invalid() const noexcept { return code_ == EINVAL; }
    [[nodiscard]] bool is_again() const noexcept { return code_ == EAGAIN; }
    [[nodiscard]] bool is_shutdown() const noexcept { return code_ == ESHUTDOWN; }
    [[nodiscard]] bool is_busy() const noexcept { return code_ == EBUSY; }
    [[nodiscard]] bool is_not_found() const noexcept { return code_ == ENOENT; }

  private:
    int code_;
    std::string message_;
};

/**
 * Buffer address, size, offset or length not aligned for direct I/O
 */
class AlignmentError : public Error {
  public:
    explicit AlignmentError(std::string_view context) : Error(EINVAL, context) {}
};

/**
 * Non-blocking submission rejected because every queue slot is in use
 */
class QueueFullError : public Error {
  public:
    explicit QueueFullError(std::string_view context = "request queue full")
        : Error(EAGAIN, context) {}
};

/**
 * Engine could not be constructed
 *
 * Raised for invalid configuration (EINVAL) and for environment failures
 * such as a filesystem without O_DIRECT support or io_uring being
 * unavailable (code of the underlying failure).
 */
class EngineInitError : public Error {
  public:
    EngineInitError(int err, std::string_view context) : Error(err, context) {}
};

/**
 * Failure of one submitted operation
 *
 * Value type carried by OperationResult. @c offset is the file offset at
 * which the failing transfer (or the open, for the start offset) was issued.
 */
struct IoError {
    int code = 0;
    off_t offset = 0;

    [[nodiscard]] std::string message() const {
        return std::generic_category().message(code) + " at offset " + std::to_string(offset);
    }
};

} // namespace blockio

#endif // BLOCKIO_ERROR_HPP
