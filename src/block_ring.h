/**
 * @file block_ring.h
 * @brief io_uring ring used by one worker thread
 *
 * Internal header - not part of public API.
 */

#ifndef BLOCKIO_BLOCK_RING_H
#define BLOCKIO_BLOCK_RING_H

#include <blockio/request.hpp>

#include <cstddef>
#include <system_error>
#include <vector>
#include <sys/types.h>
#include <liburing.h>

namespace blockio::detail {

/**
 * Outcome of BlockRing::transfer()
 *
 * On failure @c error is a positive errno and @c error_offset the file
 * offset of the chunk that failed.
 */
struct TransferResult {
    size_t bytes = 0;
    int error = 0;
    off_t error_offset = 0;
};

/**
 * Ring context
 *
 * One io_uring instance plus a fixed table of chunk slots. Not
 * thread-safe: each worker owns exactly one ring.
 */
class BlockRing {
  public:
    /**
     * Create the ring
     *
     * @param entries Submission queue size; also the number of chunks of
     *                one request kept in flight
     * @throws EngineInitError if io_uring setup fails
     */
    explicit BlockRing(unsigned entries);
    virtual ~BlockRing();

    BlockRing(const BlockRing &) = delete;
    BlockRing &operator=(const BlockRing &) = delete;

    /**
     * Move @p len bytes between @p buf and @p fd at @p offset
     *
     * The range is cut into @p block_size chunks, each issued as a
     * positioned read or write. Short transfers are continued; a read
     * returning 0 before the range is complete fails with EIO. After the
     * first failure no further chunks are issued and in-flight chunks are
     * drained before returning, so @p buf is never referenced by the
     * kernel once this returns.
     *
     * A failed submission fails only the current transfer: chunks that
     * were prepared but never submitted are dropped by recreating the ring.
     */
    TransferResult transfer(Direction dir, int fd, void *buf, size_t len, off_t offset,
                            size_t block_size);

  protected:
    /** Submit prepared chunks and wait for @p wait_nr completions */
    virtual int submit_and_wait(unsigned wait_nr);

    struct io_uring *ring() noexcept { return &ring_; }

  private:
    /** One in-flight chunk */
    struct Chunk {
        char *buf;
        size_t len;
        off_t offset;
    };

    void prep(Direction dir, int fd, unsigned slot);
    void reset();

    struct io_uring ring_;
    unsigned entries_;
    std::vector<Chunk> chunks_;     ///< Indexed by slot (sqe user_data)
    std::vector<unsigned> free_;    ///< Free slot stack
    bool live_ = false;             ///< ring_ is initialized
    int broken_ = 0;                ///< Sticky errno once the ring is lost
};

} // namespace blockio::detail

#endif /* BLOCKIO_BLOCK_RING_H */
