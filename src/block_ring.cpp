/**
 * @file block_ring.cpp
 * @brief io_uring ring used by one worker thread
 */

#include "block_ring.h"
#include "log.h"

#include <blockio/error.hpp>

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <deque>

namespace blockio::detail {

BlockRing::BlockRing(unsigned entries) : entries_(entries), chunks_(entries) {
    int ret = io_uring_queue_init(entries, &ring_, 0);
    if (ret < 0) {
        throw EngineInitError(-ret, "io_uring_queue_init");
    }
    live_ = true;
    free_.reserve(entries);
    for (unsigned i = entries; i > 0; i--) {
        free_.push_back(i - 1);
    }
}

BlockRing::~BlockRing() {
    if (live_) {
        io_uring_queue_exit(&ring_);
    }
}

int BlockRing::submit_and_wait(unsigned wait_nr) {
    return io_uring_submit_and_wait(&ring_, wait_nr);
}

void BlockRing::prep(Direction dir, int fd, unsigned slot) {
    // Slots never outnumber ring entries, so the SQ always has room
    struct io_uring_sqe *sqe = io_uring_get_sqe(&ring_);
    const Chunk &c = chunks_[slot];
    if (dir == Direction::Read) {
        io_uring_prep_read(sqe, fd, c.buf, static_cast<unsigned>(c.len), c.offset);
    } else {
        io_uring_prep_write(sqe, fd, c.buf, static_cast<unsigned>(c.len), c.offset);
    }
    io_uring_sqe_set_data(sqe, reinterpret_cast<void *>(static_cast<uintptr_t>(slot)));
}

void BlockRing::reset() {
    // Only called with nothing in flight: every slot is free again
    io_uring_queue_exit(&ring_);
    live_ = false;
    free_.clear();
    for (unsigned i = entries_; i > 0; i--) {
        free_.push_back(i - 1);
    }

    int ret = io_uring_queue_init(entries_, &ring_, 0);
    if (ret < 0) {
        broken_ = -ret;
        log_printf(LogLevel::Error, "io_uring_queue_init failed: %s; worker ring disabled",
                   std::generic_category().message(-ret).c_str());
        return;
    }
    live_ = true;
}

TransferResult BlockRing::transfer(Direction dir, int fd, void *buf, size_t len, off_t offset,
                                   size_t block_size) {
    TransferResult result;
    if (broken_ != 0) {
        result.error = broken_;
        result.error_offset = offset;
        return result;
    }

    char *base = static_cast<char *>(buf);
    size_t issued = 0;        // bytes of the range already cut into chunks
    std::deque<Chunk> resume; // tails of short transfers
    unsigned queued = 0;      // prepared, not yet submitted
    unsigned in_flight = 0;   // submitted, no CQE yet

    // Keep the failure nearest the start of the range
    auto fail = [&result](int err, off_t at) {
        if (result.error == 0 || at < result.error_offset) {
            result.error = err;
            result.error_offset = at;
        }
    };

    auto reap = [&]() {
        unsigned head;
        unsigned seen = 0;
        struct io_uring_cqe *cqe;
        io_uring_for_each_cqe(&ring_, head, cqe) {
            auto slot = static_cast<unsigned>(reinterpret_cast<uintptr_t>(io_uring_cqe_get_data(cqe)));
            Chunk c = chunks_[slot];
            free_.push_back(slot);
            seen++;

            int res = cqe->res;
            if (res < 0) {
                fail(-res, c.offset);
            } else if (res == 0) {
                // End of file on read; a write that moves nothing is no better
                fail(EIO, c.offset);
            } else {
                auto n = static_cast<size_t>(res);
                result.bytes += n;
                if (n < c.len && result.error == 0) {
                    resume.push_back(Chunk{c.buf + n, c.len - n, c.offset + res});
                }
            }
        }
        io_uring_cq_advance(&ring_, seen);
        in_flight -= seen;
    };

    for (;;) {
        while (result.error == 0 && !free_.empty() && (!resume.empty() || issued < len)) {
            Chunk c;
            if (!resume.empty()) {
                c = resume.front();
                resume.pop_front();
            } else {
                size_t n = std::min(block_size, len - issued);
                c = Chunk{base + issued, n, offset + static_cast<off_t>(issued)};
                issued += n;
            }
            unsigned slot = free_.back();
            free_.pop_back();
            chunks_[slot] = c;
            prep(dir, fd, slot);
            queued++;
        }

        if (queued == 0 && in_flight == 0) break;
        // After a failure only the drain below remains
        if (result.error != 0 && in_flight == 0) break;

        int ret = submit_and_wait(1);
        if (ret >= 0) {
            queued -= static_cast<unsigned>(ret);
            in_flight += static_cast<unsigned>(ret);
        } else if (ret == -EINTR) {
            continue;
        } else if ((ret == -EAGAIN || ret == -EBUSY) && in_flight > 0) {
            // Completion queue backpressure: make room, then resubmit
            struct io_uring_cqe *cqe = nullptr;
            int wret = io_uring_wait_cqe(&ring_, &cqe);
            if (wret < 0 && wret != -EINTR) {
                fail(-wret, offset + static_cast<off_t>(result.bytes));
                break;
            }
        } else {
            fail(-ret, offset + static_cast<off_t>(result.bytes));
            log_printf(LogLevel::Warning, "io_uring_submit failed: %s",
                       std::generic_category().message(-ret).c_str());
            break;
        }
        reap();
    }

    // Submitted chunks still point into buf
    while (in_flight > 0) {
        struct io_uring_cqe *cqe = nullptr;
        int ret = io_uring_wait_cqe(&ring_, &cqe);
        if (ret == -EINTR) continue;
        if (ret < 0) {
            broken_ = -ret;
            fail(broken_, offset + static_cast<off_t>(result.bytes));
            log_printf(LogLevel::Error,
                       "io_uring_wait_cqe failed: %s; %u chunks abandoned, worker ring disabled",
                       std::generic_category().message(-ret).c_str(), in_flight);
            return result;
        }
        reap();
    }

    if (queued > 0) {
        reset();
    }
    return result;
}

} // namespace blockio::detail
