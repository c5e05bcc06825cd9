/**
 * @file engine.cpp
 * @brief Engine implementation
 */

#include <blockio/engine.hpp>

#include "engine_core.h"
#include "internal.h"
#include "log.h"

#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <unistd.h>
#include <utility>
#include <vector>

namespace blockio {

namespace detail {

static constexpr size_t MAX_BLOCK_SIZE = size_t{1} << 30;
static constexpr unsigned MAX_RING_ENTRIES = 4096;

void validate_options(const Options &opts) {
    if (!is_power_of_two(opts.block_size()) || opts.block_size() > MAX_BLOCK_SIZE) {
        throw EngineInitError(EINVAL, "block_size must be a power of two up to 1 GiB");
    }
    if (opts.queue_depth() < 1) {
        throw EngineInitError(EINVAL, "queue_depth must be at least 1");
    }
    if (opts.thread_count() < 1) {
        throw EngineInitError(EINVAL, "thread_count must be at least 1");
    }
    if (opts.ring_entries() < 1 || opts.ring_entries() > MAX_RING_ENTRIES) {
        throw EngineInitError(EINVAL, "ring_entries must be in 1..4096");
    }
    size_t align = opts.buffer_alignment();
    if (!is_power_of_two(align) || align < sizeof(void *)) {
        throw EngineInitError(EINVAL, "buffer_alignment must be a power of two >= sizeof(void *)");
    }
    if (opts.direct_io() && !is_aligned(opts.block_size(), align)) {
        throw EngineInitError(EINVAL, "block_size must be a multiple of buffer_alignment");
    }
}

void probe_direct_io(const std::string &dir) {
    std::string tmpl = dir + "/.blockio_probe_XXXXXX";
    std::vector<char> path(tmpl.begin(), tmpl.end());
    path.push_back('\0');

    int fd = mkstemp(path.data());
    if (fd < 0) {
        throw EngineInitError(errno, "O_DIRECT probe: create " + dir);
    }
    ::close(fd);

    int dfd = ::open(path.data(), O_RDWR | O_DIRECT | O_CLOEXEC);
    int err = errno;
    unlink(path.data());
    if (dfd < 0) {
        throw EngineInitError(err, "O_DIRECT not supported in " + dir);
    }
    ::close(dfd);
}

EngineCore::EngineCore(const Options &o)
    : opts(o), queue(o.queue_depth()) {
    validate_options(opts);
    if (opts.direct_io() && !opts.probe_directory().empty()) {
        probe_direct_io(opts.probe_directory());
    }

    registry = std::make_shared<BufferRegistry>(opts.buffer_alignment(), opts.direct_io(),
                                                opts.pin_buffers());
    pool_ = std::make_unique<WorkerPool>(
        queue, opts.thread_count(), opts.ring_entries(), opts.block_size(), opts.direct_io(),
        [this](const IoRequest &req, const WorkerResult &res) { on_complete(req, res); });
    running.store(true, std::memory_order_release);

    log_printf(LogLevel::Info,
               "engine started: block_size=%zu queue_depth=%d threads=%d ring_entries=%u direct_io=%s",
               opts.block_size(), opts.queue_depth(), opts.thread_count(), opts.ring_entries(),
               opts.direct_io() ? "on" : "off");
}

EngineCore::~EngineCore() {
    shutdown();
}

void EngineCore::on_complete(const IoRequest &req, const WorkerResult &res) noexcept {
    OperationResult result;
    result.handle = OperationHandle(req.id);
    result.direction = req.direction;
    result.bytes_transferred = res.bytes;
    result.latency_ns = get_time_ns() - req.submit_time_ns;
    result.success = res.error == 0;

    if (result.success) {
        auto &counter = req.direction == Direction::Read ? bytes_read : bytes_written;
        counter.fetch_add(static_cast<int64_t>(res.bytes), std::memory_order_relaxed);
    } else {
        result.error = IoError{res.error, res.error_offset};
        ops_failed.fetch_add(1, std::memory_order_relaxed);
        log_printf(LogLevel::Debug, "%s %s failed: %s", direction_name(req.direction),
                   req.path.c_str(), result.error->message().c_str());
    }

    registry->release_io(req.buffer_handle);
    queue.release_slot();
    tracker.complete(req.id, std::move(result));
}

void EngineCore::shutdown() noexcept {
    std::lock_guard<std::mutex> lock(shutdown_lock_);
    if (stopped_) {
        return;
    }
    running.store(false, std::memory_order_release);
    queue.close();
    if (pool_) {
        pool_->join();
    }
    if (registry) {
        registry->close();
    }
    stopped_ = true;

    log_printf(LogLevel::Info, "engine shut down: %llu operations completed, %lld failed",
               static_cast<unsigned long long>(tracker.completed()),
               static_cast<long long>(ops_failed.load()));
}

} // namespace detail

// =============================================================================
// Engine
// =============================================================================

Engine::Engine() : Engine(Options()) {}

Engine::Engine(const Options &opts) : core_(std::make_unique<detail::EngineCore>(opts)) {}

std::unique_ptr<Engine> Engine::open(size_t block_size, int queue_depth, int num_threads,
                                     bool direct_io) {
    return std::make_unique<Engine>(Options()
                                        .block_size(block_size)
                                        .queue_depth(queue_depth)
                                        .thread_count(num_threads)
                                        .direct_io(direct_io));
}

Engine::~Engine() = default;

Buffer Engine::allocate_buffer(size_t size) {
    auto a = core_->registry->allocate(size);
    return Buffer(core_->registry, a.ptr, a.size, a.handle, a.pinned);
}

BufferHandle Engine::register_buffer(void *ptr, size_t size) {
    return core_->registry->register_buffer(ptr, size);
}

void Engine::release_buffer(BufferHandle handle) {
    core_->registry->release(handle);
}

OperationHandle Engine::submit_write(BufferHandle buf, const std::string &path, off_t offset) {
    return submit(Direction::Write, buf, path, offset, 0, true);
}

OperationHandle Engine::submit_write(BufferHandle buf, const std::string &path, off_t offset,
                                     size_t len) {
    return submit(Direction::Write, buf, path, offset, len, false);
}

OperationHandle Engine::submit_read(BufferHandle buf, const std::string &path, off_t offset) {
    return submit(Direction::Read, buf, path, offset, 0, true);
}

OperationHandle Engine::submit_read(BufferHandle buf, const std::string &path, off_t offset,
                                    size_t len) {
    return submit(Direction::Read, buf, path, offset, len, false);
}

OperationHandle Engine::submit(Direction dir, BufferHandle buf, const std::string &path,
                               off_t offset, size_t len, bool whole_buffer) {
    detail::EngineCore &c = *core_;

    if (!c.running.load(std::memory_order_acquire)) {
        throw Error(ESHUTDOWN, "submit");
    }
    if (path.empty()) {
        throw Error(EINVAL, "submit: empty path");
    }
    if (offset < 0) {
        throw Error(EINVAL, "submit: negative offset");
    }
    if (!whole_buffer && len == 0) {
        throw Error(EINVAL, "submit: zero length");
    }

    // Holds an I/O reference from here on; every exit below must drop it
    detail::BufferRegistry::Region region = c.registry->acquire(buf);
    const size_t n = whole_buffer ? region.size : len;

    try {
        if (n > region.size) {
            throw Error(EINVAL, "submit: length exceeds buffer");
        }
        if (c.opts.direct_io()) {
            size_t align = c.opts.buffer_alignment();
            if (!detail::is_aligned(static_cast<uintptr_t>(offset), align)) {
                throw AlignmentError("submit: offset not aligned for direct I/O");
            }
            if (!detail::is_aligned(n, align)) {
                throw AlignmentError("submit: length not aligned for direct I/O");
            }
        }
        bool block = c.opts.submit_policy() == SubmitPolicy::Block;
        if (!c.queue.acquire_slot(block)) {
            throw QueueFullError();
        }
    } catch (...) {
        c.registry->release_io(buf);
        throw;
    }

    uint64_t id = 0;
    try {
        id = c.tracker.begin(dir);
        c.ops_submitted.fetch_add(1, std::memory_order_relaxed);
        c.queue.push(detail::IoRequest{id, dir, path, offset, region.ptr, n, buf,
                                       detail::get_time_ns()});
    } catch (...) {
        if (id != 0) {
            c.ops_submitted.fetch_sub(1, std::memory_order_relaxed);
            c.tracker.abandon(id);
        }
        c.queue.release_slot();
        c.registry->release_io(buf);
        throw;
    }

    return OperationHandle(id);
}

std::vector<OperationResult> Engine::wait() {
    return core_->tracker.wait_all();
}

OperationResult Engine::wait(OperationHandle handle) {
    return core_->tracker.wait_one(handle.id());
}

void Engine::shutdown() {
    core_->shutdown();
}

Stats Engine::get_stats() const {
    const detail::EngineCore &c = *core_;
    Stats stats;
    stats.ops_submitted_ = c.ops_submitted.load(std::memory_order_relaxed);
    stats.ops_completed_ = static_cast<int64_t>(c.tracker.completed());
    stats.ops_failed_ = c.ops_failed.load(std::memory_order_relaxed);
    stats.bytes_read_ = c.bytes_read.load(std::memory_order_relaxed);
    stats.bytes_written_ = c.bytes_written.load(std::memory_order_relaxed);
    stats.current_in_flight_ = c.queue.in_flight();
    stats.peak_in_flight_ = c.queue.peak_in_flight();
    stats.queue_depth_ = c.queue.depth();
    stats.registered_buffers_ = c.registry->count();
    stats.pinned_bytes_ = c.registry->pinned_bytes();
    return stats;
}

int Engine::in_flight() const noexcept {
    return core_->queue.in_flight();
}

const Options &Engine::options() const noexcept {
    return core_->opts;
}

Engine::operator bool() const noexcept {
    return core_->running.load(std::memory_order_acquire);
}

} // namespace blockio
