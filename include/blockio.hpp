/**
 * @file blockio.hpp
 * @brief Main header for blockio
 *
 * This is the single header you need to include to use blockio.
 * It provides an asynchronous block I/O engine with a bounded request
 * queue, a worker thread pool and pinned buffer registration.
 *
 * Example (fire and wait):
 * @code
 * #include <blockio.hpp>
 *
 * int main() {
 *     blockio::Engine engine;
 *     auto buffer = engine.allocate_buffer(1 << 20);
 *
 *     auto op = engine.submit_write(buffer, "/tmp/data.swap", 0);
 *     auto result = engine.wait(op);
 *     return result.success ? 0 : 1;
 * }
 * @endcode
 *
 * Example (fire many, wait once):
 * @code
 * for (int i = 0; i < 4; i++) {
 *     engine.submit_write(buffer, "/tmp/data.swap", off_t(i) << 20);
 * }
 * auto results = engine.wait();  // 4 results, ordered by handle
 * @endcode
 */

#ifndef BLOCKIO_HPP
#define BLOCKIO_HPP

// Order matters for dependencies
#include <blockio/fwd.hpp>
#include <blockio/error.hpp>
#include <blockio/log.hpp>
#include <blockio/options.hpp>
#include <blockio/request.hpp>
#include <blockio/stats.hpp>
#include <blockio/buffer.hpp>
#include <blockio/engine.hpp>

#endif // BLOCKIO_HPP
