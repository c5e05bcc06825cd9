/**
 * @file log_handler.cpp
 * @brief Demonstrate a custom blockio log handler
 *
 * Shows how to install a custom log callback that formats library
 * messages with timestamps and severity levels, and how to emit
 * application-level messages through the same pipeline using
 * blockio::log_emit().
 *
 * Run:   ./examples/log_handler
 */

#include <blockio.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <unistd.h>

constexpr auto TEST_FILE = "/tmp/blockio_log_test.dat";
constexpr size_t BUF_SIZE = 64 * 1024;

int main() {
    std::cout << "blockio Log Handler Example\n";
    std::cout << "===========================\n\n";

    // --- Step 1: Install log handler with lambda -------------------------
    blockio::set_log_handler([](blockio::LogLevel level, std::string_view msg) {
        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::tm tm{};
        localtime_r(&time_t_now, &tm);

        std::cerr << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setfill('0')
                  << std::setw(3) << ms.count() << " [myapp] " << blockio::log_level_name(level)
                  << ": " << msg << '\n';
    });

    // --- Step 2: Emit application-level messages -------------------------
    blockio::log_emit(blockio::LogLevel::Info, "log handler installed, creating engine");

    try {
        // --- Step 3: Create engine and do I/O ----------------------------
        // Engine start/shutdown are logged at Info, per-operation failures
        // at Debug.
        blockio::Engine engine(blockio::Options().thread_count(2).queue_depth(16));

        auto buffer = engine.allocate_buffer(BUF_SIZE);
        std::fill_n(static_cast<char *>(buffer.data()), BUF_SIZE, 'A');

        blockio::log_emit(blockio::LogLevel::Debug, "submitting write");
        (void)engine.submit_write(buffer, TEST_FILE, 0);

        // A read of a file that does not exist: fails on its own, logged at Debug
        (void)engine.submit_read(buffer, "/tmp/blockio_log_test_missing.dat", 0);

        for (const auto &r : engine.wait()) {
            if (r.success) {
                blockio::log_emit(blockio::LogLevel::Info,
                                  std::string(blockio::direction_name(r.direction)) + " of " +
                                      std::to_string(r.bytes_transferred) + " bytes done");
            } else {
                blockio::log_emit(blockio::LogLevel::Warning,
                                  std::string(blockio::direction_name(r.direction)) +
                                      " failed: " + r.error->message());
            }
        }

        // --- Step 4: Show stats ------------------------------------------
        auto stats = engine.get_stats();
        std::cout << "\nEngine stats:\n";
        std::cout << "  Operations completed: " << stats.ops_completed() << '\n';
        std::cout << "  Operations failed:    " << stats.ops_failed() << '\n';
        std::cout << "  Bytes written:        " << stats.bytes_written() << '\n';

        unlink(TEST_FILE);
        blockio::log_emit(blockio::LogLevel::Notice, "shutting down");

        // Engine destroyed here (RAII) while handler is still installed,
        // so the shutdown message is captured too.

    } catch (const blockio::Error &e) {
        blockio::log_emit(blockio::LogLevel::Error, std::string("blockio error: ") + e.what());
        unlink(TEST_FILE);
        blockio::clear_log_handler();
        return 1;
    } catch (const std::exception &e) {
        blockio::log_emit(blockio::LogLevel::Error, std::string("unexpected error: ") + e.what());
        unlink(TEST_FILE);
        blockio::clear_log_handler();
        return 1;
    }

    blockio::clear_log_handler();
    return 0;
}
