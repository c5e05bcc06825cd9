/**
 * @file custom_config.cpp
 * @brief Demonstrate blockio configuration options
 *
 * Shows how to tune the engine for different workload characteristics:
 * - Block size and ring entries (chunking of each request)
 * - Queue depth and worker threads
 * - Blocking vs failing submission at capacity
 *
 * Run:   ./examples/custom_config
 */

#include <blockio.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <chrono>
#include <string>
#include <unistd.h>

constexpr const char *TEST_DIR = "/tmp";
constexpr size_t XFER_SIZE = 4 * 1024 * 1024; // 4 MB
constexpr int NUM_OPS = 16;

static std::string test_path(int i) {
    return std::string(TEST_DIR) + "/blockio_config_test_" + std::to_string(i) + ".dat";
}

void print_stats(const std::string &config_name, blockio::Engine &engine, double elapsed_ms) {
    auto stats = engine.get_stats();

    std::cout << "\n" << config_name << " Configuration:\n";
    std::cout << std::fixed << std::setprecision(2);
    std::cout << "  Elapsed time: " << elapsed_ms << " ms\n";
    std::cout << "  Operations: " << stats.ops_completed() << "\n";
    std::cout << "  Throughput: "
              << stats.bytes_transferred() / (1024.0 * 1024.0) / (elapsed_ms / 1000.0)
              << " MB/s\n";
    std::cout << "  Peak in-flight: " << stats.peak_in_flight() << " / " << stats.queue_depth()
              << "\n";
}

void run_workload(blockio::Engine &engine, const std::string &config_name) {
    std::vector<blockio::Buffer> bufs;
    bufs.reserve(NUM_OPS);
    for (int i = 0; i < NUM_OPS; i++) {
        bufs.push_back(engine.allocate_buffer(XFER_SIZE));
    }

    auto start = std::chrono::steady_clock::now();

    // Fire many, then wait once
    for (int i = 0; i < NUM_OPS; i++) {
        (void)engine.submit_write(bufs[i], test_path(i), 0);
    }
    for (const auto &r : engine.wait()) {
        if (!r.success) std::cerr << "Write failed: " << r.error->message() << "\n";
    }

    for (int i = 0; i < NUM_OPS; i++) {
        (void)engine.submit_read(bufs[i], test_path(i), 0);
    }
    for (const auto &r : engine.wait()) {
        if (!r.success) std::cerr << "Read failed: " << r.error->message() << "\n";
    }

    auto end = std::chrono::steady_clock::now();
    auto elapsed = std::chrono::duration<double, std::milli>(end - start).count();

    print_stats(config_name, engine, elapsed);
}

int main() {
    std::cout << "blockio Custom Configuration Examples\n";
    std::cout << "=====================================\n\n";

    try {
        // ===================================================================
        // Example 1: Default Configuration
        // ===================================================================
        std::cout << "Running with default configuration...\n";
        {
            blockio::Engine engine_default;
            run_workload(engine_default, "Default");
        }

        // ===================================================================
        // Example 2: Throughput - large blocks, many workers
        // ===================================================================
        std::cout << "\nRunning with throughput-optimized configuration...\n";
        {
            blockio::Options opts;
            opts.block_size(2 * 1024 * 1024).queue_depth(64).thread_count(8).ring_entries(16);
            blockio::Engine engine(opts);
            run_workload(engine, "Throughput-Optimized");
        }

        // ===================================================================
        // Example 3: Low footprint - small blocks, one worker, shallow queue
        // ===================================================================
        std::cout << "\nRunning with low-footprint configuration...\n";
        {
            blockio::Options opts;
            opts.block_size(64 * 1024).queue_depth(4).thread_count(1).ring_entries(4);
            blockio::Engine engine(opts);
            run_workload(engine, "Low-Footprint");
        }

        // ===================================================================
        // Example 4: Non-blocking submission
        // ===================================================================
        std::cout << "\nNon-blocking submission at capacity...\n";
        {
            blockio::Options opts;
            opts.queue_depth(2).thread_count(1).submit_policy(blockio::SubmitPolicy::Fail);
            blockio::Engine engine(opts);
            auto buf = engine.allocate_buffer(XFER_SIZE);

            int accepted = 0, rejected = 0;
            for (int i = 0; i < NUM_OPS; i++) {
                try {
                    (void)engine.submit_write(buf, test_path(i), 0);
                    accepted++;
                } catch (const blockio::QueueFullError &) {
                    rejected++;
                }
            }
            engine.wait();
            std::cout << "  Accepted: " << accepted << ", rejected (queue full): " << rejected
                      << "\n";
        }

        for (int i = 0; i < NUM_OPS; i++) {
            unlink(test_path(i).c_str());
        }

        std::cout << "\n--- Configuration Guide ---\n";
        std::cout << "block_size:    Chunk size of each positioned read/write\n";
        std::cout << "ring_entries:  Chunks of one request kept in flight per worker\n";
        std::cout << "queue_depth:   Operations accepted but not yet completed\n";
        std::cout << "thread_count:  Requests processed in parallel\n";
        std::cout << "submit_policy: Block (default) or Fail with QueueFullError\n";
        std::cout << "direct_io:     O_DIRECT; offsets/lengths must be aligned\n";

        return 0;

    } catch (const blockio::Error &e) {
        std::cerr << "blockio error: " << e.what() << "\n";
        for (int i = 0; i < NUM_OPS; i++) {
            unlink(test_path(i).c_str());
        }
        return 1;
    }
}
