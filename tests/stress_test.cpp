/**
 * @file stress_test.cpp
 * @brief Stress test for the blockio engine
 *
 * Tests:
 * 1. High concurrency - batches of reads at full queue depth
 * 2. Write/verify - random-size writes read back and compared
 * 3. Buffer churn - rapid allocate/register/release cycles
 * 4. Multi-threaded submissions - per-handle waits from many threads
 * 5. Shutdown under load - engine drained while submitters run
 *
 * Run:   ./tests/stress_test [options]
 *
 * Options:
 *   --duration <seconds>   Test duration (default: 10)
 *   --threads <count>      Number of submitter threads (default: 4)
 *   --files <count>        Number of test files (default: 16)
 *   --quick                Quick test (2 seconds per test, small files)
 */

#include <blockio.hpp>

#include <iostream>
#include <iomanip>
#include <vector>
#include <thread>
#include <atomic>
#include <memory>
#include <random>
#include <chrono>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>
#include <sys/stat.h>

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

// =============================================================================
// Configuration
// =============================================================================

struct Config {
    int duration_sec = 10;
    int num_threads = 4;
    int num_files = 16;
    size_t file_size = 64 * 1024 * 1024;  // 64MB per file
    std::string test_dir = "/tmp/blockio_stress";
};

// =============================================================================
// Statistics
// =============================================================================

struct Stats {
    std::atomic<long long> ops_submitted{0};
    std::atomic<long long> ops_completed{0};
    std::atomic<long long> ops_failed{0};
    std::atomic<long long> verify_failures{0};
    std::atomic<long long> bytes_read{0};
    std::atomic<long long> bytes_written{0};
    std::atomic<long long> buffers_allocated{0};
    std::atomic<long long> rejected_after_shutdown{0};

    void record(const blockio::OperationResult& r)
    {
        if (!r.success) {
            ops_failed++;
            return;
        }
        ops_completed++;
        if (r.direction == blockio::Direction::Read) {
            bytes_read += static_cast<long long>(r.bytes_transferred);
        } else {
            bytes_written += static_cast<long long>(r.bytes_transferred);
        }
    }

    void print(double elapsed_sec) const {
        long long total_bytes = bytes_read + bytes_written;
        double throughput_mb = (total_bytes / (1024.0 * 1024.0)) / elapsed_sec;
        double iops = ops_completed / elapsed_sec;

        std::cout << "\n=== Stress Test Results ===\n";
        std::cout << "Duration:          " << std::fixed << std::setprecision(2)
                  << elapsed_sec << " seconds\n";
        std::cout << "Ops submitted:     " << ops_submitted << "\n";
        std::cout << "Ops completed:     " << ops_completed << "\n";
        std::cout << "Ops failed:        " << ops_failed << "\n";
        std::cout << "Verify failures:   " << verify_failures << "\n";
        std::cout << "Bytes read:        " << bytes_read / (1024 * 1024) << " MB\n";
        std::cout << "Bytes written:     " << bytes_written / (1024 * 1024) << " MB\n";
        std::cout << "Throughput:        " << throughput_mb << " MB/s\n";
        std::cout << "IOPS:              " << std::setprecision(0) << iops << "\n";
        std::cout << "Buffers allocated: " << buffers_allocated << "\n";
        std::cout << "Late submissions:  " << rejected_after_shutdown << "\n";
    }
};

// =============================================================================
// Test File Management
// =============================================================================

class TestFiles {
public:
    TestFiles(const std::string& dir, int count, size_t file_size)
        : dir_(dir), file_size_(file_size)
    {
        mkdir(dir.c_str(), 0755);

        std::vector<char> buf(1024 * 1024);  // 1MB buffer
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dist(0, 255);

        for (int i = 0; i < count; i++) {
            std::string path = dir + "/test_" + std::to_string(i) + ".dat";
            paths_.push_back(path);

            int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
            if (fd < 0) {
                throw std::runtime_error("Failed to create test file: " + path);
            }

            for (size_t written = 0; written < file_size; ) {
                for (auto& c : buf) {
                    c = static_cast<char>(dist(gen));
                }
                size_t chunk = std::min(buf.size(), file_size - written);
                if (write(fd, buf.data(), chunk) < 0) {
                    close(fd);
                    throw std::runtime_error("Failed to write test file");
                }
                written += chunk;
            }
            fsync(fd);
            close(fd);
        }

        std::cout << "Created " << count << " test files of "
                  << file_size / (1024 * 1024) << " MB each\n";
    }

    ~TestFiles() {
        for (const auto& path : paths_) {
            unlink(path.c_str());
        }
        for (const auto& path : scratch_) {
            unlink(path.c_str());
        }
        rmdir(dir_.c_str());
    }

    // Writable file outside the read set, removed with the rest
    std::string scratch(const std::string& name)
    {
        std::string path = dir_ + "/" + name;
        scratch_.push_back(path);
        return path;
    }

    const std::vector<std::string>& paths() const { return paths_; }
    size_t file_size() const { return file_size_; }

private:
    std::string dir_;
    size_t file_size_;
    std::vector<std::string> paths_;
    std::vector<std::string> scratch_;
};

static void fill_pattern(void* buf, size_t len, unsigned seed)
{
    auto* p = static_cast<unsigned char*>(buf);
    for (size_t i = 0; i < len; i++) {
        p[i] = static_cast<unsigned char>((i * 131 + seed) & 0xff);
    }
}

static bool check_pattern(const void* buf, size_t len, unsigned seed)
{
    auto* p = static_cast<const unsigned char*>(buf);
    for (size_t i = 0; i < len; i++) {
        if (p[i] != static_cast<unsigned char>((i * 131 + seed) & 0xff)) return false;
    }
    return true;
}

// =============================================================================
// Stress Test: High Concurrency Reads
// =============================================================================

void test_high_concurrency_reads(blockio::Engine& engine, const TestFiles& files,
                                 Stats& stats, int duration_sec)
{
    std::cout << "\n--- Test: High Concurrency Reads ---\n";

    const size_t buf_size = 64 * 1024;  // 64KB
    const int batch = engine.options().queue_depth() * 2;

    std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> file_dist(0, files.paths().size() - 1);
    std::uniform_int_distribution<off_t> off_dist(0, files.file_size() - buf_size);

    auto start = Clock::now();
    auto end_time = start + std::chrono::seconds(duration_sec);
    long long ops = 0;

    while (Clock::now() < end_time) {
        std::vector<blockio::Buffer> buffers;
        for (int i = 0; i < batch; i++) {
            buffers.push_back(engine.allocate_buffer(buf_size));
            stats.buffers_allocated++;

            off_t offset = (off_dist(gen) / 4096) * 4096;
            (void)engine.submit_read(buffers.back(), files.paths()[file_dist(gen)], offset);
            stats.ops_submitted++;
        }

        auto results = engine.wait();
        if (results.size() != static_cast<size_t>(batch)) {
            stats.verify_failures++;
        }
        for (const auto& r : results) {
            stats.record(r);
            if (r.success && r.bytes_transferred != buf_size) stats.verify_failures++;
        }
        ops += static_cast<long long>(results.size());
    }

    auto elapsed = std::chrono::duration<double>(Clock::now() - start).count();
    std::cout << "Completed in " << std::fixed << std::setprecision(2)
              << elapsed << "s, " << ops << " ops\n";
}

// =============================================================================
// Stress Test: Write / Verify
// =============================================================================

void test_write_verify(blockio::Engine& engine, TestFiles& files, Stats& stats,
                       int duration_sec)
{
    std::cout << "\n--- Test: Write/Verify (random sizes) ---\n";

    const size_t block = engine.options().block_size();
    std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> size_dist(1, block * 3 + 17);

    const int slots = 8;
    std::vector<std::string> paths;
    for (int i = 0; i < slots; i++) {
        paths.push_back(files.scratch("verify_" + std::to_string(i) + ".dat"));
    }

    auto start = Clock::now();
    auto end_time = start + std::chrono::seconds(duration_sec);
    unsigned round = 0;

    while (Clock::now() < end_time) {
        std::vector<blockio::Buffer> wbufs;
        std::vector<size_t> sizes;
        for (int i = 0; i < slots; i++) {
            size_t sz = size_dist(gen);
            sizes.push_back(sz);
            wbufs.push_back(engine.allocate_buffer(sz));
            fill_pattern(wbufs.back().data(), sz, round + i);
            (void)engine.submit_write(wbufs.back(), paths[i], 0);
            stats.ops_submitted++;
        }
        for (const auto& r : engine.wait()) stats.record(r);

        std::vector<blockio::Buffer> rbufs;
        for (int i = 0; i < slots; i++) {
            rbufs.push_back(engine.allocate_buffer(sizes[i]));
            (void)engine.submit_read(rbufs.back(), paths[i], 0);
            stats.ops_submitted++;
        }
        for (const auto& r : engine.wait()) stats.record(r);

        for (int i = 0; i < slots; i++) {
            if (!check_pattern(rbufs[i].data(), sizes[i], round + i)) {
                stats.verify_failures++;
            }
        }
        round += slots;
    }

    auto elapsed = std::chrono::duration<double>(Clock::now() - start).count();
    std::cout << "Completed in " << std::fixed << std::setprecision(2)
              << elapsed << "s, " << round / slots << " rounds\n";
}

// =============================================================================
// Stress Test: Buffer Churn
// =============================================================================

void test_buffer_churn(blockio::Engine& engine, Stats& stats, int duration_sec)
{
    std::cout << "\n--- Test: Buffer Churn ---\n";

    const std::vector<size_t> sizes = {4096, 16384, 65536, 262144, 1048576};
    auto start = Clock::now();
    auto end_time = start + std::chrono::seconds(duration_sec);
    long long cycles = 0;

    while (Clock::now() < end_time) {
        std::vector<blockio::Buffer> buffers;
        for (size_t sz : sizes) {
            buffers.push_back(engine.allocate_buffer(sz));
            stats.buffers_allocated++;
        }

        void* mem = nullptr;
        if (posix_memalign(&mem, 4096, 65536) == 0) {
            blockio::BufferHandle h = engine.register_buffer(mem, 65536);
            engine.release_buffer(h);
            free(mem);
        }
        cycles++;
    }

    if (engine.get_stats().registered_buffers() != 0) {
        stats.verify_failures++;
    }

    auto elapsed = std::chrono::duration<double>(Clock::now() - start).count();
    std::cout << "Completed in " << std::fixed << std::setprecision(2)
              << elapsed << "s, " << cycles << " cycles\n";
}

// =============================================================================
// Stress Test: Multi-threaded Submissions
// =============================================================================

void test_multithread_submissions(blockio::Engine& engine, const TestFiles& files,
                                  Stats& stats, int num_threads, int duration_sec)
{
    std::cout << "\n--- Test: Multi-threaded Submissions (" << num_threads << " threads) ---\n";

    const size_t buf_size = 16 * 1024;  // 16KB
    auto start = Clock::now();
    auto end_time = start + std::chrono::seconds(duration_sec);

    std::vector<std::thread> submitters;
    for (int t = 0; t < num_threads; t++) {
        submitters.emplace_back([&, seed = std::random_device{}()]() {
            std::mt19937 gen(seed);
            std::uniform_int_distribution<size_t> file_dist(0, files.paths().size() - 1);
            std::uniform_int_distribution<off_t> off_dist(0, files.file_size() - buf_size);

            while (Clock::now() < end_time) {
                try {
                    std::vector<blockio::Buffer> buffers;
                    std::vector<blockio::OperationHandle> handles;
                    for (int i = 0; i < 8; i++) {
                        buffers.push_back(engine.allocate_buffer(buf_size));
                        stats.buffers_allocated++;
                        off_t offset = (off_dist(gen) / 4096) * 4096;
                        handles.push_back(
                            engine.submit_read(buffers.back(), files.paths()[file_dist(gen)], offset));
                        stats.ops_submitted++;
                    }
                    // Only this thread waits on its own handles
                    for (auto h : handles) {
                        auto r = engine.wait(h);
                        if (r.handle != h) stats.verify_failures++;
                        stats.record(r);
                    }
                } catch (const blockio::Error& e) {
                    std::cerr << "submitter: " << e.what() << "\n";
                    stats.verify_failures++;
                }
            }
        });
    }

    for (auto& t : submitters) t.join();

    auto elapsed = std::chrono::duration<double>(Clock::now() - start).count();
    std::cout << "Completed in " << std::fixed << std::setprecision(2)
              << elapsed << "s\n";
}

// =============================================================================
// Stress Test: Shutdown Under Load
// =============================================================================

void test_shutdown_under_load(const TestFiles& files, Stats& stats, int num_threads)
{
    std::cout << "\n--- Test: Shutdown Under Load ---\n";

    const size_t buf_size = 64 * 1024;
    blockio::Engine engine(blockio::Options().queue_depth(16).thread_count(4));
    std::vector<blockio::Buffer> buffers;
    for (int t = 0; t < num_threads; t++) {
        buffers.push_back(engine.allocate_buffer(buf_size));
    }

    std::atomic<long long> accepted{0};
    std::vector<std::thread> submitters;
    for (int t = 0; t < num_threads; t++) {
        submitters.emplace_back([&, t]() {
            for (;;) {
                try {
                    (void)engine.submit_read(buffers[t], files.paths()[t % files.paths().size()], 0);
                    accepted++;
                } catch (const blockio::Error& e) {
                    if (e.is_shutdown()) {
                        stats.rejected_after_shutdown++;
                    } else {
                        stats.verify_failures++;
                    }
                    return;
                }
            }
        });
    }

    std::this_thread::sleep_for(200ms);
    engine.shutdown();
    for (auto& t : submitters) t.join();

    // Every accepted operation ran to completion
    auto results = engine.wait();
    if (static_cast<long long>(results.size()) != accepted.load()) {
        stats.verify_failures++;
    }
    for (const auto& r : results) stats.record(r);
    stats.ops_submitted += accepted.load();

    std::cout << "Accepted " << accepted.load() << " ops before shutdown, "
              << results.size() << " results\n";
}

// =============================================================================
// Main
// =============================================================================

void print_usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [options]\n";
    std::cerr << "Options:\n";
    std::cerr << "  --duration <seconds>   Test duration (default: 10)\n";
    std::cerr << "  --threads <count>      Number of threads (default: 4)\n";
    std::cerr << "  --files <count>        Number of test files (default: 16)\n";
    std::cerr << "  --quick                Quick test (2 seconds per test)\n";
    std::cerr << "  --help                 Show this help\n";
}

int main(int argc, char** argv) {
    Config config;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--duration" && i + 1 < argc) {
            config.duration_sec = std::stoi(argv[++i]);
        } else if (arg == "--threads" && i + 1 < argc) {
            config.num_threads = std::stoi(argv[++i]);
        } else if (arg == "--files" && i + 1 < argc) {
            config.num_files = std::stoi(argv[++i]);
        } else if (arg == "--quick") {
            config.duration_sec = 2;
            config.num_files = 4;
            config.file_size = 8 * 1024 * 1024;  // 8MB
        } else if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            std::cerr << "Unknown option: " << arg << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    config.test_dir += "_" + std::to_string(getpid());

    std::cout << "=== blockio Stress Test ===\n";
    std::cout << "Duration:     " << config.duration_sec << " seconds per test\n";
    std::cout << "Threads:      " << config.num_threads << "\n";
    std::cout << "Test files:   " << config.num_files << "\n";
    std::cout << "File size:    " << config.file_size / (1024 * 1024) << " MB\n";

    try {
        std::cout << "\nCreating test files...\n";
        TestFiles files(config.test_dir, config.num_files, config.file_size);

        Stats stats;
        auto total_start = Clock::now();
        blockio::Stats engine_stats;
        {
            blockio::Options opts;
            opts.queue_depth(64).thread_count(4).block_size(64 * 1024);
            blockio::Engine engine(opts);

            test_high_concurrency_reads(engine, files, stats, config.duration_sec);
            test_write_verify(engine, files, stats, config.duration_sec);
            test_buffer_churn(engine, stats, config.duration_sec);
            test_multithread_submissions(engine, files, stats, config.num_threads,
                                         config.duration_sec);
            engine_stats = engine.get_stats();
        }
        test_shutdown_under_load(files, stats, config.num_threads);

        auto total_elapsed = std::chrono::duration<double>(Clock::now() - total_start).count();

        std::cout << "\n=== Engine Statistics ===\n";
        std::cout << "Total ops completed:  " << engine_stats.ops_completed() << "\n";
        std::cout << "Total bytes:          " << engine_stats.bytes_transferred() / (1024 * 1024) << " MB\n";
        std::cout << "Peak in-flight:       " << engine_stats.peak_in_flight() << " / "
                  << engine_stats.queue_depth() << "\n";

        stats.print(total_elapsed);

        if (engine_stats.peak_in_flight() > engine_stats.queue_depth()) {
            std::cout << "\n*** FAILED: in-flight exceeded queue depth ***\n";
            return 1;
        }
        if (stats.ops_failed > 0 || stats.verify_failures > 0) {
            std::cout << "\n*** FAILED: " << stats.ops_failed << " failed ops, "
                      << stats.verify_failures << " verification failures ***\n";
            return 1;
        }

        std::cout << "\n=== STRESS TEST PASSED ===\n";
        return 0;

    } catch (const blockio::Error& e) {
        std::cerr << "blockio error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
