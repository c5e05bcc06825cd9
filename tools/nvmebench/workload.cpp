/**
 * @file workload.cpp
 * @brief Per-size write/read timing loops for nvmebench
 */

#include "workload.h"
#include "output.h"

#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <time.h>
#include <unistd.h>

namespace nvmebench {

static constexpr int PROGRESS_BAR_WIDTH = 30;

static double now_sec() {
    struct timespec ts;
    clock_gettime(CLOCK_MONOTONIC, &ts);
    return static_cast<double>(ts.tv_sec) + static_cast<double>(ts.tv_nsec) / 1e9;
}

static void progress_update(const char *desc, int done, int total) {
    int filled = total > 0 ? done * PROGRESS_BAR_WIDTH / total : PROGRESS_BAR_WIDTH;

    char bar[PROGRESS_BAR_WIDTH + 1];
    for (int i = 0; i < PROGRESS_BAR_WIDTH; i++) {
        bar[i] = i < filled ? '=' : (i == filled ? '>' : ' ');
    }
    bar[PROGRESS_BAR_WIDTH] = '\0';

    fprintf(stderr, "\r%s: %3d%% [%s] %d/%d", desc, total > 0 ? done * 100 / total : 100, bar,
            done, total);
    if (done == total) fprintf(stderr, "\n");
}

std::string test_file_path(const std::string &dir, uint64_t size, int iteration) {
    std::string d(dir);
    while (d.size() > 1 && d.back() == '/') d.pop_back();
    return d + "/test_write_" + std::to_string(size) + "_" + std::to_string(iteration) + ".swap";
}

std::vector<double> time_transfers(blockio::Engine &engine, blockio::Direction dir,
                                   const std::vector<std::string> &files, uint64_t size,
                                   bool progress) {
    const char *desc = dir == blockio::Direction::Write ? "Writes" : "Reads";
    progress = progress && isatty(STDERR_FILENO);
    const int total = static_cast<int>(files.size());

    std::vector<double> latencies;
    latencies.reserve(files.size());

    for (int i = 0; i < total; i++) {
        blockio::Buffer buf = engine.allocate_buffer(size);
        const std::string &path = files[static_cast<size_t>(i)];

        double start = now_sec();
        blockio::OperationHandle op = dir == blockio::Direction::Write
                                          ? engine.submit_write(buf, path, 0)
                                          : engine.submit_read(buf, path, 0);
        std::vector<blockio::OperationResult> results = engine.wait();
        double end = now_sec();

        for (const auto &r : results) {
            if (!r.success) {
                throw std::runtime_error(std::string(blockio::direction_name(r.direction)) +
                                         " " + path + " failed: " + r.error->message());
            }
        }
        if (results.empty() || results.back().handle != op) {
            throw std::runtime_error("missing completion for " + path);
        }

        latencies.push_back(end - start);
        if (progress) progress_update(desc, i + 1, total);
    }
    return latencies;
}

void run_size(blockio::Engine &engine, const BenchConfig &config, uint64_t size, FILE *out) {
    fprintf(out, "Benchmarking size: %llu bytes\n", static_cast<unsigned long long>(size));
    fflush(out);

    std::vector<std::string> files;
    files.reserve(static_cast<size_t>(config.iterations));
    for (int i = 0; i < config.iterations; i++) {
        files.push_back(test_file_path(config.nvme_path, size, i));
    }

    bool progress = !config.no_progress;

    std::vector<double> write_lat =
        time_transfers(engine, blockio::Direction::Write, files, size, progress);
    print_statistics("Write", calculate_statistics(write_lat, size), out);
    fflush(out);

    std::vector<double> read_lat =
        time_transfers(engine, blockio::Direction::Read, files, size, progress);
    print_statistics("Read", calculate_statistics(read_lat, size), out);

    if (!config.keep_files) {
        for (const auto &f : files) {
            if (unlink(f.c_str()) < 0 && errno != ENOENT) {
                fprintf(stderr, "nvmebench: failed to remove %s: %s\n", f.c_str(),
                        strerror(errno));
            }
        }
        fprintf(out, "Cleaned up files for size %llu\n\n", static_cast<unsigned long long>(size));
    }
    fflush(out);
}

} // namespace nvmebench
