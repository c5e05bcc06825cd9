/**
 * @file main.cpp
 * @brief nvmebench - NVMe read/write latency and bandwidth benchmark
 *
 * For each transfer size: writes N files through the blockio engine, one
 * submit + wait() at a time, then reads them back the same way, and
 * reports latency/bandwidth statistics for both directions.
 *
 * Usage: nvmebench [-p DIR] [-s 2M,8M,32M] [-n 200] [-t 16] [-q 64] [-b 2M]
 */

#include "job_parser.h"
#include "workload.h"

#include <blockio.hpp>

#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <unistd.h>

namespace fs = std::filesystem;

static fs::path expand_path(const std::string &raw) {
    std::string p = raw;
    if (p == "~" || p.rfind("~/", 0) == 0) {
        const char *home = getenv("HOME");
        if (home) p = std::string(home) + p.substr(1);
    }
    fs::path path(p);
    // "/a/b/" names /a/b, not an empty leaf
    if (!path.has_filename() && path.has_parent_path()) path = path.parent_path();
    return path;
}

static void print_engine_stats(const blockio::Engine &engine) {
    blockio::Stats s = engine.get_stats();
    fprintf(stderr,
            "blockio: submitted=%lld completed=%lld failed=%lld read=%lld written=%lld "
            "peak_in_flight=%d/%d\n",
            static_cast<long long>(s.ops_submitted()), static_cast<long long>(s.ops_completed()),
            static_cast<long long>(s.ops_failed()), static_cast<long long>(s.bytes_read()),
            static_cast<long long>(s.bytes_written()), s.peak_in_flight(), s.queue_depth());
}

int main(int argc, char **argv) {
    nvmebench::BenchConfig config;
    if (nvmebench::parse_cli(argc, argv, config) != 0) return 1;

    try {
        fs::path nvme_dir = expand_path(config.nvme_path);
        fs::path parent = nvme_dir.parent_path();
        if (parent.empty()) parent = ".";

        std::error_code ec;
        if (!fs::is_directory(parent, ec) || access(parent.c_str(), W_OK) != 0) {
            fprintf(stderr, "nvmebench: parent of NVMe path '%s' must exist and be writable\n",
                    nvme_dir.c_str());
            return 1;
        }

        if (fs::exists(nvme_dir)) {
            fs::remove_all(nvme_dir);
            printf("Cleaned NVMe directory: %s\n", nvme_dir.c_str());
        }
        fs::create_directories(nvme_dir);
        config.nvme_path = nvme_dir.string();

        if (config.verbose) {
            blockio::set_log_handler([](blockio::LogLevel level, std::string_view msg) {
                fprintf(stderr, "[blockio %s] %.*s\n", blockio::log_level_name(level),
                        static_cast<int>(msg.size()), msg.data());
            });
        }

        auto opts = blockio::Options()
                        .block_size(config.block_size)
                        .queue_depth(config.queue_depth)
                        .thread_count(config.threads)
                        .direct_io(config.direct);
        if (config.direct) opts.probe_directory(config.nvme_path);

        blockio::Engine engine(opts);

        for (uint64_t size : config.sizes) {
            nvmebench::run_size(engine, config, size, stdout);
        }

        engine.shutdown();
        if (config.verbose) print_engine_stats(engine);
        blockio::clear_log_handler();
        return 0;

    } catch (const blockio::Error &e) {
        fprintf(stderr, "nvmebench: %s\n", e.what());
        blockio::clear_log_handler();
        return 1;
    } catch (const std::exception &e) {
        fprintf(stderr, "nvmebench: %s\n", e.what());
        blockio::clear_log_handler();
        return 1;
    }
}
