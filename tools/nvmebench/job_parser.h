/**
 * @file job_parser.h
 * @brief nvmebench configuration and command-line parsing
 */

#ifndef NVMEBENCH_JOB_PARSER_H
#define NVMEBENCH_JOB_PARSER_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nvmebench {

constexpr uint64_t KiB = 1024;
constexpr uint64_t MiB = 1024 * KiB;
constexpr uint64_t GiB = 1024 * MiB;

/* Benchmark configuration (defaults match the historical script) */
struct BenchConfig {
    std::string nvme_path = "/mnt/nvme/test";
    std::vector<uint64_t> sizes = {2 * MiB, 8 * MiB, 32 * MiB};
    int iterations = 200;
    int threads = 16;     /* engine worker threads */
    int queue_depth = 64; /* engine queue depth */
    size_t block_size = 2 * MiB;
    bool direct = false;     /* O_DIRECT */
    bool keep_files = false; /* skip per-size cleanup */
    bool no_progress = false;
    bool verbose = false; /* engine log + stats on stderr */
};

/* Parse size string with K/M/G suffixes (1024-based, fractions allowed).
 * Plain numbers are bytes and must be integers. Returns -1 on error. */
int64_t parse_size(const char *str);

/* Parse a comma-separated size list and append to @p out.
 * Returns 0 on success, -1 on the first invalid or zero entry. */
int parse_size_list(const char *str, std::vector<uint64_t> &out);

/* Parse CLI arguments into config. Returns 0 on success, -1 on error
 * (usage already printed). Exits 0 for --help. */
int parse_cli(int argc, char **argv, BenchConfig &config);

void print_usage(const char *argv0);

} // namespace nvmebench

#endif /* NVMEBENCH_JOB_PARSER_H */
