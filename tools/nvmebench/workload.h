/**
 * @file workload.h
 * @brief Per-size write/read timing loops for nvmebench
 */

#ifndef NVMEBENCH_WORKLOAD_H
#define NVMEBENCH_WORKLOAD_H

#include "job_parser.h"
#include "stats.h"

#include <blockio.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace nvmebench {

/* "<dir>/test_write_<size>_<i>.swap" */
std::string test_file_path(const std::string &dir, uint64_t size, int iteration);

/*
 * Time one submit + wait() per file.
 *
 * Each iteration gets a freshly allocated engine buffer of @p size bytes.
 * Returns the latencies in seconds.
 *
 * @throws std::runtime_error if an operation fails
 * @throws blockio::Error on submission failure
 */
std::vector<double> time_transfers(blockio::Engine &engine, blockio::Direction dir,
                                   const std::vector<std::string> &files, uint64_t size,
                                   bool progress);

/*
 * Full cycle for one transfer size: timed writes, write report, timed
 * reads of the same files, read report, cleanup (unless keep_files).
 */
void run_size(blockio::Engine &engine, const BenchConfig &config, uint64_t size, FILE *out);

} // namespace nvmebench

#endif /* NVMEBENCH_WORKLOAD_H */
