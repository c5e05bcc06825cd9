/**
 * @file stats.h
 * @brief Latency and bandwidth summaries for nvmebench
 *
 * Mean, median, population standard deviation, a Student-t 95% confidence
 * interval of the mean and 50/90/99th percentiles, for latencies (seconds)
 * and the bandwidths derived from them (MB/s, 1e6 bytes).
 */

#ifndef NVMEBENCH_STATS_H
#define NVMEBENCH_STATS_H

#include <cstdint>
#include <vector>

namespace nvmebench {

/* Summary of one sample set */
struct SampleStats {
    double mean = 0;
    double median = 0;
    double std_dev = 0; /* population (ddof = 0) */
    double ci_low = 0;  /* 95% CI of the mean */
    double ci_high = 0;
    double p50 = 0;
    double p90 = 0;
    double p99 = 0;
};

/* Results for one direction (read or write) */
struct DirectionStats {
    SampleStats latency;   /* seconds */
    SampleStats bandwidth; /* MB/s */
};

/* Percentile of sorted, non-empty samples; linear interpolation between
 * the closest ranks. @p pct in [0, 100]. */
double percentile(const std::vector<double> &sorted, double pct);

/* Summarize non-empty samples. Throws std::invalid_argument if empty.
 * For fewer than two samples the interval collapses to the mean. */
SampleStats summarize(const std::vector<double> &samples);

/* Latency/bandwidth summary for transfers of @p size_bytes.
 * Throws std::invalid_argument for an empty list or a latency <= 0. */
DirectionStats calculate_statistics(const std::vector<double> &latencies, uint64_t size_bytes);

} // namespace nvmebench

#endif /* NVMEBENCH_STATS_H */
