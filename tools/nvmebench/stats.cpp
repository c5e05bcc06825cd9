/**
 * @file stats.cpp
 * @brief Latency and bandwidth summaries for nvmebench
 */

#include "stats.h"

#include <boost/math/distributions/students_t.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace nvmebench {

static constexpr double CONFIDENCE_LEVEL = 0.95;

double percentile(const std::vector<double> &sorted, double pct) {
    if (sorted.empty()) {
        throw std::invalid_argument("percentile of empty sample set");
    }
    double rank = pct / 100.0 * static_cast<double>(sorted.size() - 1);
    size_t lo = static_cast<size_t>(std::floor(rank));
    size_t hi = std::min(lo + 1, sorted.size() - 1);
    double frac = rank - static_cast<double>(lo);
    return sorted[lo] + (sorted[hi] - sorted[lo]) * frac;
}

SampleStats summarize(const std::vector<double> &samples) {
    if (samples.empty()) {
        throw std::invalid_argument("no samples provided for statistics");
    }

    SampleStats s;
    const double n = static_cast<double>(samples.size());
    s.mean = std::accumulate(samples.begin(), samples.end(), 0.0) / n;

    double sq = 0;
    for (double v : samples) sq += (v - s.mean) * (v - s.mean);
    s.std_dev = std::sqrt(sq / n);

    if (samples.size() < 2 || s.std_dev == 0) {
        s.ci_low = s.mean;
        s.ci_high = s.mean;
    } else {
        boost::math::students_t dist(n - 1);
        double t = boost::math::quantile(boost::math::complement(dist, (1.0 - CONFIDENCE_LEVEL) / 2));
        double half = t * s.std_dev / std::sqrt(n);
        s.ci_low = s.mean - half;
        s.ci_high = s.mean + half;
    }

    std::vector<double> sorted(samples);
    std::sort(sorted.begin(), sorted.end());
    s.median = percentile(sorted, 50);
    s.p50 = s.median;
    s.p90 = percentile(sorted, 90);
    s.p99 = percentile(sorted, 99);
    return s;
}

DirectionStats calculate_statistics(const std::vector<double> &latencies, uint64_t size_bytes) {
    if (latencies.empty()) {
        throw std::invalid_argument("no latencies provided for statistics");
    }

    std::vector<double> bandwidths;
    bandwidths.reserve(latencies.size());
    for (double lat : latencies) {
        if (!(lat > 0)) {
            throw std::invalid_argument("latency <= 0; cannot compute bandwidth");
        }
        bandwidths.push_back(static_cast<double>(size_bytes) / lat / 1e6);
    }

    DirectionStats out;
    out.latency = summarize(latencies);
    out.bandwidth = summarize(bandwidths);
    return out;
}

} // namespace nvmebench
