/**
 * @file output.cpp
 * @brief nvmebench report formatting
 */

#include "output.h"

#include <charconv>
#include <cmath>
#include <cstdlib>

namespace nvmebench {

std::string format_shortest(double v) {
    if (std::isnan(v)) return "nan";
    if (std::isinf(v)) return v > 0 ? "inf" : "-inf";

    char buf[64];
    auto sci = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::scientific);
    std::string s(buf, sci.ptr);

    // Plain notation for decimal exponents in [-4, 16)
    int exp = std::atoi(s.c_str() + s.find('e') + 1);
    if (v == 0 || (exp >= -4 && exp < 16)) {
        auto fix = std::to_chars(buf, buf + sizeof(buf), v, std::chars_format::fixed);
        s.assign(buf, fix.ptr);
        if (s.find('.') == std::string::npos) s += ".0";
    }
    return s;
}

std::string format_percentiles(const SampleStats &s) {
    return "{'50th': " + format_shortest(s.p50) + ", '90th': " + format_shortest(s.p90) +
           ", '99th': " + format_shortest(s.p99) + "}";
}

void print_statistics(const char *label, const DirectionStats &stats, FILE *out) {
    const SampleStats &lat = stats.latency;
    const SampleStats &bw = stats.bandwidth;

    fprintf(out, "%s Statistics:\n", label);
    fprintf(out, "  Latency Mean: %.9fs\n", lat.mean);
    fprintf(out, "  Latency Median: %.9fs\n", lat.median);
    fprintf(out, "  Latency Std Dev: %.9fs\n", lat.std_dev);
    fprintf(out, "  Latency 95%% CI: (%.9f, %.9f)\n", lat.ci_low, lat.ci_high);
    fprintf(out, "  Latency Percentiles: %s\n", format_percentiles(lat).c_str());
    fprintf(out, "  Bandwidth Mean: %.3f MB/s\n", bw.mean);
    fprintf(out, "  Bandwidth Median: %.3f MB/s\n", bw.median);
    fprintf(out, "  Bandwidth Std Dev: %.3f MB/s\n", bw.std_dev);
    fprintf(out, "  Bandwidth 95%% CI: (%.3f, %.3f)\n", bw.ci_low, bw.ci_high);
    fprintf(out, "  Bandwidth Percentiles: %s\n", format_percentiles(bw).c_str());
}

} // namespace nvmebench
