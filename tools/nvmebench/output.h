#ifndef NVMEBENCH_OUTPUT_H
#define NVMEBENCH_OUTPUT_H

#include "stats.h"

#include <cstdio>
#include <string>

namespace nvmebench {

/*
 * Shortest decimal form that reads back as the same double, always with
 * a fractional part or exponent ("0.5", "2.0", "1e-05").
 */
std::string format_shortest(double v);

/* "{'50th': a, '90th': b, '99th': c}" */
std::string format_percentiles(const SampleStats &s);

/*
 * Print one direction's report.
 *
 * @param label "Write" or "Read"
 * @param stats Summary from calculate_statistics()
 * @param out   Output stream
 */
void print_statistics(const char *label, const DirectionStats &stats, FILE *out);

} // namespace nvmebench

#endif /* NVMEBENCH_OUTPUT_H */
