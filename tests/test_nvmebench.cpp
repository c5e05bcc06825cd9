/**
 * @file test_nvmebench.cpp
 * @brief Tests for the nvmebench parser, statistics, report and workload
 */

#include "job_parser.h"
#include "output.h"
#include "stats.h"
#include "workload.h"

#include <blockio.hpp>

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name) void test_##name()
#define RUN_TEST(name)                                                                             \
    do {                                                                                           \
        printf("  %-40s", #name);                                                                  \
        fflush(stdout);                                                                            \
        try {                                                                                      \
            test_##name();                                                                         \
            printf(" OK\n");                                                                       \
            tests_passed++;                                                                        \
        } catch (const std::exception &e) {                                                        \
            printf(" FAIL: %s\n", e.what());                                                       \
            tests_failed++;                                                                        \
        } catch (...) {                                                                            \
            printf(" FAIL: unknown exception\n");                                                  \
            tests_failed++;                                                                        \
        }                                                                                          \
    } while (0)

#define ASSERT(cond)                                                                               \
    do {                                                                                           \
        if (!(cond)) {                                                                             \
            throw std::runtime_error("Assertion failed: " #cond);                                  \
        }                                                                                          \
    } while (0)

#define ASSERT_EQ(a, b)                                                                            \
    do {                                                                                           \
        if ((a) != (b)) {                                                                          \
            throw std::runtime_error("Assertion failed: " #a " == " #b);                           \
        }                                                                                          \
    } while (0)

#define ASSERT_NEAR(a, b, eps)                                                                     \
    do {                                                                                           \
        if (std::fabs((a) - (b)) > (eps)) {                                                        \
            throw std::runtime_error("Assertion failed: " #a " ~= " #b);                           \
        }                                                                                          \
    } while (0)

#define ASSERT_THROWS(expr, exc_type)                                                              \
    do {                                                                                           \
        bool caught = false;                                                                       \
        try {                                                                                      \
            expr;                                                                                  \
        } catch (const exc_type &) {                                                               \
            caught = true;                                                                         \
        } catch (...) {                                                                            \
        }                                                                                          \
        if (!caught) {                                                                             \
            throw std::runtime_error("Expected exception " #exc_type " not thrown");               \
        }                                                                                          \
    } while (0)

using namespace nvmebench;

// argv builder for parse_cli()
class Args {
  public:
    Args(std::initializer_list<const char *> args) {
        for (const char *a : args) storage_.emplace_back(a);
        for (auto &s : storage_) argv_.push_back(s.data());
        argv_.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage_.size()); }
    char **argv() { return argv_.data(); }

  private:
    std::vector<std::string> storage_;
    std::vector<char *> argv_;
};

static std::string read_stream(FILE *f) {
    std::string out;
    rewind(f);
    char buf[4096];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) out.append(buf, n);
    return out;
}

// =============================================================================
// Size parsing / CLI
// =============================================================================

TEST(parse_size_suffixes) {
    ASSERT_EQ(parse_size("2M"), 2097152);
    ASSERT_EQ(parse_size("8m"), 8 * 1048576);
    ASSERT_EQ(parse_size("4K"), 4096);
    ASSERT_EQ(parse_size("1G"), 1073741824LL);
    ASSERT_EQ(parse_size("1.5K"), 1536);
    ASSERT_EQ(parse_size(" 2M "), 2097152);
    ASSERT_EQ(parse_size("512"), 512);
}

TEST(parse_size_invalid) {
    ASSERT_EQ(parse_size(""), -1);
    ASSERT_EQ(parse_size("abc"), -1);
    ASSERT_EQ(parse_size("M"), -1);
    ASSERT_EQ(parse_size("1.5"), -1);
    ASSERT_EQ(parse_size("-1M"), -1);
    ASSERT_EQ(parse_size("12X"), -1);
    ASSERT_EQ(parse_size("nanM"), -1);
    ASSERT_EQ(parse_size("infK"), -1);
    ASSERT_EQ(parse_size("8589934592G"), -1);
    ASSERT_EQ(parse_size("8589934591G"), static_cast<int64_t>(8589934591LL * GiB));
}

TEST(parse_cli_defaults) {
    Args args{"nvmebench"};
    BenchConfig config;
    ASSERT_EQ(parse_cli(args.argc(), args.argv(), config), 0);
    ASSERT_EQ(config.nvme_path, std::string("/mnt/nvme/test"));
    ASSERT_EQ(config.sizes.size(), static_cast<size_t>(3));
    ASSERT_EQ(config.sizes[0], 2 * MiB);
    ASSERT_EQ(config.sizes[2], 32 * MiB);
    ASSERT_EQ(config.iterations, 200);
    ASSERT_EQ(config.threads, 16);
    ASSERT_EQ(config.queue_depth, 64);
    ASSERT_EQ(config.block_size, static_cast<size_t>(2 * MiB));
    ASSERT(!config.direct && !config.keep_files && !config.no_progress && !config.verbose);
}

TEST(parse_cli_all_options) {
    Args args{"nvmebench", "-p",  "/tmp/nb", "-s", "4K,8K", "--sizes", "1M",
              "-n",        "5",   "-t",      "2",  "-q",    "8",       "-b",
              "64K",       "-d",  "-k",      "--no-progress", "-v"};
    BenchConfig config;
    ASSERT_EQ(parse_cli(args.argc(), args.argv(), config), 0);
    ASSERT_EQ(config.nvme_path, std::string("/tmp/nb"));
    ASSERT_EQ(config.sizes.size(), static_cast<size_t>(3));
    ASSERT_EQ(config.sizes[0], 4096u);
    ASSERT_EQ(config.sizes[1], 8192u);
    ASSERT_EQ(config.sizes[2], MiB);
    ASSERT_EQ(config.iterations, 5);
    ASSERT_EQ(config.threads, 2);
    ASSERT_EQ(config.queue_depth, 8);
    ASSERT_EQ(config.block_size, static_cast<size_t>(65536));
    ASSERT(config.direct && config.keep_files && config.no_progress && config.verbose);
}

TEST(parse_cli_rejects_bad_values) {
    {
        Args args{"nvmebench", "-n", "0"};
        BenchConfig config;
        ASSERT_EQ(parse_cli(args.argc(), args.argv(), config), -1);
    }
    {
        Args args{"nvmebench", "--sizes", "2M,,4M"};
        BenchConfig config;
        ASSERT_EQ(parse_cli(args.argc(), args.argv(), config), -1);
    }
    {
        Args args{"nvmebench", "-b", "huge"};
        BenchConfig config;
        ASSERT_EQ(parse_cli(args.argc(), args.argv(), config), -1);
    }
    {
        Args args{"nvmebench", "stray"};
        BenchConfig config;
        ASSERT_EQ(parse_cli(args.argc(), args.argv(), config), -1);
    }
}

// =============================================================================
// Statistics
// =============================================================================

TEST(percentile_interpolation) {
    std::vector<double> sorted{1, 2, 3, 4};
    ASSERT_NEAR(percentile(sorted, 0), 1.0, 1e-12);
    ASSERT_NEAR(percentile(sorted, 50), 2.5, 1e-12);
    ASSERT_NEAR(percentile(sorted, 90), 3.7, 1e-12);
    ASSERT_NEAR(percentile(sorted, 99), 3.97, 1e-12);
    ASSERT_NEAR(percentile(sorted, 100), 4.0, 1e-12);
    ASSERT_NEAR(percentile(std::vector<double>{7}, 99), 7.0, 1e-12);
}

TEST(summary_confidence_interval) {
    SampleStats s = summarize({4, 1, 3, 2});
    ASSERT_NEAR(s.mean, 2.5, 1e-12);
    ASSERT_NEAR(s.median, 2.5, 1e-12);
    ASSERT_NEAR(s.std_dev, std::sqrt(1.25), 1e-12);
    // t(0.975, df=3) = 3.182446305
    ASSERT_NEAR(s.ci_low, 0.720958, 1e-5);
    ASSERT_NEAR(s.ci_high, 4.279042, 1e-5);
}

TEST(summary_degenerate) {
    SampleStats one = summarize({0.25});
    ASSERT_NEAR(one.ci_low, 0.25, 1e-15);
    ASSERT_NEAR(one.ci_high, 0.25, 1e-15);
    ASSERT_NEAR(one.std_dev, 0.0, 1e-15);

    SampleStats flat = summarize({0.5, 0.5, 0.5});
    ASSERT_NEAR(flat.ci_low, 0.5, 1e-15);
    ASSERT_NEAR(flat.ci_high, 0.5, 1e-15);

    ASSERT_THROWS(summarize({}), std::invalid_argument);
}

TEST(bandwidth_from_latency) {
    DirectionStats d = calculate_statistics({0.5, 0.25}, 1000000);
    ASSERT_NEAR(d.latency.mean, 0.375, 1e-12);
    ASSERT_NEAR(d.bandwidth.mean, 3.0, 1e-12); // (2 + 4) / 2 MB/s
    ASSERT_NEAR(d.bandwidth.median, 3.0, 1e-12);
    ASSERT_NEAR(d.bandwidth.std_dev, 1.0, 1e-12);

    ASSERT_THROWS(calculate_statistics({}, 4096), std::invalid_argument);
    ASSERT_THROWS(calculate_statistics({0.1, 0.0}, 4096), std::invalid_argument);
    ASSERT_THROWS(calculate_statistics({-0.1}, 4096), std::invalid_argument);
}

// =============================================================================
// Report
// =============================================================================

TEST(format_shortest_repr) {
    ASSERT_EQ(format_shortest(0.5), std::string("0.5"));
    ASSERT_EQ(format_shortest(2.0), std::string("2.0"));
    ASSERT_EQ(format_shortest(0.0), std::string("0.0"));
    ASSERT_EQ(format_shortest(123.456), std::string("123.456"));
    ASSERT_EQ(format_shortest(0.0001), std::string("0.0001"));
    ASSERT_EQ(format_shortest(1e-05), std::string("1e-05"));
    ASSERT_EQ(format_shortest(0.1), std::string("0.1"));
}

TEST(print_statistics_format) {
    DirectionStats d;
    d.latency.mean = 0.0025;
    d.latency.median = 0.002;
    d.latency.ci_low = 0.001;
    d.latency.ci_high = 0.004;
    d.latency.p50 = 0.5;
    d.latency.p90 = 1.25;
    d.latency.p99 = 2.0;
    d.bandwidth.mean = 838.8608;

    FILE *f = tmpfile();
    ASSERT(f != nullptr);
    print_statistics("Write", d, f);
    std::string out = read_stream(f);
    fclose(f);

    ASSERT(out.find("Write Statistics:\n") == 0);
    ASSERT(out.find("  Latency Mean: 0.002500000s\n") != std::string::npos);
    ASSERT(out.find("  Latency Median: 0.002000000s\n") != std::string::npos);
    ASSERT(out.find("  Latency 95% CI: (0.001000000, 0.004000000)\n") != std::string::npos);
    ASSERT(out.find("  Latency Percentiles: {'50th': 0.5, '90th': 1.25, '99th': 2.0}\n") !=
           std::string::npos);
    ASSERT(out.find("  Bandwidth Mean: 838.861 MB/s\n") != std::string::npos);
    ASSERT(out.find("  Bandwidth 95% CI: (0.000, 0.000)\n") != std::string::npos);
}

// =============================================================================
// Workload
// =============================================================================

TEST(test_file_naming) {
    ASSERT_EQ(test_file_path("/mnt/nvme/test", 2097152, 0),
              std::string("/mnt/nvme/test/test_write_2097152_0.swap"));
    ASSERT_EQ(test_file_path("/tmp/x/", 4096, 17), std::string("/tmp/x/test_write_4096_17.swap"));
}

TEST(run_size_end_to_end) {
    char dir[] = "/tmp/nvmebench_test_XXXXXX";
    ASSERT(mkdtemp(dir) != nullptr);

    BenchConfig config;
    config.nvme_path = dir;
    config.iterations = 3;
    config.no_progress = true;

    FILE *f = tmpfile();
    ASSERT(f != nullptr);
    {
        blockio::Engine engine(blockio::Options().block_size(16384).queue_depth(4).thread_count(2));
        run_size(engine, config, 65536, f);
        ASSERT_EQ(engine.get_stats().ops_completed(), 6);
        ASSERT_EQ(engine.get_stats().bytes_written(), 3 * 65536);
        ASSERT_EQ(engine.get_stats().bytes_read(), 3 * 65536);
    }
    std::string out = read_stream(f);
    fclose(f);

    bool left_over = std::filesystem::exists(test_file_path(dir, 65536, 0));
    std::filesystem::remove_all(dir);

    ASSERT(out.find("Benchmarking size: 65536 bytes\n") == 0);
    ASSERT(out.find("Write Statistics:") != std::string::npos);
    ASSERT(out.find("Read Statistics:") != std::string::npos);
    ASSERT(out.find("Write Statistics:") < out.find("Read Statistics:"));
    ASSERT(out.find("Cleaned up files for size 65536\n") != std::string::npos);
    ASSERT(!left_over);
}

TEST(run_size_keep_files) {
    char dir[] = "/tmp/nvmebench_test_XXXXXX";
    ASSERT(mkdtemp(dir) != nullptr);

    BenchConfig config;
    config.nvme_path = dir;
    config.iterations = 2;
    config.no_progress = true;
    config.keep_files = true;

    FILE *f = tmpfile();
    ASSERT(f != nullptr);
    {
        blockio::Engine engine(blockio::Options().block_size(4096));
        run_size(engine, config, 4096, f);
    }
    std::string out = read_stream(f);
    fclose(f);

    bool kept = std::filesystem::exists(test_file_path(dir, 4096, 1));
    std::filesystem::remove_all(dir);

    ASSERT(kept);
    ASSERT(out.find("Cleaned up files") == std::string::npos);
}

TEST(read_of_missing_file_aborts) {
    char dir[] = "/tmp/nvmebench_test_XXXXXX";
    ASSERT(mkdtemp(dir) != nullptr);

    bool threw = false;
    {
        blockio::Engine engine;
        std::vector<std::string> files{std::string(dir) + "/absent.swap"};
        try {
            (void)time_transfers(engine, blockio::Direction::Read, files, 4096, false);
        } catch (const std::runtime_error &e) {
            threw = std::string(e.what()).find("read") == 0;
        }
    }
    std::filesystem::remove_all(dir);
    ASSERT(threw);
}

int main() {
    printf("Running nvmebench tests...\n");

    RUN_TEST(parse_size_suffixes);
    RUN_TEST(parse_size_invalid);
    RUN_TEST(parse_cli_defaults);
    RUN_TEST(parse_cli_all_options);
    RUN_TEST(parse_cli_rejects_bad_values);
    RUN_TEST(percentile_interpolation);
    RUN_TEST(summary_confidence_interval);
    RUN_TEST(summary_degenerate);
    RUN_TEST(bandwidth_from_latency);
    RUN_TEST(format_shortest_repr);
    RUN_TEST(print_statistics_format);
    RUN_TEST(test_file_naming);
    RUN_TEST(run_size_end_to_end);
    RUN_TEST(run_size_keep_files);
    RUN_TEST(read_of_missing_file_aborts);

    if (tests_failed > 0) {
        printf("\n%d tests passed, %d FAILED\n", tests_passed, tests_failed);
    } else {
        printf("\n%d tests passed\n", tests_passed);
    }

    return tests_failed > 0 ? 1 : 0;
}
