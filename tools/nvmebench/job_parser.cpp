/**
 * @file job_parser.cpp
 * @brief nvmebench configuration and command-line parsing
 */

#include "job_parser.h"

#include <cctype>
#include <cerrno>
#include <climits>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <getopt.h>

namespace nvmebench {

int64_t parse_size(const char *str) {
    while (isspace(static_cast<unsigned char>(*str))) str++;
    std::string s(str);
    while (!s.empty() && isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    if (s.empty()) return -1;

    double mult = 0;
    switch (s.back()) {
    case 'G':
    case 'g':
        mult = static_cast<double>(GiB);
        break;
    case 'M':
    case 'm':
        mult = static_cast<double>(MiB);
        break;
    case 'K':
    case 'k':
        mult = static_cast<double>(KiB);
        break;
    default:
        break;
    }

    char *endp;
    errno = 0;
    if (mult == 0) {
        long long val = strtoll(s.c_str(), &endp, 10);
        if (endp == s.c_str() || *endp != '\0' || errno == ERANGE || val < 0) return -1;
        return val;
    }

    s.pop_back();
    double val = strtod(s.c_str(), &endp);
    if (endp == s.c_str() || *endp != '\0' || !std::isfinite(val) || val < 0) return -1;
    val *= mult;
    if (val >= 0x1p63) return -1;
    // Truncate like int(float(...) * unit)
    return static_cast<int64_t>(val);
}

int parse_size_list(const char *str, std::vector<uint64_t> &out) {
    std::string list(str);
    size_t pos = 0;
    for (;;) {
        size_t comma = list.find(',', pos);
        std::string item = list.substr(pos, comma == std::string::npos ? std::string::npos
                                                                        : comma - pos);
        int64_t sz = parse_size(item.c_str());
        if (sz <= 0) {
            fprintf(stderr, "nvmebench: invalid size: '%s'\n", item.c_str());
            return -1;
        }
        out.push_back(static_cast<uint64_t>(sz));
        if (comma == std::string::npos) break;
        pos = comma + 1;
    }
    return 0;
}

void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s [OPTIONS]\n"
            "\n"
            "Benchmark read/write latency and bandwidth of the blockio engine on NVMe.\n"
            "\n"
            "Options:\n"
            "  -p, --nvme-path DIR     Work directory (default: /mnt/nvme/test)\n"
            "                          Removed and recreated at start\n"
            "  -s, --sizes LIST        Comma-separated transfer sizes (default: 2M,8M,32M)\n"
            "                          May be repeated. Suffixes: K, M, G\n"
            "  -n, --iterations N      Iterations per size (default: 200)\n"
            "  -t, --threads N         Engine worker threads (default: 16)\n"
            "  -q, --queue-depth N     Engine queue depth (default: 64)\n"
            "  -b, --block-size SIZE   Engine block size (default: 2M)\n"
            "  -d, --direct            Use O_DIRECT (bypass page cache)\n"
            "  -k, --keep-files        Don't delete test files after each size\n"
            "  --no-progress           Disable progress bar\n"
            "  -v, --verbose           Show engine log messages and stats\n"
            "  -h, --help              Show this help\n",
            argv0);
}

static bool parse_positive_int(const char *str, int &out) {
    char *end;
    errno = 0;
    long val = strtol(str, &end, 10);
    if (end == str || *end != '\0' || errno == ERANGE || val < 1 || val > INT_MAX) return false;
    out = static_cast<int>(val);
    return true;
}

int parse_cli(int argc, char **argv, BenchConfig &config) {
    static struct option long_opts[] = {{"nvme-path", required_argument, nullptr, 'p'},
                                        {"sizes", required_argument, nullptr, 's'},
                                        {"iterations", required_argument, nullptr, 'n'},
                                        {"threads", required_argument, nullptr, 't'},
                                        {"queue-depth", required_argument, nullptr, 'q'},
                                        {"block-size", required_argument, nullptr, 'b'},
                                        {"direct", no_argument, nullptr, 'd'},
                                        {"keep-files", no_argument, nullptr, 'k'},
                                        {"no-progress", no_argument, nullptr, 'P'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    // Full getopt reset so parse_cli() can run more than once per process
    optind = 0;
    bool sizes_given = false;

    int opt;
    while ((opt = getopt_long(argc, argv, "p:s:n:t:q:b:dkvh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'p':
            if (optarg[0] == '\0') {
                fprintf(stderr, "nvmebench: empty NVMe path\n");
                return -1;
            }
            config.nvme_path = optarg;
            break;
        case 's':
            if (!sizes_given) {
                config.sizes.clear();
                sizes_given = true;
            }
            if (parse_size_list(optarg, config.sizes) != 0) return -1;
            break;
        case 'n':
            if (!parse_positive_int(optarg, config.iterations)) {
                fprintf(stderr, "nvmebench: iterations must be a positive integer\n");
                return -1;
            }
            break;
        case 't':
            if (!parse_positive_int(optarg, config.threads)) {
                fprintf(stderr, "nvmebench: threads must be a positive integer\n");
                return -1;
            }
            break;
        case 'q':
            if (!parse_positive_int(optarg, config.queue_depth)) {
                fprintf(stderr, "nvmebench: queue depth must be a positive integer\n");
                return -1;
            }
            break;
        case 'b': {
            int64_t sz = parse_size(optarg);
            if (sz <= 0) {
                fprintf(stderr, "nvmebench: invalid block size: %s\n", optarg);
                return -1;
            }
            config.block_size = static_cast<size_t>(sz);
            break;
        }
        case 'd':
            config.direct = true;
            break;
        case 'k':
            config.keep_files = true;
            break;
        case 'P':
            config.no_progress = true;
            break;
        case 'v':
            config.verbose = true;
            break;
        case 'h':
            print_usage(argv[0]);
            exit(0);
        default:
            print_usage(argv[0]);
            return -1;
        }
    }

    if (optind < argc) {
        fprintf(stderr, "nvmebench: unexpected argument: %s\n", argv[optind]);
        print_usage(argv[0]);
        return -1;
    }

    return 0;
}

} // namespace nvmebench
