// SPDX-License-Identifier: Apache-2.0
// Copyright 2026 rdd Contributors


/**
 * @file rdd.cpp
 * @brief rdd - safe block copy (dd replacement) powered by the rdd library
 *
 * Copies fixed-size blocks between files or devices with optional
 * skip/seek offsets, sharded multi-threaded I/O, direct I/O and
 * streaming SHA-256/BLAKE3 verification.
 *
 * Usage: rdd copy -i FILE -o FILE [OPTIONS]
 *        rdd hash FILE [OPTIONS]
 */

#ifndef _GNU_SOURCE
#    define _GNU_SOURCE
#endif
#include <rdd.hpp>

#include "rdd_syslog.hpp"

#include <chrono>
#include <climits>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <string>
#include <string_view>

#include <getopt.h>
#include <signal.h>
#include <unistd.h>

// ============================================================================
// Constants
// ============================================================================

static constexpr int EXIT_IO = 1;
static constexpr int EXIT_CONFIG = 2;
static constexpr int EXIT_MISMATCH = 3;
static constexpr int EXIT_COORDINATION = 4;
static constexpr int EXIT_INTERRUPTED = 130;

static constexpr int PROGRESS_BAR_WIDTH = 30;

// ============================================================================
// Configuration
// ============================================================================

enum class Command { None, Copy, Hash };

struct Config {
    Command command = Command::None;
    rdd::JobOptions job;
    std::string hash_path;
    rdd::HashAlgorithm hash_algo = rdd::HashAlgorithm::Sha256;
    bool quiet = false;
    bool no_progress = false;
    bool use_syslog = false;
    rdd::LogLevel log_level = rdd::LogLevel::Warning;
};

// ============================================================================
// Global state for signal handling
// ============================================================================

static rdd::CancelToken g_cancel;

static void sigint_handler(int /*sig*/) {
    g_cancel.request();
}

// ============================================================================
// Logging
// ============================================================================

static void install_stderr_log(rdd::LogLevel max_level) {
    rdd::set_log_handler([max_level](rdd::LogLevel level, std::string_view msg) {
        if (static_cast<int>(level) > static_cast<int>(max_level)) return;

        auto now = std::chrono::system_clock::now();
        std::time_t secs = std::chrono::system_clock::to_time_t(now);
        auto ms =
            std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
        std::tm tm{};
        localtime_r(&secs, &tm);

        char stamp[32];
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", &tm);
        fprintf(stderr, "%s.%03d rdd %s: %.*s\n", stamp, static_cast<int>(ms.count()),
                rdd::log_level_name(level), static_cast<int>(msg.size()), msg.data());
    });
}

static bool parse_log_level(const char *text, rdd::LogLevel &out) {
    std::string_view s(text);
    if (s == "error") out = rdd::LogLevel::Error;
    else if (s == "warn" || s == "warning") out = rdd::LogLevel::Warning;
    else if (s == "notice") out = rdd::LogLevel::Notice;
    else if (s == "info") out = rdd::LogLevel::Info;
    else if (s == "debug") out = rdd::LogLevel::Debug;
    else return false;
    return true;
}

// ============================================================================
// Progress display
// ============================================================================

/**
 * Progress bar on stderr
 *
 * Intermediate samples are drawn only on a terminal; the final line is
 * always printed.
 */
class TerminalProgress final : public rdd::ProgressSink {
  public:
    TerminalProgress() : tty_(isatty(STDERR_FILENO) != 0) {}

    void on_progress(const rdd::ProgressSample &sample) override {
        if (!sample.final && !tty_) return;

        double elapsed = std::chrono::duration<double>(sample.elapsed).count();
        double done = static_cast<double>(sample.bytes_done);
        double total = static_cast<double>(sample.byte_limit);
        double rate = (elapsed > 0.01) ? done / elapsed : 0.0;

        std::string done_str = rdd::format_bytes(done);
        std::string rate_str = rdd::format_rate(rate);

        if (total <= 0) {
            // Unknown length: no bar, no ETA
            fprintf(stderr, "\r  %s  %s   ", done_str.c_str(), rate_str.c_str());
        } else {
            double pct = done / total * 100.0;
            int filled = static_cast<int>(pct / 100.0 * PROGRESS_BAR_WIDTH);
            if (filled > PROGRESS_BAR_WIDTH) filled = PROGRESS_BAR_WIDTH;

            char bar[PROGRESS_BAR_WIDTH + 1];
            for (int i = 0; i < PROGRESS_BAR_WIDTH; i++) {
                bar[i] = i < filled ? '=' : (i == filled ? '>' : ' ');
            }
            bar[PROGRESS_BAR_WIDTH] = '\0';

            char eta[32] = "";
            if (rate > 0 && total > done) {
                double remaining = (total - done) / rate;
                int mins = static_cast<int>(remaining / 60.0);
                int secs = static_cast<int>(remaining) % 60;
                snprintf(eta, sizeof(eta), "ETA %d:%02d", mins, secs);
            }

            std::string total_str = rdd::format_bytes(total);
            fprintf(stderr, "\r  %s / %s  [%s]  %3.0f%%  %s  %s   ", done_str.c_str(),
                    total_str.c_str(), bar, pct, rate_str.c_str(), eta);
        }
        if (sample.final) fprintf(stderr, "\n");
    }

  private:
    bool tty_;
};

// ============================================================================
// CLI parsing
// ============================================================================

static void print_usage(const char *argv0) {
    fprintf(stderr,
            "Usage: %s copy -i FILE -o FILE [OPTIONS]\n"
            "       %s hash FILE [OPTIONS]\n"
            "       %s --help | --version\n"
            "\n"
            "Safe block copy with sharded I/O and streaming verification.\n"
            "\n"
            "Copy options:\n"
            "  -i, --input FILE       Input file or device\n"
            "  -o, --output FILE      Output file or device (created/truncated)\n"
            "  -b, --block-size SIZE  Block size (default: 512K). Suffixes: K, M, G, T\n"
            "  -c, --count N          Copy N blocks (default: until end of input)\n"
            "      --skip N           Skip N blocks of the input\n"
            "      --seek N           Seek N blocks into the output\n"
            "  -t, --threads N        Worker threads (default: 1, max: %u)\n"
            "      --verify ALGO      Hash copied data (sha256, blake3)\n"
            "      --expect HEX       Fail with exit 3 unless the digest matches\n"
            "      --readback         Re-read the output and compare digests\n"
            "      --direct           Use O_DIRECT (bypass page cache)\n"
            "      --backend NAME     I/O backend: posix (default) or uring\n"
            "      --no-progress      Disable progress bar\n"
            "\n"
            "Hash options:\n"
            "  -a, --algo ALGO        Digest algorithm (default: sha256)\n"
            "  -b, --block-size SIZE  Read size\n"
            "      --skip N           Skip N blocks\n"
            "  -c, --count N          Hash N blocks (default: to end)\n"
            "\n"
            "General:\n"
            "  -q, --quiet            Suppress progress and summary\n"
            "  -v, --verbose          More log output (repeat for debug)\n"
            "      --log-level LEVEL  error, warn, notice, info, debug (default: warn)\n"
            "      --syslog           Send log messages to syslog instead of stderr\n"
            "  -V, --version          Show version\n"
            "  -h, --help             Show this help\n"
            "\n"
            "Exit status: 0 ok, 1 I/O error, 2 usage/config, 3 verification mismatch,\n"
            "             4 internal engine error, 130 interrupted\n",
            argv0, argv0, argv0, rdd::MAX_THREADS);
}

enum LongOpt {
    OPT_SKIP = 256,
    OPT_SEEK,
    OPT_VERIFY,
    OPT_EXPECT,
    OPT_READBACK,
    OPT_DIRECT,
    OPT_BACKEND,
    OPT_NO_PROGRESS,
    OPT_LOG_LEVEL,
    OPT_SYSLOG,
};

/**
 * Parse argv into config
 *
 * @return -1 to continue, otherwise the exit code
 * @throws rdd::Error (kind Config) for malformed values
 */
static int parse_args(int argc, char **argv, Config &config) {
    static struct option long_opts[] = {{"input", required_argument, nullptr, 'i'},
                                        {"output", required_argument, nullptr, 'o'},
                                        {"block-size", required_argument, nullptr, 'b'},
                                        {"count", required_argument, nullptr, 'c'},
                                        {"skip", required_argument, nullptr, OPT_SKIP},
                                        {"seek", required_argument, nullptr, OPT_SEEK},
                                        {"threads", required_argument, nullptr, 't'},
                                        {"verify", required_argument, nullptr, OPT_VERIFY},
                                        {"expect", required_argument, nullptr, OPT_EXPECT},
                                        {"readback", no_argument, nullptr, OPT_READBACK},
                                        {"direct", no_argument, nullptr, OPT_DIRECT},
                                        {"backend", required_argument, nullptr, OPT_BACKEND},
                                        {"no-progress", no_argument, nullptr, OPT_NO_PROGRESS},
                                        {"algo", required_argument, nullptr, 'a'},
                                        {"quiet", no_argument, nullptr, 'q'},
                                        {"verbose", no_argument, nullptr, 'v'},
                                        {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
                                        {"syslog", no_argument, nullptr, OPT_SYSLOG},
                                        {"version", no_argument, nullptr, 'V'},
                                        {"help", no_argument, nullptr, 'h'},
                                        {nullptr, 0, nullptr, 0}};

    if (argc >= 2 && argv[1][0] != '-') {
        std::string_view cmd(argv[1]);
        if (cmd == "copy") {
            config.command = Command::Copy;
        } else if (cmd == "hash") {
            config.command = Command::Hash;
        } else {
            fprintf(stderr, "rdd: unknown command '%s'\n", argv[1]);
            print_usage(argv[0]);
            return EXIT_CONFIG;
        }
        // getopt_long permutes, so skip the command word
        optind = 2;
    }

    int verbosity = 0;
    int opt;
    while ((opt = getopt_long(argc, argv, "i:o:b:c:t:a:qvVh", long_opts, nullptr)) != -1) {
        switch (opt) {
        case 'i':
            config.job.input(optarg);
            break;
        case 'o':
            config.job.output(optarg);
            break;
        case 'b':
            config.job.block_size(std::string_view(optarg));
            break;
        case 'c':
            config.job.count(rdd::parse_count(optarg, "count"));
            break;
        case OPT_SKIP:
            config.job.skip(rdd::parse_count(optarg, "skip"));
            break;
        case OPT_SEEK:
            config.job.seek(rdd::parse_count(optarg, "seek"));
            break;
        case 't': {
            std::uint64_t n = rdd::parse_count(optarg, "thread count");
            if (n == 0 || n > rdd::MAX_THREADS) {
                fprintf(stderr, "rdd: threads must be 1-%u\n", rdd::MAX_THREADS);
                return EXIT_CONFIG;
            }
            config.job.threads(static_cast<unsigned>(n));
        } break;
        case OPT_VERIFY:
            config.job.verify(rdd::parse_hash_algorithm(optarg));
            break;
        case OPT_EXPECT:
            config.job.expect_digest(optarg);
            break;
        case OPT_READBACK:
            config.job.readback(true);
            break;
        case OPT_DIRECT:
            config.job.direct(true);
            break;
        case OPT_BACKEND:
            config.job.backend(rdd::parse_backend(optarg));
            break;
        case OPT_NO_PROGRESS:
            config.no_progress = true;
            break;
        case 'a':
            config.hash_algo = rdd::parse_hash_algorithm(optarg);
            break;
        case 'q':
            config.quiet = true;
            config.no_progress = true;
            break;
        case 'v':
            verbosity++;
            break;
        case OPT_LOG_LEVEL:
            if (!parse_log_level(optarg, config.log_level)) {
                fprintf(stderr, "rdd: unknown log level '%s'\n", optarg);
                return EXIT_CONFIG;
            }
            break;
        case OPT_SYSLOG:
            config.use_syslog = true;
            break;
        case 'V':
            printf("rdd %s\n", RDD_VERSION_STRING);
            return EXIT_SUCCESS;
        case 'h':
            print_usage(argv[0]);
            return EXIT_SUCCESS;
        default:
            print_usage(argv[0]);
            return EXIT_CONFIG;
        }
    }

    if (verbosity >= 2) {
        config.log_level = rdd::LogLevel::Debug;
    } else if (verbosity == 1 && static_cast<int>(config.log_level) < 6) {
        config.log_level = rdd::LogLevel::Info;
    }

    switch (config.command) {
    case Command::Copy:
        if (optind != argc) {
            fprintf(stderr, "rdd: unexpected argument '%s'\n", argv[optind]);
            return EXIT_CONFIG;
        }
        if (config.job.input().empty() || config.job.output().empty()) {
            fprintf(stderr, "rdd: copy needs --input and --output\n");
            print_usage(argv[0]);
            return EXIT_CONFIG;
        }
        break;
    case Command::Hash:
        if (argc - optind != 1) {
            fprintf(stderr, "rdd: hash needs exactly one FILE\n");
            print_usage(argv[0]);
            return EXIT_CONFIG;
        }
        config.hash_path = argv[optind];
        if (config.hash_algo == rdd::HashAlgorithm::None) {
            fprintf(stderr, "rdd: hash needs a digest algorithm\n");
            return EXIT_CONFIG;
        }
        break;
    case Command::None:
        print_usage(argv[0]);
        return EXIT_CONFIG;
    }

    config.job.progress(!config.no_progress);
    return -1;
}

// ============================================================================
// Commands
// ============================================================================

static void print_summary(const rdd::JobResult &result) {
    double secs = std::chrono::duration<double>(result.elapsed()).count();
    std::string size_str = rdd::format_bytes(static_cast<double>(result.bytes_copied()));
    std::string rate_str = rdd::format_rate(result.throughput_bps());

    fprintf(stderr, "%llu+%llu records in\n", (unsigned long long)result.full_blocks(),
            (unsigned long long)result.partial_blocks());
    fprintf(stderr, "%llu+%llu records out\n", (unsigned long long)result.full_blocks(),
            (unsigned long long)result.partial_blocks());
    fprintf(stderr, "%llu bytes (%s) copied, %.3f s, %s\n",
            (unsigned long long)result.bytes_copied(), size_str.c_str(), secs, rate_str.c_str());
    if (result.shards() > 1) {
        fprintf(stderr, "%u shards\n", result.shards());
    }
}

static int run_copy(const Config &config) {
    auto job = rdd::JobDescriptor::from_options(config.job);

    TerminalProgress progress;
    auto result = rdd::run_job(job, config.no_progress ? nullptr : &progress, &g_cancel);

    if (!config.quiet) {
        print_summary(result);
    }
    if (auto digest = result.digest()) {
        // The digest goes to stdout so it can be captured.
        printf("%s: %s\n", rdd::hash_algorithm_name(result.algorithm()), digest->c_str());
    }

    if (result.verification() == rdd::VerificationStatus::Mismatch) {
        if (auto expected = result.expected_digest()) {
            fprintf(stderr, "rdd: verification FAILED: expected %s\n", expected->c_str());
        }
        if (auto readback = result.readback_digest()) {
            fprintf(stderr, "rdd: verification FAILED: output reads back as %s\n",
                    readback->c_str());
        }
        return EXIT_MISMATCH;
    }
    if (result.verification() == rdd::VerificationStatus::Matched && !config.quiet) {
        fprintf(stderr, "verification OK\n");
    }
    return EXIT_SUCCESS;
}

static int run_hash(const Config &config) {
    std::size_t bs = config.job.block_size();
    if (bs == 0) {
        throw rdd::config_error("block size must be greater than 0");
    }
    std::uint64_t offset = 0;
    std::uint64_t length = 0;
    if (__builtin_mul_overflow(config.job.skip(), static_cast<std::uint64_t>(bs), &offset) ||
        __builtin_mul_overflow(config.job.count(), static_cast<std::uint64_t>(bs), &length)) {
        throw rdd::Error(rdd::ErrorKind::Config, EOVERFLOW, "skip/count exceed addressable range");
    }

    rdd::EndpointOptions opts;
    opts.path = config.hash_path;
    opts.mode = rdd::OpenMode::Read;
    opts.backend = config.job.backend();
    opts.direct = config.job.direct();
    opts.block_size = bs;
    auto endpoint = rdd::open_endpoint(opts);

    std::uint64_t hashed = 0;
    auto digest = rdd::hash_range(*endpoint, offset, length, config.hash_algo, bs, &hashed);
    printf("%s  %s\n", rdd::to_hex(digest).c_str(), config.hash_path.c_str());
    if (!config.quiet) {
        fprintf(stderr, "%s: %llu bytes hashed\n", rdd::hash_algorithm_name(config.hash_algo),
                (unsigned long long)hashed);
    }
    return EXIT_SUCCESS;
}

static int exit_code_for(const rdd::Error &e) {
    switch (e.kind()) {
    case rdd::ErrorKind::Config:
        return EXIT_CONFIG;
    case rdd::ErrorKind::Verification:
        return EXIT_MISMATCH;
    case rdd::ErrorKind::Coordination:
        return EXIT_COORDINATION;
    case rdd::ErrorKind::Cancelled:
        return EXIT_INTERRUPTED;
    case rdd::ErrorKind::Io:
    default:
        return EXIT_IO;
    }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char **argv) {
    Config config;
    int status;
    try {
        status = parse_args(argc, argv, config);
    } catch (const rdd::Error &e) {
        fprintf(stderr, "rdd: %s\n", e.what());
        return EXIT_CONFIG;
    }
    if (status >= 0) return status;

    if (config.use_syslog) {
        rdd::SyslogOptions sopts;
        sopts.max_level = config.log_level;
        rdd::syslog_install(&sopts);
    } else {
        install_stderr_log(config.log_level);
    }

    // Install SIGINT handler
    struct sigaction sa = {};
    sa.sa_handler = sigint_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);

    int rc;
    try {
        rc = config.command == Command::Copy ? run_copy(config) : run_hash(config);
    } catch (const rdd::Error &e) {
        rc = exit_code_for(e);
        if (e.is_cancelled()) {
            fprintf(stderr, "\nrdd: interrupted\n");
        } else {
            fprintf(stderr, "rdd: %s error: %s\n", rdd::error_kind_name(e.kind()), e.what());
        }
    } catch (const std::exception &e) {
        fprintf(stderr, "rdd: internal error: %s\n", e.what());
        rc = EXIT_COORDINATION;
    }

    if (config.use_syslog) {
        rdd::syslog_remove();
    } else {
        rdd::clear_log_handler();
    }
    return rc;
}
