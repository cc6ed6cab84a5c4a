#include "archivedir/cli_colors.hpp"
#include "archivedir/compress.hpp"
#include "archivedir/config.hpp"
#include "archivedir/constants.hpp"
#include "archivedir/errors.hpp"
#include "archivedir/job.hpp"
#include "archivedir/log.hpp"
#include "archivedir/progress.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <limits>
#include <string>
#include <thread>
#include <vector>

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void HandleInterrupt(int) {
    g_interrupted.store(true);
}

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  archivedir backup <source>... -d <destination> [-p <password>] [options]\n";
    std::cout << "  archivedir extract <source> -o <directory> [-p <password>] [options]\n";
    std::cout << "\n";
    std::cout << "Destinations: a local path, s3://bucket[/prefix], gdrive://folder/path, gdrive://id:<ID>,\n";
    std::cout << "  https://drive.google.com/drive/folders/<ID>, onedrive://folder/path\n";
    std::cout << "\n";
    std::cout << "Backup options:\n";
    std::cout << "  --split-size <size>      part size cap, e.g. 3.5G (default 3.5G)\n";
    std::cout << "  --fat32                  never exceed 3.9G per part\n";
    std::cout << "  --compression <mode>     gzip, xz or none (default gzip)\n";
    std::cout << "  --level <n>              compression level (default 6)\n";
    std::cout << "  --threads <n>            parallel gzip workers (default 1)\n";
    std::cout << "  --exclude <pattern>      skip matching paths (repeatable)\n";
    std::cout << "  --include-problematic    do not apply the default exclusions\n";
    std::cout << "  --encrypt                encrypt with AES-256-CBC (requires -p)\n";
    std::cout << "  --salt <hex>             reuse a 32-character hex salt\n";
    std::cout << "  --kdf-iters <n>          PBKDF2 iterations (default 100000)\n";
    std::cout << "  --timestamp              write into <destination>/<unix-time>/\n";
    std::cout << "  --max-inflight <n>       concurrent part uploads (default 2)\n";
    std::cout << "  --staging <dir>          staging directory for remote uploads\n";
    std::cout << "\n";
    std::cout << "Extract options:\n";
    std::cout << "  --part <name>            extract exactly these parts (repeatable)\n";
    std::cout << "  --compression <mode>     override the mode inferred from the archive name\n";
    std::cout << "  --salt <hex>             salt when no metadata record is available\n";
    std::cout << "  --kdf-iters <n>          iterations when no metadata record is available\n";
    std::cout << "\n";
    std::cout << "Common options:\n";
    std::cout << "  --retries <n>            attempts per remote operation (default 3)\n";
    std::cout << "  --retry-delay <ms>       initial backoff delay (default 500)\n";
    std::cout << "  --attempt-timeout <s>    per-attempt timeout (default 300)\n";
    std::cout << "  --chunk-size <size>      streaming chunk size (default 64K)\n";
    std::cout << "  --no-progress            do not draw the progress bar\n";
    std::cout << "  --no-color               disable ANSI colors\n";
    std::cout << "  --log-level <level>      debug, info, warn, error or off\n";
    std::cout << "  --log-file <path>        append log lines to a file\n";
}

std::string RequireValue(int argc, char** argv, int idx, const std::string& flag) {
    if (idx + 1 >= argc) {
        throw archivedir::ConfigError("missing value for " + flag);
    }
    return argv[idx + 1];
}

std::uint64_t ParseCount(const std::string& flag, const std::string& value) {
    try {
        std::size_t used = 0;
        unsigned long long parsed = std::stoull(value, &used);
        if (used != value.size()) {
            throw archivedir::ConfigError("invalid number for " + flag + ": " + value);
        }
        return parsed;
    } catch (const std::logic_error&) {
        throw archivedir::ConfigError("invalid number for " + flag + ": " + value);
    }
}

std::uint32_t ParseCount32(const std::string& flag, const std::string& value) {
    std::uint64_t parsed = ParseCount(flag, value);
    if (parsed > std::numeric_limits<std::uint32_t>::max()) {
        throw archivedir::ConfigError("value too large for " + flag + ": " + value);
    }
    return static_cast<std::uint32_t>(parsed);
}

// Flags shared by both commands. Returns the number of argv entries consumed,
// 0 when `flag` is not a common flag.
int ParseCommonFlag(int argc, char** argv, int idx, archivedir::retry::RetryPolicy& retry,
                    std::size_t& chunk_size, bool& show_progress) {
    std::string flag(argv[idx]);
    if (flag == "--retries") {
        retry.max_attempts = ParseCount32(flag, RequireValue(argc, argv, idx, flag));
        return 2;
    }
    if (flag == "--retry-delay") {
        retry.initial_delay = std::chrono::milliseconds(ParseCount(flag, RequireValue(argc, argv, idx, flag)));
        return 2;
    }
    if (flag == "--attempt-timeout") {
        retry.attempt_timeout = std::chrono::seconds(ParseCount(flag, RequireValue(argc, argv, idx, flag)));
        return 2;
    }
    if (flag == "--chunk-size") {
        chunk_size = static_cast<std::size_t>(archivedir::config::ParseSize(RequireValue(argc, argv, idx, flag)));
        return 2;
    }
    if (flag == "--no-progress") {
        show_progress = false;
        return 1;
    }
    if (flag == "--no-color") {
        archivedir::cli::SetColorsEnabled(false);
        return 1;
    }
    if (flag == "--log-level") {
        archivedir::log::SetLevel(archivedir::log::ParseLevel(RequireValue(argc, argv, idx, flag)));
        return 2;
    }
    if (flag == "--log-file") {
        archivedir::log::SetLogFile(RequireValue(argc, argv, idx, flag));
        return 2;
    }
    return 0;
}

archivedir::config::BackupConfig ParseBackupArgs(int argc, char** argv, int start_index) {
    archivedir::config::BackupConfig cfg;
    archivedir::config::ApplyEnvironment(cfg);
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (int used = ParseCommonFlag(argc, argv, idx, cfg.retry, cfg.chunk_size, cfg.show_progress)) {
            idx += used;
        } else if (flag == "-d" || flag == "--dest") {
            cfg.destination = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "-p" || flag == "--password") {
            cfg.password = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--split-size") {
            cfg.split_size = archivedir::config::ParseSize(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "--fat32") {
            cfg.safe_cap = archivedir::constants::kFat32SafeSplitSize;
            idx += 1;
        } else if (flag == "--compression") {
            cfg.compression = archivedir::compress::ParseMode(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "--level") {
            cfg.compression_level = static_cast<int>(ParseCount32(flag, RequireValue(argc, argv, idx, flag)));
            idx += 2;
        } else if (flag == "--threads") {
            cfg.compress_threads = static_cast<std::size_t>(ParseCount(flag, RequireValue(argc, argv, idx, flag)));
            idx += 2;
        } else if (flag == "--exclude") {
            cfg.exclude.push_back(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "--include-problematic") {
            cfg.include_problematic = true;
            idx += 1;
        } else if (flag == "--encrypt") {
            cfg.encrypt = true;
            idx += 1;
        } else if (flag == "--salt") {
            cfg.salt_hex = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--kdf-iters") {
            cfg.iterations = ParseCount32(flag, RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "--timestamp") {
            cfg.timestamp_folder = true;
            idx += 1;
        } else if (flag == "--max-inflight") {
            cfg.max_inflight_uploads = static_cast<std::size_t>(ParseCount(flag, RequireValue(argc, argv, idx, flag)));
            idx += 2;
        } else if (flag == "--staging") {
            cfg.staging_dir = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (!flag.empty() && flag[0] == '-') {
            throw archivedir::ConfigError("unknown flag: " + flag);
        } else {
            cfg.sources.emplace_back(flag);
            idx += 1;
        }
    }
    if (!cfg.password.empty() && !cfg.encrypt) {
        cfg.encrypt = true;
    }
    return cfg;
}

archivedir::config::ExtractConfig ParseExtractArgs(int argc, char** argv, int start_index) {
    archivedir::config::ExtractConfig cfg;
    archivedir::config::ApplyEnvironment(cfg);
    int idx = start_index;
    while (idx < argc) {
        std::string flag(argv[idx]);
        if (int used = ParseCommonFlag(argc, argv, idx, cfg.retry, cfg.chunk_size, cfg.show_progress)) {
            idx += used;
        } else if (flag == "-o" || flag == "--out") {
            cfg.destination = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "-p" || flag == "--password") {
            cfg.password = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--part") {
            cfg.parts.push_back(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "--compression") {
            cfg.compression = archivedir::compress::ParseMode(RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (flag == "--salt") {
            cfg.salt_hex = RequireValue(argc, argv, idx, flag);
            idx += 2;
        } else if (flag == "--kdf-iters") {
            cfg.iterations = ParseCount32(flag, RequireValue(argc, argv, idx, flag));
            idx += 2;
        } else if (!flag.empty() && flag[0] == '-') {
            throw archivedir::ConfigError("unknown flag: " + flag);
        } else if (cfg.source.empty()) {
            cfg.source = flag;
            idx += 1;
        } else {
            throw archivedir::ConfigError("more than one archive source given: " + flag);
        }
    }
    return cfg;
}

// Runs the job on its own thread, drawing progress and forwarding Ctrl-C as
// a cancel, then reports the outcome and returns the process exit code.
template <typename Job>
int RunJob(Job& job, bool show_progress, const std::string& label, std::chrono::milliseconds interval) {
    archivedir::progress::ConsoleRenderer renderer(std::cerr, label);
    archivedir::progress::ProgressReporter reporter(job.progress(),
                                                    [&renderer](const archivedir::progress::ProgressState& state) {
                                                        renderer(state);
                                                    },
                                                    interval);
    std::signal(SIGINT, HandleInterrupt);
    std::signal(SIGTERM, HandleInterrupt);

    job.Start();
    if (show_progress) {
        reporter.Start();
    }
    bool cancel_sent = false;
    while (!job.Snapshot().done) {
        if (g_interrupted.load() && !cancel_sent) {
            archivedir::log::Warn("interrupted, cancelling " + label);
            job.Cancel();
            cancel_sent = true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    auto result = job.Wait();
    reporter.Stop();

    if (!result.ok()) {
        std::cerr << archivedir::cli::Colorize("Error", archivedir::cli::color::BOLD_RED, std::cerr) << " ("
                  << archivedir::job::ExitStateName(result.state) << "): " << archivedir::Describe(result.error)
                  << "\n";
        return archivedir::job::ExitCode(result.state);
    }
    for (const auto& line : archivedir::job::DescribeSummary(*result.summary)) {
        std::cout << line << "\n";
    }
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    archivedir::log::InitFromEnvironment();
    if (argc < 2) {
        PrintUsage();
        return 2;
    }
    std::string command(argv[1]);
    try {
        if (command == "-h" || command == "--help" || command == "help") {
            PrintUsage();
            return 0;
        }
        if (command == "backup") {
            archivedir::config::BackupConfig cfg = ParseBackupArgs(argc, argv, 2);
            const bool show_progress = cfg.show_progress;
            const auto interval = cfg.progress_interval;
            archivedir::job::BackupJob job(std::move(cfg));
            return RunJob(job, show_progress, "backup", interval);
        }
        if (command == "extract") {
            archivedir::config::ExtractConfig cfg = ParseExtractArgs(argc, argv, 2);
            const bool show_progress = cfg.show_progress;
            const auto interval = cfg.progress_interval;
            archivedir::job::ExtractJob job(std::move(cfg));
            return RunJob(job, show_progress, "extract", interval);
        }
        PrintUsage();
        return 2;
    } catch (const archivedir::ConfigError& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return archivedir::job::ExitCode(archivedir::job::ExitState::ConfigError);
    } catch (const std::exception& exc) {
        std::cerr << "Error: " << exc.what() << "\n";
        return 1;
    }
}
