#pragma once

#include "archivedir/archive.hpp"
#include "archivedir/compress.hpp"
#include "archivedir/config.hpp"
#include "archivedir/object_store.hpp"
#include "archivedir/part_writer.hpp"
#include "archivedir/progress.hpp"
#include "archivedir/stream.hpp"

#include <chrono>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace archivedir::job {

enum class ExitState {
    Success,
    StageFailure,
    ConfigError,
    PartIOFailure,
    SinkTransientFailure,
    SinkPermanentFailure,
    DecryptionFailed,
    PartDiscoveryFailure,
    MetadataMissing,
    Cancelled
};

const char* ExitStateName(ExitState state);
// Process exit code for the CLI: 0 success, 1..9 in enum order.
int ExitCode(ExitState state);
// Success for a null pointer, StageFailure for exceptions outside the
// archivedir::Error hierarchy.
ExitState ExitStateFor(const std::exception_ptr& error);

struct BackupSummary {
    std::string archive_base;
    std::string destination;
    compress::Mode compression = compress::Mode::Gzip;
    bool encrypted = false;
    std::optional<std::string> metadata_record;
    archive::ScanSummary scanned;
    std::vector<parts::PartRecord> parts;
    std::uint64_t archive_bytes = 0;  // tar stream before compression
    std::uint64_t stored_bytes = 0;   // sum of part sizes
    std::chrono::milliseconds elapsed{0};

    // stored_bytes / archive_bytes, 0 for an empty archive.
    double CompressionRatio() const;
};

struct ExtractSummary {
    std::string archive_base;
    std::string source;
    std::size_t part_count = 0;
    std::uint64_t stored_bytes = 0;
    compress::Mode compression = compress::Mode::Gzip;
    bool decrypted = false;
    archive::ScanSummary extracted;
    std::chrono::milliseconds elapsed{0};
};

template <typename Summary>
struct JobResult {
    ExitState state = ExitState::Success;
    std::exception_ptr error;
    std::optional<Summary> summary;

    bool ok() const noexcept { return state == ExitState::Success; }
};

// One backup run. Run() executes synchronously and throws the terminal
// error; Start()/Wait() run the same thing on a background thread while the
// caller samples Snapshot() and may Cancel().
class BackupJob {
public:
    explicit BackupJob(config::BackupConfig cfg, std::shared_ptr<sink::ObjectStoreClient> client = nullptr);
    ~BackupJob();

    BackupJob(const BackupJob&) = delete;
    BackupJob& operator=(const BackupJob&) = delete;

    BackupSummary Run();

    void Start();
    JobResult<BackupSummary> Wait();
    void Cancel() noexcept { cancel_.Cancel(); }

    progress::ProgressState Snapshot() const { return progress_.Snapshot(); }
    const progress::ProgressAggregator& progress() const noexcept { return progress_; }

private:
    BackupSummary Execute();

    config::BackupConfig cfg_;
    std::shared_ptr<sink::ObjectStoreClient> client_;
    stream::CancelToken cancel_;
    progress::ProgressAggregator progress_;
    std::thread thread_;
    JobResult<BackupSummary> result_;
    bool started_ = false;
};

class ExtractJob {
public:
    explicit ExtractJob(config::ExtractConfig cfg, std::shared_ptr<sink::ObjectStoreClient> client = nullptr);
    ~ExtractJob();

    ExtractJob(const ExtractJob&) = delete;
    ExtractJob& operator=(const ExtractJob&) = delete;

    ExtractSummary Run();

    void Start();
    JobResult<ExtractSummary> Wait();
    void Cancel() noexcept { cancel_.Cancel(); }

    progress::ProgressState Snapshot() const { return progress_.Snapshot(); }
    const progress::ProgressAggregator& progress() const noexcept { return progress_; }

private:
    ExtractSummary Execute();

    config::ExtractConfig cfg_;
    std::shared_ptr<sink::ObjectStoreClient> client_;
    stream::CancelToken cancel_;
    progress::ProgressAggregator progress_;
    std::thread thread_;
    JobResult<ExtractSummary> result_;
    bool started_ = false;
};

BackupSummary Backup(const config::BackupConfig& cfg, std::shared_ptr<sink::ObjectStoreClient> client = nullptr);
ExtractSummary Extract(const config::ExtractConfig& cfg, std::shared_ptr<sink::ObjectStoreClient> client = nullptr);

// Human-readable run summaries, one line per entry.
std::vector<std::string> DescribeSummary(const BackupSummary& summary);
std::vector<std::string> DescribeSummary(const ExtractSummary& summary);

}  // namespace archivedir::job
