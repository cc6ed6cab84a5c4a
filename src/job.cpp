#include "archivedir/job.hpp"

#include "archivedir/cipher_stage.hpp"
#include "archivedir/destination.hpp"
#include "archivedir/errors.hpp"
#include "archivedir/log.hpp"
#include "archivedir/metadata.hpp"
#include "archivedir/part_reader.hpp"
#include "archivedir/pipeline.hpp"
#include "archivedir/sink.hpp"

#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace archivedir::job {

namespace fs = std::filesystem;

namespace {

std::shared_ptr<sink::ObjectStoreClient> ResolveClient(std::shared_ptr<sink::ObjectStoreClient> client,
                                                       const std::string& object_store_root) {
    if (client) {
        return client;
    }
    if (object_store_root.empty()) {
        return nullptr;
    }
    log::Debug("job: using directory object store at " + object_store_root);
    return std::make_shared<sink::DirectoryObjectStore>(object_store_root);
}

std::string UnixTimestamp() {
    auto now = std::chrono::system_clock::now();
    return std::to_string(std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch()).count());
}

std::string FormatRatio(double ratio) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
    return ss.str();
}

std::chrono::milliseconds Since(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

// Wrong keys and corrupt ciphertext that still happen to pad correctly show
// up downstream as garbage input to decompression or tar parsing.
bool IsGarbageAfterDecrypt(const StageError& exc) {
    return exc.malformed_input() && (exc.component() == "decompress" || exc.component() == "extract");
}

template <typename Summary, typename Body>
void RunInBackground(std::thread& thread, JobResult<Summary>& result, bool& started, Body body) {
    if (started) {
        throw std::logic_error("job already started");
    }
    started = true;
    thread = std::thread([&result, body] {
        try {
            result.summary = body();
        } catch (...) {
            result.error = std::current_exception();
        }
        result.state = ExitStateFor(result.error);
    });
}

}  // namespace

const char* ExitStateName(ExitState state) {
    switch (state) {
        case ExitState::Success: return "success";
        case ExitState::StageFailure: return "stage failure";
        case ExitState::ConfigError: return "configuration error";
        case ExitState::PartIOFailure: return "part I/O failure";
        case ExitState::SinkTransientFailure: return "sink failure (retries exhausted)";
        case ExitState::SinkPermanentFailure: return "sink failure (permanent)";
        case ExitState::DecryptionFailed: return "decryption failed";
        case ExitState::PartDiscoveryFailure: return "part discovery failure";
        case ExitState::MetadataMissing: return "metadata missing";
        case ExitState::Cancelled: return "cancelled";
    }
    return "unknown";
}

int ExitCode(ExitState state) {
    switch (state) {
        case ExitState::Success: return 0;
        case ExitState::StageFailure: return 1;
        case ExitState::ConfigError: return 2;
        case ExitState::PartIOFailure: return 3;
        case ExitState::SinkTransientFailure: return 4;
        case ExitState::SinkPermanentFailure: return 5;
        case ExitState::DecryptionFailed: return 6;
        case ExitState::PartDiscoveryFailure: return 7;
        case ExitState::MetadataMissing: return 8;
        case ExitState::Cancelled: return 9;
    }
    return 1;
}

ExitState ExitStateFor(const std::exception_ptr& error) {
    if (!error) {
        return ExitState::Success;
    }
    try {
        std::rethrow_exception(error);
    } catch (const Error& exc) {
        switch (exc.kind()) {
            case ErrorKind::Stage: return ExitState::StageFailure;
            case ErrorKind::PartIO: return ExitState::PartIOFailure;
            case ErrorKind::SinkTransient: return ExitState::SinkTransientFailure;
            case ErrorKind::SinkPermanent: return ExitState::SinkPermanentFailure;
            case ErrorKind::PartDiscovery: return ExitState::PartDiscoveryFailure;
            case ErrorKind::DecryptionFailed: return ExitState::DecryptionFailed;
            case ErrorKind::MetadataMissing: return ExitState::MetadataMissing;
            case ErrorKind::Cancelled: return ExitState::Cancelled;
            case ErrorKind::Config: return ExitState::ConfigError;
        }
        return ExitState::StageFailure;
    } catch (...) {
        return ExitState::StageFailure;
    }
}

double BackupSummary::CompressionRatio() const {
    if (archive_bytes == 0) {
        return 0.0;
    }
    return static_cast<double>(stored_bytes) / static_cast<double>(archive_bytes);
}

// ---------------------------------------------------------------------------
// Backup

BackupJob::BackupJob(config::BackupConfig cfg, std::shared_ptr<sink::ObjectStoreClient> client)
    : cfg_(std::move(cfg)), client_(std::move(client)) {}

BackupJob::~BackupJob() {
    if (thread_.joinable()) {
        Cancel();
        thread_.join();
    }
}

BackupSummary BackupJob::Run() {
    if (started_) {
        throw std::logic_error("job already started");
    }
    started_ = true;
    return Execute();
}

void BackupJob::Start() {
    RunInBackground(thread_, result_, started_, [this] { return Execute(); });
}

JobResult<BackupSummary> BackupJob::Wait() {
    if (thread_.joinable()) {
        thread_.join();
    }
    return result_;
}

BackupSummary BackupJob::Execute() {
    const auto started = std::chrono::steady_clock::now();
    try {
        config::Validate(cfg_);

        destination::Destination dest = destination::Parse(cfg_.destination);
        if (cfg_.timestamp_folder) {
            dest = dest.Child(UnixTimestamp());
        }
        auto client = ResolveClient(client_, cfg_.object_store_root);

        archive::ExcludeFilter filter = archive::ExcludeFilter::Build(cfg_.exclude, cfg_.include_problematic);
        archive::ScanSummary scanned = archive::ScanSources(cfg_.sources, filter);
        log::Info("backup: " + std::to_string(scanned.files) + " files, " + std::to_string(scanned.dirs) +
                  " directories, " + progress::FormatBytes(scanned.bytes) + " to archive (" +
                  std::to_string(scanned.excluded) + " excluded)");

        BackupSummary summary;
        summary.archive_base =
            (cfg_.sources.size() == 1 ? archive::SourceRootName(cfg_.sources.front())
                                      : std::string(constants::kMultiSourceName)) +
            compress::ArchiveExtension(cfg_.compression);
        summary.destination = dest.ToString();
        summary.compression = cfg_.compression;
        summary.encrypted = cfg_.encrypt;
        summary.scanned = scanned;

        std::unique_ptr<sink::DestinationSink> sink = sink::MakeSink(dest, client, cfg_.retry, cfg_.staging_dir);

        std::optional<metadata::EncryptionMetadata> meta;
        std::vector<std::unique_ptr<stream::StreamTransform>> transforms;
        if (auto compressor = compress::MakeCompressor(cfg_.compression, cfg_.compression_level,
                                                       cfg_.compress_threads, constants::kGzipMemberSize)) {
            transforms.push_back(std::move(compressor));
        }
        if (cfg_.encrypt) {
            meta = metadata::Generate(cfg_.iterations, cfg_.salt_hex);
            transforms.push_back(std::make_unique<cipher::EncryptTransform>(cfg_.password, *meta));
        }

        parts::PartWriter::Options writer_options;
        writer_options.part_size = cfg_.EffectivePartSize();
        writer_options.max_inflight = cfg_.max_inflight_uploads;
        parts::PartWriter writer(summary.archive_base, *sink, &progress_, writer_options);

        pipeline::Options pipe_options;
        pipe_options.pipe_capacity = cfg_.pipe_capacity;
        pipe_options.chunk_size = cfg_.chunk_size;
        auto tar = std::make_unique<archive::TarWriter>(cfg_.sources, filter, cfg_.chunk_size);
        pipeline::Pipeline pipeline(std::move(tar), std::move(transforms), writer, pipe_options);

        log::Info("backup: " + summary.archive_base + " -> " + sink->Describe() + " (parts of " +
                  progress::FormatBytes(writer_options.part_size) + ")");
        pipeline::RunStats stats = pipeline.Run(cancel_);

        if (meta) {
            summary.metadata_record = metadata::RecordName(summary.archive_base);
            try {
                sink->StoreMetadata(*summary.metadata_record, metadata::Serialize(*meta), cancel_);
            } catch (...) {
                writer.Abort();
                throw;
            }
        }

        summary.parts = writer.parts();
        summary.stored_bytes = writer.bytes_written();
        summary.archive_bytes = stats.stages.front().bytes_out;
        summary.elapsed = Since(started);
        progress_.Finish(true);
        for (const auto& line : DescribeSummary(summary)) {
            log::Info("backup: " + line);
        }
        return summary;
    } catch (...) {
        progress_.Finish(false);
        throw;
    }
}

// ---------------------------------------------------------------------------
// Extract

ExtractJob::ExtractJob(config::ExtractConfig cfg, std::shared_ptr<sink::ObjectStoreClient> client)
    : cfg_(std::move(cfg)), client_(std::move(client)) {}

ExtractJob::~ExtractJob() {
    if (thread_.joinable()) {
        Cancel();
        thread_.join();
    }
}

ExtractSummary ExtractJob::Run() {
    if (started_) {
        throw std::logic_error("job already started");
    }
    started_ = true;
    return Execute();
}

void ExtractJob::Start() {
    RunInBackground(thread_, result_, started_, [this] { return Execute(); });
}

JobResult<ExtractSummary> ExtractJob::Wait() {
    if (thread_.joinable()) {
        thread_.join();
    }
    return result_;
}

ExtractSummary ExtractJob::Execute() {
    const auto started = std::chrono::steady_clock::now();
    try {
        config::Validate(cfg_);
        auto client = ResolveClient(client_, cfg_.object_store_root);

        // Parts are located and checked before any stage runs.
        std::string source_spec = cfg_.source;
        std::vector<std::string> explicit_names;
        std::optional<fs::path> parts_folder;
        for (const auto& part : cfg_.parts) {
            fs::path part_path(part);
            fs::path folder = part_path.has_parent_path() ? part_path.parent_path().lexically_normal() : fs::path(".");
            if (cfg_.source.empty()) {
                if (!parts_folder) {
                    parts_folder = folder;
                    source_spec = folder.string();
                } else if (*parts_folder != folder) {
                    throw ConfigError("explicit parts must share one folder: " + parts_folder->string() + " and " +
                                      folder.string());
                }
            }
            explicit_names.push_back(part_path.filename().string());
        }
        parts::PartSource source = parts::ResolveSource(source_spec, client, cfg_.retry, cancel_);
        parts::DiscoveredParts discovered = explicit_names.empty()
                                                ? parts::DiscoverParts(*source.location, source.selector)
                                                : parts::DiscoverParts(*source.location, explicit_names);
        log::Info("extract: found " + std::to_string(discovered.parts.size()) + " part(s) of " + discovered.base +
                  " in " + source.location->Describe() + " (" + progress::FormatBytes(discovered.total_bytes) + ")");

        ExtractSummary summary;
        summary.archive_base = discovered.base;
        summary.source = source.location->Describe();
        summary.part_count = discovered.parts.size();
        summary.stored_bytes = discovered.total_bytes;

        if (cfg_.compression) {
            summary.compression = *cfg_.compression;
        } else if (auto inferred = compress::ModeFromArchiveName(discovered.base)) {
            summary.compression = *inferred;
        } else {
            log::Warn("extract: cannot tell the compression of " + discovered.base + " from its name, assuming gzip");
            summary.compression = compress::Mode::Gzip;
        }

        std::vector<std::unique_ptr<stream::StreamTransform>> transforms;
        summary.decrypted = cfg_.password.has_value();
        if (summary.decrypted) {
            std::optional<metadata::EncryptionMetadata> stored;
            if (auto record = parts::LoadMetadataRecord(*source.location, discovered.base)) {
                stored = metadata::Parse(*record);
            }
            metadata::EncryptionMetadata meta = metadata::Resolve(stored, cfg_.salt_hex, cfg_.iterations);
            transforms.push_back(std::make_unique<cipher::DecryptTransform>(*cfg_.password, meta));
        } else {
            const std::string record = metadata::RecordName(discovered.base);
            for (const auto& object : source.location->List(record)) {
                if (object.name == record) {
                    throw ConfigError(discovered.base + " is encrypted (" + record + " present); a password is required");
                }
            }
        }
        if (auto decompressor = compress::MakeDecompressor(summary.compression)) {
            transforms.push_back(std::move(decompressor));
        }

        progress_.SetTotal(discovered.total_bytes);
        auto reader = std::make_unique<parts::PartReaderSource>(*source.location, discovered, &progress_,
                                                                cfg_.chunk_size);
        parts::PartReaderSource* reader_stage = reader.get();
        archive::TarExtractor extractor(cfg_.destination);

        pipeline::Options pipe_options;
        pipe_options.pipe_capacity = cfg_.pipe_capacity;
        pipe_options.chunk_size = cfg_.chunk_size;
        pipeline::Pipeline pipeline(std::move(reader), std::move(transforms), extractor, pipe_options);
        try {
            pipeline.Run(cancel_);
        } catch (const StageError& exc) {
            if (summary.decrypted && IsGarbageAfterDecrypt(exc)) {
                throw DecryptionFailed(std::string("decrypted data is not a valid archive (") + exc.what() + ")");
            }
            throw;
        }

        reader_stage->ReportHeld();
        summary.extracted = extractor.extracted();
        summary.elapsed = Since(started);
        progress_.Finish(true);
        for (const auto& line : DescribeSummary(summary)) {
            log::Info("extract: " + line);
        }
        return summary;
    } catch (...) {
        progress_.Finish(false);
        throw;
    }
}

BackupSummary Backup(const config::BackupConfig& cfg, std::shared_ptr<sink::ObjectStoreClient> client) {
    BackupJob job(cfg, std::move(client));
    return job.Run();
}

ExtractSummary Extract(const config::ExtractConfig& cfg, std::shared_ptr<sink::ObjectStoreClient> client) {
    ExtractJob job(cfg, std::move(client));
    return job.Run();
}

std::vector<std::string> DescribeSummary(const BackupSummary& summary) {
    std::vector<std::string> lines;
    lines.push_back("archive " + summary.archive_base + " at " + summary.destination);
    for (const auto& part : summary.parts) {
        lines.push_back("  " + part.name + "  " + progress::FormatBytes(part.size));
    }
    if (summary.metadata_record) {
        lines.push_back("  " + *summary.metadata_record + "  (encryption metadata)");
    }
    lines.push_back("parts: " + std::to_string(summary.parts.size()) + ", total " +
                    progress::FormatBytes(summary.stored_bytes));
    lines.push_back("compression: " + std::string(compress::ModeName(summary.compression)) + ", " +
                    progress::FormatBytes(summary.archive_bytes) + " -> " + progress::FormatBytes(summary.stored_bytes) +
                    " (" + FormatRatio(summary.CompressionRatio()) + ")");
    lines.push_back("encryption: " + std::string(summary.encrypted ? "AES-256-CBC" : "off"));
    lines.push_back("elapsed: " + progress::FormatDuration(summary.elapsed));
    return lines;
}

std::vector<std::string> DescribeSummary(const ExtractSummary& summary) {
    std::vector<std::string> lines;
    lines.push_back("archive " + summary.archive_base + " from " + summary.source + " (" +
                    std::to_string(summary.part_count) + " part(s), " + progress::FormatBytes(summary.stored_bytes) + ")");
    lines.push_back("restored " + std::to_string(summary.extracted.files) + " files, " +
                    std::to_string(summary.extracted.dirs) + " directories, " +
                    std::to_string(summary.extracted.symlinks) + " symlinks");
    lines.push_back("elapsed: " + progress::FormatDuration(summary.elapsed));
    return lines;
}

}  // namespace archivedir::job
