#pragma once

#include "archivedir/compress.hpp"
#include "archivedir/constants.hpp"
#include "archivedir/retry.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace archivedir::config {

struct BackupConfig {
    std::vector<std::filesystem::path> sources;
    std::string destination;  // local path or remote specifier

    std::uint64_t split_size = constants::kDefaultSplitSize;
    // Cap imposed by the target filesystem (e.g. 3.9 GiB on FAT32); parts
    // never exceed min(split_size, safe_cap).
    std::optional<std::uint64_t> safe_cap;

    compress::Mode compression = compress::Mode::Gzip;
    int compression_level = constants::kDefaultCompressionLevel;
    std::size_t compress_threads = 1;

    std::vector<std::string> exclude;
    bool include_problematic = false;

    bool encrypt = false;
    std::string password;
    std::optional<std::string> salt_hex;
    std::uint32_t iterations = constants::kDefaultKdfIterations;

    retry::RetryPolicy retry;
    std::size_t max_inflight_uploads = constants::kDefaultMaxInflightUploads;

    std::size_t pipe_capacity = constants::kPipeCapacity;
    std::size_t chunk_size = constants::kChunkSize;
    std::chrono::milliseconds progress_interval = constants::kProgressInterval;
    bool show_progress = true;

    // Write into <destination>/<unix-time>/.
    bool timestamp_folder = false;
    // Where remote parts are staged before upload; empty uses the system temp dir.
    std::filesystem::path staging_dir;
    std::string object_store_root;

    std::uint64_t EffectivePartSize() const;
};

struct ExtractConfig {
    // Folder, base name, part name or prefix, local or remote.
    std::string source;
    // Explicit part names inside the source folder; overrides discovery.
    std::vector<std::string> parts;
    std::filesystem::path destination;

    // Inferred from the archive name when unset.
    std::optional<compress::Mode> compression;

    std::optional<std::string> password;
    std::optional<std::string> salt_hex;
    std::optional<std::uint32_t> iterations;

    retry::RetryPolicy retry;
    std::size_t pipe_capacity = constants::kPipeCapacity;
    std::size_t chunk_size = constants::kChunkSize;
    std::chrono::milliseconds progress_interval = constants::kProgressInterval;
    bool show_progress = true;
    std::string object_store_root;
};

// "4096", "512K", "100M", "3.5G", "1T", with optional "B"/"iB". Units are
// binary. Throws ConfigError on anything else.
std::uint64_t ParseSize(std::string_view text);

// ARCHIVEDIR_SPLIT_SIZE, ARCHIVEDIR_COMPRESSION_LEVEL, ARCHIVEDIR_KDF_ITERS
// and ARCHIVEDIR_OBJECT_STORE_ROOT (extraction reads only the last). Applied
// to defaults before command-line flags, so flags win.
void ApplyEnvironment(BackupConfig& cfg);
void ApplyEnvironment(ExtractConfig& cfg);

// Throws ConfigError naming the first problem found.
void Validate(const BackupConfig& cfg);
void Validate(const ExtractConfig& cfg);

}  // namespace archivedir::config
