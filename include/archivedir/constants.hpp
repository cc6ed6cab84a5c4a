#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace archivedir::constants {

inline constexpr std::uint64_t kGiB = 1024ull * 1024ull * 1024ull;
inline constexpr std::uint64_t kDefaultSplitSize = kGiB * 7 / 2;          // 3.5 GiB
inline constexpr std::uint64_t kFat32SafeSplitSize = kGiB * 39 / 10;      // 3.9 GiB

inline constexpr std::size_t kSaltSize = 16;
inline constexpr std::uint32_t kDefaultKdfIterations = 100000;
inline constexpr std::size_t kAesKeyLen = 32;
inline constexpr std::size_t kAesBlockLen = 16;
inline constexpr std::string_view kCipherName = "AES-256-CBC";
inline constexpr std::string_view kKdfName = "PBKDF2-SHA256";

inline constexpr std::size_t kChunkSize = 1u << 16;
inline constexpr std::size_t kPipeCapacity = 4u << 20;
inline constexpr std::size_t kGzipMemberSize = 2u << 20;
inline constexpr int kDefaultCompressionLevel = 6;

inline constexpr std::chrono::milliseconds kProgressInterval{100};

inline constexpr std::uint32_t kDefaultRetryAttempts = 3;
inline constexpr std::chrono::milliseconds kDefaultRetryDelay{500};
inline constexpr double kDefaultRetryMultiplier = 2.0;
inline constexpr std::chrono::milliseconds kDefaultRetryMaxDelay{30000};
inline constexpr std::chrono::milliseconds kDefaultAttemptTimeout{300000};
inline constexpr std::size_t kDefaultMaxInflightUploads = 2;

inline constexpr std::string_view kPartMarker = ".part_";
inline constexpr int kPartIndexWidth = 3;
inline constexpr std::string_view kMetadataExt = ".enc";
inline constexpr std::string_view kStagingSuffix = ".partial";
inline constexpr std::string_view kMultiSourceName = "multi_backup";
inline constexpr std::string_view kTarExt = ".tar";
inline constexpr std::string_view kGzipExt = ".gz";
inline constexpr std::string_view kXzExt = ".xz";

inline constexpr std::string_view kExtractStagingPrefix = ".archivedir-extract-";

}  // namespace archivedir::constants
