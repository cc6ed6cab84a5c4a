#pragma once

#include "archivedir/crypto.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace archivedir::metadata {

using MetadataMap = std::unordered_map<std::string, std::string>;

struct EncryptionMetadata {
    crypto::Bytes salt;  // 16 bytes
    std::uint32_t iterations = 0;
    std::string algorithm;
    std::string kdf;
};

// Fresh record for a backup run. `salt_hex` reuses a caller-supplied salt.
EncryptionMetadata Generate(std::uint32_t iterations, const std::optional<std::string>& salt_hex = std::nullopt);

// Validates a 32-character hex salt. Throws ConfigError otherwise.
crypto::Bytes ParseSalt(std::string_view salt_hex);

// "<archive-base-name>.enc"
std::string RecordName(std::string_view archive_base);

// key=value lines: salt, iterations, algorithm, kdf.
std::string Serialize(const EncryptionMetadata& meta);
MetadataMap Decode(const std::string& text);
std::string GetValue(const MetadataMap& meta, std::string_view key);

// Decodes and validates a stored record. Throws MetadataMissing when a field
// is absent or unusable, and when the algorithm/kdf is not the supported pair.
EncryptionMetadata Parse(const std::string& text);

// Explicit salt/iterations win over the stored record; a salt without
// iterations takes the stored (or default) iteration count. Throws
// MetadataMissing when neither a record nor an explicit salt is available.
EncryptionMetadata Resolve(const std::optional<EncryptionMetadata>& stored,
                           const std::optional<std::string>& salt_hex,
                           const std::optional<std::uint32_t>& iterations);

}  // namespace archivedir::metadata
