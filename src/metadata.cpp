#include "archivedir/metadata.hpp"

#include "archivedir/constants.hpp"
#include "archivedir/errors.hpp"

#include <sstream>
#include <stdexcept>

namespace archivedir::metadata {

namespace {

std::string Trim(std::string_view value) {
    const char* ws = " \t\r\n";
    auto begin = value.find_first_not_of(ws);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = value.find_last_not_of(ws);
    return std::string(value.substr(begin, end - begin + 1));
}

std::optional<std::uint32_t> ParseIterations(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return std::nullopt;
    }
    try {
        unsigned long long value = std::stoull(text);
        if (value == 0 || value > 0xFFFFFFFFull) {
            return std::nullopt;
        }
        return static_cast<std::uint32_t>(value);
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

}  // namespace

crypto::Bytes ParseSalt(std::string_view salt_hex) {
    if (salt_hex.size() != constants::kSaltSize * 2) {
        throw ConfigError("salt must be " + std::to_string(constants::kSaltSize * 2) + " hex characters");
    }
    try {
        return crypto::HexDecode(salt_hex);
    } catch (const std::invalid_argument&) {
        throw ConfigError("salt is not a valid hex string");
    }
}

EncryptionMetadata Generate(std::uint32_t iterations, const std::optional<std::string>& salt_hex) {
    if (iterations == 0) {
        throw ConfigError("PBKDF2 iterations must be positive");
    }
    EncryptionMetadata meta;
    meta.salt = salt_hex ? ParseSalt(*salt_hex) : crypto::RandomBytes(constants::kSaltSize);
    meta.iterations = iterations;
    meta.algorithm = std::string(constants::kCipherName);
    meta.kdf = std::string(constants::kKdfName);
    return meta;
}

std::string RecordName(std::string_view archive_base) {
    return std::string(archive_base) + std::string(constants::kMetadataExt);
}

std::string Serialize(const EncryptionMetadata& meta) {
    std::ostringstream out;
    out << "salt=" << crypto::HexEncode(meta.salt) << "\n";
    out << "iterations=" << meta.iterations << "\n";
    out << "algorithm=" << meta.algorithm << "\n";
    out << "kdf=" << meta.kdf << "\n";
    return out.str();
}

MetadataMap Decode(const std::string& text) {
    MetadataMap meta;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        std::string trimmed = Trim(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        auto eq = trimmed.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        meta[Trim(std::string_view(trimmed).substr(0, eq))] = Trim(std::string_view(trimmed).substr(eq + 1));
    }
    return meta;
}

std::string GetValue(const MetadataMap& meta, std::string_view key) {
    auto it = meta.find(std::string(key));
    if (it == meta.end()) {
        return {};
    }
    return it->second;
}

EncryptionMetadata Parse(const std::string& text) {
    MetadataMap map = Decode(text);
    EncryptionMetadata meta;

    std::string salt = GetValue(map, "salt");
    if (salt.empty()) {
        throw MetadataMissing("metadata record has no salt");
    }
    try {
        meta.salt = ParseSalt(salt);
    } catch (const ConfigError& exc) {
        throw MetadataMissing(std::string("metadata record is unusable: ") + exc.what());
    }

    auto iterations = ParseIterations(GetValue(map, "iterations"));
    if (!iterations) {
        throw MetadataMissing("metadata record has no valid iteration count");
    }
    meta.iterations = *iterations;

    // Records written before the algorithm fields existed carry only salt/iterations.
    meta.algorithm = GetValue(map, "algorithm");
    meta.kdf = GetValue(map, "kdf");
    if (meta.algorithm.empty()) {
        meta.algorithm = std::string(constants::kCipherName);
    }
    if (meta.kdf.empty()) {
        meta.kdf = std::string(constants::kKdfName);
    }
    if (meta.algorithm != constants::kCipherName || meta.kdf != constants::kKdfName) {
        throw MetadataMissing("unsupported encryption parameters " + meta.algorithm + "/" + meta.kdf);
    }
    return meta;
}

EncryptionMetadata Resolve(const std::optional<EncryptionMetadata>& stored,
                           const std::optional<std::string>& salt_hex,
                           const std::optional<std::uint32_t>& iterations) {
    if (!stored && !salt_hex) {
        throw MetadataMissing("no encryption metadata found; supply the .enc record or --salt (and --kdf-iters if not the default)");
    }
    EncryptionMetadata meta;
    if (stored) {
        meta = *stored;
    } else {
        meta.iterations = constants::kDefaultKdfIterations;
        meta.algorithm = std::string(constants::kCipherName);
        meta.kdf = std::string(constants::kKdfName);
    }
    if (salt_hex) {
        meta.salt = ParseSalt(*salt_hex);
    }
    if (iterations) {
        if (*iterations == 0) {
            throw ConfigError("PBKDF2 iterations must be positive");
        }
        meta.iterations = *iterations;
    }
    return meta;
}

}  // namespace archivedir::metadata
