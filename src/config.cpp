#include "archivedir/config.hpp"

#include "archivedir/destination.hpp"
#include "archivedir/env.hpp"
#include "archivedir/errors.hpp"
#include "archivedir/metadata.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <limits>
#include <system_error>

namespace archivedir::config {

namespace {

std::string Trim(std::string_view text) {
    std::size_t begin = 0;
    std::size_t end = text.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(text[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1]))) --end;
    return std::string(text.substr(begin, end - begin));
}

std::string Upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return value;
}

std::uint64_t UnitMultiplier(std::string unit) {
    unit = Upper(std::move(unit));
    if (unit.size() > 1 && unit.back() == 'B') {
        unit.pop_back();
        if (unit.size() > 1 && unit.back() == 'I') {
            unit.pop_back();
        }
    }
    if (unit.empty() || unit == "B") return 1;
    if (unit == "K") return 1ull << 10;
    if (unit == "M") return 1ull << 20;
    if (unit == "G") return 1ull << 30;
    if (unit == "T") return 1ull << 40;
    return 0;
}

void ApplyCommonEnvironment(std::string& object_store_root) {
    std::string root = env::Get("ARCHIVEDIR_OBJECT_STORE_ROOT");
    if (!root.empty()) {
        object_store_root = root;
    }
}

void ValidateRetry(const retry::RetryPolicy& policy) {
    if (policy.max_attempts == 0) {
        throw ConfigError("retry attempts must be at least 1");
    }
    if (policy.backoff_multiplier < 1.0) {
        throw ConfigError("retry backoff multiplier must be >= 1");
    }
    if (policy.attempt_timeout.count() <= 0) {
        throw ConfigError("upload attempt timeout must be positive");
    }
}

void ValidateStreaming(std::size_t pipe_capacity, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw ConfigError("chunk size must be positive");
    }
    if (pipe_capacity == 0) {
        throw ConfigError("pipe capacity must be positive");
    }
}

}  // namespace

std::uint64_t BackupConfig::EffectivePartSize() const {
    if (safe_cap && *safe_cap < split_size) {
        return *safe_cap;
    }
    return split_size;
}

std::uint64_t ParseSize(std::string_view text) {
    const std::string raw = Trim(text);
    std::size_t pos = 0;
    while (pos < raw.size() && (std::isdigit(static_cast<unsigned char>(raw[pos])) || raw[pos] == '.')) {
        ++pos;
    }
    if (pos == 0) {
        throw ConfigError("invalid size: '" + std::string(text) + "'");
    }
    const std::string number = raw.substr(0, pos);
    const std::uint64_t multiplier = UnitMultiplier(Trim(raw.substr(pos)));
    if (multiplier == 0 || std::count(number.begin(), number.end(), '.') > 1) {
        throw ConfigError("invalid size: '" + std::string(text) + "'");
    }
    double value = 0.0;
    try {
        value = std::stod(number);
    } catch (const std::exception&) {
        throw ConfigError("invalid size: '" + std::string(text) + "'");
    }
    const double bytes = std::floor(value * static_cast<double>(multiplier));
    if (!std::isfinite(bytes) || bytes >= static_cast<double>(std::numeric_limits<std::uint64_t>::max())) {
        throw ConfigError("size out of range: '" + std::string(text) + "'");
    }
    return static_cast<std::uint64_t>(bytes);
}

void ApplyEnvironment(BackupConfig& cfg) {
    std::string split = env::Get("ARCHIVEDIR_SPLIT_SIZE");
    if (!split.empty()) {
        cfg.split_size = ParseSize(split);
    }
    if (!env::Get("ARCHIVEDIR_COMPRESSION_LEVEL").empty()) {
        auto level = env::GetUnsigned("ARCHIVEDIR_COMPRESSION_LEVEL");
        if (!level || *level > 9) {
            throw ConfigError("ARCHIVEDIR_COMPRESSION_LEVEL must be an integer from 0 to 9");
        }
        cfg.compression_level = static_cast<int>(*level);
    }
    if (!env::Get("ARCHIVEDIR_KDF_ITERS").empty()) {
        auto iters = env::GetUnsigned("ARCHIVEDIR_KDF_ITERS");
        if (!iters || *iters == 0 || *iters > std::numeric_limits<std::uint32_t>::max()) {
            throw ConfigError("ARCHIVEDIR_KDF_ITERS must be a positive integer");
        }
        cfg.iterations = static_cast<std::uint32_t>(*iters);
    }
    ApplyCommonEnvironment(cfg.object_store_root);
}

// The iteration count of an existing archive comes from its metadata record,
// so ARCHIVEDIR_KDF_ITERS only affects backups.
void ApplyEnvironment(ExtractConfig& cfg) {
    ApplyCommonEnvironment(cfg.object_store_root);
}

void Validate(const BackupConfig& cfg) {
    if (cfg.sources.empty()) {
        throw ConfigError("no source directories given");
    }
    for (const auto& source : cfg.sources) {
        std::error_code ec;
        if (!std::filesystem::exists(source, ec)) {
            throw ConfigError("source not found: " + source.string());
        }
    }
    if (cfg.destination.empty()) {
        throw ConfigError("no destination given");
    }
    destination::Parse(cfg.destination);

    if (cfg.split_size == 0) {
        throw ConfigError("split size must be positive");
    }
    if (cfg.safe_cap && *cfg.safe_cap == 0) {
        throw ConfigError("filesystem size cap must be positive");
    }
    if (cfg.compression == compress::Mode::Gzip && (cfg.compression_level < 1 || cfg.compression_level > 9)) {
        throw ConfigError("gzip compression level must be from 1 to 9");
    }
    if (cfg.compression == compress::Mode::Xz) {
        if (cfg.compression_level < 0 || cfg.compression_level > 9) {
            throw ConfigError("xz compression level must be from 0 to 9");
        }
        if (!compress::XzAvailable()) {
            throw ConfigError("xz compression is not available in this build");
        }
    }
    if (cfg.compress_threads == 0) {
        throw ConfigError("compression threads must be at least 1");
    }
    if (cfg.encrypt) {
        if (cfg.password.empty()) {
            throw ConfigError("encryption requested without a password");
        }
        if (cfg.salt_hex) {
            metadata::ParseSalt(*cfg.salt_hex);
        }
        if (cfg.iterations == 0) {
            throw ConfigError("KDF iterations must be positive");
        }
    }
    if (cfg.max_inflight_uploads == 0) {
        throw ConfigError("in-flight uploads must be at least 1");
    }
    ValidateRetry(cfg.retry);
    ValidateStreaming(cfg.pipe_capacity, cfg.chunk_size);
}

void Validate(const ExtractConfig& cfg) {
    if (cfg.source.empty() && cfg.parts.empty()) {
        throw ConfigError("no archive source given");
    }
    if (cfg.destination.empty()) {
        throw ConfigError("no extraction directory given");
    }
    if (!cfg.source.empty()) {
        destination::Parse(cfg.source);
    }
    if (cfg.compression == compress::Mode::Xz && !compress::XzAvailable()) {
        throw ConfigError("xz decompression is not available in this build");
    }
    if (cfg.password && cfg.password->empty()) {
        throw ConfigError("empty password");
    }
    if (cfg.salt_hex) {
        metadata::ParseSalt(*cfg.salt_hex);
    }
    if (cfg.iterations && *cfg.iterations == 0) {
        throw ConfigError("KDF iterations must be positive");
    }
    ValidateRetry(cfg.retry);
    ValidateStreaming(cfg.pipe_capacity, cfg.chunk_size);
}

}  // namespace archivedir::config
