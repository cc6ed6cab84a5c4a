#include <catch2/catch.hpp>

#include "archivedir/config.hpp"
#include "archivedir/errors.hpp"
#include "test_support.hpp"

#include <cstdlib>

using namespace archivedir;
using archivedir::testing::TempDir;

namespace {

config::BackupConfig ValidBackup(const TempDir& tmp) {
    config::BackupConfig cfg;
    cfg.sources = {tmp.path()};
    cfg.destination = (tmp / "out").string();
    return cfg;
}

struct ScopedEnv {
    ScopedEnv(const char* name, const char* value) : name_(name) { ::setenv(name, value, 1); }
    ~ScopedEnv() { ::unsetenv(name_); }
    const char* name_;
};

}  // namespace

TEST_CASE("sizes parse with binary units") {
    REQUIRE(config::ParseSize("4096") == 4096);
    REQUIRE(config::ParseSize("512K") == 512ull * 1024);
    REQUIRE(config::ParseSize("100M") == 100ull * 1024 * 1024);
    REQUIRE(config::ParseSize("100mb") == 100ull * 1024 * 1024);
    REQUIRE(config::ParseSize("1KiB") == 1024);
    REQUIRE(config::ParseSize("3.5G") == 3758096384ull);
    REQUIRE(config::ParseSize(" 2 T ") == 2ull << 40);
    REQUIRE(config::ParseSize("7B") == 7);
}

TEST_CASE("malformed sizes are config errors") {
    REQUIRE_THROWS_AS(config::ParseSize(""), ConfigError);
    REQUIRE_THROWS_AS(config::ParseSize("G"), ConfigError);
    REQUIRE_THROWS_AS(config::ParseSize("10X"), ConfigError);
    REQUIRE_THROWS_AS(config::ParseSize("1.2.3M"), ConfigError);
    REQUIRE_THROWS_AS(config::ParseSize("-5M"), ConfigError);
}

TEST_CASE("effective part size honours the filesystem cap") {
    config::BackupConfig cfg;
    cfg.split_size = 100;
    REQUIRE(cfg.EffectivePartSize() == 100);
    cfg.safe_cap = 60;
    REQUIRE(cfg.EffectivePartSize() == 60);
    cfg.safe_cap = 500;
    REQUIRE(cfg.EffectivePartSize() == 100);
}

TEST_CASE("backup validation names the first problem") {
    TempDir tmp;
    REQUIRE_NOTHROW(config::Validate(ValidBackup(tmp)));

    auto cfg = ValidBackup(tmp);
    SECTION("missing source") {
        cfg.sources = {tmp / "nope"};
        REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    }
    SECTION("no sources") {
        cfg.sources.clear();
        REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    }
    SECTION("bad destination") {
        cfg.destination = "ftp://host/dir";
        REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    }
    SECTION("zero split size") {
        cfg.split_size = 0;
        REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    }
    SECTION("gzip level out of range") {
        cfg.compression_level = 0;
        REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    }
    SECTION("encryption without a password") {
        cfg.encrypt = true;
        REQUIRE_THROWS_WITH(config::Validate(cfg), Catch::Contains("password"));
    }
    SECTION("bad salt") {
        cfg.encrypt = true;
        cfg.password = "pw";
        cfg.salt_hex = std::string("abc");
        REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    }
    SECTION("no retry attempts") {
        cfg.retry.max_attempts = 0;
        REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    }
    SECTION("no upload slots") {
        cfg.max_inflight_uploads = 0;
        REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    }
}

TEST_CASE("extract validation") {
    config::ExtractConfig cfg;
    REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);

    cfg.source = "/some/archive.tar.gz";
    REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);

    cfg.destination = "/tmp/restore";
    REQUIRE_NOTHROW(config::Validate(cfg));

    cfg.password = std::string();
    REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
    cfg.password = std::string("pw");
    cfg.iterations = 0u;
    REQUIRE_THROWS_AS(config::Validate(cfg), ConfigError);
}

TEST_CASE("environment overrides backup defaults") {
    ScopedEnv split("ARCHIVEDIR_SPLIT_SIZE", "64M");
    ScopedEnv level("ARCHIVEDIR_COMPRESSION_LEVEL", "3");
    ScopedEnv iters("ARCHIVEDIR_KDF_ITERS", "2000");

    config::BackupConfig cfg;
    config::ApplyEnvironment(cfg);
    REQUIRE(cfg.split_size == 64ull * 1024 * 1024);
    REQUIRE(cfg.compression_level == 3);
    REQUIRE(cfg.iterations == 2000);

    config::ExtractConfig extract;
    config::ApplyEnvironment(extract);
    REQUIRE_FALSE(extract.iterations.has_value());
}

TEST_CASE("malformed environment values are rejected") {
    ScopedEnv level("ARCHIVEDIR_COMPRESSION_LEVEL", "12");
    config::BackupConfig cfg;
    REQUIRE_THROWS_AS(config::ApplyEnvironment(cfg), ConfigError);
}
