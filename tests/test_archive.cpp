#include <catch2/catch.hpp>

#include "archivedir/archive.hpp"
#include "archivedir/errors.hpp"
#include "test_support.hpp"

#include <cstdio>
#include <cstring>

using namespace archivedir;
using namespace archivedir::testing;

namespace {

stream::Bytes ArchiveOf(std::vector<fs::path> sources, archive::ExcludeFilter filter = {}) {
    archive::TarWriter writer(std::move(sources), std::move(filter), 4096);
    stream::BufferSink sink;
    stream::CancelToken cancel;
    writer.Produce(sink, cancel);
    return sink.Take();
}

void ExtractInto(const stream::Bytes& tar, const fs::path& dest, std::size_t slice = 1000) {
    archive::TarExtractor extractor(dest);
    for (std::size_t offset = 0; offset < tar.size(); offset += slice) {
        extractor.Write(tar.data() + offset, std::min(slice, tar.size() - offset));
    }
    extractor.Close();
}

// One ustar header block for `name` with the given type, link target and
// payload size.
stream::Bytes HeaderBlock(const std::string& name, char type, const std::string& link = "",
                          std::size_t size = 0) {
    stream::Bytes block(512, 0);
    char* raw = reinterpret_cast<char*>(block.data());
    std::memcpy(raw, name.data(), std::min<std::size_t>(name.size(), 100));
    std::memcpy(raw + 100, type == '5' ? "0000755" : "0000644", 7);
    std::snprintf(raw + 124, 12, "%011o", static_cast<unsigned>(size));
    std::memcpy(raw + 136, "00000000000", 11);
    raw[156] = type;
    std::memcpy(raw + 157, link.data(), std::min<std::size_t>(link.size(), 100));
    std::memcpy(raw + 257, "ustar", 6);
    std::memcpy(raw + 263, "00", 2);
    std::memset(raw + 148, ' ', 8);
    unsigned sum = 0;
    for (auto byte : block) {
        sum += byte;
    }
    std::snprintf(raw + 148, 8, "%06o", sum);
    return block;
}

void AppendFile(stream::Bytes& tar, const std::string& name, const std::string& content) {
    auto header = HeaderBlock(name, '0', "", content.size());
    tar.insert(tar.end(), header.begin(), header.end());
    tar.insert(tar.end(), content.begin(), content.end());
    tar.resize(tar.size() + (512 - content.size() % 512) % 512, 0);
}

void AppendEnd(stream::Bytes& tar) {
    tar.resize(tar.size() + 1024, 0);
}

// A single zero-sized file entry followed by the end-of-archive marker.
stream::Bytes HandMadeArchive(const std::string& name) {
    stream::Bytes tar = HeaderBlock(name, '0');
    AppendEnd(tar);
    return tar;
}

}  // namespace

TEST_CASE("default exclusions skip caches and build output") {
    auto filter = archive::ExcludeFilter::Build({}, false);
    REQUIRE(filter.Matches("node_modules"));
    REQUIRE(filter.Matches("node_modules/lib/index.js"));
    REQUIRE(filter.Matches(".cache/fontconfig/x"));
    REQUIRE(filter.Matches("src/debug.log"));
    REQUIRE(filter.Matches(".DS_Store"));
    REQUIRE(filter.Matches("app/build.snapshot"));
    REQUIRE_FALSE(filter.Matches("src/main.cpp"));
    REQUIRE_FALSE(filter.Matches("node_modules_backup"));
    REQUIRE_FALSE(filter.Matches("docs/cache"));
}

TEST_CASE("include problematic drops the defaults but keeps user patterns") {
    auto filter = archive::ExcludeFilter::Build({"secret", "*.bak", ""}, true);
    REQUIRE(filter.patterns().size() == 2);
    REQUIRE_FALSE(filter.Matches("node_modules/x"));
    REQUIRE(filter.Matches("secret"));
    REQUIRE(filter.Matches("secret/key.pem"));
    REQUIRE_FALSE(filter.Matches("secretive"));
    REQUIRE(filter.Matches("a/b/old.bak"));
}

TEST_CASE("source root names come from the last path component") {
    REQUIRE(archive::SourceRootName("/home/user/photos") == "photos");
    REQUIRE(archive::SourceRootName("/home/user/photos/") == "photos");
    REQUIRE(archive::SourceRootName("/data/./set/..//set") == "set");
}

TEST_CASE("unsafe entry names are rejected") {
    REQUIRE(archive::IsSafePath("/out", "photos/a.jpg"));
    REQUIRE(archive::IsSafePath("/out", "./photos"));
    REQUIRE_FALSE(archive::IsSafePath("/out", "/etc/passwd"));
    REQUIRE_FALSE(archive::IsSafePath("/out", "../escape"));
    REQUIRE_FALSE(archive::IsSafePath("/out", "photos/../../escape"));
}

TEST_CASE("scan counts what the archive will hold") {
    TempDir tmp;
    MakeSampleTree(tmp / "src");
    WriteFile(tmp / "src" / "node_modules" / "pkg.js", "x");

    auto summary = archive::ScanSources({tmp / "src"}, archive::ExcludeFilter::Build({}, false));
    REQUIRE(summary.files == 5);
    REQUIRE(summary.symlinks == 1);
    REQUIRE(summary.dirs == 6);
    REQUIRE(summary.excluded == 1);
    REQUIRE(summary.bytes == 14 + 5000 + 200000 + 18);
}

TEST_CASE("tar writer and extractor round trip a tree") {
    TempDir tmp;
    MakeSampleTree(tmp / "src");
    auto before = Snapshot(tmp / "src");

    auto tar = ArchiveOf({tmp / "src"});
    REQUIRE(tar.size() % 512 == 0);

    ExtractInto(tar, tmp / "out");
    REQUIRE(ListNames(tmp / "out") == std::vector<std::string>{"src"});
    REQUIRE(Snapshot(tmp / "out" / "src") == before);
}

TEST_CASE("several sources become sibling roots") {
    TempDir tmp;
    WriteFile(tmp / "a" / "one.txt", "1");
    WriteFile(tmp / "b" / "two.txt", "2");
    WriteFile(tmp / "single.txt", "solo");

    archive::TarExtractor extractor(tmp / "out");
    auto tar = ArchiveOf({tmp / "a", tmp / "b", tmp / "single.txt"});
    extractor.Write(tar);
    extractor.Close();

    REQUIRE(extractor.roots() == std::set<std::string>{"a", "b", "single.txt"});
    REQUIRE(ReadFile(tmp / "out" / "a" / "one.txt") == "1");
    REQUIRE(ReadFile(tmp / "out" / "b" / "two.txt") == "2");
    REQUIRE(ReadFile(tmp / "out" / "single.txt") == "solo");
}

TEST_CASE("long entry names survive the archive") {
    TempDir tmp;
    fs::path deep = tmp / "src";
    for (int i = 0; i < 12; ++i) {
        deep /= std::string(30, static_cast<char>('a' + i));
    }
    WriteFile(deep / (std::string(120, 'f') + ".txt"), "deep");

    ExtractInto(ArchiveOf({tmp / "src"}), tmp / "out");
    REQUIRE(Snapshot(tmp / "out" / "src") == Snapshot(tmp / "src"));
}

TEST_CASE("excluded entries are left out of the archive") {
    TempDir tmp;
    WriteFile(tmp / "src" / "keep.txt", "keep");
    WriteFile(tmp / "src" / "skip.log", "skip");
    WriteFile(tmp / "src" / "private" / "key", "k");

    ExtractInto(ArchiveOf({tmp / "src"}, archive::ExcludeFilter::Build({"private/*"}, false)), tmp / "out");
    REQUIRE(ListNames(tmp / "out" / "src") == std::vector<std::string>{"keep.txt"});
}

TEST_CASE("malformed tar streams leave no output behind") {
    TempDir tmp;
    MakeSampleTree(tmp / "src");
    auto tar = ArchiveOf({tmp / "src"});
    const fs::path dest = tmp / "restore";

    SECTION("truncated") {
        archive::TarExtractor extractor(dest);
        extractor.Write(tar.data(), tar.size() / 2 + 100);
        REQUIRE_THROWS_AS(extractor.Close(), StageError);
        extractor.Abort();
    }
    SECTION("corrupt header") {
        tar[10] ^= 0x5A;
        archive::TarExtractor extractor(dest);
        try {
            extractor.Write(tar);
            FAIL("corrupt header accepted");
        } catch (const StageError& exc) {
            REQUIRE(exc.malformed_input());
        }
        extractor.Abort();
    }
    SECTION("path traversal") {
        archive::TarExtractor extractor(dest);
        REQUIRE_THROWS_WITH(extractor.Write(HandMadeArchive("../escape.txt")), Catch::Contains("unsafe"));
        extractor.Abort();
        REQUIRE_FALSE(fs::exists(tmp / "escape.txt"));
    }
    REQUIRE_FALSE(fs::exists(dest));
}

TEST_CASE("extraction into an existing directory keeps other content") {
    TempDir tmp;
    WriteFile(tmp / "src" / "file.txt", "new");
    WriteFile(tmp / "out" / "unrelated.txt", "mine");
    WriteFile(tmp / "out" / "src" / "file.txt", "old");

    ExtractInto(ArchiveOf({tmp / "src"}), tmp / "out");
    REQUIRE(ReadFile(tmp / "out" / "unrelated.txt") == "mine");
    REQUIRE(ReadFile(tmp / "out" / "src" / "file.txt") == "new");
    REQUIRE(ListNames(tmp / "out") == std::vector<std::string>{"src", "unrelated.txt"});
}

TEST_CASE("a stream without the end-of-archive marker is truncated") {
    TempDir tmp;
    stream::Bytes tar = HandMadeArchive("alone.txt");
    tar.resize(512);

    archive::TarExtractor extractor(tmp / "restore");
    extractor.Write(tar);
    try {
        extractor.Close();
        FAIL("archive without an end marker accepted");
    } catch (const StageError& exc) {
        REQUIRE(exc.malformed_input());
    }
    extractor.Abort();
    REQUIRE_FALSE(fs::exists(tmp / "restore"));
}

TEST_CASE("entries cannot escape through a symlink from the same archive") {
    TempDir tmp;
    WriteFile(tmp / "outside" / "secret", "keep out");
    const fs::path dest = tmp / "restore";

    // Staging sits directly below `dest`, so this resolves to tmp/outside.
    stream::Bytes tar = HeaderBlock("root/link", '2', "../../../outside");
    SECTION("file below the link") {
        AppendFile(tar, "root/link/evil.txt", "evil");
    }
    SECTION("directory below the link") {
        auto dir = HeaderBlock("root/link/evil", '5');
        tar.insert(tar.end(), dir.begin(), dir.end());
    }
    SECTION("hard link through the link") {
        auto hard = HeaderBlock("root/copy", '1', "root/link/secret");
        tar.insert(tar.end(), hard.begin(), hard.end());
    }
    AppendEnd(tar);

    archive::TarExtractor extractor(dest);
    try {
        extractor.Write(tar);
        extractor.Close();
        FAIL("entry written through a symlink");
    } catch (const StageError& exc) {
        REQUIRE(exc.malformed_input());
        REQUIRE(std::string(exc.what()).find("symlink") != std::string::npos);
    }
    extractor.Abort();

    REQUIRE(ListNames(tmp / "outside") == std::vector<std::string>{"secret"});
    REQUIRE_FALSE(fs::exists(dest));
}
