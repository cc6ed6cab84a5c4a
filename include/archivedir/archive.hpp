#pragma once

#include "archivedir/file_stream.hpp"
#include "archivedir/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace archivedir::archive {

// System, trash, cache and build-artifact patterns skipped unless the caller
// asks for problematic files too.
const std::vector<std::string>& DefaultExclusions();

// Pattern forms, matched against the path relative to the source root:
//   "dir/*"   the directory itself and everything below it
//   "*.log"   glob against the basename or the whole relative path
//   "a/b"     exact relative path, or anything below it
class ExcludeFilter {
public:
    ExcludeFilter() = default;
    explicit ExcludeFilter(std::vector<std::string> patterns);

    // Defaults (unless include_problematic) followed by `extra`.
    static ExcludeFilter Build(const std::vector<std::string>& extra, bool include_problematic);

    bool Matches(const std::string& rel_path) const;
    const std::vector<std::string>& patterns() const noexcept { return patterns_; }

private:
    std::vector<std::string> patterns_;
};

struct ScanSummary {
    std::uint64_t files = 0;
    std::uint64_t dirs = 0;
    std::uint64_t symlinks = 0;
    std::uint64_t excluded = 0;
    std::uint64_t bytes = 0;  // regular file content only
};

// Walks the sources the way TarWriter will, without reading file contents.
ScanSummary ScanSources(const std::vector<std::filesystem::path>& sources, const ExcludeFilter& filter);

// Entry name used for a source's root ("photos" for "/home/u/photos/").
std::string SourceRootName(const std::filesystem::path& source);

// Streams a ustar archive of `sources`. Each source becomes a top-level entry
// named after its base name. Symlinks are stored as links; names beyond the
// ustar limits get GNU long-name records.
class TarWriter : public stream::StreamSource {
public:
    TarWriter(std::vector<std::filesystem::path> sources, ExcludeFilter filter,
              std::size_t chunk_size = filestream::kDefaultChunkSize);

    std::string Name() const override { return "archive"; }
    void Produce(stream::ChunkSink& out, const stream::CancelToken& cancel) override;

    // Valid after Produce() returns.
    const ScanSummary& written() const noexcept { return written_; }

private:
    std::vector<std::filesystem::path> sources_;
    ExcludeFilter filter_;
    std::size_t chunk_size_;
    ScanSummary written_;
};

// Terminal stage of an extraction: parses the tar stream and recreates the
// tree under a hidden staging directory inside `dest_dir`. Close() moves the
// extracted entries into place; Abort() removes the staging directory, so a
// failed run leaves nothing behind.
class TarExtractor : public stream::TerminalSink {
public:
    explicit TarExtractor(std::filesystem::path dest_dir);
    ~TarExtractor() override;

    TarExtractor(const TarExtractor&) = delete;
    TarExtractor& operator=(const TarExtractor&) = delete;

    std::string Name() const override { return "extract"; }
    void Write(const std::uint8_t* data, std::size_t len) override;
    using ChunkSink::Write;
    void Close() override;
    void Abort() noexcept override;

    const std::set<std::string>& roots() const noexcept { return roots_; }
    const ScanSummary& extracted() const noexcept { return extracted_; }

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    std::set<std::string> roots_;
    ScanSummary extracted_;
};

// Rejects absolute names and any ".." component.
bool IsSafePath(const std::filesystem::path& dest_dir, const std::string& name);

}  // namespace archivedir::archive
