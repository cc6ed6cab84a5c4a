#pragma once

#include "archivedir/stream.hpp"
#include "archivedir/thread_pool.hpp"

#include <zlib.h>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace archivedir::compress {

enum class Mode {
    None,
    Gzip,
    Xz
};

const char* ModeName(Mode mode);
// "gzip", "gz", "xz", "none" (case-insensitive). Throws ConfigError otherwise.
Mode ParseMode(std::string_view name);

// ".tar.gz", ".tar.xz" or ".tar".
std::string ArchiveExtension(Mode mode);
// Inverse of ArchiveExtension, also accepting ".tgz"/".txz".
std::optional<Mode> ModeFromArchiveName(std::string_view name);

bool XzAvailable();

// Single deflate stream wrapped in a gzip header.
class GzipCompressor : public stream::StreamTransform {
public:
    explicit GzipCompressor(int level);
    ~GzipCompressor() override;

    std::string Name() const override { return "compress"; }
    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) override;
    void Finish(stream::ChunkSink& out) override;

private:
    void Pump(int flush, stream::ChunkSink& out);

    z_stream strm_{};
    stream::Bytes out_buf_;
};

// Cuts the input into member_size blocks and deflates each as an independent
// gzip member on a worker pool. Members are emitted in input order, so the
// output is a valid multi-member gzip stream. At most threads*2 members are
// in flight.
class ParallelGzipCompressor : public stream::StreamTransform {
public:
    ParallelGzipCompressor(int level, std::size_t threads, std::size_t member_size);

    std::string Name() const override { return "compress"; }
    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) override;
    void Finish(stream::ChunkSink& out) override;

private:
    void Submit(stream::ChunkSink& out);
    void DrainOne(stream::ChunkSink& out);

    int level_;
    std::size_t member_size_;
    std::size_t max_inflight_;
    stream::Bytes pending_;
    bool emitted_any_ = false;
    std::deque<std::future<stream::Bytes>> inflight_;
    ThreadPool pool_;
};

// Accepts concatenated gzip members.
class GzipDecompressor : public stream::StreamTransform {
public:
    GzipDecompressor();
    ~GzipDecompressor() override;

    std::string Name() const override { return "decompress"; }
    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) override;
    void Finish(stream::ChunkSink& out) override;

private:
    z_stream strm_{};
    stream::Bytes out_buf_;
    bool seen_input_ = false;
    bool member_done_ = false;
};

// Deflates one buffer as a complete gzip member.
stream::Bytes GzipMember(const std::uint8_t* data, std::size_t len, int level);

// Mode::None yields nullptr (no stage). Mode::Xz throws StageError when
// liblzma was not compiled in.
std::unique_ptr<stream::StreamTransform> MakeCompressor(Mode mode, int level, std::size_t threads,
                                                        std::size_t member_size);
std::unique_ptr<stream::StreamTransform> MakeDecompressor(Mode mode);

}  // namespace archivedir::compress
