#include "archivedir/compress.hpp"

#include "archivedir/constants.hpp"
#include "archivedir/errors.hpp"
#include "archivedir/log.hpp"

#include <algorithm>
#include <cctype>
#include <climits>
#include <stdexcept>
#include <utility>

#if ARCHIVEDIR_HAS_LZMA
#include <lzma.h>
#endif

namespace archivedir::compress {

namespace {

constexpr int kGzipWindowBits = 15 + 16;  // zlib: 16 selects the gzip wrapper
constexpr int kMemLevel = 8;
constexpr std::size_t kOutBufSize = 1u << 16;

std::string ZlibMessage(const z_stream& strm, int code) {
    if (strm.msg) {
        return strm.msg;
    }
    return "zlib error " + std::to_string(code);
}

bool EndsWith(std::string_view value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

std::string Lower(std::string_view value) {
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return out;
}

}  // namespace

const char* ModeName(Mode mode) {
    switch (mode) {
        case Mode::None: return "none";
        case Mode::Gzip: return "gzip";
        case Mode::Xz: return "xz";
    }
    return "unknown";
}

Mode ParseMode(std::string_view name) {
    std::string lower = Lower(name);
    if (lower == "gzip" || lower == "gz") {
        return Mode::Gzip;
    }
    if (lower == "xz" || lower == "lzma") {
        return Mode::Xz;
    }
    if (lower == "none" || lower == "off") {
        return Mode::None;
    }
    throw ConfigError("unknown compression mode '" + std::string(name) + "' (expected gzip, xz or none)");
}

std::string ArchiveExtension(Mode mode) {
    std::string ext(constants::kTarExt);
    if (mode == Mode::Gzip) {
        ext += constants::kGzipExt;
    } else if (mode == Mode::Xz) {
        ext += constants::kXzExt;
    }
    return ext;
}

std::optional<Mode> ModeFromArchiveName(std::string_view name) {
    std::string lower = Lower(name);
    if (EndsWith(lower, ".tar.gz") || EndsWith(lower, ".tgz")) {
        return Mode::Gzip;
    }
    if (EndsWith(lower, ".tar.xz") || EndsWith(lower, ".txz")) {
        return Mode::Xz;
    }
    if (EndsWith(lower, ".tar")) {
        return Mode::None;
    }
    return std::nullopt;
}

bool XzAvailable() {
#if ARCHIVEDIR_HAS_LZMA
    return true;
#else
    return false;
#endif
}

// ---------------------------------------------------------------------------
// gzip

GzipCompressor::GzipCompressor(int level) : out_buf_(kOutBufSize) {
    int ret = deflateInit2(&strm_, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw StageError(Name(), "failed to initialize gzip encoder: " + ZlibMessage(strm_, ret));
    }
}

GzipCompressor::~GzipCompressor() {
    deflateEnd(&strm_);
}

void GzipCompressor::Pump(int flush, stream::ChunkSink& out) {
    for (;;) {
        strm_.next_out = out_buf_.data();
        strm_.avail_out = static_cast<uInt>(out_buf_.size());
        int ret = deflate(&strm_, flush);
        if (ret == Z_STREAM_ERROR) {
            throw StageError(Name(), "gzip compression failed: " + ZlibMessage(strm_, ret));
        }
        std::size_t produced = out_buf_.size() - strm_.avail_out;
        if (produced > 0) {
            out.Write(out_buf_.data(), produced);
        }
        if (flush == Z_FINISH) {
            if (ret == Z_STREAM_END) {
                return;
            }
        } else if (strm_.avail_out != 0) {
            return;
        }
    }
}

void GzipCompressor::Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) {
    while (len > 0) {
        uInt slice = static_cast<uInt>(std::min<std::size_t>(len, UINT_MAX));
        strm_.next_in = const_cast<Bytef*>(data);
        strm_.avail_in = slice;
        Pump(Z_NO_FLUSH, out);
        data += slice;
        len -= slice;
    }
}

void GzipCompressor::Finish(stream::ChunkSink& out) {
    strm_.next_in = nullptr;
    strm_.avail_in = 0;
    Pump(Z_FINISH, out);
}

stream::Bytes GzipMember(const std::uint8_t* data, std::size_t len, int level) {
    z_stream strm{};
    int ret = deflateInit2(&strm, level, Z_DEFLATED, kGzipWindowBits, kMemLevel, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw StageError("compress", "failed to initialize gzip encoder: " + ZlibMessage(strm, ret));
    }
    stream::Bytes out(deflateBound(&strm, static_cast<uLong>(len)));
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(len);
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    ret = deflate(&strm, Z_FINISH);
    std::size_t produced = out.size() - strm.avail_out;
    deflateEnd(&strm);
    if (ret != Z_STREAM_END) {
        throw StageError("compress", "gzip member compression failed (zlib error " + std::to_string(ret) + ")");
    }
    out.resize(produced);
    return out;
}

ParallelGzipCompressor::ParallelGzipCompressor(int level, std::size_t threads, std::size_t member_size)
    : level_(level),
      member_size_(member_size == 0 ? constants::kGzipMemberSize : member_size),
      max_inflight_(std::max<std::size_t>(threads, 1) * 2),
      pool_(std::max<std::size_t>(threads, 1)) {
    if (level < 0 || level > 9) {
        throw StageError(Name(), "gzip level must be 0..9");
    }
    pending_.reserve(member_size_);
}

void ParallelGzipCompressor::Submit(stream::ChunkSink& out) {
    if (inflight_.size() >= max_inflight_) {
        DrainOne(out);
    }
    int level = level_;
    inflight_.push_back(pool_.Enqueue([member = std::move(pending_), level]() {
        return GzipMember(member.data(), member.size(), level);
    }));
    pending_ = stream::Bytes();
    pending_.reserve(member_size_);
}

void ParallelGzipCompressor::DrainOne(stream::ChunkSink& out) {
    stream::Bytes member = inflight_.front().get();
    inflight_.pop_front();
    out.Write(member);
    emitted_any_ = true;
}

void ParallelGzipCompressor::Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) {
    while (len > 0) {
        std::size_t take = std::min(len, member_size_ - pending_.size());
        pending_.insert(pending_.end(), data, data + take);
        data += take;
        len -= take;
        if (pending_.size() == member_size_) {
            Submit(out);
        }
    }
}

void ParallelGzipCompressor::Finish(stream::ChunkSink& out) {
    // An empty input still needs one member to be a valid gzip stream.
    if (!pending_.empty() || (inflight_.empty() && !emitted_any_)) {
        Submit(out);
    }
    while (!inflight_.empty()) {
        DrainOne(out);
    }
}

GzipDecompressor::GzipDecompressor() : out_buf_(kOutBufSize) {
    int ret = inflateInit2(&strm_, kGzipWindowBits);
    if (ret != Z_OK) {
        throw StageError(Name(), "failed to initialize gzip decoder: " + ZlibMessage(strm_, ret));
    }
}

GzipDecompressor::~GzipDecompressor() {
    inflateEnd(&strm_);
}

void GzipDecompressor::Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) {
    while (len > 0) {
        uInt slice = static_cast<uInt>(std::min<std::size_t>(len, UINT_MAX));
        seen_input_ = true;
        strm_.next_in = const_cast<Bytef*>(data);
        strm_.avail_in = slice;
        for (;;) {
            if (member_done_) {
                if (strm_.avail_in == 0) {
                    break;
                }
                // next member of a concatenated stream
                inflateReset(&strm_);
                member_done_ = false;
            }
            strm_.next_out = out_buf_.data();
            strm_.avail_out = static_cast<uInt>(out_buf_.size());
            int ret = inflate(&strm_, Z_NO_FLUSH);
            if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_STREAM_ERROR) {
                throw StageError(Name(), "gzip data is corrupt: " + ZlibMessage(strm_, ret), true);
            }
            if (ret == Z_MEM_ERROR) {
                throw StageError(Name(), "out of memory while inflating");
            }
            std::size_t produced = out_buf_.size() - strm_.avail_out;
            if (produced > 0) {
                out.Write(out_buf_.data(), produced);
            }
            if (ret == Z_STREAM_END) {
                member_done_ = true;
                continue;
            }
            if (ret == Z_BUF_ERROR) {
                break;
            }
            if (strm_.avail_in == 0 && strm_.avail_out != 0) {
                break;
            }
        }
        data += slice;
        len -= slice;
    }
}

void GzipDecompressor::Finish(stream::ChunkSink&) {
    if (!seen_input_) {
        throw StageError(Name(), "gzip stream is empty", true);
    }
    if (!member_done_) {
        throw StageError(Name(), "gzip stream is truncated", true);
    }
}

// ---------------------------------------------------------------------------
// xz

#if ARCHIVEDIR_HAS_LZMA
namespace {

class XzTransform : public stream::StreamTransform {
public:
    explicit XzTransform(bool encode, int level) : encode_(encode), out_buf_(kOutBufSize) {
        lzma_ret ret = encode ? lzma_easy_encoder(&strm_, static_cast<std::uint32_t>(std::clamp(level, 0, 9)),
                                                  LZMA_CHECK_CRC64)
                              : lzma_stream_decoder(&strm_, UINT64_MAX, LZMA_CONCATENATED);
        if (ret != LZMA_OK) {
            throw StageError(Name(), encode ? "failed to initialize xz encoder" : "failed to initialize xz decoder");
        }
    }

    ~XzTransform() override { lzma_end(&strm_); }

    std::string Name() const override { return encode_ ? "compress" : "decompress"; }

    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) override {
        if (len > 0) {
            seen_input_ = true;
        }
        strm_.next_in = data;
        strm_.avail_in = len;
        while (strm_.avail_in > 0) {
            if (Code(LZMA_RUN, out)) {
                if (strm_.avail_in > 0) {
                    throw StageError(Name(), "trailing data after xz stream", true);
                }
                break;
            }
        }
    }

    void Finish(stream::ChunkSink& out) override {
        if (!encode_ && !seen_input_) {
            throw StageError(Name(), "xz stream is empty", true);
        }
        strm_.next_in = nullptr;
        strm_.avail_in = 0;
        while (!Code(LZMA_FINISH, out)) {
        }
    }

private:
    // Returns true once the stream end was reached.
    bool Code(lzma_action action, stream::ChunkSink& out) {
        strm_.next_out = out_buf_.data();
        strm_.avail_out = out_buf_.size();
        lzma_ret ret = lzma_code(&strm_, action);
        std::size_t produced = out_buf_.size() - strm_.avail_out;
        if (produced > 0) {
            out.Write(out_buf_.data(), produced);
        }
        if (ret == LZMA_STREAM_END) {
            return true;
        }
        if (ret == LZMA_OK) {
            return false;
        }
        if (encode_) {
            throw StageError(Name(), "xz compression failed (lzma error " + std::to_string(ret) + ")");
        }
        if (ret == LZMA_MEM_ERROR || ret == LZMA_MEMLIMIT_ERROR) {
            throw StageError(Name(), "out of memory while decoding xz");
        }
        if (ret == LZMA_BUF_ERROR) {
            throw StageError(Name(), "xz stream is truncated", true);
        }
        throw StageError(Name(), "xz data is corrupt (lzma error " + std::to_string(ret) + ")", true);
    }

    bool encode_;
    bool seen_input_ = false;
    lzma_stream strm_ = LZMA_STREAM_INIT;
    stream::Bytes out_buf_;
};

}  // namespace
#endif

std::unique_ptr<stream::StreamTransform> MakeCompressor(Mode mode, int level, std::size_t threads,
                                                        std::size_t member_size) {
    switch (mode) {
        case Mode::None:
            return nullptr;
        case Mode::Gzip:
            if (threads > 1) {
                log::Debug("compress: gzip with " + std::to_string(threads) + " workers");
                return std::make_unique<ParallelGzipCompressor>(level, threads, member_size);
            }
            return std::make_unique<GzipCompressor>(level);
        case Mode::Xz:
#if ARCHIVEDIR_HAS_LZMA
            return std::make_unique<XzTransform>(true, level);
#else
            throw StageError("compress", "XZ support unavailable (liblzma missing)");
#endif
    }
    throw std::invalid_argument("unknown compression mode");
}

std::unique_ptr<stream::StreamTransform> MakeDecompressor(Mode mode) {
    switch (mode) {
        case Mode::None:
            return nullptr;
        case Mode::Gzip:
            return std::make_unique<GzipDecompressor>();
        case Mode::Xz:
#if ARCHIVEDIR_HAS_LZMA
            return std::make_unique<XzTransform>(false, 0);
#else
            throw StageError("decompress", "XZ support unavailable (liblzma missing)");
#endif
    }
    throw std::invalid_argument("unknown compression mode");
}

}  // namespace archivedir::compress
