#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace archivedir::stream {

using Bytes = std::vector<std::uint8_t>;

// Shared stop flag. Stages and sinks poll it between chunks and bail out with
// archivedir::Cancelled once it is set.
class CancelToken {
public:
    void Cancel() noexcept { cancelled_.store(true, std::memory_order_release); }
    bool IsCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }
    // Throws archivedir::Cancelled(component) if the token is set.
    void ThrowIfCancelled(const std::string& component) const;

private:
    std::atomic<bool> cancelled_{false};
};

// Anything that accepts bytes in order.
class ChunkSink {
public:
    virtual ~ChunkSink() = default;
    virtual void Write(const std::uint8_t* data, std::size_t len) = 0;

    void Write(const Bytes& chunk) { Write(chunk.data(), chunk.size()); }
};

// First stage of a pipeline: produces the whole stream into `out` and returns.
class StreamSource {
public:
    virtual ~StreamSource() = default;
    virtual std::string Name() const = 0;
    virtual void Produce(ChunkSink& out, const CancelToken& cancel) = 0;
};

// Middle stage: consume chunk, produce chunk(s). Update() may emit nothing for
// a given input; Finish() flushes whatever the transform still holds.
class StreamTransform {
public:
    virtual ~StreamTransform() = default;
    virtual std::string Name() const = 0;
    virtual void Update(const std::uint8_t* data, std::size_t len, ChunkSink& out) = 0;
    virtual void Finish(ChunkSink& out) = 0;
};

// Last consumer of a pipeline. Close() commits everything written so far;
// Abort() discards it and must not throw.
class TerminalSink : public ChunkSink {
public:
    virtual std::string Name() const = 0;
    virtual void Close() = 0;
    virtual void Abort() noexcept = 0;
};

// Collects a stream in memory. Used by tests and by the metadata round trip.
class BufferSink : public ChunkSink {
public:
    void Write(const std::uint8_t* data, std::size_t len) override { bytes_.insert(bytes_.end(), data, data + len); }
    using ChunkSink::Write;

    const Bytes& bytes() const noexcept { return bytes_; }
    Bytes Take() { return std::move(bytes_); }

private:
    Bytes bytes_;
};

// Feeds a fixed buffer downstream in chunk_size slices.
class BufferSource : public StreamSource {
public:
    explicit BufferSource(Bytes data, std::size_t chunk_size = 1u << 16);

    std::string Name() const override { return "buffer"; }
    void Produce(ChunkSink& out, const CancelToken& cancel) override;

private:
    Bytes data_;
    std::size_t chunk_size_;
};

// Runs a transform over a whole buffer synchronously.
Bytes ApplyTransform(StreamTransform& transform, const Bytes& input, std::size_t chunk_size = 1u << 16);

}  // namespace archivedir::stream
