#pragma once

#include "archivedir/stream.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>

namespace archivedir::stream {

// Bounded single-producer/single-consumer byte buffer between two stages.
// Write() blocks while the buffer holds `capacity` bytes; Read() blocks while
// it is empty. Abort() wakes both sides, which then throw Cancelled.
class BytePipe : public ChunkSink {
public:
    BytePipe(std::string name, std::size_t capacity);

    BytePipe(const BytePipe&) = delete;
    BytePipe& operator=(const BytePipe&) = delete;

    void Write(const std::uint8_t* data, std::size_t len) override;
    using ChunkSink::Write;

    // Copies up to `max` bytes into `out`. Returns 0 only at end of stream.
    std::size_t Read(std::uint8_t* out, std::size_t max);

    // Marks end of stream; pending bytes stay readable.
    void Close();
    void Abort() noexcept;

    const std::string& name() const noexcept { return name_; }
    std::uint64_t bytes_written() const;
    std::uint64_t bytes_read() const;

private:
    std::string name_;
    std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
    std::deque<Bytes> chunks_;
    std::size_t front_offset_ = 0;
    std::size_t buffered_ = 0;
    bool closed_ = false;
    bool aborted_ = false;
    std::uint64_t bytes_written_ = 0;
    std::uint64_t bytes_read_ = 0;
};

}  // namespace archivedir::stream
