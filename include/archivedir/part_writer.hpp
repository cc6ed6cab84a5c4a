#pragma once

#include "archivedir/constants.hpp"
#include "archivedir/file_stream.hpp"
#include "archivedir/progress.hpp"
#include "archivedir/sink.hpp"
#include "archivedir/stream.hpp"
#include "archivedir/thread_pool.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace archivedir::parts {

// "<base>.part_000"; indices past 999 simply widen.
std::string PartName(std::string_view base, std::uint32_t index);

struct PartRecord {
    std::uint32_t index = 0;
    std::string name;
    std::uint64_t size = 0;
};

// Terminal stage of a backup. Cuts the stream into parts of exactly
// part_size bytes (the last one may be shorter, never empty), stages each in
// the sink's staging directory and hands closed parts to the sink on a small
// worker pool. Parts are submitted in index order and part N+1 is only
// opened after part N is closed.
class PartWriter : public stream::TerminalSink {
public:
    struct Options {
        std::uint64_t part_size = constants::kDefaultSplitSize;
        std::size_t max_inflight = constants::kDefaultMaxInflightUploads;
    };

    PartWriter(std::string base, sink::DestinationSink& sink, progress::ProgressAggregator* progress,
               Options options);
    ~PartWriter() override;

    PartWriter(const PartWriter&) = delete;
    PartWriter& operator=(const PartWriter&) = delete;

    std::string Name() const override { return "part-writer"; }
    void Write(const std::uint8_t* data, std::size_t len) override;
    using ChunkSink::Write;
    // Closes the open part and waits for every store to commit.
    void Close() override;
    // Cancels stores in flight, deletes staged files and asks the sink to
    // discard parts that were already committed.
    void Abort() noexcept override;

    // Committed parts in index order. Complete after Close().
    const std::vector<PartRecord>& parts() const noexcept { return committed_; }
    std::uint64_t bytes_written() const noexcept { return bytes_written_; }

private:
    struct Pending {
        sink::PartFile part;
        std::future<void> done;
    };

    void OpenPart();
    void ClosePart();
    void Submit(sink::PartFile part);
    void CollectFinished(bool wait_for_slot);
    void Collect(Pending& pending);

    std::string base_;
    sink::DestinationSink& sink_;
    progress::ProgressAggregator* progress_;
    Options options_;

    std::unique_ptr<filestream::FileWriter> current_;
    sink::PartFile current_part_;
    std::uint32_t next_index_ = 0;
    std::uint64_t bytes_written_ = 0;

    stream::CancelToken store_cancel_;
    std::deque<Pending> inflight_;
    std::vector<PartRecord> committed_;
    bool closed_ = false;
    bool aborted_ = false;
    ThreadPool pool_;
};

}  // namespace archivedir::parts
