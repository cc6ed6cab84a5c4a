#include "archivedir/part_writer.hpp"

#include "archivedir/errors.hpp"
#include "archivedir/log.hpp"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace archivedir::parts {

namespace fs = std::filesystem;

namespace {

void RemoveStaged(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        log::Warn("part-writer: could not remove " + path.string() + ": " + ec.message());
    }
}

}  // namespace

std::string PartName(std::string_view base, std::uint32_t index) {
    char suffix[16];
    std::snprintf(suffix, sizeof(suffix), "%0*u", constants::kPartIndexWidth, static_cast<unsigned>(index));
    std::string name(base);
    name += constants::kPartMarker;
    name += suffix;
    return name;
}

PartWriter::PartWriter(std::string base, sink::DestinationSink& sink, progress::ProgressAggregator* progress,
                       Options options)
    : base_(std::move(base)),
      sink_(sink),
      progress_(progress),
      options_(options),
      pool_(std::max<std::size_t>(options.max_inflight, 1)) {
    if (options_.part_size == 0) {
        throw ConfigError("part size must be positive");
    }
    if (options_.max_inflight == 0) {
        options_.max_inflight = 1;
    }
    if (base_.empty()) {
        throw ConfigError("archive base name is empty");
    }
}

PartWriter::~PartWriter() {
    if (!closed_ && !aborted_) {
        Abort();
    }
}

void PartWriter::Write(const std::uint8_t* data, std::size_t len) {
    if (closed_ || aborted_) {
        throw std::logic_error("part writer is no longer open");
    }
    CollectFinished(false);
    while (len > 0) {
        if (!current_) {
            OpenPart();
        }
        const std::uint64_t room = options_.part_size - current_part_.size;
        const std::size_t n = static_cast<std::size_t>(std::min<std::uint64_t>(len, room));
        try {
            current_->Write(data, n);
        } catch (const std::runtime_error& exc) {
            throw PartIOError(Name(), exc.what());
        }
        current_part_.size += n;
        bytes_written_ += n;
        data += n;
        len -= n;
        if (progress_) {
            progress_->Report(n, current_part_.index);
        }
        if (current_part_.size == options_.part_size) {
            ClosePart();
        }
    }
}

void PartWriter::Close() {
    if (closed_) {
        return;
    }
    if (aborted_) {
        throw std::logic_error("part writer was aborted");
    }
    if (current_) {
        ClosePart();
    }
    while (!inflight_.empty()) {
        Pending pending = std::move(inflight_.front());
        inflight_.pop_front();
        Collect(pending);
    }
    closed_ = true;
    log::Info("part-writer: " + std::to_string(committed_.size()) + " part(s), " +
              progress::FormatBytes(bytes_written_) + " committed to " + sink_.Describe());
}

void PartWriter::Abort() noexcept {
    if (aborted_) {
        return;
    }
    aborted_ = true;
    store_cancel_.Cancel();

    if (current_) {
        current_.reset();
        RemoveStaged(current_part_.staged_path);
    }
    while (!inflight_.empty()) {
        Pending pending = std::move(inflight_.front());
        inflight_.pop_front();
        try {
            pending.done.get();
            committed_.push_back({pending.part.index, pending.part.name, pending.part.size});
        } catch (const std::exception& exc) {
            log::Debug("part-writer: store of " + pending.part.name + " stopped: " + exc.what());
        }
        std::error_code ec;
        if (fs::exists(pending.part.staged_path, ec)) {
            RemoveStaged(pending.part.staged_path);
        }
    }

    if (!committed_.empty()) {
        std::vector<std::string> names;
        names.reserve(committed_.size());
        for (const auto& record : committed_) {
            names.push_back(record.name);
        }
        log::Warn("part-writer: removing " + std::to_string(names.size()) + " part(s) of the failed run from " +
                  sink_.Describe());
        sink_.Discard(names);
        committed_.clear();
    }
}

void PartWriter::OpenPart() {
    current_part_ = sink::PartFile{};
    current_part_.index = next_index_++;
    current_part_.name = PartName(base_, current_part_.index);
    current_part_.staged_path = sink_.StagingDir() / (current_part_.name + std::string(constants::kStagingSuffix));
    try {
        current_ = std::make_unique<filestream::FileWriter>(current_part_.staged_path);
    } catch (const std::runtime_error& exc) {
        throw PartIOError(Name(), exc.what());
    }
    log::Debug("part-writer: opened " + current_part_.name);
}

void PartWriter::ClosePart() {
    try {
        current_->Close();
    } catch (const std::runtime_error& exc) {
        current_.reset();
        RemoveStaged(current_part_.staged_path);
        throw PartIOError(Name(), exc.what());
    }
    current_.reset();
    log::Debug("part-writer: closed " + current_part_.name + " (" + std::to_string(current_part_.size) + " bytes)");
    Submit(std::move(current_part_));
}

void PartWriter::Submit(sink::PartFile part) {
    try {
        CollectFinished(true);
    } catch (...) {
        RemoveStaged(part.staged_path);
        throw;
    }
    Pending pending;
    pending.part = part;
    pending.done = pool_.Enqueue([this, part = std::move(part)] { sink_.Store(part, store_cancel_); });
    inflight_.push_back(std::move(pending));
}

// Collects stores that already finished, in submission order, so an early
// sink failure stops the run without waiting for the stream to end. With
// wait_for_slot it also blocks until fewer than max_inflight remain.
void PartWriter::CollectFinished(bool wait_for_slot) {
    while (!inflight_.empty()) {
        const bool must_wait = wait_for_slot && inflight_.size() >= options_.max_inflight;
        if (!must_wait && inflight_.front().done.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            break;
        }
        Pending pending = std::move(inflight_.front());
        inflight_.pop_front();
        Collect(pending);
    }
}

void PartWriter::Collect(Pending& pending) {
    try {
        pending.done.get();
    } catch (...) {
        std::error_code ec;
        fs::remove(pending.part.staged_path, ec);
        throw;
    }
    committed_.push_back({pending.part.index, pending.part.name, pending.part.size});
    log::Info("part-writer: committed " + pending.part.name + " (" + progress::FormatBytes(pending.part.size) + ")");
}

}  // namespace archivedir::parts
