#pragma once

#include "archivedir/stream.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace archivedir::pipeline {

struct StageStats {
    std::string name;
    std::uint64_t bytes_in = 0;
    std::uint64_t bytes_out = 0;
};

struct RunStats {
    std::vector<StageStats> stages;
    std::uint64_t bytes_delivered = 0;  // bytes handed to the terminal sink
    std::chrono::milliseconds elapsed{0};
};

struct Options {
    std::size_t pipe_capacity = 4u << 20;
    std::size_t chunk_size = 1u << 16;
};

// source -> transforms[0] -> ... -> transforms[n-1] -> terminal
//
// Every stage runs on its own thread, linked by bounded BytePipes, and the
// terminal sink is fed by one more thread. The first failure cancels the
// run: pipes are aborted, all threads joined, terminal.Abort() is called and
// the failure is rethrown. Errors that are not archivedir::Error are wrapped
// in a StageError naming the stage they came from.
class Pipeline {
public:
    Pipeline(std::unique_ptr<stream::StreamSource> source,
             std::vector<std::unique_ptr<stream::StreamTransform>> transforms,
             stream::TerminalSink& terminal,
             Options options = {});

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    // Blocks until the run completes. Setting `cancel` from another thread
    // stops the run with archivedir::Cancelled.
    RunStats Run(stream::CancelToken& cancel);

    std::vector<std::string> StageNames() const;

private:
    std::unique_ptr<stream::StreamSource> source_;
    std::vector<std::unique_ptr<stream::StreamTransform>> transforms_;
    stream::TerminalSink& terminal_;
    Options options_;
    bool ran_ = false;
};

}  // namespace archivedir::pipeline
