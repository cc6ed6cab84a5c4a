#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iosfwd>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace archivedir::progress {

struct ProgressState {
    std::optional<std::uint64_t> bytes_total;
    std::uint64_t bytes_done = 0;
    std::uint32_t current_part_index = 0;
    bool done = false;
    bool success = false;
    std::chrono::milliseconds elapsed{0};
};

// The only state shared by every activity of a run. bytes_done never
// decreases; Finish() flips to done exactly once, and reports arriving after
// that are dropped.
class ProgressAggregator {
public:
    explicit ProgressAggregator(std::optional<std::uint64_t> bytes_total = std::nullopt);

    ProgressAggregator(const ProgressAggregator&) = delete;
    ProgressAggregator& operator=(const ProgressAggregator&) = delete;

    void SetTotal(std::uint64_t bytes_total);
    void Report(std::uint64_t bytes_delta, std::uint32_t part_index);
    // Returns false if the aggregator was already done. A successful finish
    // with an unknown total fixes the total at bytes_done.
    bool Finish(bool success);

    ProgressState Snapshot() const;

private:
    mutable std::mutex mutex_;
    ProgressState state_;
    std::chrono::steady_clock::time_point started_;
};

using Renderer = std::function<void(const ProgressState&)>;

// Samples the aggregator on a fixed interval from its own thread and hands
// each snapshot to the renderer. Stop() renders one final frame.
class ProgressReporter {
public:
    ProgressReporter(const ProgressAggregator& aggregator, Renderer renderer,
                     std::chrono::milliseconds interval);
    ~ProgressReporter();

    ProgressReporter(const ProgressReporter&) = delete;
    ProgressReporter& operator=(const ProgressReporter&) = delete;

    void Start();
    void Stop();

private:
    void RenderOnce();

    const ProgressAggregator& aggregator_;
    Renderer renderer_;
    std::chrono::milliseconds interval_;
    std::thread thread_;
    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
};

// Single-line bar redrawn in place on a terminal; periodic plain lines
// otherwise.
class ConsoleRenderer {
public:
    ConsoleRenderer(std::ostream& os, std::string label);

    void operator()(const ProgressState& state);

private:
    std::string BuildLine(const ProgressState& state);

    std::ostream& os_;
    std::string label_;
    bool tty_;
    std::uint64_t last_bytes_ = 0;
    std::chrono::steady_clock::time_point last_time_;
    double smooth_speed_ = 0.0;
    std::chrono::steady_clock::time_point last_plain_line_{};
};

std::string FormatBytes(std::uint64_t bytes);
std::string FormatDuration(std::chrono::milliseconds elapsed);
std::string BuildProgressBar(double pct, int width);

}  // namespace archivedir::progress
