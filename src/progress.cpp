#include "archivedir/progress.hpp"

#include "archivedir/cli_colors.hpp"

#include <algorithm>
#include <iomanip>
#include <ostream>
#include <sstream>
#include <utility>

namespace archivedir::progress {

namespace {

constexpr int kBarWidth = 40;
constexpr std::chrono::seconds kPlainLineInterval{5};

}  // namespace

ProgressAggregator::ProgressAggregator(std::optional<std::uint64_t> bytes_total)
    : started_(std::chrono::steady_clock::now()) {
    state_.bytes_total = bytes_total;
}

void ProgressAggregator::SetTotal(std::uint64_t bytes_total) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!state_.done) {
        state_.bytes_total = bytes_total;
    }
}

void ProgressAggregator::Report(std::uint64_t bytes_delta, std::uint32_t part_index) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.done) {
        return;
    }
    state_.bytes_done += bytes_delta;
    state_.current_part_index = std::max(state_.current_part_index, part_index);
}

bool ProgressAggregator::Finish(bool success) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_.done) {
        return false;
    }
    state_.done = true;
    state_.success = success;
    if (success && !state_.bytes_total) {
        state_.bytes_total = state_.bytes_done;
    }
    state_.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    return true;
}

ProgressState ProgressAggregator::Snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProgressState snapshot = state_;
    if (!snapshot.done) {
        snapshot.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started_);
    }
    return snapshot;
}

ProgressReporter::ProgressReporter(const ProgressAggregator& aggregator, Renderer renderer,
                                   std::chrono::milliseconds interval)
    : aggregator_(aggregator), renderer_(std::move(renderer)), interval_(interval) {}

ProgressReporter::~ProgressReporter() {
    Stop();
}

void ProgressReporter::Start() {
    if (running_.exchange(true)) return;
    thread_ = std::thread([this] {
        std::unique_lock<std::mutex> lock(wake_mutex_);
        while (running_.load()) {
            lock.unlock();
            RenderOnce();
            lock.lock();
            wake_.wait_for(lock, interval_, [this] { return !running_.load(); });
        }
    });
}

void ProgressReporter::Stop() {
    {
        std::lock_guard<std::mutex> lock(wake_mutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    wake_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    RenderOnce();
}

void ProgressReporter::RenderOnce() {
    if (renderer_) {
        renderer_(aggregator_.Snapshot());
    }
}

ConsoleRenderer::ConsoleRenderer(std::ostream& os, std::string label)
    : os_(os), label_(std::move(label)), tty_(cli::IsTerminal(os)), last_time_(std::chrono::steady_clock::now()) {}

std::string ConsoleRenderer::BuildLine(const ProgressState& state) {
    auto now = std::chrono::steady_clock::now();
    double elapsed_s = std::chrono::duration<double>(now - last_time_).count();
    if (elapsed_s >= 0.05) {
        double instant_speed = static_cast<double>(state.bytes_done - last_bytes_) / elapsed_s;
        smooth_speed_ = last_bytes_ == 0 ? instant_speed : 0.7 * smooth_speed_ + 0.3 * instant_speed;
        last_bytes_ = state.bytes_done;
        last_time_ = now;
    }

    std::ostringstream ss;
    ss << std::fixed;
    if (state.bytes_total && *state.bytes_total > 0) {
        double pct = static_cast<double>(state.bytes_done) / static_cast<double>(*state.bytes_total) * 100.0;
        pct = std::clamp(pct, 0.0, 100.0);
        ss << BuildProgressBar(pct, kBarWidth) << " " << std::setw(5) << std::setprecision(1) << pct << "%  ";
        ss << label_ << ": " << FormatBytes(state.bytes_done) << "/" << FormatBytes(*state.bytes_total);
    } else {
        ss << label_ << ": " << FormatBytes(state.bytes_done);
    }
    ss << "  part " << state.current_part_index;
    ss << "  " << FormatBytes(static_cast<std::uint64_t>(std::max(smooth_speed_, 0.0))) << "/s";
    ss << "  " << FormatDuration(state.elapsed);
    return ss.str();
}

void ConsoleRenderer::operator()(const ProgressState& state) {
    std::string line = BuildLine(state);
    if (tty_) {
        os_ << "\r\x1b[2K" << line;
        if (state.done) {
            os_ << "  " << (state.success ? cli::Colorize("done", cli::color::GREEN, os_)
                                          : cli::Colorize("failed", cli::color::RED, os_))
                << "\n";
        }
        os_.flush();
        return;
    }
    // Non-TTY: a plain line every few seconds plus the final one.
    auto now = std::chrono::steady_clock::now();
    if (state.done || now - last_plain_line_ >= kPlainLineInterval) {
        os_ << line << (state.done ? (state.success ? "  done" : "  failed") : "") << "\n";
        os_.flush();
        last_plain_line_ = now;
    }
}

std::string FormatBytes(std::uint64_t bytes) {
    static const char* kUnits[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream ss;
    if (unit == 0) {
        ss << bytes << " B";
    } else {
        ss << std::fixed << std::setprecision(2) << value << " " << kUnits[unit];
    }
    return ss.str();
}

std::string FormatDuration(std::chrono::milliseconds elapsed) {
    auto total_s = elapsed.count() / 1000;
    std::ostringstream ss;
    ss << std::setfill('0');
    if (total_s >= 3600) {
        ss << total_s / 3600 << ":" << std::setw(2) << (total_s / 60) % 60 << ":" << std::setw(2) << total_s % 60;
    } else {
        ss << std::setw(2) << total_s / 60 << ":" << std::setw(2) << total_s % 60;
    }
    return ss.str();
}

std::string BuildProgressBar(double pct, int width) {
    if (width < 4) return "";
    int fill = static_cast<int>(pct / 100.0 * width);
    fill = std::clamp(fill, 0, width);

    std::string bar = "[";
    for (int i = 0; i < width; ++i) {
        if (i < fill)          bar += '=';
        else if (i == fill)    bar += '>';
        else                   bar += ' ';
    }
    bar += "]";
    return bar;
}

}  // namespace archivedir::progress
