#include <catch2/catch.hpp>

#include "archivedir/progress.hpp"

#include <atomic>
#include <mutex>
#include <sstream>
#include <thread>
#include <vector>

using namespace archivedir;

TEST_CASE("progress accumulates reports from several threads") {
    progress::ProgressAggregator aggregator(std::uint64_t{40000});

    std::vector<std::thread> workers;
    for (std::uint32_t t = 0; t < 4; ++t) {
        workers.emplace_back([&aggregator, t] {
            for (int i = 0; i < 1000; ++i) {
                aggregator.Report(10, t);
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    auto state = aggregator.Snapshot();
    REQUIRE(state.bytes_done == 40000);
    REQUIRE(state.current_part_index == 3);
    REQUIRE_FALSE(state.done);
}

TEST_CASE("part index never moves backwards") {
    progress::ProgressAggregator aggregator;
    aggregator.Report(1, 5);
    aggregator.Report(1, 2);
    REQUIRE(aggregator.Snapshot().current_part_index == 5);
}

TEST_CASE("finish happens exactly once") {
    progress::ProgressAggregator aggregator;
    aggregator.Report(100, 0);

    REQUIRE(aggregator.Finish(false));
    REQUIRE_FALSE(aggregator.Finish(true));

    aggregator.Report(50, 1);
    aggregator.SetTotal(999);
    auto state = aggregator.Snapshot();
    REQUIRE(state.done);
    REQUIRE_FALSE(state.success);
    REQUIRE(state.bytes_done == 100);
    REQUIRE(state.current_part_index == 0);
    REQUIRE_FALSE(state.bytes_total.has_value());
}

TEST_CASE("a successful finish fixes an unknown total") {
    progress::ProgressAggregator aggregator;
    aggregator.Report(1234, 0);
    REQUIRE(aggregator.Finish(true));
    auto state = aggregator.Snapshot();
    REQUIRE(state.bytes_total.value() == 1234);
    REQUIRE(state.success);

    auto frozen = state.elapsed;
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    REQUIRE(aggregator.Snapshot().elapsed == frozen);
}

TEST_CASE("reporter renders periodically and once more on stop") {
    progress::ProgressAggregator aggregator(std::uint64_t{10});
    std::atomic<int> frames{0};
    progress::ProgressState last;
    std::mutex last_mutex;

    progress::ProgressReporter reporter(
        aggregator,
        [&](const progress::ProgressState& state) {
            ++frames;
            std::lock_guard<std::mutex> lock(last_mutex);
            last = state;
        },
        std::chrono::milliseconds(5));
    reporter.Start();
    aggregator.Report(10, 0);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    aggregator.Finish(true);
    reporter.Stop();
    const int after_stop = frames.load();
    reporter.Stop();

    REQUIRE(after_stop >= 2);
    REQUIRE(frames.load() == after_stop);
    REQUIRE(last.done);
    REQUIRE(last.bytes_done == 10);
}

TEST_CASE("console renderer prints a final line off a terminal") {
    std::ostringstream out;
    progress::ConsoleRenderer renderer(out, "backup");
    progress::ProgressState state;
    state.bytes_total = 2048;
    state.bytes_done = 2048;
    state.current_part_index = 1;
    state.done = true;
    state.success = true;
    state.elapsed = std::chrono::milliseconds(61000);
    renderer(state);

    const std::string line = out.str();
    REQUIRE(line.find("backup: 2.00 KiB/2.00 KiB") != std::string::npos);
    REQUIRE(line.find("100.0%") != std::string::npos);
    REQUIRE(line.find("part 1") != std::string::npos);
    REQUIRE(line.find("01:01") != std::string::npos);
    REQUIRE(line.find("done") != std::string::npos);
    REQUIRE(line.find('\x1b') == std::string::npos);
}

TEST_CASE("byte counts and durations format for humans") {
    REQUIRE(progress::FormatBytes(0) == "0 B");
    REQUIRE(progress::FormatBytes(1023) == "1023 B");
    REQUIRE(progress::FormatBytes(1536) == "1.50 KiB");
    REQUIRE(progress::FormatBytes(3758096384ull) == "3.50 GiB");

    REQUIRE(progress::FormatDuration(std::chrono::milliseconds(0)) == "00:00");
    REQUIRE(progress::FormatDuration(std::chrono::milliseconds(125000)) == "02:05");
    REQUIRE(progress::FormatDuration(std::chrono::milliseconds(3725000)) == "1:02:05");
}

TEST_CASE("progress bars fill with the percentage") {
    REQUIRE(progress::BuildProgressBar(0.0, 10) == "[>         ]");
    REQUIRE(progress::BuildProgressBar(50.0, 10) == "[=====>    ]");
    REQUIRE(progress::BuildProgressBar(100.0, 10) == "[==========]");
    REQUIRE(progress::BuildProgressBar(50.0, 3).empty());
}
