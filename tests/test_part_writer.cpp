#include <catch2/catch.hpp>

#include "archivedir/errors.hpp"
#include "archivedir/part_writer.hpp"
#include "fake_object_store.hpp"
#include "test_support.hpp"

#include <atomic>
#include <limits>
#include <mutex>
#include <thread>

using namespace archivedir;
using namespace archivedir::testing;

namespace {

// LocalSink that can fail or slow down selected stores and records what was
// discarded.
class InstrumentedSink : public sink::LocalSink {
public:
    explicit InstrumentedSink(fs::path dir) : LocalSink(std::move(dir)) {}

    void Store(const sink::PartFile& part, const stream::CancelToken& cancel) override {
        int now = ++active_;
        int seen = max_active_.load();
        while (now > seen && !max_active_.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(delay);
        --active_;
        if (part.index == fail_index) {
            throw PartIOError("instrumented", "disk full writing " + part.name);
        }
        LocalSink::Store(part, cancel);
    }

    void Discard(const std::vector<std::string>& names) noexcept override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            discarded_.insert(discarded_.end(), names.begin(), names.end());
        }
        LocalSink::Discard(names);
    }

    std::vector<std::string> discarded() {
        std::lock_guard<std::mutex> lock(mutex_);
        return discarded_;
    }
    int max_active() const { return max_active_.load(); }

    std::chrono::milliseconds delay{0};
    std::uint32_t fail_index = std::numeric_limits<std::uint32_t>::max();

private:
    std::atomic<int> active_{0};
    std::atomic<int> max_active_{0};
    std::mutex mutex_;
    std::vector<std::string> discarded_;
};

parts::PartWriter::Options Sized(std::uint64_t part_size, std::size_t inflight = 2) {
    parts::PartWriter::Options options;
    options.part_size = part_size;
    options.max_inflight = inflight;
    return options;
}

void WriteInSlices(parts::PartWriter& writer, const std::string& data, std::size_t slice) {
    for (std::size_t offset = 0; offset < data.size(); offset += slice) {
        const std::size_t n = std::min(slice, data.size() - offset);
        writer.Write(reinterpret_cast<const std::uint8_t*>(data.data() + offset), n);
    }
}

std::string Concatenate(const fs::path& dir, const std::vector<parts::PartRecord>& records) {
    std::string all;
    for (const auto& record : records) {
        all += ReadFile(dir / record.name);
    }
    return all;
}

}  // namespace

TEST_CASE("part names are zero padded to three digits") {
    REQUIRE(parts::PartName("backup.tar.gz", 0) == "backup.tar.gz.part_000");
    REQUIRE(parts::PartName("backup.tar.gz", 42) == "backup.tar.gz.part_042");
    REQUIRE(parts::PartName("x", 1000) == "x.part_1000");
}

TEST_CASE("parts never exceed the part size") {
    TempDir tmp;
    sink::LocalSink local(tmp / "out");
    progress::ProgressAggregator progress;
    const std::string data = RandomText(2500, 3);

    parts::PartWriter writer("data.tar", local, &progress, Sized(1000));
    WriteInSlices(writer, data, 333);
    writer.Close();

    REQUIRE(writer.parts().size() == 3);
    REQUIRE(writer.parts()[0].size == 1000);
    REQUIRE(writer.parts()[1].size == 1000);
    REQUIRE(writer.parts()[2].size == 500);
    REQUIRE(writer.bytes_written() == 2500);
    REQUIRE(ListNames(tmp / "out") ==
            std::vector<std::string>{"data.tar.part_000", "data.tar.part_001", "data.tar.part_002"});
    REQUIRE(Concatenate(tmp / "out", writer.parts()) == data);

    auto state = progress.Snapshot();
    REQUIRE(state.bytes_done == 2500);
    REQUIRE(state.current_part_index == 2);
}

TEST_CASE("an exact multiple of the part size leaves no empty part") {
    TempDir tmp;
    sink::LocalSink local(tmp / "out");
    const std::string data = RandomText(3000, 9);

    parts::PartWriter writer("even", local, nullptr, Sized(1000));
    WriteInSlices(writer, data, 4096);
    writer.Close();

    REQUIRE(writer.parts().size() == 3);
    REQUIRE(writer.parts().back().size == 1000);
    REQUIRE(ListNames(tmp / "out").size() == 3);
    REQUIRE(Concatenate(tmp / "out", writer.parts()) == data);
}

TEST_CASE("an empty stream produces no parts") {
    TempDir tmp;
    sink::LocalSink local(tmp / "out");
    parts::PartWriter writer("nothing", local, nullptr, Sized(1000));
    writer.Close();
    REQUIRE(writer.parts().empty());
    REQUIRE(ListNames(tmp / "out").empty());
}

TEST_CASE("stores in flight are bounded") {
    TempDir tmp;
    InstrumentedSink slow(tmp / "out");
    slow.delay = std::chrono::milliseconds(20);

    parts::PartWriter writer("bounded", slow, nullptr, Sized(100, 2));
    WriteInSlices(writer, RandomText(1000, 1), 64);
    writer.Close();

    REQUIRE(writer.parts().size() == 10);
    REQUIRE(slow.max_active() <= 2);
    for (std::size_t i = 0; i < writer.parts().size(); ++i) {
        REQUIRE(writer.parts()[i].index == i);
    }
}

TEST_CASE("a failing store stops the writer and abort discards committed parts") {
    TempDir tmp;
    InstrumentedSink failing(tmp / "out");
    failing.fail_index = 1;

    parts::PartWriter writer("broken", failing, nullptr, Sized(100, 1));
    REQUIRE_THROWS_AS(
        [&] {
            WriteInSlices(writer, RandomText(500, 2), 50);
            writer.Close();
        }(),
        PartIOError);
    writer.Abort();

    REQUIRE(failing.discarded() == std::vector<std::string>{"broken.part_000"});
    REQUIRE(ListNames(tmp / "out").empty());
}

TEST_CASE("abort removes staged and committed parts") {
    TempDir tmp;
    sink::LocalSink local(tmp / "out");
    {
        parts::PartWriter writer("partial", local, nullptr, Sized(1000));
        WriteInSlices(writer, RandomText(2500, 5), 700);
        writer.Abort();
        REQUIRE(writer.parts().empty());
        REQUIRE_THROWS_AS(writer.Write(stream::Bytes{1, 2, 3}), std::logic_error);
    }
    REQUIRE(ListNames(tmp / "out").empty());
}

TEST_CASE("a writer destroyed without close cleans up") {
    TempDir tmp;
    sink::LocalSink local(tmp / "out");
    {
        parts::PartWriter writer("dropped", local, nullptr, Sized(1000));
        WriteInSlices(writer, RandomText(1500, 5), 700);
    }
    REQUIRE(ListNames(tmp / "out").empty());
}

TEST_CASE("parts reach a remote store through its sink") {
    TempDir tmp;
    auto store = std::make_shared<FakeObjectStore>();
    store->Script("cloud.tar.part_001", {FakeObjectStore::Outcome::Transient});
    retry::RetryPolicy policy;
    policy.initial_delay = std::chrono::milliseconds(1);
    sink::RemoteSink remote(destination::Parse("s3://bucket/nightly"), store, policy, tmp.path());

    const std::string data = RandomText(2048, 11);
    parts::PartWriter writer("cloud.tar", remote, nullptr, Sized(1024));
    WriteInSlices(writer, data, 100);
    writer.Close();

    auto objects = store->objects();
    REQUIRE(objects.size() == 2);
    REQUIRE(objects.at("s3://bucket/nightly/cloud.tar.part_000") + objects.at("s3://bucket/nightly/cloud.tar.part_001") ==
            data);
    REQUIRE(store->attempts() == 3);
    REQUIRE(ListNames(remote.StagingDir()).empty());
}

TEST_CASE("part writer rejects a zero part size") {
    TempDir tmp;
    sink::LocalSink local(tmp / "out");
    REQUIRE_THROWS_AS(parts::PartWriter("x", local, nullptr, Sized(0)), ConfigError);
    REQUIRE_THROWS_AS(parts::PartWriter("", local, nullptr, Sized(10)), ConfigError);
}
