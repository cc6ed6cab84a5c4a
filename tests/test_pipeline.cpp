#include <catch2/catch.hpp>

#include "archivedir/errors.hpp"
#include "archivedir/pipeline.hpp"
#include "test_support.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

using namespace archivedir;

namespace {

// Uppercases ASCII letters; 1:1 so byte counts line up.
class UpperTransform : public stream::StreamTransform {
public:
    std::string Name() const override { return "upper"; }
    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) override {
        stream::Bytes chunk(data, data + len);
        for (auto& b : chunk) {
            if (b >= 'a' && b <= 'z') b = static_cast<std::uint8_t>(b - 'a' + 'A');
        }
        out.Write(chunk);
    }
    void Finish(stream::ChunkSink&) override {}
};

// Holds everything back until Finish.
class ReverseTransform : public stream::StreamTransform {
public:
    std::string Name() const override { return "reverse"; }
    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink&) override {
        held_.insert(held_.end(), data, data + len);
    }
    void Finish(stream::ChunkSink& out) override {
        std::reverse(held_.begin(), held_.end());
        out.Write(held_);
    }

private:
    stream::Bytes held_;
};

class FailingTransform : public stream::StreamTransform {
public:
    explicit FailingTransform(std::size_t fail_after) : fail_after_(fail_after) {}
    std::string Name() const override { return "flaky"; }
    void Update(const std::uint8_t* data, std::size_t len, stream::ChunkSink& out) override {
        seen_ += len;
        if (seen_ > fail_after_) {
            throw std::runtime_error("flaky stage gave up");
        }
        out.Write(data, len);
    }
    void Finish(stream::ChunkSink&) override {}

private:
    std::size_t fail_after_;
    std::size_t seen_ = 0;
};

// Endless source that only stops when cancelled.
class EndlessSource : public stream::StreamSource {
public:
    std::string Name() const override { return "endless"; }
    void Produce(stream::ChunkSink& out, const stream::CancelToken& cancel) override {
        stream::Bytes chunk(4096, 'x');
        for (;;) {
            cancel.ThrowIfCancelled(Name());
            out.Write(chunk);
        }
    }
};

class RecordingSink : public stream::TerminalSink {
public:
    std::string Name() const override { return "recorder"; }
    void Write(const std::uint8_t* data, std::size_t len) override { bytes.insert(bytes.end(), data, data + len); }
    using ChunkSink::Write;
    void Close() override { closed = true; }
    void Abort() noexcept override { aborted = true; }

    stream::Bytes bytes;
    bool closed = false;
    bool aborted = false;
};

}  // namespace

TEST_CASE("pipeline chains stages in order") {
    const std::string input = "hello streaming pipeline";
    std::vector<std::unique_ptr<stream::StreamTransform>> transforms;
    transforms.push_back(std::make_unique<UpperTransform>());
    transforms.push_back(std::make_unique<ReverseTransform>());
    RecordingSink sink;

    pipeline::Options options;
    options.chunk_size = 5;
    options.pipe_capacity = 7;
    pipeline::Pipeline pipe(std::make_unique<stream::BufferSource>(testing::ToBytes(input), 3), std::move(transforms),
                            sink, options);
    REQUIRE(pipe.StageNames() == std::vector<std::string>{"buffer", "upper", "reverse", "recorder"});

    stream::CancelToken cancel;
    pipeline::RunStats stats = pipe.Run(cancel);

    std::string expected = "HELLO STREAMING PIPELINE";
    std::reverse(expected.begin(), expected.end());
    REQUIRE(testing::ToString(sink.bytes) == expected);
    REQUIRE(sink.closed);
    REQUIRE_FALSE(sink.aborted);
    REQUIRE(stats.bytes_delivered == input.size());
    REQUIRE(stats.stages.size() == 4);
    REQUIRE(stats.stages[1].bytes_in == input.size());
}

TEST_CASE("pipeline with no transforms passes bytes through") {
    const std::string input = testing::RandomText(300000, 11);
    RecordingSink sink;
    pipeline::Pipeline pipe(std::make_unique<stream::BufferSource>(testing::ToBytes(input)), {}, sink);
    stream::CancelToken cancel;
    pipe.Run(cancel);
    REQUIRE(testing::ToString(sink.bytes) == input);
}

TEST_CASE("stage failure cancels the run and names the stage") {
    std::vector<std::unique_ptr<stream::StreamTransform>> transforms;
    transforms.push_back(std::make_unique<UpperTransform>());
    transforms.push_back(std::make_unique<FailingTransform>(1000));
    RecordingSink sink;

    pipeline::Options options;
    options.chunk_size = 256;
    options.pipe_capacity = 1024;
    pipeline::Pipeline pipe(std::make_unique<EndlessSource>(), std::move(transforms), sink, options);

    stream::CancelToken cancel;
    try {
        pipe.Run(cancel);
        FAIL("pipeline should have failed");
    } catch (const StageError& exc) {
        REQUIRE(exc.component() == "flaky");
        REQUIRE(std::string(exc.what()).find("flaky stage gave up") != std::string::npos);
    }
    REQUIRE(sink.aborted);
    REQUIRE_FALSE(sink.closed);
    REQUIRE(cancel.IsCancelled());
}

TEST_CASE("external cancel stops a running pipeline") {
    RecordingSink sink;
    pipeline::Pipeline pipe(std::make_unique<EndlessSource>(), {}, sink);
    stream::CancelToken cancel;

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.Cancel();
    });
    REQUIRE_THROWS_AS(pipe.Run(cancel), Cancelled);
    canceller.join();
    REQUIRE(sink.aborted);
}

TEST_CASE("pipeline runs only once") {
    RecordingSink sink;
    pipeline::Pipeline pipe(std::make_unique<stream::BufferSource>(testing::ToBytes("x")), {}, sink);
    stream::CancelToken cancel;
    pipe.Run(cancel);
    REQUIRE_THROWS_AS(pipe.Run(cancel), std::logic_error);
}
