#include <catch2/catch.hpp>

#include "archivedir/errors.hpp"
#include "archivedir/retry.hpp"
#include "archivedir/sink.hpp"
#include "fake_object_store.hpp"
#include "test_support.hpp"

#include <thread>

using namespace archivedir;
using namespace archivedir::testing;
using Outcome = FakeObjectStore::Outcome;

namespace {

retry::RetryPolicy FastPolicy(std::uint32_t attempts = 3) {
    retry::RetryPolicy policy;
    policy.max_attempts = attempts;
    policy.initial_delay = std::chrono::milliseconds(1);
    policy.max_delay = std::chrono::milliseconds(4);
    return policy;
}

sink::PartFile StagePart(const fs::path& dir, const std::string& name, const std::string& content) {
    sink::PartFile part;
    part.name = name;
    part.staged_path = dir / (name + ".partial");
    part.size = content.size();
    WriteFile(part.staged_path, content);
    return part;
}

}  // namespace

TEST_CASE("retry delay grows exponentially up to the cap") {
    retry::RetryPolicy policy;
    policy.initial_delay = std::chrono::milliseconds(100);
    policy.backoff_multiplier = 2.0;
    policy.max_delay = std::chrono::milliseconds(1000);

    REQUIRE(retry::CalculateRetryDelay(policy, 1).count() == 100);
    REQUIRE(retry::CalculateRetryDelay(policy, 2).count() == 200);
    REQUIRE(retry::CalculateRetryDelay(policy, 3).count() == 400);
    REQUIRE(retry::CalculateRetryDelay(policy, 5).count() == 1000);
    REQUIRE(retry::CalculateRetryDelay(policy, 40).count() == 1000);

    policy.use_jitter = true;
    auto jittered = retry::CalculateRetryDelay(policy, 2).count();
    REQUIRE(jittered >= 100);
    REQUIRE(jittered <= 300);
}

TEST_CASE("transient failures are retried until an attempt succeeds") {
    stream::CancelToken cancel;
    int calls = 0;
    int result = retry::Run(FastPolicy(3), "test", "operation", cancel, [&](std::uint32_t attempt) {
        ++calls;
        if (attempt < 3) {
            throw SinkTransientError("test", "flaky");
        }
        return 42;
    });
    REQUIRE(result == 42);
    REQUIRE(calls == 3);
}

TEST_CASE("retries give up after the attempt budget") {
    stream::CancelToken cancel;
    int calls = 0;
    try {
        retry::Run(FastPolicy(3), "test", "upload of x", cancel, [&](std::uint32_t) {
            ++calls;
            throw SinkTransientError("test", "timeout");
        });
        FAIL("retry loop returned");
    } catch (const SinkTransientError& exc) {
        REQUIRE(std::string(exc.what()).find("failed after 3 attempts") != std::string::npos);
    }
    REQUIRE(calls == 3);
}

TEST_CASE("permanent failures are not retried") {
    stream::CancelToken cancel;
    int calls = 0;
    REQUIRE_THROWS_AS(retry::Run(FastPolicy(5), "test", "op", cancel,
                                 [&](std::uint32_t) {
                                     ++calls;
                                     throw SinkPermanentError("test", "forbidden");
                                 }),
                      SinkPermanentError);
    REQUIRE(calls == 1);
}

TEST_CASE("cancelling interrupts a retry wait") {
    stream::CancelToken cancel;
    retry::RetryPolicy policy = FastPolicy(10);
    policy.initial_delay = std::chrono::milliseconds(5000);
    policy.max_delay = std::chrono::milliseconds(5000);

    std::thread canceller([&] {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        cancel.Cancel();
    });
    auto started = std::chrono::steady_clock::now();
    REQUIRE_THROWS_AS(retry::Run(policy, "test", "op", cancel,
                                 [](std::uint32_t) { throw SinkTransientError("test", "down"); }),
                      Cancelled);
    canceller.join();
    REQUIRE(std::chrono::steady_clock::now() - started < std::chrono::seconds(4));
}

TEST_CASE("attempt context enforces its deadline") {
    sink::AttemptContext ctx;
    ctx.deadline = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    REQUIRE_THROWS_AS(ctx.Check("uploader"), SinkTransientError);

    stream::CancelToken cancel;
    cancel.Cancel();
    ctx.deadline = std::chrono::steady_clock::now() + std::chrono::hours(1);
    ctx.cancel = &cancel;
    REQUIRE_THROWS_AS(ctx.Check("uploader"), Cancelled);
}

TEST_CASE("local sink commits parts by rename") {
    TempDir tmp;
    sink::LocalSink local(tmp / "dest");
    stream::CancelToken cancel;

    auto part = StagePart(local.StagingDir(), "data.tar.gz.part_000", "payload");
    local.Store(part, cancel);
    REQUIRE_FALSE(fs::exists(part.staged_path));
    REQUIRE(ReadFile(tmp / "dest" / "data.tar.gz.part_000") == "payload");

    local.StoreMetadata("data.tar.gz.enc", "salt=00\n", cancel);
    REQUIRE(ReadFile(tmp / "dest" / "data.tar.gz.enc") == "salt=00\n");

    local.Discard({"data.tar.gz.part_000", "never-written"});
    REQUIRE(ListNames(tmp / "dest") == std::vector<std::string>{"data.tar.gz.enc"});
}

TEST_CASE("local sink reports a missing staged file as part I/O") {
    TempDir tmp;
    sink::LocalSink local(tmp / "dest");
    stream::CancelToken cancel;
    sink::PartFile part;
    part.name = "x.part_000";
    part.staged_path = tmp / "dest" / "missing.partial";
    REQUIRE_THROWS_AS(local.Store(part, cancel), PartIOError);
}

TEST_CASE("remote sink retries transient upload failures") {
    TempDir tmp;
    auto store = std::make_shared<FakeObjectStore>();
    store->Script("a.part_000", {Outcome::Transient, Outcome::Transient});
    sink::RemoteSink remote(destination::Parse("s3://bucket/backups"), store, FastPolicy(3), tmp.path());
    stream::CancelToken cancel;

    auto part = StagePart(remote.StagingDir(), "a.part_000", "remote bytes");
    remote.Store(part, cancel);

    REQUIRE(store->attempts() == 3);
    REQUIRE(store->objects().at("s3://bucket/backups/a.part_000") == "remote bytes");
    REQUIRE_FALSE(fs::exists(part.staged_path));
}

TEST_CASE("remote sink surfaces exhausted and permanent failures") {
    TempDir tmp;
    auto store = std::make_shared<FakeObjectStore>();
    sink::RemoteSink remote(destination::Parse("onedrive://Backups"), store, FastPolicy(2), tmp.path());
    stream::CancelToken cancel;

    SECTION("exhausted") {
        store->Script("b.part_000", {Outcome::Transient, Outcome::Transient, Outcome::Transient});
        auto part = StagePart(remote.StagingDir(), "b.part_000", "x");
        REQUIRE_THROWS_AS(remote.Store(part, cancel), SinkTransientError);
        REQUIRE(store->attempts() == 2);
    }
    SECTION("permanent") {
        store->Script("b.part_000", {Outcome::Permanent});
        auto part = StagePart(remote.StagingDir(), "b.part_000", "x");
        REQUIRE_THROWS_AS(remote.Store(part, cancel), SinkPermanentError);
        REQUIRE(store->attempts() == 1);
    }
    REQUIRE(store->objects().empty());
}

TEST_CASE("remote sink stages under its own directory and cleans up") {
    TempDir tmp;
    fs::path staging;
    {
        sink::RemoteSink remote(destination::Parse("gdrive://Backups"), std::make_shared<FakeObjectStore>(),
                                FastPolicy(), tmp.path());
        staging = remote.StagingDir();
        REQUIRE(fs::is_directory(staging));
        REQUIRE(staging.parent_path() == tmp.path());
    }
    REQUIRE_FALSE(fs::exists(staging));
}

TEST_CASE("remote destinations need a client") {
    TempDir tmp;
    REQUIRE_THROWS_AS(sink::MakeSink(destination::Parse("s3://bucket"), nullptr, FastPolicy(), tmp.path()),
                      SinkPermanentError);
    auto local = sink::MakeSink(destination::Parse((tmp / "here").string()), nullptr, FastPolicy(), tmp.path());
    REQUIRE(local->Name() == "local-sink");
}

TEST_CASE("directory object store maps providers onto folders") {
    TempDir tmp;
    sink::DirectoryObjectStore store(tmp.path());
    REQUIRE(store.Resolve(destination::Parse("s3://b/x/y")) == tmp / "s3" / "b" / "x" / "y");
    REQUIRE(store.Resolve(destination::Parse("gdrive://F/g")) == tmp / "gdrive" / "F" / "g");
    REQUIRE(store.Resolve(destination::Parse("gdrive://id:ABC/s")) == tmp / "gdrive-id" / "ABC" / "s");
    REQUIRE(store.Resolve(destination::Parse("onedrive://O")) == tmp / "onedrive" / "O");
}

TEST_CASE("directory object store uploads, lists and removes") {
    TempDir tmp;
    sink::DirectoryObjectStore store(tmp / "root");
    auto dest = destination::Parse("s3://bucket/prefix");
    sink::AttemptContext ctx;
    ctx.deadline = std::chrono::steady_clock::now() + std::chrono::minutes(1);

    fs::create_directories(tmp / "root");
    REQUIRE_THROWS_AS(store.Put(dest, "x.enc", "data", ctx), SinkPermanentError);
    REQUIRE_THROWS_AS(store.List(dest, ""), SinkPermanentError);

    fs::create_directories(tmp / "root" / "s3" / "bucket");
    WriteFile(tmp / "local.bin", "part bytes");
    store.Upload(dest, "x.part_000", tmp / "local.bin", ctx);
    store.Put(dest, "x.enc", "meta", ctx);
    store.Put(dest, "other.txt", "-", ctx);

    auto listed = store.List(dest, "x.");
    REQUIRE(listed.size() == 2);
    REQUIRE(ListNames(tmp / "root" / "s3" / "bucket" / "prefix") ==
            std::vector<std::string>{"other.txt", "x.enc", "x.part_000"});

    auto reader = store.Open(dest, "x.part_000");
    std::uint8_t buffer[64];
    std::size_t n = reader->Read(buffer, sizeof(buffer));
    REQUIRE(std::string(reinterpret_cast<char*>(buffer), n) == "part bytes");

    store.Remove(dest, "x.part_000");
    REQUIRE(store.List(dest, "x.").size() == 1);
    REQUIRE_THROWS_AS(store.Open(dest, "x.part_000"), SinkPermanentError);
}
