#pragma once

#include "archivedir/destination.hpp"
#include "archivedir/object_store.hpp"
#include "archivedir/retry.hpp"
#include "archivedir/stream.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace archivedir::sink {

// A closed part waiting to be committed.
struct PartFile {
    std::uint32_t index = 0;
    std::string name;                   // final name, "<base>.part_NNN"
    std::filesystem::path staged_path;  // "<staging>/<name>.partial"
    std::uint64_t size = 0;
};

// Store(part) either commits the part under its final name or throws
// PartIOError / SinkTransientError / SinkPermanentError. The staged file is
// consumed on success.
class DestinationSink {
public:
    virtual ~DestinationSink() = default;

    virtual std::string Name() const = 0;
    virtual std::string Describe() const = 0;
    // Where the part writer stages open parts.
    virtual std::filesystem::path StagingDir() const = 0;

    virtual void Store(const PartFile& part, const stream::CancelToken& cancel) = 0;
    virtual void StoreMetadata(const std::string& name, const std::string& content,
                               const stream::CancelToken& cancel) = 0;
    // Removes already committed objects of a failed run. Failures are logged.
    virtual void Discard(const std::vector<std::string>& names) noexcept = 0;
};

// Local directory: parts are staged beside their final name and renamed into
// place, so a part is never visible half-written.
class LocalSink : public DestinationSink {
public:
    explicit LocalSink(std::filesystem::path dir);

    std::string Name() const override { return "local-sink"; }
    std::string Describe() const override { return dir_.string(); }
    std::filesystem::path StagingDir() const override { return dir_; }

    void Store(const PartFile& part, const stream::CancelToken& cancel) override;
    void StoreMetadata(const std::string& name, const std::string& content,
                       const stream::CancelToken& cancel) override;
    void Discard(const std::vector<std::string>& names) noexcept override;

private:
    std::filesystem::path dir_;
};

// Object store behind an ObjectStoreClient. Each store attempt carries the
// policy's attempt timeout; transient failures are retried with exponential
// backoff, permanent ones abort immediately.
class RemoteSink : public DestinationSink {
public:
    RemoteSink(destination::Destination dest, std::shared_ptr<ObjectStoreClient> client,
               retry::RetryPolicy policy, const std::filesystem::path& staging_root);
    ~RemoteSink() override;

    RemoteSink(const RemoteSink&) = delete;
    RemoteSink& operator=(const RemoteSink&) = delete;

    std::string Name() const override { return dest_.Provider() + "-sink"; }
    std::string Describe() const override { return dest_.ToString(); }
    std::filesystem::path StagingDir() const override { return staging_; }

    void Store(const PartFile& part, const stream::CancelToken& cancel) override;
    void StoreMetadata(const std::string& name, const std::string& content,
                       const stream::CancelToken& cancel) override;
    void Discard(const std::vector<std::string>& names) noexcept override;

private:
    AttemptContext NextAttempt(const stream::CancelToken& cancel) const;

    destination::Destination dest_;
    std::shared_ptr<ObjectStoreClient> client_;
    retry::RetryPolicy policy_;
    std::filesystem::path staging_;
};

// LocalSink for local destinations, RemoteSink otherwise. A remote
// destination without a client fails with SinkPermanentError.
std::unique_ptr<DestinationSink> MakeSink(const destination::Destination& dest,
                                          std::shared_ptr<ObjectStoreClient> client,
                                          const retry::RetryPolicy& policy,
                                          const std::filesystem::path& staging_root);

}  // namespace archivedir::sink
