#pragma once

#include "archivedir/destination.hpp"
#include "archivedir/stream.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace archivedir::sink {

struct ObjectInfo {
    std::string name;
    std::uint64_t size = 0;
};

// Forward-only reader over one stored object.
class ObjectReader {
public:
    virtual ~ObjectReader() = default;
    // Returns 0 at end of object.
    virtual std::size_t Read(std::uint8_t* buffer, std::size_t max) = 0;
};

// Limits of one store attempt. Clients check it between transfer chunks.
struct AttemptContext {
    std::chrono::steady_clock::time_point deadline;
    const stream::CancelToken* cancel = nullptr;

    // Throws Cancelled when cancelled, SinkTransientError once the deadline passed.
    void Check(const std::string& component) const;
};

// Provider seam. Every call is a single attempt: retrying is the sink's job.
// Implementations report failures as SinkTransientError (network, timeout,
// throttling) or SinkPermanentError (auth, missing bucket/folder), and must
// never leave a partially uploaded object visible under its final name.
class ObjectStoreClient {
public:
    virtual ~ObjectStoreClient() = default;

    virtual std::string Name() const = 0;
    virtual void Upload(const destination::Destination& dest, const std::string& name,
                        const std::filesystem::path& file, const AttemptContext& ctx) = 0;
    virtual void Put(const destination::Destination& dest, const std::string& name, const std::string& content,
                     const AttemptContext& ctx) = 0;
    virtual std::vector<ObjectInfo> List(const destination::Destination& dest, const std::string& prefix) = 0;
    virtual std::unique_ptr<ObjectReader> Open(const destination::Destination& dest, const std::string& name) = 0;
    virtual void Remove(const destination::Destination& dest, const std::string& name) = 0;
};

// Maps provider locations onto a mounted directory tree:
//   s3://bucket/prefix        -> <root>/s3/bucket/prefix
//   gdrive://folder/path      -> <root>/gdrive/folder/path
//   gdrive://id:ID/sub        -> <root>/gdrive-id/ID/sub
//   onedrive://folder/path    -> <root>/onedrive/folder/path
// Bucket and Drive-id roots must already exist (a missing one is permanent);
// folders below them are created on upload.
class DirectoryObjectStore : public ObjectStoreClient {
public:
    explicit DirectoryObjectStore(std::filesystem::path root);

    std::string Name() const override { return "directory-object-store"; }
    void Upload(const destination::Destination& dest, const std::string& name,
                const std::filesystem::path& file, const AttemptContext& ctx) override;
    void Put(const destination::Destination& dest, const std::string& name, const std::string& content,
             const AttemptContext& ctx) override;
    std::vector<ObjectInfo> List(const destination::Destination& dest, const std::string& prefix) override;
    std::unique_ptr<ObjectReader> Open(const destination::Destination& dest, const std::string& name) override;
    void Remove(const destination::Destination& dest, const std::string& name) override;

    std::filesystem::path Resolve(const destination::Destination& dest) const;
    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::filesystem::path EnsureFolder(const destination::Destination& dest) const;

    std::filesystem::path root_;
};

}  // namespace archivedir::sink
