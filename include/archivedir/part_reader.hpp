#pragma once

#include "archivedir/destination.hpp"
#include "archivedir/object_store.hpp"
#include "archivedir/progress.hpp"
#include "archivedir/retry.hpp"
#include "archivedir/stream.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace archivedir::parts {

// A folder holding parts: a local directory or a remote destination.
class PartLocation {
public:
    virtual ~PartLocation() = default;

    virtual std::string Describe() const = 0;
    // Regular objects whose name starts with `prefix`, in no particular order.
    virtual std::vector<sink::ObjectInfo> List(const std::string& prefix) = 0;
    virtual std::unique_ptr<sink::ObjectReader> Open(const std::string& name) = 0;
};

class LocalLocation : public PartLocation {
public:
    explicit LocalLocation(std::filesystem::path dir);

    std::string Describe() const override { return dir_.string(); }
    std::vector<sink::ObjectInfo> List(const std::string& prefix) override;
    std::unique_ptr<sink::ObjectReader> Open(const std::string& name) override;

private:
    std::filesystem::path dir_;
};

// Lists and opens through an ObjectStoreClient with the sink retry policy.
class RemoteLocation : public PartLocation {
public:
    RemoteLocation(destination::Destination dest, std::shared_ptr<sink::ObjectStoreClient> client,
                   retry::RetryPolicy policy, const stream::CancelToken& cancel);

    std::string Describe() const override { return dest_.ToString(); }
    std::vector<sink::ObjectInfo> List(const std::string& prefix) override;
    std::unique_ptr<sink::ObjectReader> Open(const std::string& name) override;

private:
    destination::Destination dest_;
    std::shared_ptr<sink::ObjectStoreClient> client_;
    retry::RetryPolicy policy_;
    const stream::CancelToken& cancel_;
};

// A source specifier split into the folder that holds the parts and a
// selector naming them inside it ("" when the specifier is the folder).
struct PartSource {
    std::unique_ptr<PartLocation> location;
    std::string selector;
};

// Local: an existing directory selects everything inside it, any other path
// is <parent>/<selector>. Remote: the last path component is the selector
// when it looks like an archive or part name.
PartSource ResolveSource(const std::string& spec, std::shared_ptr<sink::ObjectStoreClient> client,
                         const retry::RetryPolicy& policy, const stream::CancelToken& cancel);

struct DiscoveredParts {
    std::string base;                     // archive base name, e.g. "photos.tar.gz"
    std::vector<sink::ObjectInfo> parts;  // index order, contiguous from 000
    std::uint64_t total_bytes = 0;
};

// Splits "<base>.part_<digits>" into base and index.
bool ParsePartName(const std::string& name, std::string& base, std::uint32_t& index);

// The selector may be empty (the folder must hold exactly one archive), a
// part name, a base name, a "<base>.part_*" pattern or a name prefix that
// matches a single archive. Throws PartDiscoveryError when nothing matches,
// more than one archive matches, an index repeats or the indices are not a
// contiguous run from 0.
DiscoveredParts DiscoverParts(PartLocation& location, const std::string& selector);

// Same checks for an explicit list of part names inside `location`.
DiscoveredParts DiscoverParts(PartLocation& location, const std::vector<std::string>& names);

// Reads "<base>.enc". When it is absent but the folder holds exactly one
// ".enc" record, that one is used with a warning.
std::optional<std::string> LoadMetadataRecord(PartLocation& location, const std::string& base);

// First stage of an extraction: concatenates the parts strictly in index
// order, one forward-only read per part.
class PartReaderSource : public stream::StreamSource {
public:
    PartReaderSource(PartLocation& location, DiscoveredParts parts, progress::ProgressAggregator* progress,
                     std::size_t chunk_size);

    std::string Name() const override { return "part-reader"; }
    // Progress for the final chunk is held back so the run does not read as
    // complete while downstream stages are still draining.
    void Produce(stream::ChunkSink& out, const stream::CancelToken& cancel) override;
    // Credits the held-back chunk once the whole pipeline has succeeded.
    void ReportHeld();

private:
    PartLocation& location_;
    DiscoveredParts parts_;
    progress::ProgressAggregator* progress_;
    std::size_t chunk_size_;
    std::uint64_t held_bytes_ = 0;
    std::uint32_t held_index_ = 0;
};

}  // namespace archivedir::parts
