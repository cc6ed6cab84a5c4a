#include "archivedir/part_reader.hpp"

#include "archivedir/constants.hpp"
#include "archivedir/errors.hpp"
#include "archivedir/file_stream.hpp"
#include "archivedir/log.hpp"
#include "archivedir/metadata.hpp"
#include "archivedir/part_writer.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace archivedir::parts {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "part-reader";

bool EndsWith(const std::string& value, std::string_view suffix) {
    return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.compare(0, prefix.size(), prefix) == 0;
}

class LocalPartReader : public sink::ObjectReader {
public:
    explicit LocalPartReader(const fs::path& path) : reader_(path) {}

    std::size_t Read(std::uint8_t* buffer, std::size_t max) override {
        try {
            return reader_.Read(buffer, max);
        } catch (const std::runtime_error& exc) {
            throw PartIOError(kComponent, exc.what());
        }
    }

private:
    filestream::FileReader reader_;
};

struct IndexedPart {
    std::uint32_t index;
    sink::ObjectInfo info;
};

// Sorts one archive's parts and checks they run 0..n-1 without repeats.
DiscoveredParts Validate(const std::string& base, std::vector<IndexedPart> found, const std::string& where) {
    if (found.empty()) {
        throw PartDiscoveryError("no parts of " + base + " found in " + where);
    }
    std::sort(found.begin(), found.end(), [](const IndexedPart& a, const IndexedPart& b) {
        return a.index < b.index;
    });
    for (std::size_t i = 1; i < found.size(); ++i) {
        if (found[i].index == found[i - 1].index) {
            throw PartDiscoveryError("duplicate part index " + std::to_string(found[i].index) + " for " + base + ": " +
                                     found[i - 1].info.name + " and " + found[i].info.name);
        }
    }
    for (std::size_t i = 0; i < found.size(); ++i) {
        if (found[i].index != i) {
            throw PartDiscoveryError("missing " + PartName(base, static_cast<std::uint32_t>(i)) + " in " + where +
                                     " (found " + std::to_string(found.size()) + " part(s), highest index " +
                                     std::to_string(found.back().index) + ")");
        }
    }

    DiscoveredParts result;
    result.base = base;
    for (auto& part : found) {
        result.total_bytes += part.info.size;
        result.parts.push_back(std::move(part.info));
    }
    return result;
}

std::string CanonicalSelector(std::string selector) {
    while (!selector.empty() && selector.back() == '*') {
        selector.pop_back();
    }
    if (EndsWith(selector, constants::kPartMarker)) {
        selector.resize(selector.size() - constants::kPartMarker.size());
    }
    return selector;
}

bool LooksLikeArchiveName(const std::string& name) {
    return name.find(constants::kPartMarker) != std::string::npos ||
           name.find(constants::kTarExt) != std::string::npos ||
           name.find('*') != std::string::npos;
}

std::string ReadAll(sink::ObjectReader& reader) {
    std::string content;
    char buffer[4096];
    for (;;) {
        std::size_t n = reader.Read(reinterpret_cast<std::uint8_t*>(buffer), sizeof(buffer));
        if (n == 0) {
            break;
        }
        content.append(buffer, n);
    }
    return content;
}

}  // namespace

// ---------------------------------------------------------------------------
// Locations

LocalLocation::LocalLocation(fs::path dir) : dir_(std::move(dir)) {}

std::vector<sink::ObjectInfo> LocalLocation::List(const std::string& prefix) {
    std::error_code ec;
    if (!fs::is_directory(dir_, ec)) {
        throw PartDiscoveryError("source directory not found: " + dir_.string());
    }
    std::vector<sink::ObjectInfo> objects;
    fs::directory_iterator it(dir_, ec);
    for (; !ec && it != fs::directory_iterator(); it.increment(ec)) {
        std::string name = it->path().filename().string();
        if (!StartsWith(name, prefix)) {
            continue;
        }
        std::error_code entry_ec;
        if (!it->is_regular_file(entry_ec)) {
            continue;
        }
        std::uint64_t size = it->file_size(entry_ec);
        if (entry_ec) {
            throw PartIOError(kComponent, "cannot stat " + it->path().string() + ": " + entry_ec.message());
        }
        objects.push_back({name, size});
    }
    if (ec) {
        throw PartIOError(kComponent, "cannot list " + dir_.string() + ": " + ec.message());
    }
    return objects;
}

std::unique_ptr<sink::ObjectReader> LocalLocation::Open(const std::string& name) {
    try {
        return std::make_unique<LocalPartReader>(dir_ / name);
    } catch (const std::runtime_error& exc) {
        throw PartIOError(kComponent, exc.what());
    }
}

RemoteLocation::RemoteLocation(destination::Destination dest, std::shared_ptr<sink::ObjectStoreClient> client,
                               retry::RetryPolicy policy, const stream::CancelToken& cancel)
    : dest_(std::move(dest)), client_(std::move(client)), policy_(policy), cancel_(cancel) {
    if (!client_) {
        throw SinkPermanentError(dest_.Provider() + "-source",
                                 "no " + dest_.Provider() + " client configured for " + dest_.ToString() +
                                     " (set ARCHIVEDIR_OBJECT_STORE_ROOT for a mounted store)");
    }
}

std::vector<sink::ObjectInfo> RemoteLocation::List(const std::string& prefix) {
    return retry::Run(policy_, kComponent, "listing of " + dest_.ToString(), cancel_,
                      [&](std::uint32_t) { return client_->List(dest_, prefix); });
}

std::unique_ptr<sink::ObjectReader> RemoteLocation::Open(const std::string& name) {
    return retry::Run(policy_, kComponent, "open of " + name, cancel_,
                      [&](std::uint32_t) { return client_->Open(dest_, name); });
}

PartSource ResolveSource(const std::string& spec, std::shared_ptr<sink::ObjectStoreClient> client,
                         const retry::RetryPolicy& policy, const stream::CancelToken& cancel) {
    destination::Destination dest = destination::Parse(spec);
    PartSource source;
    if (!dest.IsRemote()) {
        fs::path path(dest.path);
        std::error_code ec;
        if (fs::is_directory(path, ec)) {
            source.location = std::make_unique<LocalLocation>(path);
            return source;
        }
        fs::path parent = path.parent_path();
        source.location = std::make_unique<LocalLocation>(parent.empty() ? fs::path(".") : parent);
        source.selector = path.filename().string();
        return source;
    }

    auto slash = dest.path.rfind('/');
    std::string last = slash == std::string::npos ? dest.path : dest.path.substr(slash + 1);
    if (!last.empty() && LooksLikeArchiveName(last)) {
        source.selector = last;
        dest.path = slash == std::string::npos ? std::string() : dest.path.substr(0, slash);
    }
    source.location = std::make_unique<RemoteLocation>(std::move(dest), std::move(client), policy, cancel);
    return source;
}

// ---------------------------------------------------------------------------
// Discovery

bool ParsePartName(const std::string& name, std::string& base, std::uint32_t& index) {
    auto marker = name.rfind(constants::kPartMarker);
    if (marker == std::string::npos || marker == 0) {
        return false;
    }
    std::string digits = name.substr(marker + constants::kPartMarker.size());
    if (digits.empty() || digits.size() > 9) {
        return false;
    }
    for (char c : digits) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    base = name.substr(0, marker);
    index = static_cast<std::uint32_t>(std::stoul(digits));
    return true;
}

DiscoveredParts DiscoverParts(PartLocation& location, const std::string& selector) {
    const std::string wanted = CanonicalSelector(selector);
    std::string wanted_base;
    std::uint32_t ignored_index = 0;
    if (!ParsePartName(wanted, wanted_base, ignored_index)) {
        wanted_base.clear();
    }

    std::map<std::string, std::vector<IndexedPart>> by_base;
    for (auto& object : location.List(wanted_base.empty() ? wanted : wanted_base)) {
        std::string base;
        std::uint32_t index = 0;
        if (ParsePartName(object.name, base, index)) {
            by_base[base].push_back({index, std::move(object)});
        }
    }

    const std::string where = location.Describe();
    if (!wanted_base.empty() || by_base.count(wanted) != 0) {
        const std::string& base = wanted_base.empty() ? wanted : wanted_base;
        auto it = by_base.find(base);
        if (it == by_base.end()) {
            throw PartDiscoveryError("no parts of " + base + " found in " + where);
        }
        return Validate(base, std::move(it->second), where);
    }

    if (by_base.empty()) {
        throw PartDiscoveryError("no parts" + (wanted.empty() ? std::string() : " matching '" + wanted + "'") +
                                 " found in " + where);
    }
    if (by_base.size() > 1) {
        std::string names;
        for (const auto& entry : by_base) {
            names += (names.empty() ? "" : ", ") + entry.first;
        }
        throw PartDiscoveryError("ambiguous source " + where + ": several archives match (" + names + ")");
    }
    auto& only = *by_base.begin();
    return Validate(only.first, std::move(only.second), where);
}

DiscoveredParts DiscoverParts(PartLocation& location, const std::vector<std::string>& names) {
    if (names.empty()) {
        throw PartDiscoveryError("empty part list");
    }
    std::map<std::string, std::uint64_t> sizes;
    for (auto& object : location.List("")) {
        sizes[object.name] = object.size;
    }

    const std::string where = location.Describe();
    std::string base;
    std::vector<IndexedPart> found;
    for (const auto& name : names) {
        std::string part_base;
        std::uint32_t index = 0;
        if (!ParsePartName(name, part_base, index)) {
            throw PartDiscoveryError("not a part name: " + name);
        }
        if (!base.empty() && part_base != base) {
            throw PartDiscoveryError("parts of different archives given: " + base + " and " + part_base);
        }
        base = part_base;
        auto it = sizes.find(name);
        if (it == sizes.end()) {
            throw PartDiscoveryError("part not found: " + name + " in " + where);
        }
        found.push_back({index, {name, it->second}});
    }
    return Validate(base, std::move(found), where);
}

std::optional<std::string> LoadMetadataRecord(PartLocation& location, const std::string& base) {
    const std::string exact = metadata::RecordName(base);
    std::vector<std::string> records;
    for (const auto& object : location.List("")) {
        if (object.name == exact) {
            records.assign(1, exact);
            break;
        }
        if (EndsWith(object.name, constants::kMetadataExt)) {
            records.push_back(object.name);
        }
    }
    if (records.empty()) {
        return std::nullopt;
    }
    if (records.front() != exact) {
        if (records.size() > 1) {
            log::Warn(std::string(kComponent) + ": " + exact + " not found and " + std::to_string(records.size()) +
                      " other metadata records are present; ignoring them");
            return std::nullopt;
        }
        log::Warn(std::string(kComponent) + ": " + exact + " not found, using " + records.front());
    }
    auto reader = location.Open(records.front());
    return ReadAll(*reader);
}

// ---------------------------------------------------------------------------
// Reader stage

PartReaderSource::PartReaderSource(PartLocation& location, DiscoveredParts parts,
                                   progress::ProgressAggregator* progress, std::size_t chunk_size)
    : location_(location), parts_(std::move(parts)), progress_(progress), chunk_size_(std::max<std::size_t>(chunk_size, 1)) {}

void PartReaderSource::Produce(stream::ChunkSink& out, const stream::CancelToken& cancel) {
    stream::Bytes buffer(chunk_size_);
    held_bytes_ = 0;
    for (std::uint32_t index = 0; index < parts_.parts.size(); ++index) {
        const sink::ObjectInfo& part = parts_.parts[index];
        cancel.ThrowIfCancelled(Name());
        log::Debug(std::string(kComponent) + ": reading " + part.name);
        auto reader = location_.Open(part.name);
        std::uint64_t read = 0;
        for (;;) {
            cancel.ThrowIfCancelled(Name());
            std::size_t n = reader->Read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            read += n;
            out.Write(buffer.data(), n);
            if (progress_ && held_bytes_ > 0) {
                progress_->Report(held_bytes_, held_index_);
            }
            held_bytes_ = n;
            held_index_ = index;
        }
        if (read != part.size) {
            throw PartIOError(Name(), part.name + " changed while reading: expected " + std::to_string(part.size) +
                                          " bytes, got " + std::to_string(read));
        }
    }
}

void PartReaderSource::ReportHeld() {
    if (progress_ && held_bytes_ > 0) {
        progress_->Report(held_bytes_, held_index_);
    }
    held_bytes_ = 0;
}

}  // namespace archivedir::parts
