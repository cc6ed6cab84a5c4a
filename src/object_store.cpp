#include "archivedir/object_store.hpp"

#include "archivedir/errors.hpp"
#include "archivedir/file_stream.hpp"
#include "archivedir/log.hpp"

#include <random>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace archivedir::sink {

namespace fs = std::filesystem;

namespace {

constexpr const char* kComponent = "object-store";

[[noreturn]] void ThrowFor(const std::error_code& ec, const std::string& what) {
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted
        || ec == std::errc::read_only_file_system) {
        throw SinkPermanentError(kComponent, what + ": " + ec.message());
    }
    throw SinkTransientError(kComponent, what + ": " + ec.message());
}

std::string UploadTempName(const std::string& name) {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return "." + name + ".upload-" + std::to_string(gen());
}

class FileObjectReader : public ObjectReader {
public:
    explicit FileObjectReader(const fs::path& path) : reader_(path) {}

    std::size_t Read(std::uint8_t* buffer, std::size_t max) override {
        try {
            return reader_.Read(buffer, max);
        } catch (const std::runtime_error& exc) {
            throw SinkTransientError(kComponent, exc.what());
        }
    }

private:
    filestream::FileReader reader_;
};

// Writes through a hidden temp name and renames into place, removing the
// temp file on any failure.
template <typename WriteBody>
void CommitObject(const fs::path& folder, const std::string& name, WriteBody&& write_body) {
    fs::path tmp = folder / UploadTempName(name);
    fs::path final_path = folder / name;
    try {
        filestream::FileWriter writer(tmp);
        write_body(writer);
        writer.Close();
    } catch (const Error&) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw;
    } catch (const std::runtime_error& exc) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw SinkTransientError(kComponent, exc.what());
    }
    std::error_code ec;
    fs::rename(tmp, final_path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        ThrowFor(ec, "cannot commit " + final_path.string());
    }
}

}  // namespace

void AttemptContext::Check(const std::string& component) const {
    if (cancel) {
        cancel->ThrowIfCancelled(component);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        throw SinkTransientError(component, "store attempt timed out");
    }
}

DirectoryObjectStore::DirectoryObjectStore(fs::path root) : root_(std::move(root)) {}

fs::path DirectoryObjectStore::Resolve(const destination::Destination& dest) const {
    using destination::Kind;
    fs::path base;
    switch (dest.kind) {
        case Kind::S3:
            base = root_ / "s3" / dest.bucket;
            break;
        case Kind::DriveFolderPath:
            base = root_ / "gdrive";
            break;
        case Kind::DriveFolderId:
            base = root_ / "gdrive-id" / dest.folder_id;
            break;
        case Kind::OneDrive:
            base = root_ / "onedrive";
            break;
        case Kind::Local:
            return fs::path(dest.path);
    }
    if (!dest.path.empty()) {
        base /= fs::path(dest.path);
    }
    return base;
}

fs::path DirectoryObjectStore::EnsureFolder(const destination::Destination& dest) const {
    std::error_code ec;
    if (!fs::is_directory(root_, ec)) {
        throw SinkPermanentError(kComponent, "object store root is not mounted: " + root_.string());
    }
    if (dest.kind == destination::Kind::S3 && !fs::is_directory(root_ / "s3" / dest.bucket, ec)) {
        throw SinkPermanentError(kComponent, "bucket does not exist: " + dest.bucket);
    }
    if (dest.kind == destination::Kind::DriveFolderId && !fs::is_directory(root_ / "gdrive-id" / dest.folder_id, ec)) {
        throw SinkPermanentError(kComponent, "drive folder id not found: " + dest.folder_id);
    }
    fs::path folder = Resolve(dest);
    fs::create_directories(folder, ec);
    if (ec) {
        ThrowFor(ec, "cannot create folder " + folder.string());
    }
    return folder;
}

void DirectoryObjectStore::Upload(const destination::Destination& dest, const std::string& name,
                                  const fs::path& file, const AttemptContext& ctx) {
    ctx.Check(kComponent);
    fs::path folder = EnsureFolder(dest);
    CommitObject(folder, name, [&](filestream::FileWriter& writer) {
        filestream::FileReader reader(file);
        std::vector<std::uint8_t> buffer(filestream::kDefaultChunkSize);
        for (;;) {
            ctx.Check(kComponent);
            std::size_t n = reader.Read(buffer.data(), buffer.size());
            if (n == 0) {
                break;
            }
            writer.Write(buffer.data(), n);
        }
    });
    log::Debug(std::string(kComponent) + ": stored " + (folder / name).string());
}

void DirectoryObjectStore::Put(const destination::Destination& dest, const std::string& name,
                               const std::string& content, const AttemptContext& ctx) {
    ctx.Check(kComponent);
    fs::path folder = EnsureFolder(dest);
    CommitObject(folder, name, [&](filestream::FileWriter& writer) {
        writer.Write(reinterpret_cast<const std::uint8_t*>(content.data()), content.size());
    });
}

std::vector<ObjectInfo> DirectoryObjectStore::List(const destination::Destination& dest, const std::string& prefix) {
    std::error_code ec;
    if (dest.kind == destination::Kind::S3 && !fs::is_directory(root_ / "s3" / dest.bucket, ec)) {
        throw SinkPermanentError(kComponent, "bucket does not exist: " + dest.bucket);
    }
    std::vector<ObjectInfo> objects;
    fs::path folder = Resolve(dest);
    if (!fs::is_directory(folder, ec)) {
        return objects;
    }
    fs::directory_iterator it(folder, ec);
    if (ec) {
        ThrowFor(ec, "cannot list " + folder.string());
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        if (ec) {
            ThrowFor(ec, "cannot list " + folder.string());
        }
        std::string name = it->path().filename().string();
        if (name.empty() || name.front() == '.' || name.compare(0, prefix.size(), prefix) != 0) {
            continue;
        }
        std::error_code size_ec;
        if (!it->is_regular_file(size_ec)) {
            continue;
        }
        std::uint64_t size = it->file_size(size_ec);
        if (size_ec) {
            ThrowFor(size_ec, "cannot stat " + it->path().string());
        }
        objects.push_back({name, size});
    }
    return objects;
}

std::unique_ptr<ObjectReader> DirectoryObjectStore::Open(const destination::Destination& dest, const std::string& name) {
    fs::path path = Resolve(dest) / name;
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw SinkPermanentError(kComponent, "object not found: " + path.string());
    }
    try {
        return std::make_unique<FileObjectReader>(path);
    } catch (const std::runtime_error& exc) {
        throw SinkTransientError(kComponent, exc.what());
    }
}

void DirectoryObjectStore::Remove(const destination::Destination& dest, const std::string& name) {
    fs::path path = Resolve(dest) / name;
    std::error_code ec;
    fs::remove(path, ec);
    if (ec) {
        ThrowFor(ec, "cannot remove " + path.string());
    }
}

}  // namespace archivedir::sink
