#include "archivedir/sink.hpp"

#include "archivedir/constants.hpp"
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

std::string RandomToken() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return std::to_string(gen());
}

}  // namespace

// ---------------------------------------------------------------------------
// LocalSink

LocalSink::LocalSink(fs::path dir) : dir_(std::move(dir)) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw PartIOError(Name(), "cannot create " + dir_.string() + ": " + ec.message());
    }
    if (!fs::is_directory(dir_, ec)) {
        throw PartIOError(Name(), "destination is not a directory: " + dir_.string());
    }
}

void LocalSink::Store(const PartFile& part, const stream::CancelToken& cancel) {
    cancel.ThrowIfCancelled(Name());
    fs::path final_path = dir_ / part.name;
    std::error_code ec;
    fs::rename(part.staged_path, final_path, ec);
    if (ec) {
        throw PartIOError(Name(), "cannot commit " + final_path.string() + ": " + ec.message());
    }
    log::Debug(Name() + ": committed " + final_path.string());
}

void LocalSink::StoreMetadata(const std::string& name, const std::string& content,
                              const stream::CancelToken& cancel) {
    cancel.ThrowIfCancelled(Name());
    fs::path tmp = dir_ / (name + std::string(constants::kStagingSuffix));
    try {
        filestream::FileWriter writer(tmp);
        writer.Write(reinterpret_cast<const std::uint8_t*>(content.data()), content.size());
        writer.Close();
    } catch (const std::runtime_error& exc) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw PartIOError(Name(), exc.what());
    }
    std::error_code ec;
    fs::rename(tmp, dir_ / name, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw PartIOError(Name(), "cannot commit " + (dir_ / name).string() + ": " + ec.message());
    }
}

void LocalSink::Discard(const std::vector<std::string>& names) noexcept {
    for (const auto& name : names) {
        std::error_code ec;
        fs::remove(dir_ / name, ec);
        if (ec) {
            log::Warn(Name() + ": could not remove " + (dir_ / name).string() + ": " + ec.message());
        }
    }
}

// ---------------------------------------------------------------------------
// RemoteSink

RemoteSink::RemoteSink(destination::Destination dest, std::shared_ptr<ObjectStoreClient> client,
                       retry::RetryPolicy policy, const fs::path& staging_root)
    : dest_(std::move(dest)), client_(std::move(client)), policy_(policy) {
    if (!client_) {
        throw SinkPermanentError(dest_.Provider() + "-sink",
                                 "no " + dest_.Provider() + " client configured for " + dest_.ToString() +
                                     " (set ARCHIVEDIR_OBJECT_STORE_ROOT for a mounted store)");
    }
    fs::path root = staging_root.empty() ? fs::temp_directory_path() : staging_root;
    staging_ = root / ("archivedir-staging-" + RandomToken());
    std::error_code ec;
    fs::create_directories(staging_, ec);
    if (ec) {
        throw PartIOError(Name(), "cannot create staging directory " + staging_.string() + ": " + ec.message());
    }
}

RemoteSink::~RemoteSink() {
    std::error_code ec;
    fs::remove_all(staging_, ec);
}

AttemptContext RemoteSink::NextAttempt(const stream::CancelToken& cancel) const {
    AttemptContext ctx;
    ctx.deadline = std::chrono::steady_clock::now() + policy_.attempt_timeout;
    ctx.cancel = &cancel;
    return ctx;
}

void RemoteSink::Store(const PartFile& part, const stream::CancelToken& cancel) {
    retry::Run(policy_, Name(), "upload of " + part.name, cancel, [&](std::uint32_t attempt) {
        log::Debug(Name() + ": uploading " + part.name + " (attempt " + std::to_string(attempt) + ")");
        client_->Upload(dest_, part.name, part.staged_path, NextAttempt(cancel));
    });
    std::error_code ec;
    fs::remove(part.staged_path, ec);
    if (ec) {
        log::Warn(Name() + ": could not remove staged " + part.staged_path.string() + ": " + ec.message());
    }
    log::Debug(Name() + ": committed " + dest_.ToString() + "/" + part.name);
}

void RemoteSink::StoreMetadata(const std::string& name, const std::string& content,
                               const stream::CancelToken& cancel) {
    retry::Run(policy_, Name(), "upload of " + name, cancel, [&](std::uint32_t) {
        client_->Put(dest_, name, content, NextAttempt(cancel));
    });
}

void RemoteSink::Discard(const std::vector<std::string>& names) noexcept {
    for (const auto& name : names) {
        try {
            client_->Remove(dest_, name);
        } catch (const std::exception& exc) {
            log::Warn(Name() + ": could not remove " + name + ": " + exc.what());
        }
    }
}

std::unique_ptr<DestinationSink> MakeSink(const destination::Destination& dest,
                                          std::shared_ptr<ObjectStoreClient> client,
                                          const retry::RetryPolicy& policy,
                                          const fs::path& staging_root) {
    if (!dest.IsRemote()) {
        return std::make_unique<LocalSink>(dest.path);
    }
    return std::make_unique<RemoteSink>(dest, std::move(client), policy, staging_root);
}

}  // namespace archivedir::sink
