#include "archivedir/destination.hpp"

#include "archivedir/errors.hpp"

#include <filesystem>

namespace archivedir::destination {

namespace {

constexpr std::string_view kS3Scheme = "s3://";
constexpr std::string_view kGsScheme = "gs://";
constexpr std::string_view kDriveScheme = "gdrive://";
constexpr std::string_view kOneDriveScheme = "onedrive://";
constexpr std::string_view kDriveIdTag = "id:";
constexpr std::string_view kDriveFoldersMarker = "/folders/";

bool StartsWith(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

// Drops leading/trailing slashes and collapses "//".
std::string CleanRemotePath(std::string_view path) {
    std::string out;
    out.reserve(path.size());
    for (char ch : path) {
        if (ch == '/' && (out.empty() || out.back() == '/')) {
            continue;
        }
        out.push_back(ch);
    }
    while (!out.empty() && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

std::string JoinRemote(const std::string& base, const std::string& name) {
    if (base.empty()) {
        return CleanRemotePath(name);
    }
    return base + "/" + CleanRemotePath(name);
}

bool IsDriveUrl(std::string_view spec) {
    return (StartsWith(spec, "https://drive.google.com/") || StartsWith(spec, "http://drive.google.com/"))
           && spec.find(kDriveFoldersMarker) != std::string_view::npos;
}

}  // namespace

const char* KindName(Kind kind) {
    switch (kind) {
        case Kind::Local: return "local";
        case Kind::S3: return "s3";
        case Kind::DriveFolderPath: return "gdrive-path";
        case Kind::DriveFolderId: return "gdrive-id";
        case Kind::OneDrive: return "onedrive";
    }
    return "unknown";
}

std::string Destination::Provider() const {
    switch (kind) {
        case Kind::Local: return "local";
        case Kind::S3: return "s3";
        case Kind::DriveFolderPath:
        case Kind::DriveFolderId: return "gdrive";
        case Kind::OneDrive: return "onedrive";
    }
    return "unknown";
}

Destination Destination::Child(const std::string& name) const {
    Destination child = *this;
    if (kind == Kind::Local) {
        child.path = (std::filesystem::path(path) / name).string();
    } else {
        child.path = JoinRemote(path, name);
    }
    return child;
}

std::string Destination::ToString() const {
    switch (kind) {
        case Kind::Local:
            return path;
        case Kind::S3:
            return std::string(kS3Scheme) + bucket + (path.empty() ? "" : "/" + path);
        case Kind::DriveFolderPath:
            return std::string(kDriveScheme) + path;
        case Kind::DriveFolderId:
            return std::string(kDriveScheme) + std::string(kDriveIdTag) + folder_id + (path.empty() ? "" : "/" + path);
        case Kind::OneDrive:
            return std::string(kOneDriveScheme) + path;
    }
    return path;
}

Destination Parse(std::string_view spec) {
    if (spec.empty()) {
        throw ConfigError("destination is empty");
    }
    Destination dest;

    if (StartsWith(spec, kS3Scheme)) {
        std::string rest = CleanRemotePath(spec.substr(kS3Scheme.size()));
        auto slash = rest.find('/');
        dest.kind = Kind::S3;
        dest.bucket = rest.substr(0, slash);
        dest.path = slash == std::string::npos ? std::string() : rest.substr(slash + 1);
        if (dest.bucket.empty()) {
            throw ConfigError("s3 destination has no bucket: " + std::string(spec));
        }
        return dest;
    }

    if (StartsWith(spec, kGsScheme) || StartsWith(spec, kDriveScheme)) {
        std::string_view rest = spec.substr(StartsWith(spec, kGsScheme) ? kGsScheme.size() : kDriveScheme.size());
        if (StartsWith(rest, kDriveIdTag)) {
            std::string tail = CleanRemotePath(rest.substr(kDriveIdTag.size()));
            auto slash = tail.find('/');
            dest.kind = Kind::DriveFolderId;
            dest.folder_id = tail.substr(0, slash);
            dest.path = slash == std::string::npos ? std::string() : tail.substr(slash + 1);
            if (dest.folder_id.empty()) {
                throw ConfigError("drive destination has an empty folder id: " + std::string(spec));
            }
            return dest;
        }
        dest.kind = Kind::DriveFolderPath;
        dest.path = CleanRemotePath(rest);
        if (dest.path.empty()) {
            throw ConfigError("drive destination has no folder path: " + std::string(spec));
        }
        return dest;
    }

    if (IsDriveUrl(spec)) {
        auto pos = spec.find(kDriveFoldersMarker) + kDriveFoldersMarker.size();
        std::string_view id = spec.substr(pos);
        auto end = id.find_first_of("/?#");
        if (end != std::string_view::npos) {
            id = id.substr(0, end);
        }
        if (id.empty()) {
            throw ConfigError("drive folder URL has no folder id: " + std::string(spec));
        }
        dest.kind = Kind::DriveFolderId;
        dest.folder_id = std::string(id);
        return dest;
    }

    if (StartsWith(spec, kOneDriveScheme)) {
        dest.kind = Kind::OneDrive;
        dest.path = CleanRemotePath(spec.substr(kOneDriveScheme.size()));
        if (dest.path.empty()) {
            throw ConfigError("onedrive destination has no folder path: " + std::string(spec));
        }
        return dest;
    }

    if (spec.find("://") != std::string_view::npos) {
        throw ConfigError("unsupported destination scheme: " + std::string(spec));
    }
    dest.kind = Kind::Local;
    dest.path = std::string(spec);
    return dest;
}

}  // namespace archivedir::destination
