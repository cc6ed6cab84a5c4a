#pragma once

#include <string>
#include <string_view>

namespace archivedir::destination {

enum class Kind {
    Local,
    S3,
    DriveFolderPath,
    DriveFolderId,
    OneDrive
};

const char* KindName(Kind kind);

// A resolved place where parts live. For S3 `bucket` is set and `path` is the
// key prefix; for the Drive id form `folder_id` is set and `path` is a
// sub-folder path below it; otherwise `path` is the folder path.
struct Destination {
    Kind kind = Kind::Local;
    std::string bucket;
    std::string folder_id;
    std::string path;

    bool IsRemote() const noexcept { return kind != Kind::Local; }
    // "local", "s3", "gdrive" or "onedrive"
    std::string Provider() const;
    // Same destination, one folder deeper.
    Destination Child(const std::string& name) const;
    // Canonical specifier ("s3://bucket/prefix", "gdrive://id:XYZ/sub", ...).
    std::string ToString() const;
};

// Accepts a local path, s3://bucket[/prefix], gs:// or gdrive://folder/path,
// gdrive://id:<ID>, https://drive.google.com/drive/folders/<ID> and
// onedrive://folder/path. Throws ConfigError on malformed specifiers.
Destination Parse(std::string_view spec);

}  // namespace archivedir::destination
