#pragma once

#include "archivedir/stream.hpp"

#include <sys/stat.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <random>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace archivedir::testing {

namespace fs = std::filesystem;

// Fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag = "test") {
        std::random_device rd;
        std::mt19937_64 gen(rd());
        path_ = fs::temp_directory_path() / ("archivedir-" + tag + "-" + std::to_string(gen()));
        fs::create_directories(path_);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const noexcept { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

inline void WriteFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Deterministic pseudo-random bytes; incompressible enough to span parts.
inline std::string RandomText(std::size_t size, std::uint32_t seed) {
    std::mt19937 gen(seed);
    std::string text(size, '\0');
    for (auto& ch : text) {
        ch = static_cast<char>(gen() & 0xFF);
    }
    return text;
}

inline stream::Bytes ToBytes(const std::string& text) {
    return stream::Bytes(text.begin(), text.end());
}

inline std::string ToString(const stream::Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

// A small tree: nested dirs, an empty file, a binary file, an executable
// script and a symlink.
inline void MakeSampleTree(const fs::path& root) {
    WriteFile(root / "readme.txt", "hello archive\n");
    WriteFile(root / "empty.dat", "");
    WriteFile(root / "docs" / "notes.md", std::string(5000, 'n'));
    WriteFile(root / "docs" / "deep" / "nested" / "blob.bin", RandomText(200000, 7));
    WriteFile(root / "bin" / "run.sh", "#!/bin/sh\necho hi\n");
    fs::permissions(root / "bin" / "run.sh", fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec);
    fs::create_directories(root / "empty_dir");
    fs::create_symlink("readme.txt", root / "link_to_readme");
}

// Relative path -> description of the entry (type, content, permissions).
inline std::map<std::string, std::string> Snapshot(const fs::path& root) {
    std::map<std::string, std::string> entries;
    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        const fs::path rel = fs::relative(it->path(), root);
        struct stat st {};
        ::lstat(it->path().c_str(), &st);
        std::ostringstream desc;
        if (S_ISLNK(st.st_mode)) {
            desc << "link:" << fs::read_symlink(it->path()).string();
        } else if (S_ISDIR(st.st_mode)) {
            desc << "dir:" << std::oct << (st.st_mode & 07777);
        } else {
            desc << "file:" << std::oct << (st.st_mode & 07777) << ":" << ReadFile(it->path());
        }
        entries[rel.generic_string()] = desc.str();
    }
    return entries;
}

inline std::vector<std::string> ListNames(const fs::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

}  // namespace archivedir::testing
