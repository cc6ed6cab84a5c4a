#include "archivedir/archive.hpp"

#include "archivedir/constants.hpp"
#include "archivedir/errors.hpp"
#include "archivedir/log.hpp"

#include <fcntl.h>
#include <fnmatch.h>
#include <sys/stat.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstring>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string_view>
#include <system_error>
#include <utility>

namespace archivedir::archive {

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kTarBlockSize = 512;
constexpr std::string_view kLongLinkName = "././@LongLink";
constexpr std::uint64_t kMaxLongNameSize = 1u << 20;

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char pad[12];
};

static_assert(sizeof(TarHeader) == kTarBlockSize, "Tar header must be 512 bytes");

const std::array<std::uint8_t, kTarBlockSize> kZeroBlock{};

std::uint64_t PadFor(std::uint64_t size) {
    return (kTarBlockSize - (size % kTarBlockSize)) % kTarBlockSize;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
    return value.size() >= prefix.size() && value.substr(0, prefix.size()) == prefix;
}

void WriteOctal(char* dest, std::size_t size, std::uint64_t value) {
    std::snprintf(dest, size, "%0*llo", static_cast<int>(size - 1),
                  static_cast<unsigned long long>(value));
}

// Octal when it fits in size-1 digits, otherwise GNU base-256.
void WriteNumeric(char* dest, std::size_t size, std::uint64_t value) {
    const unsigned bits = static_cast<unsigned>(3 * (size - 1));
    if (bits >= 64 || value < (std::uint64_t{1} << bits)) {
        WriteOctal(dest, size, value);
        return;
    }
    std::memset(dest, 0, size);
    dest[0] = static_cast<char>(0x80);
    for (std::size_t i = size - 1; i > 0 && value != 0; --i) {
        dest[i] = static_cast<char>(value & 0xFF);
        value >>= 8;
    }
}

std::uint64_t ParseOctal(const char* data, std::size_t size) {
    std::uint64_t value = 0;
    for (std::size_t i = 0; i < size; ++i) {
        char ch = data[i];
        if (ch == '\0' || ch == ' ') {
            continue;
        }
        if (ch < '0' || ch > '7') {
            break;
        }
        value = (value << 3) + static_cast<std::uint64_t>(ch - '0');
    }
    return value;
}

std::uint64_t ParseNumeric(const char* data, std::size_t size) {
    if (static_cast<unsigned char>(data[0]) & 0x80) {
        std::uint64_t value = 0;
        for (std::size_t i = 1; i < size; ++i) {
            value = (value << 8) | static_cast<unsigned char>(data[i]);
        }
        return value;
    }
    return ParseOctal(data, size);
}

unsigned int HeaderChecksum(const TarHeader& header) {
    const unsigned char* bytes = reinterpret_cast<const unsigned char*>(&header);
    const std::size_t chk_begin = offsetof(TarHeader, chksum);
    const std::size_t chk_end = chk_begin + sizeof(header.chksum);
    unsigned int sum = 0;
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        sum += (i >= chk_begin && i < chk_end) ? static_cast<unsigned char>(' ') : bytes[i];
    }
    return sum;
}

bool SplitTarName(const std::string& full, std::string& name, std::string& prefix) {
    if (full.size() <= sizeof(TarHeader::name)) {
        name = full;
        prefix.clear();
        return true;
    }
    if (full.size() > sizeof(TarHeader::name) + sizeof(TarHeader::prefix)) {
        return false;
    }
    auto pos = full.rfind('/');
    while (pos != std::string::npos) {
        std::string candidate_prefix = full.substr(0, pos);
        std::string candidate_name = full.substr(pos + 1);
        if (!candidate_name.empty() && candidate_name.size() <= sizeof(TarHeader::name)
            && candidate_prefix.size() <= sizeof(TarHeader::prefix)) {
            name = candidate_name;
            prefix = candidate_prefix;
            return true;
        }
        if (pos == 0) {
            break;
        }
        pos = full.rfind('/', pos - 1);
    }
    return false;
}

std::string FieldString(const char* field, std::size_t size) {
    return std::string(field, strnlen(field, size));
}

std::string ExtractName(const TarHeader& header) {
    std::string name = FieldString(header.name, sizeof(header.name));
    std::string prefix = FieldString(header.prefix, sizeof(header.prefix));
    if (!prefix.empty()) {
        return prefix + "/" + name;
    }
    return name;
}

bool IsAllZero(const std::uint8_t* block) {
    return std::memcmp(block, kZeroBlock.data(), kTarBlockSize) == 0;
}

struct EntryInfo {
    char type = '0';
    std::uint32_t mode = 0644;
    std::uint32_t uid = 0;
    std::uint32_t gid = 0;
    std::uint64_t size = 0;
    std::int64_t mtime = 0;
    std::string link_target;
};

bool StatEntry(const fs::path& path, EntryInfo& info, std::string& error) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        error = std::strerror(errno);
        return false;
    }
    info.mode = static_cast<std::uint32_t>(st.st_mode & 07777);
    info.uid = static_cast<std::uint32_t>(st.st_uid);
    info.gid = static_cast<std::uint32_t>(st.st_gid);
    info.mtime = static_cast<std::int64_t>(st.st_mtime);
    info.size = 0;
    if (S_ISDIR(st.st_mode)) {
        info.type = '5';
    } else if (S_ISREG(st.st_mode)) {
        info.type = '0';
        info.size = static_cast<std::uint64_t>(st.st_size);
    } else if (S_ISLNK(st.st_mode)) {
        info.type = '2';
        std::error_code ec;
        fs::path target = fs::read_symlink(path, ec);
        if (ec) {
            error = ec.message();
            return false;
        }
        info.link_target = target.string();
    } else {
        info.type = 0;  // fifo, socket, device
    }
    return true;
}

// Coalesces header and data writes into chunk_size writes downstream.
class BlockWriter {
public:
    BlockWriter(stream::ChunkSink& out, std::size_t chunk_size)
        : out_(out), buffer_(std::max<std::size_t>(chunk_size, kTarBlockSize)) {}

    void Write(const std::uint8_t* data, std::size_t len) {
        while (len > 0) {
            std::size_t take = std::min(len, buffer_.size() - fill_);
            std::memcpy(buffer_.data() + fill_, data, take);
            fill_ += take;
            data += take;
            len -= take;
            if (fill_ == buffer_.size()) {
                Flush();
            }
        }
    }

    void Pad(std::uint64_t size) {
        std::uint64_t pad = PadFor(size);
        if (pad) {
            Write(kZeroBlock.data(), static_cast<std::size_t>(pad));
        }
    }

    void Flush() {
        if (fill_ > 0) {
            out_.Write(buffer_.data(), fill_);
            fill_ = 0;
        }
    }

private:
    stream::ChunkSink& out_;
    std::vector<std::uint8_t> buffer_;
    std::size_t fill_ = 0;
};

void WriteRawHeader(BlockWriter& writer, const std::string& name, const std::string& prefix,
                    const EntryInfo& info, char typeflag, const std::string& linkname) {
    TarHeader header{};
    std::memcpy(header.name, name.data(), std::min(name.size(), sizeof(header.name)));
    std::memcpy(header.prefix, prefix.data(), std::min(prefix.size(), sizeof(header.prefix)));
    std::memcpy(header.linkname, linkname.data(), std::min(linkname.size(), sizeof(header.linkname)));
    WriteNumeric(header.mode, sizeof(header.mode), info.mode);
    WriteNumeric(header.uid, sizeof(header.uid), info.uid);
    WriteNumeric(header.gid, sizeof(header.gid), info.gid);
    WriteNumeric(header.size, sizeof(header.size), typeflag == '0' || typeflag == 'L' || typeflag == 'K' ? info.size : 0);
    WriteNumeric(header.mtime, sizeof(header.mtime), static_cast<std::uint64_t>(std::max<std::int64_t>(info.mtime, 0)));
    header.typeflag = typeflag;
    std::memcpy(header.magic, "ustar", 5);
    std::memcpy(header.version, "00", 2);

    unsigned int sum = HeaderChecksum(header);
    std::snprintf(header.chksum, sizeof(header.chksum), "%06o", sum);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';

    writer.Write(reinterpret_cast<const std::uint8_t*>(&header), sizeof(TarHeader));
}

void WriteLongRecord(BlockWriter& writer, char typeflag, const std::string& value) {
    EntryInfo info;
    info.size = value.size() + 1;
    WriteRawHeader(writer, std::string(kLongLinkName), {}, info, typeflag, {});
    writer.Write(reinterpret_cast<const std::uint8_t*>(value.c_str()), value.size() + 1);
    writer.Pad(info.size);
}

void WriteHeader(BlockWriter& writer, const std::string& entry_name, const EntryInfo& info) {
    std::string name_field;
    std::string prefix_field;
    if (!SplitTarName(entry_name, name_field, prefix_field)) {
        WriteLongRecord(writer, 'L', entry_name);
        name_field = entry_name.substr(0, sizeof(TarHeader::name));
        prefix_field.clear();
    }
    std::string link_field = info.link_target;
    if (link_field.size() > sizeof(TarHeader::linkname)) {
        WriteLongRecord(writer, 'K', link_field);
        link_field.resize(sizeof(TarHeader::linkname));
    }
    WriteRawHeader(writer, name_field, prefix_field, info, info.type, link_field);
}

// Visits every entry under `source` that survives the filter, parents before
// children, siblings in name order. `visit(path, entry_name, info)` returns
// false when it skipped the entry.
template <typename Visit>
void WalkSource(const fs::path& source, const ExcludeFilter& filter, ScanSummary& summary,
                const stream::CancelToken* cancel, Visit&& visit) {
    const std::string root_name = SourceRootName(source);
    EntryInfo root_info;
    std::string error;
    if (!StatEntry(source, root_info, error)) {
        throw StageError("archive", "cannot read source " + source.string() + ": " + error);
    }

    auto count = [&summary](const EntryInfo& info) {
        if (info.type == '5') {
            ++summary.dirs;
        } else if (info.type == '2') {
            ++summary.symlinks;
        } else {
            ++summary.files;
            summary.bytes += info.size;
        }
    };

    struct Frame {
        fs::path path;
        std::string rel;
    };
    if (root_info.type != '5') {
        if (root_info.type != 0 && visit(source, root_name, root_info)) {
            count(root_info);
        }
        return;
    }
    if (visit(source, root_name + "/", root_info)) {
        count(root_info);
    }

    std::vector<Frame> stack{{source, std::string()}};
    while (!stack.empty()) {
        Frame frame = std::move(stack.back());
        stack.pop_back();
        if (cancel) {
            cancel->ThrowIfCancelled("archive");
        }

        std::vector<fs::path> children;
        std::error_code ec;
        fs::directory_iterator it(frame.path, ec);
        if (ec) {
            log::Warn("archive: skipping unreadable directory " + frame.path.string() + ": " + ec.message());
            continue;
        }
        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) {
                break;
            }
            children.push_back(it->path());
        }
        if (ec) {
            log::Warn("archive: incomplete listing of " + frame.path.string() + ": " + ec.message());
        }
        std::sort(children.begin(), children.end());

        // Subdirectories go on the stack in reverse so they pop in name order.
        std::vector<Frame> subdirs;
        for (const auto& child : children) {
            std::string leaf = child.filename().string();
            std::string rel = frame.rel.empty() ? leaf : frame.rel + "/" + leaf;
            if (filter.Matches(rel)) {
                ++summary.excluded;
                continue;
            }
            EntryInfo info;
            if (!StatEntry(child, info, error)) {
                log::Warn("archive: skipping " + child.string() + ": " + error);
                continue;
            }
            if (info.type == 0) {
                log::Debug("archive: skipping special file " + child.string());
                continue;
            }
            std::string entry_name = root_name + "/" + rel;
            if (info.type == '5') {
                if (visit(child, entry_name + "/", info)) {
                    count(info);
                    subdirs.push_back({child, rel});
                }
            } else if (visit(child, entry_name, info)) {
                count(info);
            }
        }
        for (auto rit = subdirs.rbegin(); rit != subdirs.rend(); ++rit) {
            stack.push_back(std::move(*rit));
        }
    }
}

std::string RandomToken() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    return std::to_string(gen());
}

void SetMtime(const fs::path& path, std::int64_t mtime, bool no_follow) {
    struct timespec times[2];
    times[0].tv_sec = static_cast<time_t>(mtime);
    times[0].tv_nsec = 0;
    times[1] = times[0];
    if (::utimensat(AT_FDCWD, path.c_str(), times, no_follow ? AT_SYMLINK_NOFOLLOW : 0) != 0) {
        throw StageError("extract", "cannot set mtime on " + path.string() + ": " + std::strerror(errno));
    }
}

void RemoveExisting(const fs::path& path) {
    std::error_code ec;
    auto status = fs::symlink_status(path, ec);
    if (!ec && fs::exists(status) && !fs::is_directory(status)) {
        fs::remove(path);
    }
}

// True when a component of `rel` below `root` is already a symlink. The leaf
// itself is only checked when `include_leaf` is set.
bool CrossesSymlink(const fs::path& root, const std::string& rel, bool include_leaf) {
    fs::path rel_path(rel);
    fs::path current = root;
    auto end = rel_path.end();
    if (!include_leaf && rel_path.begin() != end) {
        end = std::prev(end);
    }
    for (auto it = rel_path.begin(); it != end; ++it) {
        current /= *it;
        std::error_code ec;
        auto status = fs::symlink_status(current, ec);
        if (ec) {
            return false;
        }
        if (fs::is_symlink(status)) {
            return true;
        }
    }
    return false;
}

// Moves `src` to `dst`, merging directories and replacing files.
void MoveInto(const fs::path& src, const fs::path& dst) {
    std::error_code ec;
    auto dst_status = fs::symlink_status(dst, ec);
    if (ec || !fs::exists(dst_status)) {
        fs::rename(src, dst);
        return;
    }
    auto src_status = fs::symlink_status(src);
    if (fs::is_directory(src_status) && fs::is_directory(dst_status)) {
        for (const auto& child : fs::directory_iterator(src)) {
            MoveInto(child.path(), dst / child.path().filename());
        }
        fs::remove(src);
        return;
    }
    if (fs::is_directory(dst_status)) {
        fs::remove_all(dst);
    } else {
        fs::remove(dst);
    }
    fs::rename(src, dst);
}

}  // namespace

const std::vector<std::string>& DefaultExclusions() {
    static const std::vector<std::string> kDefaults = {
        // system directories
        "Library/*",
        "System/*",
        ".Trash/*",
        ".cache/*",
        ".local/share/Trash/*",
        "applications/*",
        // Dart/Flutter build output
        "*.dill",
        "*.snapshot",
        ".dart_tool/flutter_build/*",
        ".dart_tool/chrome-device/*",
        "build/flutter_assets/*",
        "build/web/*",
        // general build artifacts
        "node_modules/*",
        ".DS_Store",
        "*.tmp",
        "*.temp",
        "*.log",
        // caches
        "__pycache__/*",
        "cache/*",
        "tmp/*",
        // disk images
        "*.dmg",
    };
    return kDefaults;
}

ExcludeFilter::ExcludeFilter(std::vector<std::string> patterns) : patterns_(std::move(patterns)) {}

ExcludeFilter ExcludeFilter::Build(const std::vector<std::string>& extra, bool include_problematic) {
    std::vector<std::string> patterns;
    if (!include_problematic) {
        patterns = DefaultExclusions();
    }
    for (const auto& pattern : extra) {
        if (!pattern.empty()) {
            patterns.push_back(pattern);
        }
    }
    return ExcludeFilter(std::move(patterns));
}

bool ExcludeFilter::Matches(const std::string& rel_path) const {
    std::string_view rel(rel_path);
    auto slash = rel.rfind('/');
    std::string basename(slash == std::string_view::npos ? rel : rel.substr(slash + 1));
    for (const auto& pattern : patterns_) {
        std::string_view pat(pattern);
        if (pat.size() >= 2 && pat.substr(pat.size() - 2) == "/*") {
            std::string_view prefix = pat.substr(0, pat.size() - 2);
            if (rel == prefix || (StartsWith(rel, prefix) && rel.size() > prefix.size() && rel[prefix.size()] == '/')) {
                return true;
            }
        } else if (pat.find('*') != std::string_view::npos) {
            if (::fnmatch(pattern.c_str(), basename.c_str(), 0) == 0
                || ::fnmatch(pattern.c_str(), rel_path.c_str(), 0) == 0) {
                return true;
            }
        } else if (rel == pat || (StartsWith(rel, pat) && rel.size() > pat.size() && rel[pat.size()] == '/')) {
            return true;
        }
    }
    return false;
}

std::string SourceRootName(const fs::path& source) {
    fs::path abs = fs::absolute(source).lexically_normal();
    if (!abs.has_filename()) {
        abs = abs.parent_path();
    }
    std::string name = abs.filename().string();
    if (name.empty()) {
        name = "root";
    }
    return name;
}

ScanSummary ScanSources(const std::vector<fs::path>& sources, const ExcludeFilter& filter) {
    ScanSummary summary;
    for (const auto& source : sources) {
        WalkSource(source, filter, summary, nullptr,
                   [](const fs::path&, const std::string&, const EntryInfo&) { return true; });
    }
    return summary;
}

bool IsSafePath(const fs::path& dest_dir, const std::string& name) {
    fs::path rel(name);
    if (rel.is_absolute() || rel.has_root_name() || rel.has_root_directory()) {
        return false;
    }
    for (const auto& part : rel) {
        if (part == "..") {
            return false;
        }
    }
    auto base = dest_dir.lexically_normal();
    auto full = (dest_dir / rel).lexically_normal();
    auto mismatch = std::mismatch(base.begin(), base.end(), full.begin(), full.end());
    return mismatch.first == base.end() || (std::next(mismatch.first) == base.end() && mismatch.first->empty());
}

// ---------------------------------------------------------------------------
// TarWriter

TarWriter::TarWriter(std::vector<fs::path> sources, ExcludeFilter filter, std::size_t chunk_size)
    : sources_(std::move(sources)), filter_(std::move(filter)), chunk_size_(chunk_size) {
    if (sources_.empty()) {
        throw StageError(Name(), "no sources to archive");
    }
}

void TarWriter::Produce(stream::ChunkSink& out, const stream::CancelToken& cancel) {
    written_ = ScanSummary{};
    BlockWriter writer(out, chunk_size_);
    std::vector<std::uint8_t> buffer(std::max<std::size_t>(chunk_size_, kTarBlockSize));

    auto visit = [&](const fs::path& path, const std::string& entry_name, const EntryInfo& info) {
        if (info.type != '0') {
            WriteHeader(writer, entry_name, info);
            return true;
        }
        std::unique_ptr<filestream::FileReader> reader;
        try {
            reader = std::make_unique<filestream::FileReader>(path);
        } catch (const std::runtime_error& exc) {
            log::Warn("archive: skipping " + path.string() + ": " + exc.what());
            return false;
        }
        WriteHeader(writer, entry_name, info);
        std::uint64_t remaining = info.size;
        while (remaining > 0) {
            cancel.ThrowIfCancelled(Name());
            std::size_t want = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
            std::size_t got = reader->Read(buffer.data(), want);
            if (got == 0) {
                throw StageError(Name(), "file shrank while archiving: " + path.string());
            }
            writer.Write(buffer.data(), got);
            remaining -= got;
        }
        writer.Pad(info.size);
        return true;
    };

    for (const auto& source : sources_) {
        cancel.ThrowIfCancelled(Name());
        log::Debug("archive: adding " + source.string() + " as " + SourceRootName(source));
        WalkSource(source, filter_, written_, &cancel, visit);
    }

    writer.Write(kZeroBlock.data(), kZeroBlock.size());
    writer.Write(kZeroBlock.data(), kZeroBlock.size());
    writer.Flush();
}

// ---------------------------------------------------------------------------
// TarExtractor

struct TarExtractor::Impl {
    enum class State { Header, Data, Pad, End };
    enum class DataKind { File, Skip, LongName, LongLink };

    struct PendingDir {
        std::string rel;
        std::uint32_t mode;
        std::int64_t mtime;
    };

    fs::path dest;
    fs::path staging;
    bool created_dest = false;
    bool finished = false;

    State state = State::Header;
    DataKind kind = DataKind::Skip;
    std::array<std::uint8_t, kTarBlockSize> header{};
    std::size_t header_fill = 0;
    std::uint64_t remaining = 0;
    std::uint64_t pad = 0;

    std::unique_ptr<filestream::FileWriter> file;
    fs::path file_path;
    std::uint32_t file_mode = 0644;
    std::int64_t file_mtime = 0;
    std::uint64_t file_size = 0;

    std::string long_buffer;
    std::string pending_name;
    std::string pending_link;
    std::vector<PendingDir> dirs;
};

TarExtractor::TarExtractor(fs::path dest_dir) : impl_(std::make_unique<Impl>()) {
    impl_->dest = std::move(dest_dir);
    std::error_code ec;
    if (!fs::exists(impl_->dest, ec)) {
        if (!fs::create_directories(impl_->dest, ec) || ec) {
            throw StageError(Name(), "cannot create destination " + impl_->dest.string() + ": " + ec.message());
        }
        impl_->created_dest = true;
    } else if (!fs::is_directory(impl_->dest, ec)) {
        throw StageError(Name(), "destination is not a directory: " + impl_->dest.string());
    }
    for (int i = 0; i < 64; ++i) {
        fs::path candidate = impl_->dest / (std::string(constants::kExtractStagingPrefix) + RandomToken());
        if (fs::create_directory(candidate, ec)) {
            impl_->staging = candidate;
            break;
        }
    }
    if (impl_->staging.empty()) {
        throw StageError(Name(), "cannot create staging directory in " + impl_->dest.string());
    }
}

TarExtractor::~TarExtractor() {
    if (impl_ && !impl_->finished) {
        Abort();
    }
}

void TarExtractor::Write(const std::uint8_t* data, std::size_t len) {
    Impl& s = *impl_;
    auto finish_entry = [&] {
        if (s.kind == Impl::DataKind::File) {
            s.file->Close();
            s.file.reset();
            std::error_code ec;
            fs::permissions(s.file_path, static_cast<fs::perms>(s.file_mode & 07777), ec);
            if (ec) {
                throw StageError(Name(), "cannot set permissions on " + s.file_path.string() + ": " + ec.message());
            }
            SetMtime(s.file_path, s.file_mtime, false);
            ++extracted_.files;
            extracted_.bytes += s.file_size;
        } else if (s.kind == Impl::DataKind::LongName) {
            s.pending_name = s.long_buffer.c_str();
        } else if (s.kind == Impl::DataKind::LongLink) {
            s.pending_link = s.long_buffer.c_str();
        }
        s.state = s.pad > 0 ? Impl::State::Pad : Impl::State::Header;
    };

    auto handle_header = [&] {
        if (IsAllZero(s.header.data())) {
            s.state = Impl::State::End;
            return;
        }
        TarHeader header;
        std::memcpy(&header, s.header.data(), sizeof(header));
        std::uint64_t stored = ParseOctal(header.chksum, sizeof(header.chksum));
        if (stored != HeaderChecksum(header)) {
            throw StageError(Name(), "tar header checksum mismatch", true);
        }

        std::uint64_t size = ParseNumeric(header.size, sizeof(header.size));
        char type = header.typeflag;
        s.remaining = size;
        s.pad = PadFor(size);
        s.kind = Impl::DataKind::Skip;

        if (type == 'L' || type == 'K') {
            if (size > kMaxLongNameSize) {
                throw StageError(Name(), "tar long-name record too large", true);
            }
            s.kind = type == 'L' ? Impl::DataKind::LongName : Impl::DataKind::LongLink;
            s.long_buffer.clear();
            s.state = Impl::State::Data;
            if (size == 0) {
                finish_entry();
            }
            return;
        }

        std::string name = s.pending_name.empty() ? ExtractName(header) : s.pending_name;
        std::string link = s.pending_link.empty() ? FieldString(header.linkname, sizeof(header.linkname))
                                                  : s.pending_link;
        s.pending_name.clear();
        s.pending_link.clear();
        while (!name.empty() && name.back() == '/') {
            name.pop_back();
        }
        while (StartsWith(name, "./")) {
            name.erase(0, 2);
        }

        std::uint32_t mode = static_cast<std::uint32_t>(ParseNumeric(header.mode, sizeof(header.mode)));
        std::int64_t mtime = static_cast<std::int64_t>(ParseNumeric(header.mtime, sizeof(header.mtime)));

        if (name.empty() || name == ".") {
            s.state = Impl::State::Data;
            if (size == 0) {
                finish_entry();
            }
            return;
        }
        if (!IsSafePath(s.staging, name)) {
            throw StageError(Name(), "unsafe tar entry: " + name, true);
        }
        if (CrossesSymlink(s.staging, name, type == '5')) {
            throw StageError(Name(), "tar entry passes through a symlink: " + name, true);
        }
        roots_.insert((*fs::path(name).begin()).string());
        fs::path out_path = s.staging / fs::path(name);

        if (type == '5') {
            fs::create_directories(out_path);
            s.dirs.push_back({name, mode, mtime});
            ++extracted_.dirs;
        } else if (type == '0' || type == '\0' || type == '7') {
            fs::create_directories(out_path.parent_path());
            RemoveExisting(out_path);
            s.file = std::make_unique<filestream::FileWriter>(out_path);
            s.file_path = out_path;
            s.file_mode = mode;
            s.file_mtime = mtime;
            s.file_size = size;
            s.kind = Impl::DataKind::File;
        } else if (type == '2') {
            fs::create_directories(out_path.parent_path());
            RemoveExisting(out_path);
            fs::create_symlink(fs::path(link), out_path);
            SetMtime(out_path, mtime, true);
            ++extracted_.symlinks;
        } else if (type == '1') {
            if (!IsSafePath(s.staging, link)) {
                throw StageError(Name(), "unsafe hard link target: " + link, true);
            }
            if (CrossesSymlink(s.staging, link, true)) {
                throw StageError(Name(), "hard link target passes through a symlink: " + link, true);
            }
            fs::create_directories(out_path.parent_path());
            RemoveExisting(out_path);
            fs::create_hard_link(s.staging / fs::path(link), out_path);
            ++extracted_.files;
        } else {
            log::Debug(std::string("extract: skipping entry of type '") + type + "': " + name);
        }

        s.state = Impl::State::Data;
        if (size == 0) {
            finish_entry();
        }
    };

    while (len > 0) {
        switch (s.state) {
            case Impl::State::Header: {
                std::size_t take = std::min(len, kTarBlockSize - s.header_fill);
                std::memcpy(s.header.data() + s.header_fill, data, take);
                s.header_fill += take;
                data += take;
                len -= take;
                if (s.header_fill == kTarBlockSize) {
                    s.header_fill = 0;
                    handle_header();
                }
                break;
            }
            case Impl::State::Data: {
                std::size_t take = static_cast<std::size_t>(std::min<std::uint64_t>(len, s.remaining));
                if (s.kind == Impl::DataKind::File) {
                    s.file->Write(data, take);
                } else if (s.kind == Impl::DataKind::LongName || s.kind == Impl::DataKind::LongLink) {
                    s.long_buffer.append(reinterpret_cast<const char*>(data), take);
                }
                data += take;
                len -= take;
                s.remaining -= take;
                if (s.remaining == 0) {
                    finish_entry();
                }
                break;
            }
            case Impl::State::Pad: {
                std::size_t take = static_cast<std::size_t>(std::min<std::uint64_t>(len, s.pad));
                data += take;
                len -= take;
                s.pad -= take;
                if (s.pad == 0) {
                    s.state = Impl::State::Header;
                }
                break;
            }
            case Impl::State::End:
                // trailing zero blocks / record padding
                len = 0;
                break;
        }
    }
}

void TarExtractor::Close() {
    Impl& s = *impl_;
    if (s.state != Impl::State::End) {
        throw StageError(Name(), "tar stream is truncated", true);
    }

    for (const auto& child : fs::directory_iterator(s.staging)) {
        MoveInto(child.path(), s.dest / child.path().filename());
    }
    fs::remove(s.staging);

    // Deepest first so restoring a read-only mode never blocks a child.
    std::sort(s.dirs.begin(), s.dirs.end(),
              [](const Impl::PendingDir& a, const Impl::PendingDir& b) { return a.rel > b.rel; });
    for (const auto& dir : s.dirs) {
        fs::path path = s.dest / fs::path(dir.rel);
        SetMtime(path, dir.mtime, false);
        std::error_code ec;
        fs::permissions(path, static_cast<fs::perms>(dir.mode & 07777), ec);
        if (ec) {
            throw StageError(Name(), "cannot set permissions on " + path.string() + ": " + ec.message());
        }
    }
    s.finished = true;
    log::Info("extract: restored " + std::to_string(extracted_.files) + " files, " +
              std::to_string(extracted_.dirs) + " directories into " + s.dest.string());
}

void TarExtractor::Abort() noexcept {
    Impl& s = *impl_;
    if (s.finished) {
        return;
    }
    s.file.reset();
    std::error_code ec;
    if (!s.staging.empty()) {
        fs::remove_all(s.staging, ec);
    }
    if (s.created_dest && fs::is_empty(s.dest, ec) && !ec) {
        fs::remove(s.dest, ec);
    }
    s.finished = true;
}

}  // namespace archivedir::archive
