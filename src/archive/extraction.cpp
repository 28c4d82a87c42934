#include "fsgate/extraction.hpp"
#include "fsgate/path_utils.hpp"
#include "fsgate/platform.hpp"
#include "fsgate/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <zlib.h>

#include <sys/stat.h>
#include <unistd.h>

namespace fsgate {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_PREFIX_SIZE = 155;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_AREGTYPE = '\0';
static constexpr char TAR_CONTTYPE = '7';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[12];                 // 136
    char chksum[8];                 // 148
    char typeflag;                  // 156
    char linkname[100];             // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

namespace {

uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    for (size_t i = 0; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

TarEntryType entry_type(char typeflag) {
    switch (typeflag) {
        case TAR_REGTYPE:
        case TAR_AREGTYPE:
        case TAR_CONTTYPE:
            return TarEntryType::RegularFile;
        case TAR_DIRTYPE: return TarEntryType::Directory;
        case TAR_SYMTYPE: return TarEntryType::Symlink;
        case TAR_LNKTYPE: return TarEntryType::Hardlink;
        default: return TarEntryType::Other;
    }
}

bool is_zero_block(const std::vector<std::uint8_t>& data, size_t offset) {
    return std::all_of(data.begin() + static_cast<long>(offset),
                       data.begin() + static_cast<long>(offset + TAR_BLOCK_SIZE),
                       [](std::uint8_t b) { return b == 0; });
}

// Tracks what extraction created so a failure can undo it.
class Rollback {
public:
    ~Rollback() {
        if (committed_) return;
        for (auto it = files_.rbegin(); it != files_.rend(); ++it) {
            ::unlink(it->c_str());
        }
        for (auto it = dirs_.rbegin(); it != dirs_.rend(); ++it) {
            ::rmdir(it->c_str());
        }
    }

    void file(const std::string& path) { files_.push_back(path); }
    void dir(const std::string& path) { dirs_.push_back(path); }
    void commit() { committed_ = true; }

private:
    std::vector<std::string> files_;
    std::vector<std::string> dirs_;
    bool committed_ = false;
};

// Create every missing directory between root and path. Existing components
// must be real directories; a symlink anywhere is refused.
bool ensure_directory(const std::string& root, const std::string& path, Rollback& rollback,
                      std::string& error) {
    if (path.size() <= root.size()) return true;

    std::string current = root == "/" ? "" : root;
    std::string rest = path.substr(current.size() + 1);
    size_t pos = 0;
    while (pos <= rest.size()) {
        size_t slash = rest.find('/', pos);
        if (slash == std::string::npos) slash = rest.size();
        current += "/" + rest.substr(pos, slash - pos);
        pos = slash + 1;

        struct stat st {};
        if (::lstat(current.c_str(), &st) == 0) {
            if (S_ISLNK(st.st_mode)) {
                error = "Symlink traversal detected";
                return false;
            }
            if (!S_ISDIR(st.st_mode)) {
                error = "Not a directory";
                return false;
            }
            continue;
        }
        if (errno != ENOENT || ::mkdir(current.c_str(), 0755) != 0) {
            error = std::strerror(errno);
            return false;
        }
        rollback.dir(current);
    }
    return true;
}

bool write_all(int fd, const std::uint8_t* data, std::uint64_t size) {
    while (size > 0) {
        size_t step = static_cast<size_t>(std::min<std::uint64_t>(size, 1 << 20));
        ssize_t written = ::write(fd, data, step);
        if (written < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += written;
        size -= static_cast<std::uint64_t>(written);
    }
    return true;
}

} // namespace

// ============================================================================
// Guarded Inflate
// ============================================================================

InflateResult gzip_inflate_guarded(const std::vector<std::uint8_t>& compressed,
                                   const SecurityLimits& limits) {
    InflateResult result;

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // 15 window bits + 16: gzip wrapper, header and trailer checked by zlib
    if (inflateInit2(&strm, 15 + 16) != Z_OK) {
        result.error = "failed to initialize decompressor";
        return result;
    }

    DecompressionBudget budget(limits);
    std::vector<std::uint8_t> chunk(limits.chunk_size);
    size_t in_offset = 0;
    int ret = Z_OK;

    while (ret != Z_STREAM_END) {
        if (strm.avail_in == 0) {
            if (in_offset >= compressed.size()) {
                result.error = "truncated gzip stream";
                break;
            }
            size_t n = std::min(limits.chunk_size, compressed.size() - in_offset);
            strm.next_in = const_cast<Bytef*>(compressed.data() + in_offset);
            strm.avail_in = static_cast<uInt>(n);
            in_offset += n;
        }

        strm.next_out = chunk.data();
        strm.avail_out = static_cast<uInt>(chunk.size());
        uLong in_before = strm.total_in;

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR ||
            ret == Z_STREAM_ERROR) {
            result.error = std::string("corrupt gzip stream: ") + (strm.msg ? strm.msg : "inflate failed");
            break;
        }

        std::uint64_t produced = chunk.size() - strm.avail_out;
        std::uint64_t consumed = strm.total_in - in_before;
        if (!budget.account(consumed, produced)) {
            result.error = budget.error();
            spdlog::warn("decompression aborted: {}", budget.error());
            break;
        }
        result.data.insert(result.data.end(), chunk.begin(),
                           chunk.begin() + static_cast<long>(produced));
    }

    inflateEnd(&strm);

    if (!result.error.empty()) {
        result.data.clear();
        return result;
    }

    result.ok = true;
    result.compressed_bytes = budget.compressed_total();
    return result;
}

// ============================================================================
// Tar Parsing
// ============================================================================

TarParseResult parse_tar(const std::vector<std::uint8_t>& tar_data) {
    TarParseResult result;
    size_t offset = 0;

    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        if (is_zero_block(tar_data, offset)) break;

        const TarHeader* header = reinterpret_cast<const TarHeader*>(tar_data.data() + offset);

        std::string name;
        if (header->prefix[0] != '\0') {
            name = std::string(header->prefix, strnlen(header->prefix, TAR_PREFIX_SIZE));
            name += '/';
        }
        name += std::string(header->name, strnlen(header->name, TAR_NAME_SIZE));
        while (name.size() > 1 && name.back() == '/') {
            name.pop_back();
        }
        if (name.rfind("./", 0) == 0) {
            name = name.substr(2);
        }

        TarMember member;
        member.name = name;
        member.type = entry_type(header->typeflag);
        member.size = parse_octal(header->size, TAR_SIZE_SIZE);
        member.executable = (parse_octal(header->mode, TAR_MODE_SIZE) & 0111) != 0;
        member.data_offset = offset + TAR_BLOCK_SIZE;

        std::uint64_t data_size = member.type == TarEntryType::Directory ? 0 : member.size;
        if (member.data_offset + data_size > tar_data.size()) {
            result.error = "truncated archive: " + name;
            return result;
        }

        size_t blocks = static_cast<size_t>((data_size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE);
        offset = member.data_offset + blocks * TAR_BLOCK_SIZE;

        if (!name.empty() && name != ".") {
            result.members.push_back(std::move(member));
        }
    }

    result.ok = true;
    return result;
}

// ============================================================================
// Extraction
// ============================================================================

ExtractResult extract_tar_gz(const std::string& archive_path, const std::string& target_dir,
                             const SecurityLimits& limits) {
    ExtractResult result;

    auto format = detect_archive_format_file(archive_path);
    if (!format.ok) {
        result.error = format.error;
        return result;
    }
    if (format.format != ArchiveFormat::Gzip) {
        result.error = std::string("unsupported archive format: ") +
                       archive_format_to_string(format.format) + " (expected tar.gz)";
        return result;
    }

    if (!is_directory(target_dir)) {
        result.error = "target directory does not exist";
        return result;
    }
    auto target = resolve_real(target_dir);
    if (!target.ok) {
        result.error = target.error.message;
        return result;
    }
    const std::string& root = target.real_path;

    auto content = read_file(archive_path);
    if (!content) {
        result.error = "failed to open archive";
        return result;
    }
    std::vector<std::uint8_t> compressed(content->begin(), content->end());

    auto inflated = gzip_inflate_guarded(compressed, limits);
    if (!inflated.ok) {
        result.error = inflated.error;
        return result;
    }

    auto parsed = parse_tar(inflated.data);
    if (!parsed.ok) {
        result.error = parsed.error;
        return result;
    }

    // Everything is judged before the first byte is written.
    std::vector<ArchiveEntry> entries;
    entries.reserve(parsed.members.size());
    for (const auto& member : parsed.members) {
        if (member.type == TarEntryType::Symlink || member.type == TarEntryType::Hardlink) {
            result.error = "symlinks and hardlinks not permitted: " + member.name;
            return result;
        }
        if (member.type == TarEntryType::Other) {
            result.error = "unsupported entry type: " + member.name;
            return result;
        }
        entries.push_back({member.name, member.size});
    }

    auto validation = validate_archive_entries(entries, root, limits);
    if (!validation.valid) {
        result.invalid_entries = std::move(validation.invalid_entries);
        result.error = "archive contains " + std::to_string(result.invalid_entries.size()) +
                       " invalid entries";
        return result;
    }

    Rollback rollback;
    for (const auto& member : parsed.members) {
        auto destination = normalize_under_root(root, member.name);
        if (!destination.ok) {
            result.error = std::string(path_error_to_string(destination.error)) + ": " + member.name;
            return result;
        }

        std::string error;
        std::string dir = member.type == TarEntryType::Directory
                              ? destination.path
                              : get_parent_directory(destination.path);
        if (!ensure_directory(root, dir, rollback, error)) {
            result.error = error + ": " + member.name;
            return result;
        }

        if (member.type == TarEntryType::Directory) {
            result.entries.push_back(member.name);
            continue;
        }

        auto opened = open_no_follow(destination.path, OpenMode::Create);
        if (!opened.ok) {
            result.error = opened.error.message + ": " + member.name;
            return result;
        }
        rollback.file(destination.path);

        if (!write_all(opened.fd.get(), inflated.data.data() + member.data_offset, member.size)) {
            result.error = "failed to write file: " + member.name;
            return result;
        }
        if (member.executable) {
            ::fchmod(opened.fd.get(), 0755);
        }

        result.bytes_written += member.size;
        result.entries.push_back(member.name);
    }

    rollback.commit();
    spdlog::info("extracted {} entries ({} bytes)", result.entries.size(), result.bytes_written);
    result.ok = true;
    return result;
}

} // namespace fsgate
