#include "fsgate/resolver.hpp"
#include "fsgate/error_format.hpp"
#include "fsgate/path_utils.hpp"

#include <spdlog/spdlog.h>

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <string>
#include <vector>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fsgate {

namespace {

// Same bound the kernel applies to nested symlinks during lookup.
constexpr int kMaxSymlinkHops = 40;

struct RealpathResult {
    bool ok = false;
    std::string path;
    int err = 0;
};

RealpathResult call_realpath(const std::string& path) {
    RealpathResult result;
    char* resolved = ::realpath(path.c_str(), nullptr);
    if (!resolved) {
        result.err = errno;
        return result;
    }
    result.ok = true;
    result.path = resolved;
    std::free(resolved);
    return result;
}

std::vector<std::string> components_of(const std::string& absolute_path) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : absolute_path) {
        if (c == '/') {
            if (!current.empty()) parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    if (!current.empty()) parts.push_back(current);
    return parts;
}

std::string join_from(const std::vector<std::string>& parts, size_t begin, size_t end) {
    std::string out;
    for (size_t i = begin; i < end; ++i) {
        out += '/';
        out += parts[i];
    }
    return out;
}

Error circular_symlink(const std::string& path) {
    return access_denied(path, "Circular symlink detected");
}

Error system_error(const std::string& path, int err) {
    return access_denied(path, sanitize_message(std::strerror(err)));
}

ResolveResult resolve_impl(const std::string& absolute_path, const std::string& requested,
                           int hops) {
    ResolveResult result;
    if (hops > kMaxSymlinkHops) {
        result.error = circular_symlink(requested);
        return result;
    }

    auto real = call_realpath(absolute_path);
    if (real.ok) {
        result.ok = true;
        result.exists = true;
        result.real_path = real.path;
        return result;
    }
    if (real.err == ELOOP) {
        result.error = circular_symlink(requested);
        return result;
    }
    if (real.err != ENOENT && real.err != ENOTDIR) {
        result.error = system_error(requested, real.err);
        return result;
    }

    // Longest prefix that names something, without following its leaf.
    auto parts = components_of(absolute_path);
    size_t existing = parts.size();
    struct stat st {};
    while (existing > 0) {
        if (::lstat(join_from(parts, 0, existing).c_str(), &st) == 0) break;
        --existing;
    }

    std::string tail = join_from(parts, existing, parts.size());
    if (existing == 0) {
        result.ok = true;
        result.real_path = tail.empty() ? "/" : tail;
        return result;
    }

    std::string prefix = join_from(parts, 0, existing);
    auto prefix_real = call_realpath(prefix);
    if (prefix_real.ok) {
        result.ok = true;
        result.real_path = prefix_real.path == "/" ? tail : prefix_real.path + tail;
        if (result.real_path.empty()) result.real_path = "/";
        return result;
    }
    if (prefix_real.err == ELOOP) {
        result.error = circular_symlink(requested);
        return result;
    }

    // Dangling symlink: follow its target textually so a missing path behind
    // a link is judged by where the link points.
    if (!S_ISLNK(st.st_mode)) {
        result.error = system_error(requested, prefix_real.err);
        return result;
    }

    std::vector<char> buf(PATH_MAX + 1);
    ssize_t len = ::readlink(prefix.c_str(), buf.data(), buf.size() - 1);
    if (len < 0) {
        result.error = system_error(requested, errno);
        return result;
    }
    std::string target(buf.data(), static_cast<size_t>(len));
    // A relative target is relative to where the link really lives, not to
    // the lexical path that reached it.
    std::string next = target;
    if (target.empty() || target[0] != '/') {
        std::string link_dir = join_from(parts, 0, existing - 1);
        auto dir_real = call_realpath(link_dir.empty() ? "/" : link_dir);
        if (!dir_real.ok) {
            result.error = dir_real.err == ELOOP ? circular_symlink(requested)
                                                 : system_error(requested, dir_real.err);
            return result;
        }
        next = (dir_real.path == "/" ? "" : dir_real.path) + "/" + target;
    }
    spdlog::debug("following dangling symlink hop {}", hops + 1);
    return resolve_impl(collapse_absolute(next + tail), requested, hops + 1);
}

} // namespace

ResolveResult resolve_real(const std::string& absolute_path) {
    return resolve_impl(absolute_path, absolute_path, 0);
}

bool is_symlink_no_follow(const std::string& path) {
    struct stat st {};
    if (::lstat(path.c_str(), &st) != 0) {
        return false;
    }
    return S_ISLNK(st.st_mode);
}

// ============================================================================
// UniqueFd
// ============================================================================

UniqueFd::~UniqueFd() {
    reset();
}

UniqueFd& UniqueFd::operator=(UniqueFd&& other) noexcept {
    if (this != &other) {
        reset(other.release());
    }
    return *this;
}

int UniqueFd::release() {
    int fd = fd_;
    fd_ = -1;
    return fd;
}

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

// ============================================================================
// No-follow open
// ============================================================================

OpenResult open_no_follow(const std::string& real_path, OpenMode mode) {
    OpenResult result;

    int flags = O_NOFOLLOW | O_CLOEXEC;
    switch (mode) {
        case OpenMode::Read: flags |= O_RDONLY; break;
        case OpenMode::Write: flags |= O_RDWR; break;
        case OpenMode::Create: flags |= O_WRONLY | O_CREAT | O_EXCL; break;
        case OpenMode::Directory: flags |= O_RDONLY | O_DIRECTORY; break;
    }

    int fd = ::open(real_path.c_str(), flags, 0644);
    if (fd < 0) {
        int err = errno;
        if (err == ELOOP) {
            result.error = access_denied(real_path, "Symlink traversal detected");
        } else if (err == ENOENT) {
            result.error = access_denied(real_path, "Path does not exist");
        } else if (err == EEXIST) {
            result.error = access_denied(real_path, "Path already exists");
        } else if (err == ENOTDIR) {
            result.error = access_denied(real_path, "Not a directory");
        } else {
            result.error = system_error(real_path, err);
        }
        spdlog::warn("open refused: {}", sanitize_message(result.error.message));
        return result;
    }
    result.fd.reset(fd);

    struct stat st {};
    if (::fstat(result.fd.get(), &st) != 0) {
        result.error = system_error(real_path, errno);
        result.fd.reset();
        return result;
    }

    bool want_dir = mode == OpenMode::Directory;
    if (want_dir && !S_ISDIR(st.st_mode)) {
        result.error = access_denied(real_path, "Not a directory");
        result.fd.reset();
        return result;
    }
    if (!want_dir && !S_ISREG(st.st_mode)) {
        result.error = access_denied(real_path, "Not a regular file");
        result.fd.reset();
        return result;
    }

    result.ok = true;
    return result;
}

} // namespace fsgate
