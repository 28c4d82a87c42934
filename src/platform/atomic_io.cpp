#include "fsgate/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <system_error>

#include <fcntl.h>
#include <pwd.h>
#include <sys/stat.h>
#include <unistd.h>

#if defined(__APPLE__)
#include <crt_externs.h>
#define environ (*_NSGetEnviron())
#else
extern "C" char** environ;
#endif

namespace fsgate {

namespace fs = std::filesystem;

Platform get_current_platform() {
#if defined(__APPLE__)
    return Platform::macOS;
#elif defined(_WIN32)
    return Platform::Windows;
#elif defined(__linux__)
    return Platform::Linux;
#else
    return Platform::Unknown;
#endif
}

namespace {

bool sync_fd(int fd) {
#ifdef __APPLE__
    return fcntl(fd, F_FULLFSYNC, 0) == 0;
#else
    return fsync(fd) == 0;
#endif
}

void sync_parent(const std::string& path) {
    std::string dir = get_parent_directory(path);
    if (dir.empty()) return;

    int fd = open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (fd < 0) return;
    sync_fd(fd);
    close(fd);
}

std::string errno_text(const char* what) {
    return std::string(what) + ": " + std::strerror(errno);
}

} // namespace

AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode) {
    AtomicWriteResult result;

    // Sibling of the target so the rename never crosses a filesystem.
    std::string temp_path = path + ".tmp." + generate_uuid().substr(0, 8);

    int fd = open(temp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
    if (fd < 0) {
        result.error = errno_text("failed to create temp file");
        return result;
    }

    auto abandon = [&](const std::string& error) {
        close(fd);
        unlink(temp_path.c_str());
        result.error = error;
        return result;
    };

    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            return abandon(errno_text("failed to write content"));
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }

    if (fchmod(fd, static_cast<mode_t>(mode)) != 0) {
        return abandon(errno_text("failed to set permissions"));
    }
    if (!sync_fd(fd)) {
        return abandon(errno_text("failed to fsync temp file"));
    }
    close(fd);

    if (rename(temp_path.c_str(), path.c_str()) != 0) {
        result.error = errno_text("failed to rename temp file");
        unlink(temp_path.c_str());
        return result;
    }

    sync_parent(path);
    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string get_parent_directory(const std::string& path) {
    return fs::path(path).parent_path().string();
}

std::string get_filename(const std::string& path) {
    return fs::path(path).filename().string();
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

bool is_directory(const std::string& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool create_directories(const std::string& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    return !ec && fs::is_directory(path, ec);
}

std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string current_directory() {
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    if (ec) {
        return {};
    }
    return cwd.string();
}

std::optional<std::string> get_env(const std::string& name) {
    if (const char* val = std::getenv(name.c_str())) {
        return std::string(val);
    }
    return std::nullopt;
}

std::unordered_map<std::string, std::string> get_all_env() {
    std::unordered_map<std::string, std::string> env;
    for (char** ep = environ; *ep; ++ep) {
        const char* eq = std::strchr(*ep, '=');
        if (eq && eq != *ep) {
            env.emplace(std::string(*ep, static_cast<std::size_t>(eq - *ep)), std::string(eq + 1));
        }
    }
    return env;
}

std::string home_directory() {
    if (auto home = get_env("HOME"); home && !home->empty()) {
        return *home;
    }
    if (const struct passwd* pw = getpwuid(getuid()); pw && pw->pw_dir) {
        return pw->pw_dir;
    }
    return {};
}

std::string generate_uuid() {
    std::random_device rd;
    std::mt19937_64 gen(rd());
    std::uniform_int_distribution<uint64_t> dis;

    uint64_t a = dis(gen);
    uint64_t b = dis(gen);

    a = (a & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;  // version 4
    b = (b & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 1

    char buf[37];
    snprintf(buf, sizeof(buf),
             "%08x-%04x-%04x-%04x-%012llx",
             static_cast<uint32_t>(a >> 32),
             static_cast<uint16_t>((a >> 16) & 0xFFFF),
             static_cast<uint16_t>(a & 0xFFFF),
             static_cast<uint16_t>(b >> 48),
             static_cast<unsigned long long>(b & 0xFFFFFFFFFFFFULL));

    return buf;
}

} // namespace fsgate
