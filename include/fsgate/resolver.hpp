#pragma once

#include "fsgate/errors.hpp"

#include <string>

namespace fsgate {

// ============================================================================
// TOCTOU-Safe Resolver
// ============================================================================

struct ResolveResult {
    bool ok = false;
    std::string real_path;
    bool exists = false;
    Error error;
};

// Resolve an absolute, normalized path to the location it really names.
//   - existing target: canonical path with every symlink resolved
//   - missing target:  nearest existing ancestor canonicalized, missing tail
//                      re-appended
//   - nothing exists:  the input unchanged (containment then fails closed
//                      unless the input is lexically inside a root)
// A symlink loop anywhere on the path is AccessDenied.
ResolveResult resolve_real(const std::string& absolute_path);

// lstat-based: true only if the final component itself is a symlink.
bool is_symlink_no_follow(const std::string& path);

// ============================================================================
// No-follow open
// ============================================================================

// Move-only owner of a POSIX file descriptor.
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd();

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;
    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept;

    int get() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    int release();
    void reset(int fd = -1);

private:
    int fd_ = -1;
};

enum class OpenMode {
    Read,       // existing regular file, read-only
    Write,      // existing regular file, read-write
    Create,     // new regular file, fails if anything exists at the path
    Directory,  // existing directory, read-only
};

struct OpenResult {
    bool ok = false;
    UniqueFd fd;
    Error error;
};

// Open a validated real path without following a symlink at the leaf
// (O_NOFOLLOW). A symlink swapped in after validation is refused with
// AccessDenied. The opened object is fstat-checked against the mode.
//
// Only the final component is protected; a directory component replaced by a
// symlink between resolve_real() and this call is not detected.
OpenResult open_no_follow(const std::string& real_path, OpenMode mode);

} // namespace fsgate
