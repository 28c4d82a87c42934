#include "fsgate/deny_list.hpp"
#include "fsgate/config.hpp"
#include "fsgate/containment.hpp"
#include "fsgate/path_utils.hpp"

#include <spdlog/spdlog.h>

namespace fsgate {

std::vector<std::string> default_system_deny_list(Platform platform) {
    switch (platform) {
        case Platform::macOS:
            return {"/System", "/Library", "/Applications", "/usr", "/bin", "/sbin",
                    "/opt", "/private/etc", "/private/var/db"};
        case Platform::Windows:
            return {"C:/Windows", "C:/Program Files", "C:/Program Files (x86)",
                    "C:/ProgramData", "C:/$Recycle.Bin", "C:/System Volume Information"};
        case Platform::Linux:
        case Platform::Unknown:
            break;
    }
    return {"/etc", "/usr", "/bin", "/sbin", "/lib", "/lib64", "/boot",
            "/sys", "/proc", "/dev", "/root", "/var", "/opt"};
}

DenyList::DenyList(std::vector<std::string> roots)
    : roots_(dedupe_roots(roots)) {}

DenyList DenyList::from_config(const Config& config) {
    std::vector<std::string> roots;
    if (config.security.blacklist_system_paths) {
        roots = default_system_deny_list();
    }
    for (const auto& dir : config.security.denied_directories) {
        auto normalized = normalize_path(dir, "/");
        if (!normalized.ok) {
            spdlog::warn("ignoring denied directory entry: {}",
                         path_error_to_string(normalized.error));
            continue;
        }
        roots.push_back(normalized.path);
    }
    return DenyList(std::move(roots));
}

std::optional<std::string> DenyList::match(const std::string& real_path) const {
    auto index = find_containing_root(real_path, roots_);
    if (!index) {
        return std::nullopt;
    }
    return roots_[*index];
}

} // namespace fsgate
