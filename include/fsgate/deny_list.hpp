#pragma once

#include "fsgate/platform.hpp"

#include <optional>
#include <string>
#include <vector>

namespace fsgate {

struct Config;

// ============================================================================
// System Directory Deny-List
// ============================================================================

// Conservative default for the given platform. Entries are absolute,
// normalized directory roots.
std::vector<std::string> default_system_deny_list(Platform platform = get_current_platform());

class DenyList {
public:
    DenyList() = default;
    explicit DenyList(std::vector<std::string> roots);

    // Defaults when security.blacklist_system_paths is true, plus
    // security.denied_directories (normalized, ~ and variables expanded).
    static DenyList from_config(const Config& config);

    // Root that contains real_path, if any.
    std::optional<std::string> match(const std::string& real_path) const;

    const std::vector<std::string>& roots() const { return roots_; }
    bool empty() const { return roots_.empty(); }

private:
    std::vector<std::string> roots_;
};

} // namespace fsgate
