#pragma once

#include "fsgate/limits.hpp"
#include "fsgate/security_mode.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fsgate {

// ============================================================================
// Configuration Document
// ============================================================================

struct Config {
    std::string version = "1.0.0";

    struct {
        SecurityMode mode = SecurityMode::Strict;
        std::vector<std::string> allowed_directories;  // original, unexpanded
        bool blacklist_system_paths = true;
        std::vector<std::string> denied_directories;   // extra deny-list roots
        bool allowed_directories_from_env = false;     // FSGATE_ALLOWED_DIRS was applied
    } security;

    // Consumed by organization-layer collaborators; capped into
    // SecurityLimits where they overlap (see effective_limits)
    struct {
        std::uint64_t max_file_size = 100 * MiB;
        std::uint64_t max_files_per_operation = 10000;
        std::uint64_t max_directory_depth = 10;
    } limits;

    struct {
        bool audit_enabled = false;
        std::string log_level = "info";  // debug | info | warn | error
    } logging;

    // Source path for diagnostics
    std::string source_path;
};

Config default_config();

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

// Parse a configuration document. Missing sections keep their defaults;
// invalid values fall back to defaults with a warning.
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// FSGATE_MODE, FSGATE_ALLOWED_DIRS, FSGATE_AUDIT, FSGATE_DEBUG,
// FSGATE_MAX_FILE_SIZE, FSGATE_MAX_FILES, FSGATE_MAX_DEPTH
void apply_env_overrides(Config& config,
                         const std::unordered_map<std::string, std::string>& env,
                         std::vector<std::string>& warnings);

// Range checks. Returns human-readable problems; empty when valid.
std::vector<std::string> validate_config(const Config& config);

struct ConfigLoadResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
    bool from_file = false;
};

// defaults <- file <- environment. A missing file is not an error; an
// unparseable file yields defaults plus a warning. Unrestricted mode forces
// audit logging on.
ConfigLoadResult load_config(const std::string& path);

// Same, with an explicit environment.
ConfigLoadResult load_config(const std::string& path,
                             const std::unordered_map<std::string, std::string>& env);

// Serialize to the JSON document layout (pretty-printed).
std::string config_to_json(const Config& config);

// --config value > FSGATE_CONFIG > ~/.fsgate/config.json
std::string resolve_config_path(const std::optional<std::string>& override_path);

// Hard caps: config limits that overlap path/entry limits lower them.
SecurityLimits effective_limits(const Config& config);

} // namespace fsgate
