#include "fsgate/config.hpp"
#include "fsgate/platform.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <optional>
#include <sstream>

namespace fsgate {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

std::optional<bool> get_bool(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_boolean()) {
        return j[key].get<bool>();
    }
    return std::nullopt;
}

std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

// Positive integer field; anything else keeps the current value with a warning.
void read_limit(const nlohmann::json& j, const std::string& key, std::uint64_t& out,
                std::vector<std::string>& warnings) {
    if (!j.contains(key)) return;
    const auto& v = j[key];
    if (v.is_number_unsigned() && v.get<std::uint64_t>() > 0) {
        out = v.get<std::uint64_t>();
    } else if (v.is_number_integer() && v.get<std::int64_t>() > 0) {
        out = static_cast<std::uint64_t>(v.get<std::int64_t>());
    } else {
        warnings.push_back("limits." + key + " must be a positive integer; using default");
    }
}

std::optional<std::uint64_t> parse_positive(const std::string& s) {
    std::string t = trim(s);
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(t.data(), t.data() + t.size(), value);
    if (ec != std::errc() || ptr != t.data() + t.size() || value == 0) {
        return std::nullopt;
    }
    return value;
}

bool is_log_level(const std::string& level) {
    return level == "debug" || level == "info" || level == "warn" || level == "error";
}

} // namespace

Config default_config() {
    return Config{};
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        if (auto version = get_string(j, "version")) {
            result.config.version = *version;
        }

        // "security" section
        if (j.contains("security") && j["security"].is_object()) {
            const auto& security = j["security"];

            if (auto mode = get_string(security, "mode")) {
                auto parsed = parse_security_mode(*mode);
                if (parsed) {
                    result.config.security.mode = *parsed;
                } else {
                    result.warnings.push_back("Invalid security mode: " + *mode +
                                              ". Must be one of: strict, sandboxed, unrestricted");
                    result.config.security.mode = SecurityMode::Strict;
                }
            }

            if (security.contains("allowed_directories") &&
                !security["allowed_directories"].is_array()) {
                result.warnings.push_back("allowed_directories must be an array");
            }
            result.config.security.allowed_directories =
                get_string_array(security, "allowed_directories");

            if (auto blacklist = get_bool(security, "blacklist_system_paths")) {
                result.config.security.blacklist_system_paths = *blacklist;
            }

            result.config.security.denied_directories =
                get_string_array(security, "denied_directories");
        }

        // "limits" section
        if (j.contains("limits") && j["limits"].is_object()) {
            const auto& limits = j["limits"];
            read_limit(limits, "max_file_size", result.config.limits.max_file_size,
                       result.warnings);
            read_limit(limits, "max_files_per_operation",
                       result.config.limits.max_files_per_operation, result.warnings);
            read_limit(limits, "max_directory_depth", result.config.limits.max_directory_depth,
                       result.warnings);
        }

        // "logging" section
        if (j.contains("logging") && j["logging"].is_object()) {
            const auto& logging = j["logging"];
            if (auto audit = get_bool(logging, "audit_enabled")) {
                result.config.logging.audit_enabled = *audit;
            }
            if (auto level = get_string(logging, "log_level")) {
                std::string lower = to_lower(*level);
                if (is_log_level(lower)) {
                    result.config.logging.log_level = lower;
                } else {
                    result.warnings.push_back("Invalid log level: " + *level + "; using info");
                }
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

void apply_env_overrides(Config& config,
                         const std::unordered_map<std::string, std::string>& env,
                         std::vector<std::string>& warnings) {
    auto get = [&env](const char* name) -> std::optional<std::string> {
        auto it = env.find(name);
        if (it == env.end() || it->second.empty()) return std::nullopt;
        return it->second;
    };

    if (auto mode = get("FSGATE_MODE")) {
        if (auto parsed = parse_security_mode(*mode)) {
            config.security.mode = *parsed;
        } else {
            warnings.push_back("FSGATE_MODE: unknown mode '" + *mode + "' ignored");
        }
    }

    if (auto dirs = get("FSGATE_ALLOWED_DIRS")) {
        std::vector<std::string> parsed;
        std::istringstream ss(*dirs);
        std::string item;
        while (std::getline(ss, item, ',')) {
            item = trim(item);
            if (!item.empty()) parsed.push_back(item);
        }
        config.security.allowed_directories = parsed;
        config.security.allowed_directories_from_env = true;
    }

    if (auto audit = get("FSGATE_AUDIT")) {
        config.logging.audit_enabled = to_lower(*audit) == "true";
    }

    if (auto debug = get("FSGATE_DEBUG")) {
        if (to_lower(*debug) == "true") {
            config.logging.log_level = "debug";
        }
    }

    struct NumericOverride {
        const char* name;
        std::uint64_t* target;
    };
    const NumericOverride numeric[] = {
        {"FSGATE_MAX_FILE_SIZE", &config.limits.max_file_size},
        {"FSGATE_MAX_FILES", &config.limits.max_files_per_operation},
        {"FSGATE_MAX_DEPTH", &config.limits.max_directory_depth},
    };
    for (const auto& n : numeric) {
        auto raw = get(n.name);
        if (!raw) continue;
        if (auto value = parse_positive(*raw)) {
            *n.target = *value;
        } else {
            warnings.push_back(std::string(n.name) + ": expected a positive integer, ignored");
        }
    }
}

std::vector<std::string> validate_config(const Config& config) {
    std::vector<std::string> errors;

    const auto& limits = config.limits;
    if (limits.max_file_size < 1 * MiB || limits.max_file_size > 1 * GiB) {
        errors.push_back("max_file_size must be between 1MB and 1GB");
    }
    if (limits.max_files_per_operation < 10 || limits.max_files_per_operation > 100000) {
        errors.push_back("max_files_per_operation must be between 10 and 100000");
    }
    if (limits.max_directory_depth < 1 || limits.max_directory_depth > 50) {
        errors.push_back("max_directory_depth must be between 1 and 50");
    }
    if (!is_log_level(config.logging.log_level)) {
        errors.push_back("log_level must be one of: debug, info, warn, error");
    }

    return errors;
}

ConfigLoadResult load_config(const std::string& path) {
    return load_config(path, get_all_env());
}

ConfigLoadResult load_config(const std::string& path,
                             const std::unordered_map<std::string, std::string>& env) {
    ConfigLoadResult result;
    result.config = default_config();
    result.config.source_path = path;

    if (auto content = read_file(path)) {
        auto parsed = parse_config(*content, path);
        if (parsed.ok) {
            result.config = std::move(parsed.config);
            result.from_file = true;
            for (auto& w : parsed.warnings) {
                result.warnings.push_back(std::move(w));
            }
        } else {
            result.warnings.push_back("Could not parse config file: " + parsed.error);
        }
    } else if (path_exists(path)) {
        result.warnings.push_back("Could not read config file");
    }

    apply_env_overrides(result.config, env, result.warnings);

    if (result.config.security.mode == SecurityMode::Unrestricted) {
        result.config.logging.audit_enabled = true;
    }

    for (auto& problem : validate_config(result.config)) {
        result.warnings.push_back(std::move(problem));
    }

    result.ok = true;
    return result;
}

std::string config_to_json(const Config& config) {
    nlohmann::json j;
    j["version"] = config.version;
    j["security"] = {
        {"mode", security_mode_to_string(config.security.mode)},
        {"allowed_directories", config.security.allowed_directories},
        {"blacklist_system_paths", config.security.blacklist_system_paths},
        {"denied_directories", config.security.denied_directories},
    };
    j["limits"] = {
        {"max_file_size", config.limits.max_file_size},
        {"max_files_per_operation", config.limits.max_files_per_operation},
        {"max_directory_depth", config.limits.max_directory_depth},
    };
    j["logging"] = {
        {"audit_enabled", config.logging.audit_enabled},
        {"log_level", config.logging.log_level},
    };
    return j.dump(2);
}

std::string resolve_config_path(const std::optional<std::string>& override_path) {
    if (override_path && !override_path->empty()) {
        return *override_path;
    }

    if (auto env_path = get_env("FSGATE_CONFIG"); env_path && !env_path->empty()) {
        return *env_path;
    }

    std::string home = home_directory();
    if (!home.empty()) {
        return home + "/.fsgate/config.json";
    }

    return ".fsgate/config.json";
}

SecurityLimits effective_limits(const Config& config) {
    SecurityLimits limits = default_limits();
    limits.max_file_size = std::min(limits.max_file_size, config.limits.max_file_size);
    limits.max_entries = static_cast<std::size_t>(
        std::min<std::uint64_t>(limits.max_entries, config.limits.max_files_per_operation));
    return limits;
}

} // namespace fsgate
