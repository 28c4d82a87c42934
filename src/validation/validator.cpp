#include "fsgate/validator.hpp"
#include "fsgate/allow_list.hpp"
#include "fsgate/config.hpp"
#include "fsgate/containment.hpp"
#include "fsgate/error_format.hpp"
#include "fsgate/path_utils.hpp"
#include "fsgate/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>

#include <unistd.h>

namespace fsgate {

namespace {

bool is_blank(const std::string& s) {
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isspace(c) != 0; });
}

bool has_control_chars(const std::string& s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) {
        return (c > 0 && c < 0x20) || c == 0x7f;
    });
}

std::string parent_of(const std::string& path) {
    auto pos = path.find_last_of('/');
    if (pos == std::string::npos || pos == 0) {
        return "/";
    }
    return path.substr(0, pos);
}

// Log-safe rendering of a path: raw only when debugging.
std::string loggable(const std::string& path) {
    if (spdlog::get_level() <= spdlog::level::debug) {
        return path;
    }
    return sanitize_message(path);
}

// Roots compare against real paths, so they are resolved the same way.
std::vector<std::string> resolve_roots(const std::vector<std::string>& roots) {
    std::vector<std::string> out;
    out.reserve(roots.size());
    for (const auto& root : roots) {
        auto resolved = resolve_real(root);
        out.push_back(resolved.ok ? resolved.real_path : root);
    }
    return dedupe_roots(out);
}

std::string sandboxed_empty_message() {
    return "No allowed directories configured for SANDBOXED mode. "
           "Add directories with 'fsgate allow add <dir>' or update the configuration file.";
}

} // namespace

// ============================================================================
// Pipeline layers
// ============================================================================

bool is_reserved_device_name(const std::string& basename) {
    std::string stem = basename.substr(0, basename.find('.'));
    std::transform(stem.begin(), stem.end(), stem.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (stem == "CON" || stem == "PRN" || stem == "AUX" || stem == "NUL") {
        return true;
    }
    if (stem.size() == 4 && (stem.compare(0, 3, "COM") == 0 || stem.compare(0, 3, "LPT") == 0)) {
        return stem[3] >= '1' && stem[3] <= '9';
    }
    return false;
}

bool check_access(const std::string& real_path, const ValidateOptions& options,
                  std::string& reason) {
    int mode = options.check_write ? (R_OK | W_OK) : R_OK;
    if (::access(real_path.c_str(), mode) == 0) {
        return true;
    }

    int err = errno;
    if (err != ENOENT && err != ENOTDIR) {
        reason = sanitize_message(std::strerror(err));
        return false;
    }
    if (options.require_exists) {
        reason = "Path does not exist";
        return false;
    }

    // New file: the nearest existing ancestor decides.
    int ancestor_mode = options.check_write ? W_OK : R_OK;
    std::string ancestor = parent_of(real_path);
    while (true) {
        if (::access(ancestor.c_str(), F_OK) == 0) {
            if (::access(ancestor.c_str(), ancestor_mode) == 0) {
                return true;
            }
            reason = "Parent directory not accessible";
            return false;
        }
        if (ancestor == "/") break;
        ancestor = parent_of(ancestor);
    }

    reason = "Parent directory not accessible";
    return false;
}

Result<std::string> validate_path_base(const std::string& input, const BaseOptions& options) {
    using R = Result<std::string>;

    // Layer 1: type check
    if (input.empty() || is_blank(input)) {
        return R::failure(validation_error("Path cannot be empty"));
    }
    if (input.find('\0') != std::string::npos) {
        return R::failure(validation_error("Path contains invalid null byte"));
    }

    // Layer 2: normalize, expand, resolve to absolute
    auto normalized = normalize_path(input, options.base_path);
    if (!normalized.ok) {
        return R::failure(validation_error(path_error_to_string(normalized.error)));
    }
    const std::string& absolute = normalized.path;
    spdlog::debug("normalized {} -> {}", loggable(input), loggable(absolute));

    // Layer 3: post-expansion character checks
    if (has_control_chars(absolute)) {
        return R::failure(validation_error("Path contains invalid control characters"));
    }
    if (absolute.size() > options.limits.max_input_path_length) {
        return R::failure(validation_error(
            "Path too long: " + std::to_string(absolute.size()) + " characters (max: " +
                std::to_string(options.limits.max_input_path_length) + ")",
            {{"limit", "max_input_path_length"}}));
    }
    std::string basename = get_filename(absolute);
    if (!basename.empty() && is_reserved_device_name(basename)) {
        return R::failure(validation_error("Windows reserved filename detected: " + basename));
    }

    // Layer 4: real-path resolution
    std::string real_path = absolute;
    if (options.validate.resolve_symlinks) {
        auto resolved = resolve_real(absolute);
        if (!resolved.ok) {
            resolved.error.requested_path = input;
            return R::failure(resolved.error);
        }
        real_path = resolved.real_path;
    } else if (is_symlink_no_follow(absolute)) {
        return R::failure(validation_error("Symlinks are not allowed"));
    }
    spdlog::debug("resolved {} -> {}", loggable(absolute), loggable(real_path));

    // Layer 5: containment
    if (options.roots) {
        auto roots = options.validate.resolve_symlinks ? resolve_roots(*options.roots)
                                                       : dedupe_roots(*options.roots);
        if (!is_contained(real_path, roots)) {
            return R::failure(access_denied(input));
        }
    }

    // Layer 6: deny-list, checked on both the lexical and the real location
    if (options.deny_list) {
        if (options.deny_list->match(real_path) || options.deny_list->match(absolute)) {
            return R::failure(access_denied(input, "Path is a protected system directory"));
        }
    }

    // Layer 7: existence / permission probe
    if (options.validate.require_exists || options.validate.check_write) {
        std::string reason;
        if (!check_access(real_path, options.validate, reason)) {
            return R::failure(access_denied(input, reason));
        }
    }

    return R::success(real_path);
}

// ============================================================================
// PathValidator
// ============================================================================

PathValidator::PathValidator(SecurityPolicy policy)
    : policy_(std::move(policy)) {
    if (policy_.cwd.empty()) {
        policy_.cwd = current_directory();
    }
}

Result<std::vector<std::string>> PathValidator::root_set() const {
    using R = Result<std::vector<std::string>>;

    switch (policy_.mode) {
        case SecurityMode::Strict:
            return R::success({policy_.cwd});
        case SecurityMode::Sandboxed: {
            std::vector<std::string> roots;
            if (policy_.allowed_override) {
                for (const auto& dir : *policy_.allowed_override) {
                    auto normalized = normalize_path(dir, policy_.cwd);
                    if (normalized.ok) roots.push_back(normalized.path);
                }
                roots = dedupe_roots(roots);
            } else if (policy_.allow_list) {
                roots = policy_.allow_list->normalized_roots();
            }
            if (roots.empty()) {
                return R::failure(fsgate::validation_error(sandboxed_empty_message(),
                                                           {{"config", "security.allowed_directories"}}));
            }
            return R::success(roots);
        }
        case SecurityMode::Unrestricted:
            return R::success({"/"});
    }
    return R::success({policy_.cwd});
}

Result<std::string> PathValidator::validate(const std::string& path,
                                            const ValidateOptions& options) const {
    auto roots = root_set();
    if (!roots.ok) {
        spdlog::warn("[{}] validation refused: {}", security_mode_to_string(policy_.mode),
                     roots.error.message);
        return Result<std::string>::failure(roots.error);
    }

    BaseOptions base;
    base.base_path = policy_.cwd;
    base.roots = roots.value;
    base.deny_list = policy_.mode == SecurityMode::Unrestricted ? &policy_.deny_list : nullptr;
    base.validate = options;
    base.limits = policy_.limits;

    auto result = validate_path_base(path, base);
    if (!result.ok) {
        spdlog::warn("[{}] denied {}: {}", security_mode_to_string(policy_.mode), loggable(path),
                     sanitize_message(result.error.message));
    } else if (policy_.audit) {
        spdlog::info("[audit] [{}] allowed {} -> {}", security_mode_to_string(policy_.mode),
                     loggable(path), loggable(result.value));
    }
    return result;
}

bool PathValidator::is_path_allowed(const std::string& path) const {
    return validate(path).ok;
}

std::optional<Error> PathValidator::validation_error(const std::string& path) const {
    auto result = validate(path);
    if (result.ok) {
        return std::nullopt;
    }
    return result.error;
}

bool PathValidator::quick_check(const std::string& path) const {
    if (path.empty() || is_blank(path) || path.find('\0') != std::string::npos) {
        return false;
    }
    auto normalized = normalize_path(path, policy_.cwd);
    if (!normalized.ok || has_control_chars(normalized.path) ||
        normalized.path.size() > policy_.limits.max_input_path_length) {
        return false;
    }
    std::string basename = get_filename(normalized.path);
    if (!basename.empty() && is_reserved_device_name(basename)) {
        return false;
    }

    auto roots = root_set();
    if (!roots.ok || !is_contained(normalized.path, dedupe_roots(roots.value))) {
        return false;
    }
    if (policy_.mode == SecurityMode::Unrestricted && policy_.deny_list.match(normalized.path)) {
        return false;
    }
    return true;
}

OpenResult PathValidator::open_validated(const std::string& path, OpenMode mode) const {
    ValidateOptions options;
    switch (mode) {
        case OpenMode::Read:
        case OpenMode::Directory:
            options.require_exists = true;
            break;
        case OpenMode::Write:
            options.require_exists = true;
            options.check_write = true;
            break;
        case OpenMode::Create:
            options.check_write = true;
            break;
    }

    auto validated = validate(path, options);
    if (!validated.ok) {
        OpenResult result;
        result.error = validated.error;
        return result;
    }

    auto opened = open_no_follow(validated.value, mode);
    if (!opened.ok) {
        opened.error.requested_path = path;
    }
    return opened;
}

std::unique_ptr<PathValidator> make_validator(const Config& config,
                                              const AllowListStore& store,
                                              const std::string& cwd) {
    SecurityPolicy policy;
    policy.mode = config.security.mode;
    policy.cwd = cwd;
    if (!cwd.empty()) {
        auto normalized = normalize_path(cwd);
        if (normalized.ok) {
            policy.cwd = normalized.path;
        }
    }
    policy.allow_list = &store;
    if (config.security.allowed_directories_from_env) {
        policy.allowed_override = config.security.allowed_directories;
    }
    policy.deny_list = DenyList::from_config(config);
    policy.limits = effective_limits(config);
    policy.audit = config.logging.audit_enabled;

    spdlog::debug("validator mode={} audit={}", security_mode_to_string(policy.mode),
                  policy.audit);
    return std::make_unique<PathValidator>(std::move(policy));
}

} // namespace fsgate
