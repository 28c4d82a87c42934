#pragma once

#include "fsgate/errors.hpp"
#include "fsgate/security_mode.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fsgate {

// ============================================================================
// Sanitizer
// ============================================================================

// Replace every absolute path token with "[PATH]". POSIX tokens are '/'
// followed by non-space, non-quote characters; Windows tokens are a drive
// letter, ':' and a backslash path.
std::string sanitize_message(const std::string& text);

// ============================================================================
// Error Categories
// ============================================================================

enum class ErrorCategory {
    AccessDenied,
    PathNotFound,
    Validation,
    Permission,
    LimitExceeded,
    Config,
    Unknown,
};

// "ACCESS_DENIED", "PATH_NOT_FOUND", ...
const char* error_category_to_string(ErrorCategory category);

ErrorCategory categorize(const Error& error);
ErrorCategory categorize_errno(int err);

// ============================================================================
// Guidance
// ============================================================================

struct GuidanceContext {
    SecurityMode mode = SecurityMode::Strict;
    std::vector<std::string> allowed_directories;  // original strings
};

// User-facing text for a failure at the tool-handler boundary. Paths in the
// error are sanitized; mode guidance explains how access could be granted.
std::string format_error(const Error& error, const GuidanceContext& context);

std::string format_limit_exceeded(const std::string& limit, std::uint64_t current,
                                  std::uint64_t max);

} // namespace fsgate
