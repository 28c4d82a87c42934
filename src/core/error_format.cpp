#include "fsgate/error_format.hpp"

#include <cerrno>
#include <regex>
#include <sstream>

namespace fsgate {

std::string sanitize_message(const std::string& text) {
    static const std::regex posix_path(R"(/[^\s'"]+)");
    static const std::regex windows_path(R"([A-Za-z]:\\[^\s'"]+)");

    std::string out = std::regex_replace(text, posix_path, "[PATH]");
    return std::regex_replace(out, windows_path, "[PATH]");
}

const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::AccessDenied: return "ACCESS_DENIED";
        case ErrorCategory::PathNotFound: return "PATH_NOT_FOUND";
        case ErrorCategory::Validation: return "VALIDATION_ERROR";
        case ErrorCategory::Permission: return "PERMISSION_ERROR";
        case ErrorCategory::LimitExceeded: return "LIMIT_EXCEEDED";
        case ErrorCategory::Config: return "CONFIG_ERROR";
        case ErrorCategory::Unknown: return "UNKNOWN";
    }
    return "UNKNOWN";
}

ErrorCategory categorize(const Error& error) {
    if (error.is_access_denied()) {
        if (error.message.find("does not exist") != std::string::npos) {
            return ErrorCategory::PathNotFound;
        }
        return ErrorCategory::AccessDenied;
    }
    if (error.details.count("limit")) {
        return ErrorCategory::LimitExceeded;
    }
    if (error.details.count("config")) {
        return ErrorCategory::Config;
    }
    return ErrorCategory::Validation;
}

ErrorCategory categorize_errno(int err) {
    switch (err) {
        case EACCES:
        case ELOOP:
            return ErrorCategory::AccessDenied;
        case ENOENT:
        case ENOTDIR:
            return ErrorCategory::PathNotFound;
        case EPERM:
        case EROFS:
            return ErrorCategory::Permission;
        case EFBIG:
        case ENOSPC:
        case EMFILE:
        case ENAMETOOLONG:
            return ErrorCategory::LimitExceeded;
        default:
            return ErrorCategory::Unknown;
    }
}

namespace {

std::string mode_guidance(const GuidanceContext& context) {
    std::ostringstream out;
    switch (context.mode) {
        case SecurityMode::Strict:
            out << "This directory is not allowed in STRICT mode.\n"
                << "STRICT mode only allows access to the current working directory.\n\n"
                << "Options:\n"
                << "1. Switch to SANDBOXED mode and add this directory to the allow-list\n"
                << "2. Run from this directory instead\n"
                << "3. Enable UNRESTRICTED mode (advanced users only)";
            break;
        case SecurityMode::Sandboxed:
            out << "This directory is not in your allow-list.\n\n"
                << "Currently allowed directories:\n";
            if (context.allowed_directories.empty()) {
                out << "  (no directories configured)\n";
            } else {
                for (const auto& dir : context.allowed_directories) {
                    out << "  - " << dir << "\n";
                }
            }
            out << "\nOptions:\n"
                << "1. Add this directory: fsgate allow add <dir>\n"
                << "2. Use a directory from the allow-list above\n"
                << "3. Switch to UNRESTRICTED mode (advanced users only)";
            break;
        case SecurityMode::Unrestricted:
            out << "This is a protected system directory.\n\n"
                << "Even in UNRESTRICTED mode, critical system directories are blocked.";
            break;
    }
    return out.str();
}

} // namespace

std::string format_error(const Error& error, const GuidanceContext& context) {
    std::ostringstream out;
    std::string path = sanitize_message(error.requested_path);

    switch (categorize(error)) {
        case ErrorCategory::AccessDenied: {
            std::string reason = error.message;
            const std::string prefix = "Access denied: ";
            if (reason.compare(0, prefix.size(), prefix) == 0) {
                reason.erase(0, prefix.size());
            }
            out << "Access denied: " << path << "\n"
                << "Reason: " << sanitize_message(reason) << "\n\n"
                << mode_guidance(context);
            break;
        }
        case ErrorCategory::PathNotFound:
            out << "Path not found: " << path << "\n\n"
                << "The specified path does not exist. Please check:\n"
                << "1. The path is spelled correctly\n"
                << "2. The file or directory has not been moved or deleted\n"
                << "3. The capitalization matches (case-sensitive on some systems)";
            break;
        case ErrorCategory::Validation:
            out << "Invalid input: " << sanitize_message(error.message) << "\n\n"
                << "Please check your input and try again.";
            break;
        case ErrorCategory::Permission:
            out << "Permission denied: " << path << "\n\n"
                << "Check ownership and permissions of the file or folder.";
            break;
        case ErrorCategory::LimitExceeded:
        case ErrorCategory::Config:
            out << sanitize_message(error.message);
            break;
        case ErrorCategory::Unknown:
            out << "Error: " << sanitize_message(error.message);
            break;
    }
    return out.str();
}

std::string format_limit_exceeded(const std::string& limit, std::uint64_t current,
                                  std::uint64_t max) {
    std::ostringstream out;
    out << "Limit exceeded: " << limit << "\n\n"
        << "Current: " << current << "\n"
        << "Maximum: " << max << "\n\n"
        << "Limits can be adjusted in the configuration file.";
    return out.str();
}

} // namespace fsgate
