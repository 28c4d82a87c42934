#include "fsgate/errors.hpp"

namespace fsgate {

const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::AccessDenied: return "access_denied";
    }
    return "validation";
}

std::optional<ErrorKind> parse_error_kind(const std::string& s) {
    if (s == "validation") return ErrorKind::Validation;
    if (s == "access_denied") return ErrorKind::AccessDenied;
    return std::nullopt;
}

Error validation_error(const std::string& message, std::map<std::string, std::string> details) {
    Error e;
    e.kind = ErrorKind::Validation;
    e.message = message;
    e.details = std::move(details);
    return e;
}

Error access_denied(const std::string& requested_path, const std::string& reason) {
    Error e;
    e.kind = ErrorKind::AccessDenied;
    e.message = "Access denied: " + reason;
    e.requested_path = requested_path;
    return e;
}

} // namespace fsgate
