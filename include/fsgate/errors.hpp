#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>

namespace fsgate {

// ============================================================================
// Error Taxonomy
// ============================================================================

// Exactly two failure kinds leave the trust boundary:
//   Validation   - the request itself is malformed, or the configuration makes
//                  the request impossible (e.g. sandboxed mode, empty allow-list)
//   AccessDenied - the request is well-formed but the resolved real path is
//                  outside the permitted roots, or existence/permission checks
//                  failed
enum class ErrorKind {
    Validation,
    AccessDenied,
};

const char* error_kind_to_string(ErrorKind kind);
std::optional<ErrorKind> parse_error_kind(const std::string& s);

struct Error {
    ErrorKind kind = ErrorKind::Validation;
    std::string message;
    std::string requested_path;                   // AccessDenied only
    std::map<std::string, std::string> details;   // Validation only

    bool is_access_denied() const { return kind == ErrorKind::AccessDenied; }
    bool is_validation() const { return kind == ErrorKind::Validation; }
};

Error validation_error(const std::string& message,
                       std::map<std::string, std::string> details = {});

// message becomes "Access denied: <reason>"
Error access_denied(const std::string& requested_path,
                    const std::string& reason = "Path is outside the allowed directory");

// ============================================================================
// Result
// ============================================================================

template <typename T>
struct Result {
    bool ok = false;
    T value{};
    Error error;

    static Result success(T v) {
        Result r;
        r.ok = true;
        r.value = std::move(v);
        return r;
    }

    static Result failure(Error e) {
        Result r;
        r.ok = false;
        r.error = std::move(e);
        return r;
    }

    explicit operator bool() const { return ok; }
};

} // namespace fsgate
