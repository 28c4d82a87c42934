#include <doctest/doctest.h>
#include <fsgate/error_format.hpp>

#include <cerrno>

using namespace fsgate;

// ============================================================================
// Error taxonomy
// ============================================================================

TEST_CASE("error constructors set kind and message") {
    auto denied = access_denied("/secret/file");
    CHECK(denied.is_access_denied());
    CHECK(denied.message == "Access denied: Path is outside the allowed directory");
    CHECK(denied.requested_path == "/secret/file");

    auto invalid = validation_error("Path cannot be empty", {{"field", "path"}});
    CHECK(invalid.is_validation());
    CHECK(invalid.details.at("field") == "path");
}

TEST_CASE("error kinds round trip through strings") {
    CHECK(std::string(error_kind_to_string(ErrorKind::Validation)) == "validation");
    CHECK(std::string(error_kind_to_string(ErrorKind::AccessDenied)) == "access_denied");
    CHECK(parse_error_kind("access_denied") == ErrorKind::AccessDenied);
    CHECK(parse_error_kind("validation") == ErrorKind::Validation);
    CHECK_FALSE(parse_error_kind("other").has_value());
}

// ============================================================================
// Sanitizer
// ============================================================================

TEST_CASE("absolute paths are replaced") {
    CHECK(sanitize_message("cannot open /home/alice/secret.txt now") ==
          "cannot open [PATH] now");
    CHECK(sanitize_message("'/etc/shadow' missing") == "'[PATH]' missing");
    CHECK(sanitize_message("copy /a to /b") == "copy [PATH] to [PATH]");
}

TEST_CASE("windows paths are replaced") {
    CHECK(sanitize_message("failed: C:\\Users\\bob\\file.txt") == "failed: [PATH]");
}

TEST_CASE("text without paths is unchanged") {
    CHECK(sanitize_message("Path cannot be empty") == "Path cannot be empty");
    CHECK(sanitize_message("") == "");
}

// ============================================================================
// Categories
// ============================================================================

TEST_CASE("categorize typed errors") {
    CHECK(categorize(access_denied("/x")) == ErrorCategory::AccessDenied);
    CHECK(categorize(access_denied("/x", "Path does not exist")) == ErrorCategory::PathNotFound);
    CHECK(categorize(validation_error("bad")) == ErrorCategory::Validation);
    CHECK(categorize(validation_error("long", {{"limit", "max_input_path_length"}})) ==
          ErrorCategory::LimitExceeded);
    CHECK(categorize(validation_error("empty", {{"config", "security.allowed_directories"}})) ==
          ErrorCategory::Config);
}

TEST_CASE("categorize errno values") {
    CHECK(categorize_errno(EACCES) == ErrorCategory::AccessDenied);
    CHECK(categorize_errno(ENOENT) == ErrorCategory::PathNotFound);
    CHECK(categorize_errno(EPERM) == ErrorCategory::Permission);
    CHECK(categorize_errno(ENOSPC) == ErrorCategory::LimitExceeded);
    CHECK(categorize_errno(EINTR) == ErrorCategory::Unknown);
    CHECK(std::string(error_category_to_string(ErrorCategory::AccessDenied)) == "ACCESS_DENIED");
}

// ============================================================================
// Guidance
// ============================================================================

TEST_CASE("strict guidance never leaks the requested path") {
    GuidanceContext ctx;
    ctx.mode = SecurityMode::Strict;

    auto text = format_error(access_denied("/home/alice/private/notes.txt"), ctx);
    CHECK(text.find("/home/alice") == std::string::npos);
    CHECK(text.find("Access denied: [PATH]") == 0);
    CHECK(text.find("Reason: Path is outside the allowed directory") != std::string::npos);
    CHECK(text.find("STRICT mode") != std::string::npos);
}

TEST_CASE("sandboxed guidance lists configured directories") {
    GuidanceContext ctx;
    ctx.mode = SecurityMode::Sandboxed;
    ctx.allowed_directories = {"~/Documents", "$HOME/Downloads"};

    auto text = format_error(access_denied("/opt/x"), ctx);
    CHECK(text.find("  - ~/Documents") != std::string::npos);
    CHECK(text.find("  - $HOME/Downloads") != std::string::npos);
    CHECK(text.find("fsgate allow add") != std::string::npos);

    ctx.allowed_directories.clear();
    CHECK(format_error(access_denied("/opt/x"), ctx).find("(no directories configured)") !=
          std::string::npos);
}

TEST_CASE("unrestricted guidance mentions protected directories") {
    GuidanceContext ctx;
    ctx.mode = SecurityMode::Unrestricted;
    auto text = format_error(access_denied("/etc/passwd", "Path is a protected system directory"),
                             ctx);
    CHECK(text.find("protected system directory") != std::string::npos);
    CHECK(text.find("/etc/passwd") == std::string::npos);
}

TEST_CASE("validation and not-found renderings") {
    GuidanceContext ctx;
    auto invalid = format_error(validation_error("Windows reserved filename detected: CON"), ctx);
    CHECK(invalid.find("Invalid input: Windows reserved filename detected: CON") == 0);

    auto missing = format_error(access_denied("/data/gone.txt", "Path does not exist"), ctx);
    CHECK(missing.find("Path not found: [PATH]") == 0);
}

TEST_CASE("limit exceeded text") {
    auto text = format_limit_exceeded("max_files_per_operation", 20000, 10000);
    CHECK(text.find("Limit exceeded: max_files_per_operation") == 0);
    CHECK(text.find("Current: 20000") != std::string::npos);
    CHECK(text.find("Maximum: 10000") != std::string::npos);
}
