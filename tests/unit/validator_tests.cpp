#include <doctest/doctest.h>
#include <fsgate/allow_list.hpp>
#include <fsgate/config.hpp>
#include <fsgate/error_format.hpp>
#include <fsgate/validator.hpp>

#include "test_helpers.hpp"

#include <unistd.h>

namespace fs = std::filesystem;

using namespace fsgate;
using fsgate::testing::TempDir;
using fsgate::testing::write_text;

namespace {

PathValidator strict_validator(const std::string& cwd) {
    SecurityPolicy policy;
    policy.mode = SecurityMode::Strict;
    policy.cwd = cwd;
    return PathValidator(policy);
}

} // namespace

// ============================================================================
// Strict mode
// ============================================================================

TEST_CASE("strict allows paths under the working directory") {
    TempDir cwd;
    auto v = strict_validator(cwd.path());

    auto r = v.validate("docs/file.txt");
    REQUIRE(r.ok);
    CHECK(r.value == cwd / "docs/file.txt");
    CHECK(v.is_path_allowed(cwd.path()));
}

TEST_CASE("strict denies dotdot escape") {
    TempDir cwd;
    auto v = strict_validator(cwd.path());

    auto r = v.validate("Documents/../../etc/shadow");
    CHECK_FALSE(r.ok);
    CHECK(r.error.is_access_denied());
    CHECK(r.error.message == "Access denied: Path is outside the allowed directory");
    CHECK(r.error.requested_path == "Documents/../../etc/shadow");
}

TEST_CASE("strict denies absolute paths elsewhere") {
    TempDir cwd;
    auto v = strict_validator(cwd.path());

    CHECK_FALSE(v.is_path_allowed("/etc/passwd"));
    auto err = v.validation_error("/etc/passwd");
    REQUIRE(err.has_value());
    CHECK(err->is_access_denied());
}

TEST_CASE("sibling with shared prefix is denied") {
    TempDir base;
    fs::create_directories(base / "project");
    fs::create_directories(base / "project-evil");
    auto v = strict_validator(base / "project");

    CHECK_FALSE(v.is_path_allowed(base / "project-evil/file"));
    CHECK(v.is_path_allowed(base / "project/file"));
}

TEST_CASE("symlink escaping the root is denied") {
    TempDir cwd;
    TempDir outside;
    write_text(outside / "secret.txt", "secret");
    fs::create_symlink(outside.path(), cwd / "link");

    auto v = strict_validator(cwd.path());
    auto r = v.validate("link/secret.txt");
    CHECK_FALSE(r.ok);
    CHECK(r.error.is_access_denied());
}

TEST_CASE("dangling symlink pointing outside is denied") {
    TempDir cwd;
    TempDir outside;
    fs::create_symlink(outside / "later", cwd / "trap");

    auto v = strict_validator(cwd.path());
    CHECK_FALSE(v.is_path_allowed("trap/new-file.txt"));
}

TEST_CASE("relative dangling symlink reached through a symlinked directory is denied") {
    TempDir base;
    fs::create_directories(base / "root");
    fs::create_directories(base / "out/deep");
    fs::create_directory_symlink(base / "out/deep", base / "root/a");
    fs::create_symlink("../x", base / "out/deep/link");

    auto v = strict_validator(base / "root");
    auto r = v.validate(base / "root/a/link");
    CHECK_FALSE(r.ok);
    CHECK(r.error.is_access_denied());
    CHECK_FALSE(v.is_path_allowed(base / "out/x"));
}

TEST_CASE("symlink staying inside the root is followed") {
    TempDir cwd;
    write_text(cwd / "real/data.txt", "x");
    fs::create_symlink(cwd / "real", cwd / "alias");

    auto v = strict_validator(cwd.path());
    auto r = v.validate("alias/data.txt");
    REQUIRE(r.ok);
    CHECK(r.value == cwd / "real/data.txt");
}

TEST_CASE("validating a real path yields the same real path") {
    TempDir cwd;
    write_text(cwd / "a/b.txt", "x");
    fs::create_symlink(cwd / "a", cwd / "l");
    auto v = strict_validator(cwd.path());

    for (const char* input : {"a/b.txt", "l/b.txt", "./a/../a/b.txt", "missing/x"}) {
        auto first = v.validate(input);
        REQUIRE(first.ok);
        auto second = v.validate(first.value);
        REQUIRE(second.ok);
        CHECK(first.value == second.value);
    }
}

// ============================================================================
// Pipeline layers
// ============================================================================

TEST_CASE("malformed input is a validation error") {
    TempDir cwd;
    auto v = strict_validator(cwd.path());

    auto empty = v.validate("");
    CHECK(empty.error.is_validation());
    CHECK(empty.error.message == "Path cannot be empty");

    auto blank = v.validate("   ");
    CHECK(blank.error.is_validation());

    auto nul = v.validate(std::string("a\0b", 3));
    CHECK(nul.error.is_validation());
    CHECK(nul.error.message == "Path contains invalid null byte");

    auto control = v.validate("bad\x01name");
    CHECK(control.error.is_validation());
    CHECK(control.error.message == "Path contains invalid control characters");
}

TEST_CASE("reserved device names are rejected") {
    TempDir cwd;
    auto v = strict_validator(cwd.path());

    auto r = v.validate("docs/CON.txt");
    CHECK_FALSE(r.ok);
    CHECK(r.error.is_validation());
    CHECK(r.error.message == "Windows reserved filename detected: CON.txt");

    CHECK(is_reserved_device_name("con"));
    CHECK(is_reserved_device_name("Aux.log"));
    CHECK(is_reserved_device_name("COM1"));
    CHECK(is_reserved_device_name("lpt9.tar.gz"));
    CHECK_FALSE(is_reserved_device_name("COM0"));
    CHECK_FALSE(is_reserved_device_name("COM10"));
    CHECK_FALSE(is_reserved_device_name("CONSOLE"));
    CHECK_FALSE(is_reserved_device_name("readme.con"));
}

TEST_CASE("path length is checked after expansion") {
    TempDir cwd;
    SecurityPolicy policy;
    policy.mode = SecurityMode::Strict;
    policy.cwd = cwd.path();
    policy.limits.max_input_path_length = cwd.path().size() + 10;
    PathValidator v(policy);

    CHECK(v.validate("short").ok);

    auto r = v.validate("this-name-is-far-too-long.txt");
    CHECK_FALSE(r.ok);
    CHECK(r.error.is_validation());
    CHECK(r.error.message.find("Path too long") == 0);
    CHECK(categorize(r.error) == ErrorCategory::LimitExceeded);
}

TEST_CASE("no-follow option rejects a symlink leaf") {
    TempDir cwd;
    write_text(cwd / "target.txt", "x");
    fs::create_symlink(cwd / "target.txt", cwd / "link.txt");
    auto v = strict_validator(cwd.path());

    ValidateOptions opts;
    opts.resolve_symlinks = false;
    auto r = v.validate("link.txt", opts);
    CHECK_FALSE(r.ok);
    CHECK(r.error.is_validation());
    CHECK(r.error.message == "Symlinks are not allowed");

    CHECK(v.validate("target.txt", opts).ok);
}

TEST_CASE("require_exists and check_write") {
    TempDir cwd;
    write_text(cwd / "present.txt", "x");
    auto v = strict_validator(cwd.path());

    ValidateOptions must_exist;
    must_exist.require_exists = true;
    CHECK(v.validate("present.txt", must_exist).ok);

    auto missing = v.validate("absent.txt", must_exist);
    CHECK_FALSE(missing.ok);
    CHECK(missing.error.is_access_denied());
    CHECK(missing.error.message == "Access denied: Path does not exist");
    CHECK(categorize(missing.error) == ErrorCategory::PathNotFound);

    ValidateOptions writable;
    writable.check_write = true;
    CHECK(v.validate("new/nested/file.txt", writable).ok);
}

TEST_CASE("unwritable parent is access denied") {
    if (::geteuid() == 0) {
        MESSAGE("skipped: permission checks do not apply to root");
        return;
    }
    TempDir cwd;
    fs::create_directories(cwd / "locked");
    fs::permissions(cwd / "locked", fs::perms::owner_read | fs::perms::owner_exec);

    std::string reason;
    ValidateOptions writable;
    writable.check_write = true;
    CHECK_FALSE(check_access(cwd / "locked/new.txt", writable, reason));
    CHECK(reason == "Parent directory not accessible");

    fs::permissions(cwd / "locked", fs::perms::owner_all);
}

TEST_CASE("validate_path_base without roots skips containment") {
    TempDir dir;
    BaseOptions base;
    base.base_path = dir.path();

    auto r = validate_path_base("../elsewhere", base);
    REQUIRE(r.ok);
    CHECK(r.value == fs::path(dir.path()).parent_path().string() + "/elsewhere");
}

// ============================================================================
// Sandboxed mode
// ============================================================================

TEST_CASE("sandboxed with empty allow-list is a validation error") {
    TempDir dir;
    AllowListStore store(dir / "config.json");

    SecurityPolicy policy;
    policy.mode = SecurityMode::Sandboxed;
    policy.cwd = dir.path();
    policy.allow_list = &store;
    PathValidator v(policy);

    auto roots = v.root_set();
    CHECK_FALSE(roots.ok);
    CHECK(roots.error.is_validation());

    auto r = v.validate(dir / "anything");
    CHECK_FALSE(r.ok);
    CHECK(r.error.is_validation());
    CHECK(categorize(r.error) == ErrorCategory::Config);
}

TEST_CASE("sandboxed allows only allow-listed directories") {
    TempDir dir;
    fs::create_directories(dir / "allowed");
    fs::create_directories(dir / "other");
    AllowListStore store(dir / "config.json");
    REQUIRE(store.add(dir / "allowed").ok);

    SecurityPolicy policy;
    policy.mode = SecurityMode::Sandboxed;
    policy.cwd = dir / "other";
    policy.allow_list = &store;
    PathValidator v(policy);

    CHECK(v.is_path_allowed(dir / "allowed/file.txt"));
    CHECK_FALSE(v.is_path_allowed(dir / "other/file.txt"));
    CHECK_FALSE(v.is_path_allowed("file.txt"));
}

TEST_CASE("sandboxed override replaces the stored roots") {
    TempDir dir;
    fs::create_directories(dir / "stored");
    fs::create_directories(dir / "env");
    AllowListStore store(dir / "config.json");
    REQUIRE(store.add(dir / "stored").ok);

    SecurityPolicy policy;
    policy.mode = SecurityMode::Sandboxed;
    policy.cwd = dir.path();
    policy.allow_list = &store;
    policy.allowed_override = std::vector<std::string>{dir / "env"};
    PathValidator v(policy);

    CHECK(v.is_path_allowed(dir / "env/x"));
    CHECK_FALSE(v.is_path_allowed(dir / "stored/x"));
}

TEST_CASE("stored and overriding relative entries share the working directory") {
    TempDir dir;
    fs::create_directories(dir / "work/data");
    AllowListStore store(dir / "config.json", dir / "work");
    REQUIRE(store.add("data").ok);

    SecurityPolicy policy;
    policy.mode = SecurityMode::Sandboxed;
    policy.cwd = dir / "work";
    policy.allow_list = &store;
    PathValidator stored(policy);

    policy.allowed_override = std::vector<std::string>{"data"};
    PathValidator overridden(policy);

    REQUIRE(stored.root_set().ok);
    REQUIRE(overridden.root_set().ok);
    CHECK(stored.root_set().value == overridden.root_set().value);
    CHECK(stored.is_path_allowed(dir / "work/data/report.csv"));
    CHECK(overridden.is_path_allowed(dir / "work/data/report.csv"));
}

// ============================================================================
// Unrestricted mode
// ============================================================================

TEST_CASE("unrestricted denies system directories") {
    TempDir dir;
    SecurityPolicy policy;
    policy.mode = SecurityMode::Unrestricted;
    policy.cwd = dir.path();
    policy.deny_list = DenyList(default_system_deny_list());
    PathValidator v(policy);

    auto r = v.validate("/etc/passwd");
    CHECK_FALSE(r.ok);
    CHECK(r.error.is_access_denied());
    CHECK(r.error.message == "Access denied: Path is a protected system directory");

    CHECK(v.is_path_allowed(dir / "anywhere.txt"));
}

TEST_CASE("unrestricted applies configured denied directories") {
    TempDir dir;
    fs::create_directories(dir / "secret");
    Config config;
    config.security.mode = SecurityMode::Unrestricted;
    config.security.blacklist_system_paths = false;
    config.security.denied_directories = {dir / "secret"};
    AllowListStore store(dir / "config.json");

    auto v = make_validator(config, store, dir.path());
    CHECK_FALSE(v->is_path_allowed(dir / "secret/key"));
    CHECK(v->is_path_allowed(dir / "public/file"));
}

TEST_CASE("symlink into a denied directory is denied") {
    TempDir dir;
    fs::create_directories(dir / "secret");
    fs::create_symlink(dir / "secret", dir / "shortcut");

    SecurityPolicy policy;
    policy.mode = SecurityMode::Unrestricted;
    policy.cwd = dir.path();
    policy.deny_list = DenyList({dir / "secret"});
    PathValidator v(policy);

    CHECK_FALSE(v.is_path_allowed(dir / "shortcut/file"));
}

// ============================================================================
// quick_check / open_validated / make_validator
// ============================================================================

TEST_CASE("quick_check is lexical only") {
    TempDir cwd;
    TempDir outside;
    fs::create_symlink(outside.path(), cwd / "link");
    auto v = strict_validator(cwd.path());

    CHECK(v.quick_check("sub/file"));
    CHECK_FALSE(v.quick_check("../escape"));
    CHECK_FALSE(v.quick_check(""));

    // Lexically inside, really outside: only validate() catches it.
    CHECK(v.quick_check("link/file"));
    CHECK_FALSE(v.is_path_allowed("link/file"));
}

TEST_CASE("open_validated creates and reads inside the root") {
    TempDir cwd;
    auto v = strict_validator(cwd.path());

    auto created = v.open_validated("made.txt", OpenMode::Create);
    REQUIRE(created.ok);
    CHECK(::write(created.fd.get(), "abc", 3) == 3);
    created.fd.reset();

    auto read = v.open_validated("made.txt", OpenMode::Read);
    REQUIRE(read.ok);

    auto outside = v.open_validated("/etc/hostname", OpenMode::Read);
    CHECK_FALSE(outside.ok);
    CHECK(outside.error.is_access_denied());
}

TEST_CASE("make_validator follows the configured mode") {
    TempDir dir;
    fs::create_directories(dir / "env-root");
    AllowListStore store(dir / "config.json");

    Config config;
    config.security.mode = SecurityMode::Sandboxed;
    config.security.allowed_directories = {dir / "env-root"};
    config.security.allowed_directories_from_env = true;
    config.logging.audit_enabled = true;

    auto v = make_validator(config, store, dir.path());
    CHECK(v->mode() == SecurityMode::Sandboxed);
    CHECK(v->policy().audit);
    CHECK(v->is_path_allowed(dir / "env-root/a"));
    CHECK_FALSE(v->is_path_allowed(dir / "b"));
}
