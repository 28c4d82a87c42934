#include <doctest/doctest.h>
#include <fsgate/archive_validator.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace fsgate;
using fsgate::testing::TempDir;
using fsgate::testing::write_text;

// ============================================================================
// validate_entry
// ============================================================================

TEST_CASE("safe entry maps under the target") {
    auto v = validate_entry("docs/readme.txt", "/safe/target");
    CHECK(v.valid);
    CHECK(v.extraction_path == "/safe/target/docs/readme.txt");
}

TEST_CASE("nested safe entries accepted") {
    CHECK(validate_entry("src/sub/dir/file.so", "/safe/target").valid);
    CHECK(validate_entry("a/b/..", "/safe/target").valid);
    CHECK(validate_entry("file..name", "/safe/target").valid);
}

TEST_CASE("parent traversal rejected") {
    auto v = validate_entry("../../etc/passwd", "/safe/target");
    CHECK_FALSE(v.valid);
    CHECK(v.error == "Path traversal attempt detected: ../../etc/passwd");

    CHECK_FALSE(validate_entry("docs/../../escape", "/safe/target").valid);
    CHECK_FALSE(validate_entry("docs\\..\\..\\escape", "/safe/target").valid);
}

TEST_CASE("absolute names and drive prefixes rejected") {
    CHECK_FALSE(validate_entry("/etc/passwd", "/safe/target").valid);
    CHECK_FALSE(validate_entry("\\windows\\system32", "/safe/target").valid);
    CHECK_FALSE(validate_entry("C:\\Windows\\evil.dll", "/safe/target").valid);
    CHECK_FALSE(validate_entry("c:/temp/x", "/safe/target").valid);
}

TEST_CASE("system directory prefixes rejected as whole first components") {
    CHECK_FALSE(validate_entry("etc/cron.d/job", "/safe/target").valid);
    CHECK_FALSE(validate_entry("USR/bin/x", "/safe/target").valid);
    CHECK_FALSE(validate_entry("tmp", "/safe/target").valid);
    CHECK_FALSE(validate_entry("Program Files/app.exe", "/safe/target").valid);
    CHECK_FALSE(validate_entry("windows\\system.ini", "/safe/target").valid);

    CHECK(validate_entry("etcetera/file", "/safe/target").valid);
    CHECK(validate_entry("library/file", "/safe/target").valid);
    CHECK(validate_entry("docs/etc/file", "/safe/target").valid);
}

TEST_CASE("length limits") {
    SecurityLimits limits;
    limits.max_path_length = 20;
    limits.max_path_component_length = 8;

    CHECK(validate_entry("short/name", "/t", limits).valid);

    auto long_total = validate_entry("aaaaaaa/bbbbbbb/ccccccc", "/t", limits);
    CHECK_FALSE(long_total.valid);
    CHECK(long_total.error.find("Path too long") == 0);

    auto long_component = validate_entry("ok/muchtoolong", "/t", limits);
    CHECK_FALSE(long_component.valid);
    CHECK(long_component.error.find("Path component too long") == 0);
}

TEST_CASE("NUL byte in entry name rejected") {
    auto v = validate_entry(std::string("evil\0.txt", 9), "/safe/target");
    CHECK_FALSE(v.valid);
    CHECK(v.error == "Null byte detected in entry name");
}

TEST_CASE("reserved device basename rejected") {
    auto v = validate_entry("docs/nul.txt", "/safe/target");
    CHECK_FALSE(v.valid);
    CHECK(v.error == "Windows reserved filename detected: nul.txt");
}

TEST_CASE("blocked pattern table is exposed in evaluation order") {
    const auto& patterns = blocked_patterns();
    REQUIRE(patterns.size() == 6);
    CHECK(patterns.front().name == "absolute_path");
    CHECK(patterns[2].name == "parent_traversal");
    CHECK(patterns.back().name == "windows_system_directory");
}

// ============================================================================
// validate_archive_entries
// ============================================================================

TEST_CASE("every failing entry is reported") {
    std::vector<ArchiveEntry> entries = {
        {"ok/file.txt", 10},
        {"../escape", 10},
        {"/abs", 10},
        {"also/fine", 10},
    };
    auto result = validate_archive_entries(entries, "/safe/target");
    CHECK_FALSE(result.valid);
    REQUIRE(result.invalid_entries.size() == 2);
    CHECK(result.invalid_entries[0].entry_name == "../escape");
    CHECK(result.invalid_entries[1].entry_name == "/abs");
}

TEST_CASE("entry count limit short-circuits") {
    SecurityLimits limits;
    limits.max_entries = 3;

    std::vector<ArchiveEntry> entries = {{"a", 1}, {"../b", 1}, {"c", 1}, {"d", 1}};
    auto result = validate_archive_entries(entries, "/safe/target", limits);
    CHECK_FALSE(result.valid);
    REQUIRE(result.invalid_entries.size() == 1);
    CHECK(result.invalid_entries[0].error == "Too many entries: 4 exceeds limit of 3");
}

TEST_CASE("declared sizes are checked per entry and in total") {
    SecurityLimits limits;
    limits.max_file_size = 100;
    limits.max_absolute_bytes = 150;

    std::vector<ArchiveEntry> entries = {{"a", 101}, {"b", 60}};
    auto result = validate_archive_entries(entries, "/safe/target", limits);
    CHECK_FALSE(result.valid);
    REQUIRE(result.invalid_entries.size() == 2);
    CHECK(result.invalid_entries[0].error == "File size 101 exceeds maximum allowed 100");
    CHECK(result.invalid_entries[1].error == "Total size 161 exceeds maximum allowed 150");
}

TEST_CASE("clean archive is valid") {
    std::vector<ArchiveEntry> entries = {{"app/bin/tool", 100}, {"app/lib/libx.so", 200}, {"docs", 0}};
    auto result = validate_archive_entries(entries, "/safe/target");
    CHECK(result.valid);
    CHECK(result.invalid_entries.empty());
}

// ============================================================================
// sanitize_entry_name
// ============================================================================

TEST_CASE("sanitize strips separators, dotdot and control characters") {
    CHECK(sanitize_entry_name("../../etc/passwd") == "etc/passwd");
    CHECK(sanitize_entry_name("/abs/./path") == "abs/path");
    CHECK(sanitize_entry_name("dir\\sub\\file") == "dir/sub/file");
    CHECK(sanitize_entry_name(std::string("a\0b\x01" "c", 5)) == "abc");
    CHECK(sanitize_entry_name("///") == "");
}

// ============================================================================
// Format detection
// ============================================================================

TEST_CASE("magic numbers are recognized") {
    CHECK(detect_archive_format({0x50, 0x4B, 0x03, 0x04, 0x00}).format == ArchiveFormat::Zip);
    CHECK(detect_archive_format({0x50, 0x4B, 0x05, 0x06}).format == ArchiveFormat::ZipEmpty);
    CHECK(detect_archive_format({0x50, 0x4B, 0x07, 0x08}).format == ArchiveFormat::ZipSpanned);
    CHECK(detect_archive_format({0x1F, 0x8B, 0x08, 0x00}).format == ArchiveFormat::Gzip);
    CHECK(detect_archive_format({0x42, 0x5A, 0x68, 0x39}).format == ArchiveFormat::Bzip2);
    CHECK(detect_archive_format({0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00}).format ==
          ArchiveFormat::Xz);
    CHECK(detect_archive_format({0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C}).format ==
          ArchiveFormat::SevenZip);

    std::vector<std::uint8_t> tar(512, 0);
    std::copy_n("ustar", 5, tar.begin() + 257);
    CHECK(detect_archive_format(tar).format == ArchiveFormat::Tar);
}

TEST_CASE("too small or unknown content is an error") {
    auto small = detect_archive_format({0x1F, 0x8B});
    CHECK_FALSE(small.ok);
    CHECK(small.error == "File too small to be an archive");

    auto unknown = detect_archive_format({'h', 'e', 'l', 'l', 'o'});
    CHECK_FALSE(unknown.ok);
    CHECK(unknown.format == ArchiveFormat::Unknown);
}

TEST_CASE("detect from file") {
    TempDir dir;
    write_text(dir / "a.zip", std::string("PK\x03\x04rest", 8));

    auto detected = detect_archive_format_file(dir / "a.zip");
    REQUIRE(detected.ok);
    CHECK(detected.format == ArchiveFormat::Zip);
    CHECK(std::string(archive_format_to_string(detected.format)) == "zip");

    CHECK_FALSE(detect_archive_format_file(dir / "absent").ok);
}
