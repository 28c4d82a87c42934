#pragma once

#include "fsgate/limits.hpp"

#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace fsgate {

// ============================================================================
// Archive Entry Validation
// ============================================================================

struct ArchiveEntry {
    std::string name;
    std::uint64_t declared_size = 0;
};

struct EntryValidation {
    bool valid = false;
    std::string entry_name;
    std::string error;
    std::string extraction_path;  // absolute, when valid
};

struct ArchiveValidation {
    bool valid = false;
    std::vector<EntryValidation> invalid_entries;
};

// One row of the blocked-name table.
struct BlockedPattern {
    std::string name;
    std::string expression;
    std::regex regex;
};

// Rule table, compiled once and evaluated in this order against entry names
// with '\' converted to '/'.
const std::vector<BlockedPattern>& blocked_patterns();

// Checks, in order: blocked patterns, total and per-component length,
// containment of target_dir + name in target_dir, NUL bytes, reserved device
// basenames. target_dir must be absolute.
EntryValidation validate_entry(const std::string& name,
                               const std::string& target_dir,
                               const SecurityLimits& limits = default_limits());

// Entry-count limit is checked first and rejects without inspecting any
// entry. Otherwise every failing entry is reported, plus declared sizes over
// max_file_size and an aggregate failure when the declared total exceeds
// max_absolute_bytes.
ArchiveValidation validate_archive_entries(const std::vector<ArchiveEntry>& entries,
                                           const std::string& target_dir,
                                           const SecurityLimits& limits = default_limits());

// Best-effort cleanup for display or for mapping a rejected name to something
// harmless: drops control characters and NUL, converts '\' to '/', strips
// leading separators and removes "." / ".." components.
// The result must still go through validate_entry before use.
std::string sanitize_entry_name(const std::string& name);

// ============================================================================
// Format Detection
// ============================================================================

enum class ArchiveFormat {
    Zip,
    ZipEmpty,
    ZipSpanned,
    Gzip,
    Bzip2,
    Xz,
    SevenZip,
    Tar,
    Unknown,
};

const char* archive_format_to_string(ArchiveFormat format);

struct FormatDetection {
    bool ok = false;
    ArchiveFormat format = ArchiveFormat::Unknown;
    std::string error;
};

// Magic-number detection. Fewer than 4 bytes, or no known signature, is an
// error.
FormatDetection detect_archive_format(const std::vector<std::uint8_t>& header);

// Reads the first 512 bytes of path.
FormatDetection detect_archive_format_file(const std::string& path);

} // namespace fsgate
