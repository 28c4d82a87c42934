#pragma once

#include "fsgate/archive_validator.hpp"
#include "fsgate/limits.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace fsgate {

// ============================================================================
// Guarded Extraction
// ============================================================================

// Entry type in a tar archive
enum class TarEntryType {
    RegularFile,
    Directory,
    Symlink,    // rejected
    Hardlink,   // rejected
    Other       // rejected
};

struct TarMember {
    std::string name;
    TarEntryType type = TarEntryType::Other;
    std::uint64_t size = 0;
    bool executable = false;
    std::size_t data_offset = 0;  // into the inflated buffer
};

struct InflateResult {
    bool ok = false;
    std::string error;
    std::vector<std::uint8_t> data;
    std::uint64_t compressed_bytes = 0;
};

// Inflate a gzip stream in limits.chunk_size steps; every produced chunk is
// accounted against a DecompressionBudget before it is kept.
InflateResult gzip_inflate_guarded(const std::vector<std::uint8_t>& compressed,
                                   const SecurityLimits& limits);

struct TarParseResult {
    bool ok = false;
    std::string error;
    std::vector<TarMember> members;
};

// Parse ustar headers from an uncompressed tar stream. No data is copied.
TarParseResult parse_tar(const std::vector<std::uint8_t>& tar_data);

struct ExtractResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> entries;                // extracted relative paths
    std::vector<EntryValidation> invalid_entries;    // when validation failed
    std::uint64_t bytes_written = 0;
};

// Extract a .tar.gz into an existing target directory. All entries are
// validated before anything is written; files are created exclusively and
// never through a symlink. On failure, files created so far are removed.
ExtractResult extract_tar_gz(const std::string& archive_path,
                             const std::string& target_dir,
                             const SecurityLimits& limits = default_limits());

} // namespace fsgate
