#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace fsgate {

// ============================================================================
// Security Limits
// ============================================================================

constexpr std::uint64_t KiB = 1024;
constexpr std::uint64_t MiB = 1024 * KiB;
constexpr std::uint64_t GiB = 1024 * MiB;

// Process-wide, read-only after start. Nothing in the library mutates an
// instance it did not create.
struct SecurityLimits {
    // Decompression bomb mitigation
    std::uint64_t max_ratio = 10;                          // uncompressed / compressed
    std::uint64_t max_absolute_bytes = 5 * GiB / 2;        // 2.5 GiB
    std::size_t max_entries = 10000;
    std::uint64_t max_file_size = 1 * GiB;
    std::size_t chunk_size = 64 * KiB;
    // Ratio is not judged until this much output exists; tar padding alone
    // compresses far beyond max_ratio.
    std::uint64_t ratio_grace_bytes = 1 * MiB;

    // Archive entry names
    std::size_t max_path_length = 260;
    std::size_t max_path_component_length = 255;

    // Validator input, measured after ~ and variable expansion
    std::size_t max_input_path_length = 4096;
};

SecurityLimits default_limits();

// ============================================================================
// Decompression Budget
// ============================================================================

// Per-chunk limits contract for callers that inflate archive data. Every
// chunk handed out by the decompressor is accounted before it is used:
// cumulative uncompressed bytes must stay within max_absolute_bytes and the
// running uncompressed:compressed ratio within max_ratio.
//
// The ratio is not enforced until cumulative output passes
// ratio_grace_bytes, so the first grace window may exceed max_ratio. The
// absolute limit applies from the first byte.
class DecompressionBudget {
public:
    explicit DecompressionBudget(const SecurityLimits& limits)
        : max_ratio_(limits.max_ratio),
          max_absolute_bytes_(limits.max_absolute_bytes),
          ratio_grace_bytes_(limits.ratio_grace_bytes) {}

    // Returns false once a limit is exceeded; the reason is kept in error().
    bool account(std::uint64_t compressed_bytes, std::uint64_t uncompressed_bytes);

    std::uint64_t compressed_total() const { return compressed_total_; }
    std::uint64_t uncompressed_total() const { return uncompressed_total_; }
    bool exceeded() const { return exceeded_; }
    const std::string& error() const { return error_; }

private:
    std::uint64_t max_ratio_;
    std::uint64_t max_absolute_bytes_;
    std::uint64_t ratio_grace_bytes_;
    std::uint64_t compressed_total_ = 0;
    std::uint64_t uncompressed_total_ = 0;
    bool exceeded_ = false;
    std::string error_;
};

} // namespace fsgate
