#pragma once

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace fsgate {

// ============================================================================
// Platform Detection
// ============================================================================

enum class Platform {
    Linux,
    macOS,
    Windows,
    Unknown
};

Platform get_current_platform();

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The temp file is created with O_EXCL | O_NOFOLLOW beside the target.
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode = 0644);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes
std::string to_portable_path(const std::string& path);

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Get the filename from a path
std::string get_filename(const std::string& path);

// Check if a path exists (follows symlinks)
bool path_exists(const std::string& path);

// Check if a path is a directory (follows symlinks)
bool is_directory(const std::string& path);

// Create directories recursively
bool create_directories(const std::string& path);

// Read a whole file; nullopt if it cannot be opened
std::optional<std::string> read_file(const std::string& path);

// Current working directory of the process
std::string current_directory();

// ============================================================================
// Environment
// ============================================================================

// Get an environment variable
std::optional<std::string> get_env(const std::string& name);

// Get all environment variables as a map
std::unordered_map<std::string, std::string> get_all_env();

// Home directory: HOME, then the passwd entry
std::string home_directory();

// Generate a UUID string
std::string generate_uuid();

} // namespace fsgate
