#pragma once

#include <mutex>
#include <string>
#include <vector>

namespace fsgate {

// ============================================================================
// Allow-List Store
// ============================================================================

// One configured directory. `original` is persisted verbatim (may contain ~
// or variables); `normalized` is derived on demand and never persisted.
struct AllowedRoot {
    std::string original;
    std::string normalized;  // empty if normalization failed
    bool exists = false;
    std::string error;
};

struct AllowListResult {
    bool ok = false;
    std::string message;
    std::string normalized;
};

struct AllowCheck {
    bool allowed = false;
    std::string containing_dir;  // original entry that matched
    std::string error;
};

struct AddOptions {
    bool create_if_missing = false;
    bool validate_exists = true;
};

// Persisted as security.allowed_directories in the JSON configuration
// document at config_path. Every mutation is a read-modify-write of that
// file serialized by an in-process mutex. There is no cross-process lock:
// with several processes on one file, the last writer wins.
//
// Relative entries are normalized against base_dir (the process working
// directory when empty), the same base the validator uses.
class AllowListStore {
public:
    explicit AllowListStore(std::string config_path, std::string base_dir = {});

    AllowListResult add(const std::string& directory, const AddOptions& options = {});

    // Matches by original string or by normalized form; removes all matches.
    AllowListResult remove(const std::string& directory);

    AllowListResult clear();

    std::vector<AllowedRoot> list() const;

    // Persisted strings, as written.
    std::vector<std::string> originals() const;

    // Normalized, deduplicated roots. Entries that fail to normalize are skipped.
    std::vector<std::string> normalized_roots() const;

    AllowCheck is_path_allowed(const std::string& path) const;

    const std::string& config_path() const { return config_path_; }

private:
    struct Document;

    bool read_document(Document& doc, std::string& error) const;
    bool write_document(const Document& doc, std::string& error) const;

    std::string config_path_;
    std::string base_dir_;
    mutable std::mutex mutex_;
};

} // namespace fsgate
