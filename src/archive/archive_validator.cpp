#include "fsgate/archive_validator.hpp"
#include "fsgate/containment.hpp"
#include "fsgate/path_utils.hpp"
#include "fsgate/platform.hpp"
#include "fsgate/validator.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>
#include <fstream>

namespace fsgate {

namespace {

BlockedPattern make_pattern(const char* name, const char* expression, bool icase = false) {
    auto flags = std::regex::ECMAScript;
    if (icase) flags |= std::regex::icase;
    return BlockedPattern{name, expression, std::regex(expression, flags)};
}

std::vector<std::string> split_components(const std::string& name) {
    std::vector<std::string> parts;
    std::string current;
    for (char c : name) {
        if (c == '/') {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

EntryValidation reject(const std::string& name, std::string error) {
    EntryValidation v;
    v.valid = false;
    v.entry_name = name;
    v.error = std::move(error);
    return v;
}

bool starts_with(const std::vector<std::uint8_t>& data, const std::vector<std::uint8_t>& magic,
                 size_t offset) {
    if (data.size() < offset + magic.size()) return false;
    return std::equal(magic.begin(), magic.end(), data.begin() + static_cast<long>(offset));
}

} // namespace

// ============================================================================
// Blocked Pattern Table
// ============================================================================

const std::vector<BlockedPattern>& blocked_patterns() {
    static const std::vector<BlockedPattern> patterns = {
        make_pattern("absolute_path", R"(^/)"),
        make_pattern("windows_drive", R"(^[A-Z]:[/\\])", true),
        make_pattern("parent_traversal", R"(\.\.[/\\])"),
        make_pattern("leading_separator", R"(^[/\\]+)"),
        make_pattern("system_directory", R"(^(etc|bin|usr|sbin|boot|lib|root|home|tmp)([/\\]|$))",
                     true),
        make_pattern("windows_system_directory",
                     R"(^(Windows|Program Files|Program Files \(x86\))([/\\]|$))", true),
    };
    return patterns;
}

// ============================================================================
// Entry Validation
// ============================================================================

EntryValidation validate_entry(const std::string& name, const std::string& target_dir,
                               const SecurityLimits& limits) {
    std::string normalized_entry = to_portable_path(name);

    for (const auto& pattern : blocked_patterns()) {
        if (std::regex_search(normalized_entry, pattern.regex)) {
            spdlog::debug("entry rejected by pattern {}", pattern.name);
            return reject(name, "Path traversal attempt detected: " + name);
        }
    }

    if (normalized_entry.size() > limits.max_path_length) {
        return reject(name, "Path too long: " + std::to_string(normalized_entry.size()) +
                                " characters (max: " + std::to_string(limits.max_path_length) +
                                ")");
    }
    for (const auto& component : split_components(normalized_entry)) {
        if (component.size() > limits.max_path_component_length) {
            return reject(name, "Path component too long: " + std::to_string(component.size()) +
                                    " characters (max: " +
                                    std::to_string(limits.max_path_component_length) + ")");
        }
    }

    std::string target = target_dir;
    if (target.empty() || target[0] != '/') {
        auto resolved_target = normalize_path(target_dir.empty() ? "." : target_dir);
        if (!resolved_target.ok) {
            return reject(name, "Invalid target directory");
        }
        target = resolved_target.path;
    } else {
        target = collapse_absolute(target);
    }

    std::string extraction_path = collapse_absolute(target + "/" + normalized_entry);
    if (!is_contained(extraction_path, target)) {
        return reject(name, "Zip-slip attempt: extracted path escapes target directory");
    }

    if (name.find('\0') != std::string::npos) {
        return reject(name, "Null byte detected in entry name");
    }

    std::string base = get_filename(normalized_entry);
    if (!base.empty() && is_reserved_device_name(base)) {
        return reject(name, "Windows reserved filename detected: " + base);
    }

    EntryValidation v;
    v.valid = true;
    v.entry_name = name;
    v.extraction_path = extraction_path;
    return v;
}

ArchiveValidation validate_archive_entries(const std::vector<ArchiveEntry>& entries,
                                           const std::string& target_dir,
                                           const SecurityLimits& limits) {
    ArchiveValidation result;

    if (entries.size() > limits.max_entries) {
        result.invalid_entries.push_back(
            reject("", "Too many entries: " + std::to_string(entries.size()) +
                           " exceeds limit of " + std::to_string(limits.max_entries)));
        return result;
    }

    std::uint64_t declared_total = 0;
    for (const auto& entry : entries) {
        auto validation = validate_entry(entry.name, target_dir, limits);
        if (!validation.valid) {
            result.invalid_entries.push_back(std::move(validation));
            continue;
        }

        if (entry.declared_size > limits.max_file_size) {
            result.invalid_entries.push_back(
                reject(entry.name, "File size " + std::to_string(entry.declared_size) +
                                       " exceeds maximum allowed " +
                                       std::to_string(limits.max_file_size)));
        }
        declared_total += entry.declared_size;
    }

    if (declared_total > limits.max_absolute_bytes) {
        result.invalid_entries.push_back(
            reject("", "Total size " + std::to_string(declared_total) +
                           " exceeds maximum allowed " +
                           std::to_string(limits.max_absolute_bytes)));
    }

    result.valid = result.invalid_entries.empty();
    if (!result.valid) {
        spdlog::warn("archive rejected: {} invalid entries", result.invalid_entries.size());
    }
    return result;
}

std::string sanitize_entry_name(const std::string& name) {
    std::string cleaned;
    cleaned.reserve(name.size());
    for (unsigned char c : name) {
        if (c < 0x20 || c == 0x7f) continue;
        cleaned += static_cast<char>(c == '\\' ? '/' : c);
    }

    size_t start = cleaned.find_first_not_of('/');
    if (start == std::string::npos) {
        return {};
    }

    std::string out;
    for (const auto& part : split_components(cleaned.substr(start))) {
        if (part.empty() || part == "." || part == "..") continue;
        if (!out.empty()) out += '/';
        out += part;
    }
    return out;
}

// ============================================================================
// Format Detection
// ============================================================================

const char* archive_format_to_string(ArchiveFormat format) {
    switch (format) {
        case ArchiveFormat::Zip: return "zip";
        case ArchiveFormat::ZipEmpty: return "zip-empty";
        case ArchiveFormat::ZipSpanned: return "zip-spanned";
        case ArchiveFormat::Gzip: return "gz";
        case ArchiveFormat::Bzip2: return "bz2";
        case ArchiveFormat::Xz: return "xz";
        case ArchiveFormat::SevenZip: return "7z";
        case ArchiveFormat::Tar: return "tar";
        case ArchiveFormat::Unknown: return "unknown";
    }
    return "unknown";
}

FormatDetection detect_archive_format(const std::vector<std::uint8_t>& header) {
    FormatDetection result;

    if (header.size() < 4) {
        result.error = "File too small to be an archive";
        return result;
    }

    struct Signature {
        ArchiveFormat format;
        std::vector<std::uint8_t> magic;
        size_t offset;
    };
    static const Signature signatures[] = {
        {ArchiveFormat::Zip, {0x50, 0x4B, 0x03, 0x04}, 0},
        {ArchiveFormat::ZipEmpty, {0x50, 0x4B, 0x05, 0x06}, 0},
        {ArchiveFormat::ZipSpanned, {0x50, 0x4B, 0x07, 0x08}, 0},
        {ArchiveFormat::Gzip, {0x1F, 0x8B}, 0},
        {ArchiveFormat::Bzip2, {0x42, 0x5A, 0x68}, 0},
        {ArchiveFormat::Xz, {0xFD, 0x37, 0x7A, 0x58, 0x5A, 0x00}, 0},
        {ArchiveFormat::SevenZip, {0x37, 0x7A, 0xBC, 0xAF, 0x27, 0x1C}, 0},
        {ArchiveFormat::Tar, {0x75, 0x73, 0x74, 0x61, 0x72}, 257},
    };

    for (const auto& sig : signatures) {
        if (starts_with(header, sig.magic, sig.offset)) {
            result.ok = true;
            result.format = sig.format;
            return result;
        }
    }

    result.error = "Unknown or unsupported archive format";
    return result;
}

FormatDetection detect_archive_format_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        FormatDetection result;
        result.error = "Could not open file";
        return result;
    }

    std::vector<std::uint8_t> header(512);
    file.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    header.resize(static_cast<size_t>(file.gcount()));
    return detect_archive_format(header);
}

} // namespace fsgate
