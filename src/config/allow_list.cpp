#include "fsgate/allow_list.hpp"
#include "fsgate/containment.hpp"
#include "fsgate/path_utils.hpp"
#include "fsgate/platform.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace fsgate {

// The whole configuration document, so keys this store does not own survive
// a rewrite.
struct AllowListStore::Document {
    nlohmann::json root = nlohmann::json::object();

    std::vector<std::string> entries() const {
        std::vector<std::string> out;
        if (!root.contains("security") || !root["security"].is_object()) return out;
        const auto& security = root["security"];
        if (!security.contains("allowed_directories") ||
            !security["allowed_directories"].is_array()) {
            return out;
        }
        for (const auto& elem : security["allowed_directories"]) {
            if (elem.is_string()) out.push_back(elem.get<std::string>());
        }
        return out;
    }

    void set_entries(const std::vector<std::string>& dirs) {
        if (!root.contains("security") || !root["security"].is_object()) {
            root["security"] = nlohmann::json::object();
        }
        root["security"]["allowed_directories"] = dirs;
    }
};

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

PathResult normalize_directory(const std::string& directory, const std::string& base_dir) {
    return normalize_path(trim(directory), base_dir);
}

AllowedRoot describe(const std::string& original, const std::string& base_dir) {
    AllowedRoot root;
    root.original = original;
    auto normalized = normalize_directory(original, base_dir);
    if (!normalized.ok) {
        root.error = path_error_to_string(normalized.error);
        return root;
    }
    root.normalized = normalized.path;
    root.exists = is_directory(normalized.path);
    return root;
}

} // namespace

AllowListStore::AllowListStore(std::string config_path, std::string base_dir)
    : config_path_(std::move(config_path)), base_dir_(std::move(base_dir)) {}

bool AllowListStore::read_document(Document& doc, std::string& error) const {
    auto content = read_file(config_path_);
    if (!content) {
        if (path_exists(config_path_)) {
            error = "Could not read config file";
            return false;
        }
        doc.root = nlohmann::json::object();
        return true;
    }

    try {
        auto parsed = nlohmann::json::parse(*content);
        if (!parsed.is_object()) {
            error = "Config file must contain a JSON object";
            return false;
        }
        doc.root = std::move(parsed);
        return true;
    } catch (const nlohmann::json::parse_error& e) {
        error = std::string("Could not parse config file: ") + e.what();
        return false;
    }
}

bool AllowListStore::write_document(const Document& doc, std::string& error) const {
    std::string parent = get_parent_directory(config_path_);
    if (!parent.empty() && !create_directories(parent)) {
        error = "Could not create config directory";
        return false;
    }

    auto written = atomic_write_file(config_path_, doc.root.dump(2) + "\n");
    if (!written.ok) {
        error = written.error;
        return false;
    }
    return true;
}

AllowListResult AllowListStore::add(const std::string& directory, const AddOptions& options) {
    std::lock_guard<std::mutex> lock(mutex_);
    AllowListResult result;

    auto normalized = normalize_directory(directory, base_dir_);
    if (!normalized.ok) {
        result.message = "Failed to add directory: Directory must be a non-empty string";
        return result;
    }
    result.normalized = normalized.path;

    Document doc;
    std::string error;
    if (!read_document(doc, error)) {
        result.message = "Failed to add directory: " + error;
        return result;
    }

    auto current = doc.entries();
    for (const auto& entry : current) {
        auto existing = normalize_directory(entry, base_dir_);
        if (existing.ok && existing.path == normalized.path) {
            result.message = "Directory already in allow-list: " + normalized.path;
            return result;
        }
    }

    if (!is_directory(normalized.path)) {
        if (options.create_if_missing) {
            if (!create_directories(normalized.path)) {
                result.message = "Failed to add directory: could not create " + normalized.path;
                return result;
            }
        } else if (options.validate_exists) {
            result.message = "Directory does not exist: " + normalized.path +
                             ". Use the create option to create it.";
            return result;
        }
    }

    current.push_back(trim(directory));
    doc.set_entries(current);
    if (!write_document(doc, error)) {
        result.message = "Failed to add directory: " + error;
        return result;
    }

    spdlog::info("allow-list: added {}", normalized.path);
    result.ok = true;
    result.message = "Added directory to allow-list: " + normalized.path;
    return result;
}

AllowListResult AllowListStore::remove(const std::string& directory) {
    std::lock_guard<std::mutex> lock(mutex_);
    AllowListResult result;

    auto normalized = normalize_directory(directory, base_dir_);
    if (!normalized.ok) {
        result.message = "Failed to remove directory: Directory must be a non-empty string";
        return result;
    }
    result.normalized = normalized.path;

    Document doc;
    std::string error;
    if (!read_document(doc, error)) {
        result.message = "Failed to remove directory: " + error;
        return result;
    }

    auto current = doc.entries();
    auto matches = [&](const std::string& entry) {
        if (entry == directory) return true;
        auto existing = normalize_directory(entry, base_dir_);
        return existing.ok && existing.path == normalized.path;
    };
    auto it = std::remove_if(current.begin(), current.end(), matches);
    if (it == current.end()) {
        result.message = "Directory not found in allow-list: " + directory;
        return result;
    }
    current.erase(it, current.end());

    doc.set_entries(current);
    if (!write_document(doc, error)) {
        result.message = "Failed to remove directory: " + error;
        return result;
    }

    spdlog::info("allow-list: removed {}", normalized.path);
    result.ok = true;
    result.message = "Removed directory from allow-list: " + normalized.path;
    return result;
}

AllowListResult AllowListStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    AllowListResult result;

    Document doc;
    std::string error;
    if (!read_document(doc, error)) {
        result.message = "Failed to clear directories: " + error;
        return result;
    }

    size_t count = doc.entries().size();
    doc.set_entries({});
    if (!write_document(doc, error)) {
        result.message = "Failed to clear directories: " + error;
        return result;
    }

    spdlog::info("allow-list: cleared {} entries", count);
    result.ok = true;
    result.message = "Cleared " + std::to_string(count) + " directories from allow-list";
    return result;
}

std::vector<std::string> AllowListStore::originals() const {
    std::lock_guard<std::mutex> lock(mutex_);
    Document doc;
    std::string error;
    if (!read_document(doc, error)) {
        spdlog::warn("allow-list unreadable: {}", error);
        return {};
    }
    return doc.entries();
}

std::vector<AllowedRoot> AllowListStore::list() const {
    std::vector<AllowedRoot> out;
    for (const auto& original : originals()) {
        out.push_back(describe(original, base_dir_));
    }
    return out;
}

std::vector<std::string> AllowListStore::normalized_roots() const {
    std::vector<std::string> roots;
    for (const auto& root : list()) {
        if (!root.normalized.empty()) {
            roots.push_back(root.normalized);
        }
    }
    return dedupe_roots(roots);
}

AllowCheck AllowListStore::is_path_allowed(const std::string& path) const {
    AllowCheck check;

    auto normalized = normalize_directory(path, base_dir_);
    if (!normalized.ok) {
        check.error = path_error_to_string(normalized.error);
        return check;
    }

    for (const auto& root : list()) {
        if (root.normalized.empty()) continue;
        if (is_contained(normalized.path, root.normalized)) {
            check.allowed = true;
            check.containing_dir = root.original;
            return check;
        }
    }
    return check;
}

} // namespace fsgate
