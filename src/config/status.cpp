#include "fsgate/status.hpp"
#include "fsgate/path_utils.hpp"
#include "fsgate/platform.hpp"

#include <cstdio>
#include <sstream>

namespace fsgate {

std::string format_bytes(std::uint64_t bytes) {
    static const char* const units[] = {"B", "KB", "MB", "GB"};
    size_t unit = 0;
    double value = static_cast<double>(bytes);

    while (value >= 1024.0 && unit < 3) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), value < 10.0 ? "%.1f %s" : "%.0f %s", value, units[unit]);
    return buf;
}

nlohmann::json security_status(const Config& config, const AllowListStore& store,
                               const std::string& cwd) {
    SecurityMode mode = config.security.mode;
    ModeInfo info = mode_info(mode);

    nlohmann::json status;
    status["mode"] = security_mode_to_string(mode);
    status["mode_display"] = info.name;
    status["mode_description"] = info.description;
    status["risk_level"] = info.risk_level;
    status["cwd"] = cwd;
    status["config_path"] = store.config_path();
    status["limits"] = {
        {"max_file_size", format_bytes(config.limits.max_file_size)},
        {"max_files_per_operation", config.limits.max_files_per_operation},
        {"max_directory_depth", config.limits.max_directory_depth},
    };
    status["logging"] = {
        {"audit_enabled", config.logging.audit_enabled},
        {"log_level", config.logging.log_level},
    };

    nlohmann::json warnings = nlohmann::json::array();
    nlohmann::json recommendations = nlohmann::json::array();

    if (mode == SecurityMode::Sandboxed) {
        std::vector<AllowedRoot> roots;
        if (config.security.allowed_directories_from_env) {
            for (const auto& dir : config.security.allowed_directories) {
                AllowedRoot root;
                root.original = dir;
                auto normalized = normalize_path(dir, cwd);
                if (normalized.ok) {
                    root.normalized = normalized.path;
                    root.exists = is_directory(normalized.path);
                } else {
                    root.error = path_error_to_string(normalized.error);
                }
                roots.push_back(root);
            }
        } else {
            roots = store.list();
        }

        nlohmann::json dirs = nlohmann::json::array();
        size_t missing = 0;
        for (const auto& root : roots) {
            nlohmann::json d;
            d["path"] = root.original;
            d["resolved"] = root.normalized.empty() ? nlohmann::json(nullptr)
                                                    : nlohmann::json(root.normalized);
            d["exists"] = root.exists;
            if (!root.error.empty()) d["error"] = root.error;
            dirs.push_back(d);
            if (!root.exists) ++missing;
        }
        status["allowed_directories"] = dirs;

        if (roots.empty()) {
            warnings.push_back("No directories configured for SANDBOXED mode. "
                               "Add directories to enable file operations.");
        }
        if (missing > 0) {
            warnings.push_back(std::to_string(missing) + " configured directories do not exist.");
        }
    }

    if (mode == SecurityMode::Strict) {
        recommendations.push_back(
            "Consider switching to SANDBOXED mode for more flexibility with multiple directories.");
    }

    if (mode == SecurityMode::Unrestricted) {
        warnings.push_back("RUNNING IN UNRESTRICTED MODE - Full filesystem access enabled");
        warnings.push_back("Audit logging is mandatory in this mode");
        if (!config.security.blacklist_system_paths) {
            warnings.push_back(
                "System path blacklist is DISABLED - critical system files are accessible");
        }
    }

    status["warnings"] = warnings;
    status["recommendations"] = recommendations;
    return status;
}

std::string status_report(const nlohmann::json& status) {
    std::ostringstream out;
    const std::string rule(55, '=');

    out << rule << "\n"
        << "  FSGATE - SECURITY STATUS\n"
        << rule << "\n\n";

    out << "Security Mode: " << status.value("mode_display", "") << "\n"
        << "   " << status.value("mode_description", "") << "\n"
        << "   Risk Level: " << status.value("risk_level", "") << "\n\n";

    out << "Working Directory: " << status.value("cwd", "") << "\n\n";

    if (status.contains("limits")) {
        const auto& limits = status["limits"];
        out << "Limits:\n"
            << "   - Max file size: " << limits.value("max_file_size", "") << "\n"
            << "   - Max files per operation: "
            << limits.value("max_files_per_operation", std::uint64_t{0}) << "\n"
            << "   - Max directory depth: "
            << limits.value("max_directory_depth", std::uint64_t{0}) << "\n\n";
    }

    if (status.contains("logging")) {
        const auto& logging = status["logging"];
        out << "Logging:\n"
            << "   - Audit: " << (logging.value("audit_enabled", false) ? "Enabled" : "Disabled")
            << "\n"
            << "   - Level: " << logging.value("log_level", "") << "\n";
    }

    if (status.contains("allowed_directories") && !status["allowed_directories"].empty()) {
        out << "\nAllowed Directories:\n";
        for (const auto& dir : status["allowed_directories"]) {
            std::string path = dir.value("path", "");
            out << "   " << (dir.value("exists", false) ? "[ok]      " : "[missing] ") << path
                << "\n";
            if (dir.contains("resolved") && dir["resolved"].is_string() &&
                dir["resolved"].get<std::string>() != path) {
                out << "      -> " << dir["resolved"].get<std::string>() << "\n";
            }
        }
    }

    auto print_list = [&out](const nlohmann::json& items, const char* title) {
        if (!items.is_array() || items.empty()) return;
        out << "\n" << title << ":\n";
        for (const auto& item : items) {
            out << "   - " << item.get<std::string>() << "\n";
        }
    };
    if (status.contains("warnings")) print_list(status["warnings"], "Warnings");
    if (status.contains("recommendations")) print_list(status["recommendations"], "Recommendations");

    out << "\n" << rule;
    return out.str();
}

} // namespace fsgate
