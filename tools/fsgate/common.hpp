/**
 * fsgate CLI - Common utilities and types
 */

#pragma once

#include <fsgate/allow_list.hpp>
#include <fsgate/config.hpp>
#include <fsgate/error_format.hpp>
#include <fsgate/errors.hpp>
#include <fsgate/path_utils.hpp>
#include <fsgate/platform.hpp>
#include <fsgate/validator.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fsgate::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    std::string cwd;               // --cwd
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = sanitize_message(msg);
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << sanitize_message(msg) << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Route library logging to stderr so stdout stays machine-readable.
 */
inline void init_logging() {
    auto logger = spdlog::stderr_color_mt("fsgate");
    logger->set_pattern("[%l] %v");
    spdlog::set_default_logger(logger);
    spdlog::set_level(spdlog::level::warn);
}

// -v wins over -q, both win over logging.log_level
inline void apply_log_level(const GlobalOptions& opts, const Config& config) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(spdlog::level::from_str(config.logging.log_level));
    }
}

/**
 * Everything a command needs: configuration, allow-list store and the
 * validator for the configured mode.
 */
struct Context {
    Config config;
    std::string config_path;
    std::string cwd;
    std::unique_ptr<AllowListStore> store;
    std::unique_ptr<PathValidator> validator;

    GuidanceContext guidance() const {
        GuidanceContext g;
        g.mode = config.security.mode;
        g.allowed_directories = config.security.allowed_directories_from_env
                                    ? config.security.allowed_directories
                                    : store->originals();
        return g;
    }
};

inline std::optional<Context> load_context(const GlobalOptions& opts) {
    Context ctx;
    ctx.config_path = resolve_config_path(
        opts.config.empty() ? std::nullopt : std::make_optional(opts.config));

    auto loaded = load_config(ctx.config_path);
    if (!loaded.ok) {
        print_error(loaded.error, opts.json);
        return std::nullopt;
    }
    ctx.config = loaded.config;
    for (const auto& w : loaded.warnings) {
        print_warning(w);
    }
    apply_log_level(opts, ctx.config);

    if (opts.cwd.empty()) {
        ctx.cwd = current_directory();
    } else {
        auto normalized = normalize_path(opts.cwd);
        if (!normalized.ok) {
            print_error(std::string("Invalid --cwd: ") + path_error_to_string(normalized.error),
                        opts.json);
            return std::nullopt;
        }
        ctx.cwd = normalized.path;
    }

    ctx.store = std::make_unique<AllowListStore>(ctx.config_path, ctx.cwd);
    ctx.validator = make_validator(ctx.config, *ctx.store, ctx.cwd);
    spdlog::debug("mode {} with config {}", security_mode_to_string(ctx.config.security.mode),
                  ctx.config_path);
    return ctx;
}

/**
 * Report a typed failure. Text mode prints guidance, JSON mode the sanitized
 * message and its kind.
 */
inline void print_failure(const Error& error, const Context& ctx, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = sanitize_message(error.message);
        j["kind"] = error_kind_to_string(error.kind);
        j["category"] = error_category_to_string(categorize(error));
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << format_error(error, ctx.guidance()) << std::endl;
    }
}

} // namespace fsgate::cli
