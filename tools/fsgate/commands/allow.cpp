/**
 * fsgate CLI - allow command
 *
 * Manage the sandboxed-mode allow-list persisted in the configuration file.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace fsgate::cli::commands {

namespace {

struct AllowCmdOptions {
    std::string directory;
    std::string path;
    bool create = false;
    bool no_validate = false;
};

int report(const AllowListResult& result, const GlobalOptions& opts) {
    if (!result.ok) {
        print_error(result.message, opts.json);
        return 1;
    }
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["message"] = result.message;
        if (!result.normalized.empty()) {
            j["normalized"] = result.normalized;
        }
        output_json(j);
    } else if (!opts.quiet) {
        print_success(result.message, opts.json);
    }
    return 0;
}

int cmd_add(const GlobalOptions& opts, const AllowCmdOptions& cmd_opts) {
    init_warning_collector(opts.json, opts.quiet);
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    AddOptions add_opts;
    add_opts.create_if_missing = cmd_opts.create;
    add_opts.validate_exists = !cmd_opts.no_validate;
    return report(ctx->store->add(cmd_opts.directory, add_opts), opts);
}

int cmd_remove(const GlobalOptions& opts, const AllowCmdOptions& cmd_opts) {
    init_warning_collector(opts.json, opts.quiet);
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    return report(ctx->store->remove(cmd_opts.directory), opts);
}

int cmd_clear(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    return report(ctx->store->clear(), opts);
}

int cmd_list(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto roots = ctx->store->list();

    if (opts.json) {
        nlohmann::json dirs = nlohmann::json::array();
        for (const auto& root : roots) {
            nlohmann::json d;
            d["path"] = root.original;
            d["normalized"] = root.normalized.empty() ? nlohmann::json(nullptr)
                                                      : nlohmann::json(root.normalized);
            d["exists"] = root.exists;
            if (!root.error.empty()) d["error"] = root.error;
            dirs.push_back(d);
        }
        nlohmann::json j;
        j["ok"] = true;
        j["allowed_directories"] = dirs;
        output_json(j);
        return 0;
    }

    if (roots.empty()) {
        std::cout << "No directories in allow-list." << std::endl;
        return 0;
    }
    std::cout << "Allowed directories:" << std::endl;
    for (const auto& root : roots) {
        std::cout << "  " << root.original;
        if (!root.normalized.empty() && root.normalized != root.original) {
            std::cout << " -> " << root.normalized;
        }
        if (!root.exists) {
            std::cout << " (missing)";
        }
        std::cout << std::endl;
    }
    return 0;
}

int cmd_check(const GlobalOptions& opts, const AllowCmdOptions& cmd_opts) {
    init_warning_collector(opts.json, opts.quiet);
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto check = ctx->store->is_path_allowed(cmd_opts.path);
    if (!check.error.empty()) {
        print_error(check.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["allowed"] = check.allowed;
        if (check.allowed) j["containing_dir"] = check.containing_dir;
        output_json(j);
    } else if (check.allowed) {
        std::cout << "Allowed (in " << check.containing_dir << ")" << std::endl;
    } else {
        std::cout << "Not allowed" << std::endl;
    }
    return check.allowed ? 0 : 1;
}

} // anonymous namespace

void setup_allow(CLI::App* app, GlobalOptions& opts) {
    static AllowCmdOptions cmd_opts;

    app->require_subcommand(1);

    auto* add = app->add_subcommand("add", "Add a directory to the allow-list");
    add->add_option("directory", cmd_opts.directory, "Directory to allow")->required();
    add->add_flag("--create", cmd_opts.create, "Create the directory if missing");
    add->add_flag("--no-validate", cmd_opts.no_validate, "Accept a directory that does not exist");
    add->callback([&opts]() { std::exit(cmd_add(opts, cmd_opts)); });

    auto* remove = app->add_subcommand("remove", "Remove a directory from the allow-list");
    remove->add_option("directory", cmd_opts.directory, "Directory to remove")->required();
    remove->callback([&opts]() { std::exit(cmd_remove(opts, cmd_opts)); });

    auto* list = app->add_subcommand("list", "List allowed directories");
    list->callback([&opts]() { std::exit(cmd_list(opts)); });

    auto* check = app->add_subcommand("check", "Check whether a path is inside the allow-list");
    check->add_option("path", cmd_opts.path, "Path to check")->required();
    check->callback([&opts]() { std::exit(cmd_check(opts, cmd_opts)); });

    auto* clear = app->add_subcommand("clear", "Remove every directory from the allow-list");
    clear->callback([&opts]() { std::exit(cmd_clear(opts)); });
}

} // namespace fsgate::cli::commands
