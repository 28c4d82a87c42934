/**
 * fsgate CLI - validate command
 *
 * Run a path through the validator for the configured mode and print the
 * proven-safe real path.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace fsgate::cli::commands {

namespace {

struct ValidateCmdOptions {
    std::string path;
    bool require_exists = false;
    bool write = false;
    bool no_follow = false;
};

int cmd_validate(const GlobalOptions& opts, const ValidateCmdOptions& cmd_opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto ctx = load_context(opts);
    if (!ctx) return 1;

    ValidateOptions options;
    options.require_exists = cmd_opts.require_exists;
    options.check_write = cmd_opts.write;
    options.resolve_symlinks = !cmd_opts.no_follow;

    auto result = ctx->validator->validate(cmd_opts.path, options);
    if (!result.ok) {
        print_failure(result.error, *ctx, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["path"] = cmd_opts.path;
        j["real_path"] = result.value;
        j["mode"] = security_mode_to_string(ctx->config.security.mode);
        output_json(j);
    } else {
        std::cout << result.value << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_validate(CLI::App* app, GlobalOptions& opts) {
    static ValidateCmdOptions cmd_opts;

    app->add_option("path", cmd_opts.path, "Path to validate")->required();
    app->add_flag("--require-exists", cmd_opts.require_exists, "Fail when the path does not exist");
    app->add_flag("--write", cmd_opts.write, "Require write access");
    app->add_flag("--no-follow", cmd_opts.no_follow, "Reject a symlink instead of resolving it");

    app->callback([&opts]() {
        std::exit(cmd_validate(opts, cmd_opts));
    });
}

} // namespace fsgate::cli::commands
