/**
 * fsgate CLI - status command
 */

#include "../common.hpp"
#include <fsgate/status.hpp>
#include <CLI/CLI.hpp>

namespace fsgate::cli::commands {

namespace {

int cmd_status(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto status = security_status(ctx->config, *ctx->store, ctx->cwd);

    if (opts.json) {
        status["ok"] = true;
        output_json(status);
    } else {
        std::cout << status_report(status) << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_status(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_status(opts));
    });
}

} // namespace fsgate::cli::commands
