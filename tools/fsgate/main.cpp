/**
 * fsgate CLI - Entry Point
 *
 * Filesystem trust-boundary command-line interface.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace fsgate::cli::commands {
    void setup_validate(CLI::App* app, GlobalOptions& opts);
    void setup_allow(CLI::App* app, GlobalOptions& opts);
    void setup_archive(CLI::App* app, GlobalOptions& opts);
    void setup_status(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace fsgate::cli;

    CLI::App app{"fsgate - filesystem trust boundary"};
    app.set_version_flag("-V,--version", FSGATE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file");
    app.add_option("--cwd", opts.cwd, "Working directory for strict mode");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    init_logging();

    // Commands
    auto* validate_cmd = app.add_subcommand("validate", "Validate a path for the configured mode");
    commands::setup_validate(validate_cmd, opts);

    auto* allow_cmd = app.add_subcommand("allow", "Manage the allow-list");
    commands::setup_allow(allow_cmd, opts);

    auto* archive_cmd = app.add_subcommand("archive", "Check, detect and extract archives");
    commands::setup_archive(archive_cmd, opts);

    auto* status_cmd = app.add_subcommand("status", "Show the security status");
    commands::setup_status(status_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
