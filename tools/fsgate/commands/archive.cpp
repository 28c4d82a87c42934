/**
 * fsgate CLI - archive command
 *
 * Entry-name checks, format detection and guarded tar.gz extraction.
 */

#include "../common.hpp"
#include <fsgate/archive_validator.hpp>
#include <fsgate/extraction.hpp>
#include <CLI/CLI.hpp>

namespace fsgate::cli::commands {

namespace {

struct ArchiveCmdOptions {
    std::string target;
    std::vector<std::string> entries;
    std::string file;
};

nlohmann::json invalid_to_json(const std::vector<EntryValidation>& invalid) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& v : invalid) {
        arr.push_back({{"entry", v.entry_name}, {"error", sanitize_message(v.error)}});
    }
    return arr;
}

void print_invalid(const std::vector<EntryValidation>& invalid) {
    for (const auto& v : invalid) {
        std::cerr << "  " << (v.entry_name.empty() ? "<archive>" : sanitize_entry_name(v.entry_name))
                  << ": " << sanitize_message(v.error) << std::endl;
    }
}

int cmd_check(const GlobalOptions& opts, const ArchiveCmdOptions& cmd_opts) {
    init_warning_collector(opts.json, opts.quiet);
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    auto target = normalize_path(cmd_opts.target, ctx->cwd);
    if (!target.ok) {
        print_error(std::string("Invalid target directory: ") + path_error_to_string(target.error),
                    opts.json);
        return 1;
    }

    std::vector<ArchiveEntry> entries;
    for (const auto& name : cmd_opts.entries) {
        entries.push_back({name, 0});
    }

    auto limits = effective_limits(ctx->config);
    auto result = validate_archive_entries(entries, target.path, limits);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.valid;
        j["target"] = target.path;
        j["invalid_entries"] = invalid_to_json(result.invalid_entries);
        if (result.valid) {
            nlohmann::json paths = nlohmann::json::array();
            for (const auto& name : cmd_opts.entries) {
                paths.push_back(validate_entry(name, target.path, limits).extraction_path);
            }
            j["extraction_paths"] = paths;
        }
        output_json(j);
    } else if (result.valid) {
        for (const auto& name : cmd_opts.entries) {
            std::cout << validate_entry(name, target.path, limits).extraction_path << std::endl;
        }
    } else {
        std::cerr << "Error: " << result.invalid_entries.size() << " invalid entries" << std::endl;
        print_invalid(result.invalid_entries);
    }
    return result.valid ? 0 : 1;
}

int cmd_detect(const GlobalOptions& opts, const ArchiveCmdOptions& cmd_opts) {
    init_warning_collector(opts.json, opts.quiet);
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    ValidateOptions read_opts;
    read_opts.require_exists = true;
    auto file = ctx->validator->validate(cmd_opts.file, read_opts);
    if (!file.ok) {
        print_failure(file.error, *ctx, opts.json);
        return 1;
    }

    auto detection = detect_archive_format_file(file.value);
    if (!detection.ok) {
        print_error(detection.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["format"] = archive_format_to_string(detection.format);
        output_json(j);
    } else {
        std::cout << archive_format_to_string(detection.format) << std::endl;
    }
    return 0;
}

int cmd_extract(const GlobalOptions& opts, const ArchiveCmdOptions& cmd_opts) {
    init_warning_collector(opts.json, opts.quiet);
    auto ctx = load_context(opts);
    if (!ctx) return 1;

    ValidateOptions read_opts;
    read_opts.require_exists = true;
    auto archive = ctx->validator->validate(cmd_opts.file, read_opts);
    if (!archive.ok) {
        print_failure(archive.error, *ctx, opts.json);
        return 1;
    }

    ValidateOptions write_opts;
    write_opts.require_exists = true;
    write_opts.check_write = true;
    auto target = ctx->validator->validate(cmd_opts.target, write_opts);
    if (!target.ok) {
        print_failure(target.error, *ctx, opts.json);
        return 1;
    }

    auto result = extract_tar_gz(archive.value, target.value, effective_limits(ctx->config));

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.ok;
        if (result.ok) {
            j["entries"] = result.entries;
            j["bytes_written"] = result.bytes_written;
        } else {
            j["error"] = sanitize_message(result.error);
            j["invalid_entries"] = invalid_to_json(result.invalid_entries);
        }
        output_json(j);
    } else if (result.ok) {
        if (!opts.quiet) {
            std::cout << "Extracted " << result.entries.size() << " entries ("
                      << result.bytes_written << " bytes)" << std::endl;
        }
    } else {
        std::cerr << "Error: " << sanitize_message(result.error) << std::endl;
        print_invalid(result.invalid_entries);
    }
    return result.ok ? 0 : 1;
}

} // anonymous namespace

void setup_archive(CLI::App* app, GlobalOptions& opts) {
    static ArchiveCmdOptions cmd_opts;

    app->require_subcommand(1);

    auto* check = app->add_subcommand("check", "Validate archive entry names");
    check->add_option("--target", cmd_opts.target, "Extraction directory")->required();
    check->add_option("entries", cmd_opts.entries, "Entry names")->required();
    check->callback([&opts]() { std::exit(cmd_check(opts, cmd_opts)); });

    auto* detect = app->add_subcommand("detect", "Detect the archive format of a file");
    detect->add_option("file", cmd_opts.file, "Archive file")->required();
    detect->callback([&opts]() { std::exit(cmd_detect(opts, cmd_opts)); });

    auto* extract = app->add_subcommand("extract", "Extract a .tar.gz into a directory");
    extract->add_option("archive", cmd_opts.file, "Archive file")->required();
    extract->add_option("target", cmd_opts.target, "Target directory")->required();
    extract->callback([&opts]() { std::exit(cmd_extract(opts, cmd_opts)); });
}

} // namespace fsgate::cli::commands
