/**
 * salvage CLI - Entry Point
 *
 * Recover files and metadata from language-model responses.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace salvage::cli::commands {
    void setup_parse(CLI::App* app, GlobalOptions& opts);
    void setup_detect(CLI::App* app, GlobalOptions& opts);
    void setup_extract(CLI::App* app, GlobalOptions& opts);
    void setup_repair_json(CLI::App* app, GlobalOptions& opts);
    void setup_fix(CLI::App* app, GlobalOptions& opts);
    void setup_status(CLI::App* app, GlobalOptions& opts);
    void setup_continue(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace salvage::cli;

    CLI::App app{"salvage - recover structured output from model responses"};
    app.set_version_flag("-V,--version", SALVAGE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Parser config file (default: $SALVAGE_CONFIG)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* parse_cmd = app.add_subcommand("parse", "Parse a response into files and metadata");
    commands::setup_parse(parse_cmd, opts);

    auto* detect_cmd = app.add_subcommand("detect", "Print the response format");
    commands::setup_detect(detect_cmd, opts);

    auto* extract_cmd = app.add_subcommand("extract", "Write extracted files to a directory");
    commands::setup_extract(extract_cmd, opts);

    auto* repair_cmd = app.add_subcommand("repair-json", "Close a truncated JSON document");
    commands::setup_repair_json(repair_cmd, opts);

    auto* fix_cmd = app.add_subcommand("fix", "Run syntax auto-repair on a source file");
    commands::setup_fix(fix_cmd, opts);

    auto* status_cmd = app.add_subcommand("status", "Show streaming progress of a response");
    commands::setup_status(status_cmd, opts);

    auto* continue_cmd = app.add_subcommand("continue", "Print the next-batch prompt");
    commands::setup_continue(continue_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
