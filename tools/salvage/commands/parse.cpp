/**
 * salvage CLI - parse command
 *
 * Parse a model response and print the structured result.
 */

#include "../common.hpp"

#include <salvage/errors.hpp>
#include <salvage/parser.hpp>
#include <salvage/result_json.hpp>

#include <CLI/CLI.hpp>

namespace salvage::cli::commands {

namespace {

struct ParseOptions {
    std::string input;
    bool no_content = false;
    bool raw = false;
    bool no_repair = false;
    bool strict = false;
};

void print_list(const std::string& title, const std::vector<std::string>& items) {
    if (items.empty()) return;
    std::cout << title << ":" << std::endl;
    for (const auto& item : items) {
        std::cout << "  " << item << std::endl;
    }
}

int cmd_parse(const GlobalOptions& opts, const ParseOptions& parse_opts) {
    auto options = begin_command(opts);
    if (!options) return 1;
    if (parse_opts.raw) options->include_raw = true;
    if (parse_opts.no_repair) options->auto_repair = false;
    if (parse_opts.strict) options->aggressive_recovery = false;

    auto text = read_command_input(parse_opts.input, opts.json);
    if (!text) return 1;

    ParseResult result;
    try {
        result = parse(*text, *options);
    } catch (const InputTooLarge& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    if (opts.json) {
        auto j = result_to_json(result, !parse_opts.no_content);
        j["ok"] = result.errors.empty() || !result.files.empty();
        output_json(j);
        return result.files.empty() && result.incomplete_files.empty() ? 1 : 0;
    }

    std::cout << "Format: " << format_to_string(result.format) << std::endl;
    if (result.truncated) {
        std::cout << "Truncated: yes" << std::endl;
    }
    if (result.explanation) {
        std::cout << "Explanation: " << *result.explanation << std::endl;
    }
    std::cout << "Files (" << result.files.size() << "):" << std::endl;
    for (const auto& [path, content] : result.files) {
        std::cout << "  " << path << " (" << content.size() << " chars)" << std::endl;
    }
    print_list("Incomplete", result.incomplete_files);
    print_list("Recovered", result.recovered_files);
    print_list("Deleted", result.deleted_files);
    if (result.batch) {
        std::cout << "Batch: " << result.batch->current << "/" << result.batch->total
                  << (result.batch->is_complete ? " (complete)" : " (incomplete)") << std::endl;
    }
    if (!opts.quiet) {
        for (const auto& w : result.warnings) {
            std::cerr << "Warning: " << w << std::endl;
        }
    }
    for (const auto& e : result.errors) {
        std::cerr << "Error: " << e << std::endl;
    }
    return result.files.empty() && result.incomplete_files.empty() ? 1 : 0;
}

} // anonymous namespace

void setup_parse(CLI::App* app, GlobalOptions& opts) {
    static ParseOptions parse_opts;

    app->add_option("input", parse_opts.input, "Response file ('-' for stdin)")->required();
    app->add_flag("--no-content", parse_opts.no_content, "Report file sizes instead of contents");
    app->add_flag("--raw", parse_opts.raw, "Include the raw response in JSON output");
    app->add_flag("--no-repair", parse_opts.no_repair, "Skip syntax auto-repair of script files");
    app->add_flag("--strict", parse_opts.strict, "Disable recovery for unrecognized formats");

    app->callback([&opts]() {
        std::exit(cmd_parse(opts, parse_opts));
    });
}

} // namespace salvage::cli::commands
