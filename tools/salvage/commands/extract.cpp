/**
 * salvage CLI - extract command
 *
 * Parse a response and write its complete files under an output directory.
 */

#include "../common.hpp"

#include <salvage/errors.hpp>
#include <salvage/parser.hpp>
#include <salvage/path_utils.hpp>

#include <CLI/CLI.hpp>

namespace salvage::cli::commands {

namespace {

struct ExtractOptions {
    std::string input;
    std::string output = ".";
    bool dry_run = false;
};

int cmd_extract(const GlobalOptions& opts, const ExtractOptions& extract_opts) {
    auto options = begin_command(opts);
    if (!options) return 1;

    auto text = read_command_input(extract_opts.input, opts.json);
    if (!text) return 1;

    ParseResult result;
    try {
        result = parse(*text, *options);
    } catch (const InputTooLarge& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    if (result.files.empty()) {
        std::string msg = "No files extracted";
        if (!result.errors.empty()) msg += ": " + result.errors.front();
        print_error(msg, opts.json);
        return 1;
    }

    if (!extract_opts.dry_run && !fs::create_directories(extract_opts.output)) {
        print_error("Failed to create output directory: " + extract_opts.output, opts.json);
        return 1;
    }

    nlohmann::json written = nlohmann::json::array();
    nlohmann::json rejected = nlohmann::json::array();
    for (const auto& [path, content] : result.files) {
        auto target = normalize_under_root(extract_opts.output, path);
        if (!target.ok) {
            print_warning("Refusing to write " + path + ": " + path_error_to_string(target.error));
            rejected.push_back(path);
            continue;
        }
        if (!extract_opts.dry_run && !fs::write_file(target.path, content)) {
            print_error("Failed to write " + target.path, opts.json);
            return 1;
        }
        spdlog::debug("wrote {} ({} chars)", target.path, content.size());
        written.push_back(target.path);
        if (!opts.json && !opts.quiet) {
            std::cout << (extract_opts.dry_run ? "Would write " : "Wrote ") << target.path
                      << std::endl;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["format"] = format_to_string(result.format);
        j["written"] = written;
        j["rejected"] = rejected;
        j["incomplete_files"] = result.incomplete_files;
        j["dry_run"] = extract_opts.dry_run;
        output_json(j);
    }
    return rejected.empty() ? 0 : 2;
}

} // anonymous namespace

void setup_extract(CLI::App* app, GlobalOptions& opts) {
    static ExtractOptions extract_opts;

    app->add_option("input", extract_opts.input, "Response file ('-' for stdin)")->required();
    app->add_option("-o,--output", extract_opts.output, "Output directory")
        ->capture_default_str();
    app->add_flag("-n,--dry-run", extract_opts.dry_run, "List files without writing them");

    app->callback([&opts]() {
        std::exit(cmd_extract(opts, extract_opts));
    });
}

} // namespace salvage::cli::commands
