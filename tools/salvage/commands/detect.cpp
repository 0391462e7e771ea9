/**
 * salvage CLI - detect command
 *
 * Print the detected response format.
 */

#include "../common.hpp"

#include <salvage/format.hpp>

#include <CLI/CLI.hpp>

namespace salvage::cli::commands {

namespace {

struct DetectOptions {
    std::string input;
};

int cmd_detect(const GlobalOptions& opts, const DetectOptions& detect_opts) {
    if (!begin_command(opts)) return 1;

    auto text = read_command_input(detect_opts.input, opts.json);
    if (!text) return 1;

    ResponseFormat format = detect_format(*text);
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["format"] = format_to_string(format);
        output_json(j);
    } else {
        std::cout << format_to_string(format) << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_detect(CLI::App* app, GlobalOptions& opts) {
    static DetectOptions detect_opts;

    app->add_option("input", detect_opts.input, "Response file ('-' for stdin)")->required();

    app->callback([&opts]() {
        std::exit(cmd_detect(opts, detect_opts));
    });
}

} // namespace salvage::cli::commands
