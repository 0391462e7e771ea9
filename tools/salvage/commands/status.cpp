/**
 * salvage CLI - status and continue commands
 *
 * status reports pending/streaming/complete files of a (partial) response.
 * continue prints the prompt for the next batch of a multi-batch response.
 */

#include "../common.hpp"

#include <salvage/errors.hpp>
#include <salvage/parser.hpp>
#include <salvage/result_json.hpp>
#include <salvage/streaming.hpp>
#include <salvage/text_utils.hpp>

#include <CLI/CLI.hpp>

namespace salvage::cli::commands {

namespace {

struct StatusOptions {
    std::string input;
    std::string rendered;
};

struct ContinueOptions {
    std::string input;
};

std::optional<ParseResult> parse_input(const GlobalOptions& opts, const std::string& input) {
    auto options = begin_command(opts);
    if (!options) return std::nullopt;

    auto text = read_command_input(input, opts.json);
    if (!text) return std::nullopt;

    try {
        return parse(*text, *options);
    } catch (const InputTooLarge& e) {
        print_error(e.what(), opts.json);
        return std::nullopt;
    }
}

void print_group(const std::string& title, const std::vector<std::string>& paths) {
    std::cout << title << " (" << paths.size() << ")" << std::endl;
    for (const auto& p : paths) {
        std::cout << "  " << p << std::endl;
    }
}

int cmd_status(const GlobalOptions& opts, const StatusOptions& status_opts) {
    auto result = parse_input(opts, status_opts.input);
    if (!result) return 1;

    std::set<std::string> rendered;
    for (const auto& p : split_list(status_opts.rendered, ',')) {
        rendered.insert(p);
    }
    StreamingStatus status = streaming_status(*result, rendered);

    if (opts.json) {
        auto j = status_to_json(status);
        j["ok"] = true;
        j["format"] = format_to_string(result->format);
        j["truncated"] = result->truncated;
        output_json(j);
    } else {
        print_group("Complete", status.complete);
        print_group("Streaming", status.streaming);
        print_group("Pending", status.pending);
    }
    return 0;
}

int cmd_continue(const GlobalOptions& opts, const ContinueOptions& continue_opts) {
    auto result = parse_input(opts, continue_opts.input);
    if (!result) return 1;

    auto prompt = batch_continuation_prompt(*result);
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["prompt"] = prompt ? nlohmann::json(*prompt) : nlohmann::json(nullptr);
        if (result->batch) {
            j["batch"] = batch_to_json(*result->batch);
        }
        output_json(j);
    } else if (prompt) {
        std::cout << *prompt << std::endl;
    } else if (!opts.quiet) {
        std::cerr << "No continuation needed" << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_status(CLI::App* app, GlobalOptions& opts) {
    static StatusOptions status_opts;

    app->add_option("input", status_opts.input, "Response file ('-' for stdin)")->required();
    app->add_option("--rendered", status_opts.rendered,
                    "Comma-separated paths already shown to the user");

    app->callback([&opts]() {
        std::exit(cmd_status(opts, status_opts));
    });
}

void setup_continue(CLI::App* app, GlobalOptions& opts) {
    static ContinueOptions continue_opts;

    app->add_option("input", continue_opts.input, "Response file ('-' for stdin)")->required();

    app->callback([&opts]() {
        std::exit(cmd_continue(opts, continue_opts));
    });
}

} // namespace salvage::cli::commands
