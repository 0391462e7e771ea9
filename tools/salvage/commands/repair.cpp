/**
 * salvage CLI - repair-json and fix commands
 *
 * repair-json closes a truncated JSON document.
 * fix runs the syntax auto-repair pipeline over a source file.
 */

#include "../common.hpp"

#include <salvage/errors.hpp>
#include <salvage/json_repair.hpp>
#include <salvage/result_json.hpp>
#include <salvage/syntax_repair.hpp>

#include <CLI/CLI.hpp>

namespace salvage::cli::commands {

namespace {

struct RepairJsonOptions {
    std::string input;
    bool check = false;
};

struct FixOptions {
    std::string input;
    bool unsafe = false;
};

int cmd_repair_json(const GlobalOptions& opts, const RepairJsonOptions& repair_opts) {
    auto options = begin_command(opts);
    if (!options) return 1;

    auto text = read_command_input(repair_opts.input, opts.json);
    if (!text) return 1;

    JsonRepairOptions repair_options;
    repair_options.max_size = options->max_size;
    JsonRepairResult repaired;
    try {
        repaired = repair_json(*text, repair_options);
    } catch (const InputTooLarge& e) {
        print_error(e.what(), opts.json);
        return 1;
    }

    bool valid = !nlohmann::json::parse(repaired.json, nullptr, false).is_discarded();
    if (opts.json) {
        auto j = repair_to_json(repaired);
        j["ok"] = valid;
        output_json(j);
    } else {
        std::cout << repaired.json << std::endl;
        if (opts.verbose) {
            for (const auto& step : repaired.repairs) {
                std::cerr << "Repair: " << step << std::endl;
            }
        }
        if (!valid && !opts.quiet) {
            std::cerr << "Warning: repaired text is still not valid JSON" << std::endl;
        }
    }
    if (repair_opts.check && repaired.was_repaired) return 2;
    return valid ? 0 : 1;
}

int cmd_fix(const GlobalOptions& opts, const FixOptions& fix_opts) {
    auto options = begin_command(opts);
    if (!options) return 1;

    auto text = read_command_input(fix_opts.input, opts.json);
    if (!text) return 1;

    RepairSession session(*text);
    session.run(options->repair_rounds);
    bool accepted = fix_opts.unsafe || !session.changed() || session.validate();
    std::string code = accepted ? session.commit() : session.discard();
    if (!accepted) {
        print_warning("Repaired code failed validation; original kept");
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["code"] = code;
        j["changed"] = accepted && session.changed();
        j["fixes_applied"] = session.fixes();
        j["valid"] = quick_validate(code);
        output_json(j);
    } else {
        std::cout << code;
        if (!code.empty() && code.back() != '\n') std::cout << std::endl;
        if (opts.verbose) {
            for (const auto& fix : session.fixes()) {
                std::cerr << "Fix: " << fix << std::endl;
            }
        }
    }
    return 0;
}

} // anonymous namespace

void setup_repair_json(CLI::App* app, GlobalOptions& opts) {
    static RepairJsonOptions repair_opts;

    app->add_option("input", repair_opts.input, "JSON file ('-' for stdin)")->required();
    app->add_flag("--check", repair_opts.check, "Exit with status 2 when repair was needed");

    app->callback([&opts]() {
        std::exit(cmd_repair_json(opts, repair_opts));
    });
}

void setup_fix(CLI::App* app, GlobalOptions& opts) {
    static FixOptions fix_opts;

    app->add_option("input", fix_opts.input, "Source file ('-' for stdin)")->required();
    app->add_flag("--unsafe", fix_opts.unsafe, "Keep repairs even when validation fails");

    app->callback([&opts]() {
        std::exit(cmd_fix(opts, fix_opts));
    });
}

} // namespace salvage::cli::commands
