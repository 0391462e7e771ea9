/**
 * salvage CLI - Common utilities and types
 */

#pragma once

#include <salvage/config.hpp>
#include <salvage/fs.hpp>
#include <salvage/types.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace salvage::cli {

// Portable getenv that avoids MSVC warnings
inline std::string safe_getenv(const char* name) {
#ifdef _WIN32
    char* buf = nullptr;
    size_t sz = 0;
    if (_dupenv_s(&buf, &sz, name) == 0 && buf != nullptr) {
        std::string result(buf);
        free(buf);
        return result;
    }
    return "";
#else
    const char* val = std::getenv(name);
    return val ? val : "";
#endif
}

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the parser configuration file.
 * Priority: --config flag > SALVAGE_CONFIG env > none
 */
inline std::optional<std::string> resolve_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }
    std::string env_path = safe_getenv("SALVAGE_CONFIG");
    if (!env_path.empty()) {
        return env_path;
    }
    return std::nullopt;
}

/**
 * Map -v / -q onto the spdlog level.
 */
inline void configure_logging(const GlobalOptions& opts) {
    if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::warn);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("cli_warnings")) {
        nlohmann::json output = j;
        output["cli_warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

/**
 * Shared per-command setup: logging, warning collector and parser options.
 * Returns nullopt (after reporting) when the config file is unusable.
 */
inline std::optional<ParserOptions> begin_command(const GlobalOptions& opts) {
    configure_logging(opts);
    init_warning_collector(opts.json, opts.quiet);

    auto config_path = resolve_config_path(opts.config);
    if (!config_path) {
        return get_default_options();
    }

    auto content = fs::read_file(*config_path);
    if (!content) {
        print_error("Failed to read config: " + *config_path, opts.json);
        return std::nullopt;
    }
    auto result = parse_parser_config(*content, *config_path);
    if (!result.ok) {
        print_error("Invalid config " + *config_path + ": " + result.error, opts.json);
        return std::nullopt;
    }
    for (const auto& w : result.warnings) {
        print_warning(w);
    }
    spdlog::debug("loaded parser config from {}", *config_path);
    return result.options;
}

/**
 * Read a command input; "-" reads stdin.
 */
inline std::optional<std::string> read_command_input(const std::string& path, bool json_mode) {
    auto content = fs::read_input(path);
    if (!content) {
        print_error("Failed to read input: " + path, json_mode);
    }
    return content;
}

} // namespace salvage::cli
