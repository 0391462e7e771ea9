#include "salvage/config.hpp"
#include "salvage/text_utils.hpp"

#include <nlohmann/json.hpp>

namespace salvage {

namespace {

// Helper to safely get a string from JSON
std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

void read_bool(const nlohmann::json& section, const std::string& key, bool& out,
               std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    if (section[key].is_boolean()) {
        out = section[key].get<bool>();
    } else {
        warnings.push_back("invalid_configuration:" + key);
    }
}

// Non-negative integer no smaller than min.
void read_size(const nlohmann::json& section, const std::string& key, size_t min, size_t& out,
               std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    const auto& v = section[key];
    if (v.is_number_unsigned() && v.get<size_t>() >= min) {
        out = v.get<size_t>();
    } else if (v.is_number_integer() && v.get<long long>() >= 0 &&
               static_cast<size_t>(v.get<long long>()) >= min) {
        out = static_cast<size_t>(v.get<long long>());
    } else {
        warnings.push_back("invalid_configuration:" + key);
    }
}

} // namespace

ParserOptions get_default_options() {
    return ParserOptions{};
}

ConfigParseResult parse_parser_config(const std::string& json_str,
                                      const std::string& source_path) {
    ConfigParseResult result;
    result.source_path = source_path;
    result.options = get_default_options();

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema (REQUIRED)
        auto schema = get_string(j, "$schema");
        if (!schema) {
            result.error = "$schema missing";
            return result;
        }
        if (trim(*schema) != CONFIG_SCHEMA) {
            result.error = std::string("$schema mismatch: expected ") + CONFIG_SCHEMA;
            return result;
        }

        // "limits" section
        if (j.contains("limits") && j["limits"].is_object()) {
            const auto& limits = j["limits"];
            read_size(limits, "max_size", 1, result.options.max_size, result.warnings);
            read_size(limits, "min_file_length", 0, result.options.min_file_length,
                      result.warnings);
        }

        // "recovery" section
        if (j.contains("recovery") && j["recovery"].is_object()) {
            const auto& recovery = j["recovery"];
            read_bool(recovery, "aggressive", result.options.aggressive_recovery,
                      result.warnings);
            read_bool(recovery, "include_raw", result.options.include_raw, result.warnings);
        }

        // "repair" section
        if (j.contains("repair") && j["repair"].is_object()) {
            const auto& repair = j["repair"];
            read_bool(repair, "enabled", result.options.auto_repair, result.warnings);
            size_t rounds = static_cast<size_t>(result.options.repair_rounds);
            read_size(repair, "max_rounds", 1, rounds, result.warnings);
            if (rounds > 10) {
                result.warnings.push_back("invalid_configuration:max_rounds");
                rounds = DEFAULT_REPAIR_ROUNDS;
            }
            result.options.repair_rounds = static_cast<int>(rounds);
        }

        for (auto& [key, val] : j.items()) {
            (void)val;
            if (key != "$schema" && key != "limits" && key != "recovery" && key != "repair") {
                result.warnings.push_back("invalid_configuration:unknown_key:" + key);
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

} // namespace salvage
