#pragma once

#include "salvage/types.hpp"

#include <string>
#include <vector>

namespace salvage {

// ============================================================================
// Parser configuration file
// ============================================================================
//
// {
//   "$schema": "salvage.config.v1",
//   "limits":   { "max_size": 500000, "min_file_length": 10 },
//   "recovery": { "aggressive": true, "include_raw": false },
//   "repair":   { "enabled": true, "max_rounds": 3 }
// }
//
// Every section and key is optional. Values of the wrong type or out of range
// keep their defaults and add an "invalid_configuration:<key>" warning.

constexpr const char* CONFIG_SCHEMA = "salvage.config.v1";

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    std::string source_path;
    ParserOptions options;
    std::vector<std::string> warnings;
};

ConfigParseResult parse_parser_config(const std::string& json_str,
                                      const std::string& source_path = "");

ParserOptions get_default_options();

} // namespace salvage
