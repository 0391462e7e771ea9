#pragma once

#include "salvage/types.hpp"

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace salvage {

// ============================================================================
// JSON Repair
// ============================================================================

struct JsonRepairOptions {
    size_t max_size = DEFAULT_MAX_SIZE;
};

struct JsonRepairResult {
    std::string json;
    bool was_repaired = false;
    std::vector<std::string> repairs;  // human-readable description per step applied
};

// Close a JSON document that was cut off mid-stream.
// 1. Balanced input is returned unchanged (trimmed).
// 2. An unterminated string is closed.
// 3. One dangling trailing fragment is stripped (comma, "key":, orphan "key").
// 4. Open brackets are closed in reverse order of opening.
// Throws InputTooLarge when the trimmed input exceeds options.max_size.
JsonRepairResult repair_json(const std::string& text, const JsonRepairOptions& options = {});

struct JsonParseOutcome {
    bool ok = false;
    nlohmann::json value;
    bool repaired = false;
    std::string error;
};

// Parse as-is, falling back to repair_json and a second parse.
JsonParseOutcome parse_json_with_repair(const std::string& text,
                                        const JsonRepairOptions& options = {});

} // namespace salvage
