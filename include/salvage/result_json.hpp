#pragma once

#include "salvage/json_repair.hpp"
#include "salvage/types.hpp"

#include <nlohmann/json.hpp>

namespace salvage {

// ============================================================================
// JSON views of results
// ============================================================================
//
// Keys are snake_case. Optional members are omitted when absent. File
// contents are included only when with_content is set; otherwise "files"
// maps each path to its length.

nlohmann::json plan_to_json(const PlanInfo& plan);
nlohmann::json manifest_entry_to_json(const ManifestEntry& entry);
nlohmann::json batch_to_json(const BatchInfo& batch);
nlohmann::json validation_to_json(const ManifestValidation& validation);

nlohmann::json result_to_json(const ParseResult& result, bool with_content = true);
nlohmann::json status_to_json(const StreamingStatus& status);
nlohmann::json repair_to_json(const JsonRepairResult& repair);

} // namespace salvage
