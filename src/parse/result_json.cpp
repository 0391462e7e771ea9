#include "salvage/result_json.hpp"

namespace salvage {

nlohmann::json plan_to_json(const PlanInfo& plan) {
    nlohmann::json j;
    j["create"] = plan.create;
    j["update"] = plan.update;
    j["delete"] = plan.deleted;
    if (!plan.sizes.empty()) {
        j["sizes"] = plan.sizes;
    }
    return j;
}

nlohmann::json manifest_entry_to_json(const ManifestEntry& entry) {
    nlohmann::json j;
    j["path"] = entry.path;
    j["action"] = action_to_string(entry.action);
    j["lines"] = entry.lines;
    j["tokens"] = entry.tokens;
    j["status"] = status_to_string(entry.status);
    return j;
}

nlohmann::json batch_to_json(const BatchInfo& batch) {
    nlohmann::json j;
    j["current"] = batch.current;
    j["total"] = batch.total;
    j["is_complete"] = batch.is_complete;
    j["completed"] = batch.completed;
    j["remaining"] = batch.remaining;
    if (batch.next_batch_hint) {
        j["next_batch_hint"] = *batch.next_batch_hint;
    }
    return j;
}

nlohmann::json validation_to_json(const ManifestValidation& validation) {
    nlohmann::json j;
    j["expected"] = validation.expected;
    j["received"] = validation.received;
    j["missing"] = validation.missing;
    j["extra"] = validation.extra;
    j["is_valid"] = validation.is_valid;
    return j;
}

nlohmann::json result_to_json(const ParseResult& result, bool with_content) {
    nlohmann::json j;
    j["format"] = format_to_string(result.format);

    nlohmann::json files = nlohmann::json::object();
    for (const auto& [path, content] : result.files) {
        if (with_content) {
            files[path] = content;
        } else {
            files[path] = content.size();
        }
    }
    j["files"] = files;

    if (result.explanation) j["explanation"] = *result.explanation;
    if (result.plan) j["plan"] = plan_to_json(*result.plan);
    if (result.manifest) {
        nlohmann::json entries = nlohmann::json::array();
        for (const auto& entry : *result.manifest) {
            entries.push_back(manifest_entry_to_json(entry));
        }
        j["manifest"] = entries;
    }
    if (result.batch) j["batch"] = batch_to_json(*result.batch);
    if (result.meta) {
        nlohmann::json meta;
        meta["format"] = result.meta->format;
        meta["version"] = result.meta->version;
        if (result.meta->timestamp) meta["timestamp"] = *result.meta->timestamp;
        j["meta"] = meta;
    }
    if (result.validation) j["validation"] = validation_to_json(*result.validation);

    j["truncated"] = result.truncated;
    j["incomplete_files"] = result.incomplete_files;
    j["recovered_files"] = result.recovered_files;
    j["deleted_files"] = result.deleted_files;
    j["warnings"] = result.warnings;
    j["errors"] = result.errors;
    if (result.raw_response) j["raw_response"] = *result.raw_response;
    return j;
}

nlohmann::json status_to_json(const StreamingStatus& status) {
    nlohmann::json j;
    j["pending"] = status.pending;
    j["streaming"] = status.streaming;
    j["complete"] = status.complete;
    return j;
}

nlohmann::json repair_to_json(const JsonRepairResult& repair) {
    nlohmann::json j;
    j["json"] = repair.json;
    j["was_repaired"] = repair.was_repaired;
    j["repairs"] = repair.repairs;
    return j;
}

} // namespace salvage
