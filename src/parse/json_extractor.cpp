#include "salvage/extractors.hpp"
#include "salvage/balance.hpp"
#include "salvage/json_repair.hpp"
#include "salvage/manifest.hpp"
#include "salvage/path_utils.hpp"
#include "salvage/text_utils.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>
#include <initializer_list>
#include <limits>

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

// Helper to safely get a string array from JSON
std::vector<std::string> get_string_array(const nlohmann::json& j, const std::string& key) {
    std::vector<std::string> result;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& elem : j[key]) {
            if (elem.is_string()) {
                result.push_back(elem.get<std::string>());
            }
        }
    }
    return result;
}

// Out-of-range numbers clamp to the int range; NaN and infinity fall back.
int get_int(const nlohmann::json& j, const std::string& key, int fallback) {
    constexpr int lo = std::numeric_limits<int>::min();
    constexpr int hi = std::numeric_limits<int>::max();
    if (!j.contains(key)) return fallback;
    const auto& v = j[key];
    if (v.is_number_unsigned()) {
        auto u = v.get<std::uint64_t>();
        return u > static_cast<std::uint64_t>(hi) ? hi : static_cast<int>(u);
    }
    if (v.is_number_integer()) {
        auto i = v.get<std::int64_t>();
        if (i < lo) return lo;
        if (i > hi) return hi;
        return static_cast<int>(i);
    }
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (!std::isfinite(d)) return fallback;
        if (d <= static_cast<double>(lo)) return lo;
        if (d >= static_cast<double>(hi)) return hi;
        return static_cast<int>(d);
    }
    return fallback;
}

std::optional<std::string> file_body(const nlohmann::json& value, bool allow_diff) {
    if (value.is_string()) return value.get<std::string>();
    if (!value.is_object()) return std::nullopt;
    if (auto content = get_string(value, "content")) return content;
    if (auto code = get_string(value, "code")) return code;
    if (allow_diff) {
        if (auto diff = get_string(value, "diff")) return diff;
    }
    return std::nullopt;
}

// Root keys such as "src/App.tsx" in responses without a files object.
bool looks_like_file_key(const std::string& key) {
    std::string ext = get_file_extension(key);
    if (ext.empty()) return false;
    for (char c : ext) {
        if (!std::islower(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

PlanInfo plan_from_json(const nlohmann::json& j) {
    PlanInfo plan;
    plan.create = get_string_array(j, "create");
    plan.update = get_string_array(j, "update");
    plan.deleted = get_string_array(j, "delete");
    return plan;
}

// Parse the candidate region, repairing it when the direct parse fails.
std::optional<nlohmann::json> load_document(const std::string& response, ParseResult& result,
                                            const ParserOptions& options,
                                            std::string* plan_json) {
    std::string region = json_region(prepare_json_text(response, plan_json));
    if (region.empty()) {
        result.errors.push_back("No JSON object found");
        return std::nullopt;
    }

    auto direct = nlohmann::json::parse(region, nullptr, false);
    if (!direct.is_discarded()) return direct;

    JsonRepairOptions repair_options;
    repair_options.max_size = options.max_size;
    JsonRepairResult repaired = repair_json(region, repair_options);
    try {
        auto value = nlohmann::json::parse(repaired.json);
        result.truncated = true;
        result.warnings.push_back("JSON was repaired from truncated response");
        return value;
    } catch (const nlohmann::json::parse_error& e) {
        result.errors.push_back(std::string("JSON parse error: ") + e.what());
        return std::nullopt;
    }
}

} // namespace

std::string prepare_json_text(const std::string& response, std::string* plan_json) {
    std::string text = strip_invisible(response);
    text = trim(unwrap_leading_fence(text));
    return strip_plan_comment(text, plan_json);
}

std::string json_region(const std::string& text) {
    size_t brace = text.find('{');
    if (brace == std::string::npos) return std::string();
    size_t close = find_matching_close(text, brace, ScanMode::Json);
    if (close == std::string::npos) return text.substr(brace);
    return text.substr(brace, close - brace + 1);
}

// ============================================================================
// JSON v1
// ============================================================================

void extract_json_v1(const std::string& response, ParseResult& result,
                     const ParserOptions& options) {
    std::string plan_json;
    auto doc = load_document(response, result, options, &plan_json);
    if (!doc) return;
    const nlohmann::json& root = *doc;
    if (!root.is_object()) {
        result.errors.push_back("No JSON object found");
        return;
    }

    if (auto explanation = get_string(root, "explanation")) {
        result.explanation = *explanation;
    }

    const nlohmann::json* files = nullptr;
    for (const char* key : {"files", "fileChanges", "Changes", "changes"}) {
        if (root.contains(key) && root[key].is_object()) {
            files = &root[key];
            break;
        }
    }

    if (files) {
        for (auto& [path, value] : files->items()) {
            if (path.find('.') == std::string::npos && path.find('/') == std::string::npos) {
                continue;
            }
            if (auto body = file_body(value, true)) {
                store_extracted_file(path, *body, result, options, options.min_file_length);
            }
        }
    } else {
        for (auto& [key, value] : root.items()) {
            if (!looks_like_file_key(key)) continue;
            if (auto body = file_body(value, true)) {
                store_extracted_file(key, *body, result, options, options.min_file_length);
            }
        }
    }

    if (!plan_json.empty()) {
        auto plan = nlohmann::json::parse(plan_json, nullptr, false);
        if (!plan.is_discarded() && plan.is_object()) {
            result.plan = plan_from_json(plan);
        }
    }

    if (root.contains("deletedFiles")) {
        result.deleted_files = get_string_array(root, "deletedFiles");
    } else if (result.plan) {
        result.deleted_files = result.plan->deleted;
    }
}

// ============================================================================
// JSON v2
// ============================================================================

void extract_json_v2(const std::string& response, ParseResult& result,
                     const ParserOptions& options) {
    auto doc = load_document(response, result, options, nullptr);
    if (!doc) return;
    const nlohmann::json& root = *doc;
    if (!root.is_object()) {
        result.errors.push_back("No JSON object found");
        return;
    }

    if (root.contains("meta") && root["meta"].is_object()) {
        const auto& m = root["meta"];
        MetaInfo meta;
        meta.format = get_string(m, "format").value_or("json");
        meta.version = get_string(m, "version").value_or("2.0");
        meta.timestamp = get_string(m, "timestamp");
        result.meta = meta;
    }

    if (root.contains("plan") && root["plan"].is_object()) {
        result.plan = plan_from_json(root["plan"]);
        result.deleted_files = result.plan->deleted;
    }

    if (root.contains("manifest") && root["manifest"].is_array()) {
        std::vector<ManifestEntry> entries;
        for (const auto& item : root["manifest"]) {
            if (!item.is_object()) continue;
            auto path = get_string(item, "path");
            if (!path) continue;
            ManifestEntry entry;
            entry.path = *path;
            if (auto action = get_string(item, "action")) {
                entry.action = parse_file_action(*action).value_or(FileAction::Create);
            }
            entry.lines = get_int(item, "lines", 0);
            entry.tokens = get_int(item, "tokens", 0);
            if (auto status = get_string(item, "status")) {
                entry.status = parse_file_status(*status).value_or(FileStatus::Included);
            }
            entries.push_back(entry);
        }
        result.manifest = entries;
    }

    if (root.contains("batch") && root["batch"].is_object()) {
        const auto& b = root["batch"];
        BatchInfo batch;
        batch.current = get_int(b, "current", 1);
        batch.total = get_int(b, "total", 1);
        batch.is_complete = !(b.contains("isComplete") && b["isComplete"].is_boolean() &&
                              !b["isComplete"].get<bool>());
        batch.completed = get_string_array(b, "completed");
        batch.remaining = get_string_array(b, "remaining");
        batch.next_batch_hint = get_string(b, "nextBatchHint");
        result.batch = batch;
        if (!batch.is_complete) result.truncated = true;
    }

    if (auto explanation = get_string(root, "explanation")) {
        result.explanation = *explanation;
    }

    if (root.contains("files") && root["files"].is_object()) {
        for (auto& [path, value] : root["files"].items()) {
            if (auto body = file_body(value, false)) {
                store_extracted_file(path, *body, result, options, options.min_file_length);
            }
        }
    }

    apply_manifest_validation(result);
}

} // namespace salvage
