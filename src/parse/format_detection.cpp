#include "salvage/format.hpp"
#include "salvage/balance.hpp"
#include "salvage/markers.hpp"
#include "salvage/text_utils.hpp"

#include <cctype>
#include <vector>

#include <nlohmann/json.hpp>

namespace salvage {

namespace {

size_t skip_ws(const std::string& s, size_t i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return i;
}

// Positions just past `"key" :` (and following whitespace) for every
// occurrence of the key.
std::vector<size_t> key_values(const std::string& text, const std::string& key) {
    std::vector<size_t> out;
    const std::string needle = "\"" + key + "\"";
    size_t pos = text.find(needle);
    while (pos != std::string::npos) {
        size_t i = skip_ws(text, pos + needle.size());
        if (i < text.size() && text[i] == ':') {
            out.push_back(skip_ws(text, i + 1));
        }
        pos = text.find(needle, pos + needle.size());
    }
    return out;
}

bool has_key(const std::string& text, const std::string& key) {
    return !key_values(text, key).empty();
}

bool key_opens(const std::string& text, const std::string& key, char opener) {
    for (size_t v : key_values(text, key)) {
        if (v < text.size() && text[v] == opener) return true;
    }
    return false;
}

bool key_has_string(const std::string& text, const std::string& key, const std::string& value) {
    const std::string lowered = to_lower(value);
    for (size_t v : key_values(text, key)) {
        if (v >= text.size() || text[v] != '"') continue;
        size_t close = text.find('"', v + 1);
        if (close == std::string::npos) continue;
        if (to_lower(text.substr(v + 1, close - v - 1)) == lowered) return true;
    }
    return false;
}

bool looks_like_json(const std::string& text) {
    return (!text.empty() && text[0] == '{') || text.find("\"meta\"") != std::string::npos ||
           text.find("\"files\"") != std::string::npos ||
           text.find("\"fileChanges\"") != std::string::npos;
}

bool declares_v2(const std::string& text) {
    return key_has_string(text, "format", "json") || key_has_string(text, "version", "2.0") ||
           (key_opens(text, "batch", '{') && key_opens(text, "manifest", '['));
}

ResponseFormat classify_by_parse(const std::string& text) {
    size_t brace = text.find('{');
    if (brace == std::string::npos) return ResponseFormat::Unknown;
    size_t close = find_matching_close(text, brace, ScanMode::Json);
    if (close == std::string::npos) return ResponseFormat::Unknown;

    auto j = nlohmann::json::parse(text.substr(brace, close - brace + 1), nullptr, false);
    if (j.is_discarded() || !j.is_object()) return ResponseFormat::Unknown;

    if (j.contains("meta") && j["meta"].is_object() && j["meta"].contains("version") &&
        j["meta"]["version"] == "2.0") {
        return ResponseFormat::JsonV2;
    }
    if (j.contains("batch") && j.contains("manifest")) return ResponseFormat::JsonV2;
    if (j.contains("files") || j.contains("fileChanges") || j.contains("meta") ||
        j.contains("batch")) {
        return ResponseFormat::JsonV1;
    }
    return ResponseFormat::Unknown;
}

} // namespace

bool has_source_fence(const std::string& text) {
    static const char* const languages[] = {"typescript", "javascript", "tsx", "jsx", "ts", "js"};
    size_t pos = text.find("```");
    while (pos != std::string::npos) {
        size_t i = pos + 3;
        for (const char* lang : languages) {
            std::string l(lang);
            if (text.compare(i, l.size(), l) != 0) continue;
            size_t after = i + l.size();
            if (after >= text.size() || !std::isalnum(static_cast<unsigned char>(text[after]))) {
                return true;
            }
        }
        pos = text.find("```", pos + 3);
    }
    return false;
}

ResponseFormat detect_format(const std::string& text) {
    const std::string clean = strip_invisible(text);
    if (clean.empty()) return ResponseFormat::Unknown;

    auto tokens = scan_markers(clean);
    bool file_marker = has_file_opening(clean);
    if (file_marker && has_marker(tokens, "META")) return ResponseFormat::MarkerV2;
    if (file_marker) return ResponseFormat::MarkerV1;
    if (has_marker(tokens, "PLAN") && has_marker(tokens, "EXPLANATION")) {
        return ResponseFormat::MarkerV1;
    }

    std::string json = strip_plan_comment(unwrap_leading_fence(strip_plan_comment(clean)));
    if (looks_like_json(json)) {
        if (declares_v2(json)) return ResponseFormat::JsonV2;
        if (key_opens(json, "files", '{') || key_opens(json, "fileChanges", '{') ||
            has_key(json, "explanation")) {
            return ResponseFormat::JsonV1;
        }
        ResponseFormat parsed = classify_by_parse(json);
        if (parsed != ResponseFormat::Unknown) return parsed;
    }

    if (has_source_fence(clean)) return ResponseFormat::Fallback;
    return ResponseFormat::Unknown;
}

} // namespace salvage
