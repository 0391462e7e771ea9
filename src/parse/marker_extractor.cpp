#include "salvage/extractors.hpp"
#include "salvage/manifest.hpp"
#include "salvage/markers.hpp"
#include "salvage/path_utils.hpp"
#include "salvage/text_utils.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace salvage {

namespace {

// Leading integer of s (after an optional sign); fallback when there is none.
int leading_int(const std::string& s, int fallback) {
    size_t i = 0;
    bool negative = false;
    if (i < s.size() && (s[i] == '-' || s[i] == '+')) {
        negative = s[i] == '-';
        ++i;
    }
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return fallback;
    long value = 0;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) {
        value = value * 10 + (s[i] - '0');
        if (value > 1000000000L) break;
        ++i;
    }
    return static_cast<int>(negative ? -value : value);
}

// Non-empty trimmed lines of a block body, split at the first ':'.
std::vector<std::pair<std::string, std::string>> key_value_lines(const std::string& body,
                                                                 bool lower_keys) {
    std::vector<std::pair<std::string, std::string>> out;
    for (const auto& raw : split_lines(body)) {
        std::string line = trim(raw);
        size_t colon = line.find(':');
        if (colon == std::string::npos) continue;
        std::string key = trim(line.substr(0, colon));
        if (lower_keys) key = to_lower(key);
        out.emplace_back(key, trim(line.substr(colon + 1)));
    }
    return out;
}

std::vector<std::string> split_table_row(const std::string& line) {
    std::vector<std::string> cells;
    size_t start = 0;
    while (start <= line.size()) {
        size_t bar = line.find('|', start);
        std::string cell = trim(line.substr(start, bar == std::string::npos ? std::string::npos
                                                                            : bar - start));
        if (!cell.empty()) cells.push_back(cell);
        if (bar == std::string::npos) break;
        start = bar + 1;
    }
    return cells;
}

// Markdown alignment rows such as "| --- | :---: |".
bool is_separator_row(const std::vector<std::string>& cells) {
    for (const auto& cell : cells) {
        if (cell.find_first_not_of("-: ") != std::string::npos) return false;
    }
    return !cells.empty();
}

std::string strip_blank_lines(const std::string& s) {
    size_t begin = 0;
    while (begin < s.size() && (s[begin] == '\n' || s[begin] == '\r')) ++begin;
    size_t end = s.size();
    while (end > begin && (s[end - 1] == '\n' || s[end - 1] == '\r')) --end;
    return s.substr(begin, end - begin);
}

// A trailing "<!--" that has not been terminated yet bounds all content.
size_t content_limit(const std::string& text) {
    size_t open = text.rfind("<!--");
    if (open == std::string::npos) return text.size();
    if (text.find("-->", open + 4) != std::string::npos) return text.size();
    return open;
}

struct FileOpening {
    size_t token = 0;  // index into the token list
    std::string path;
};

} // namespace

// ============================================================================
// Block parsers
// ============================================================================

MetaInfo parse_meta_block(const std::string& body) {
    MetaInfo meta;
    meta.format = "marker";
    meta.version = "1.0";
    for (const auto& [key, value] : key_value_lines(body, true)) {
        if (key == "format") {
            meta.format = value;
        } else if (key == "version") {
            meta.version = value;
        } else if (key == "timestamp") {
            meta.timestamp = value;
        }
    }
    return meta;
}

PlanInfo parse_plan_block(const std::string& body) {
    PlanInfo plan;
    for (const auto& [key, value] : key_value_lines(body, false)) {
        if (key == "create") {
            plan.create = split_list(value, ',');
        } else if (key == "update") {
            plan.update = split_list(value, ',');
        } else if (key == "delete") {
            plan.deleted = split_list(value, ',');
        } else if (key == "sizes") {
            for (const auto& pair : split_list(value, ',')) {
                size_t colon = pair.rfind(':');
                if (colon == std::string::npos || colon == 0) continue;
                std::string path = trim(pair.substr(0, colon));
                std::string size = trim(pair.substr(colon + 1));
                if (path.empty() || size.empty() ||
                    !std::isdigit(static_cast<unsigned char>(size[0]))) {
                    continue;
                }
                plan.sizes[path] = leading_int(size, 0);
            }
        }
    }
    return plan;
}

std::vector<ManifestEntry> parse_manifest_block(const std::string& body) {
    std::vector<ManifestEntry> entries;
    for (const auto& raw : split_lines(body)) {
        std::string line = trim(raw);
        if (!starts_with(line, "|")) continue;
        if (starts_with(line, "| File") || starts_with(line, "|-")) continue;

        auto cells = split_table_row(line);
        if (cells.size() < 4 || is_separator_row(cells)) continue;

        ManifestEntry entry;
        entry.path = cells[0];
        entry.action = parse_file_action(cells[1]).value_or(FileAction::Create);
        entry.lines = leading_int(cells[2], 0);
        std::string tokens = cells[3];
        tokens.erase(std::remove_if(tokens.begin(), tokens.end(),
                                    [](char c) { return c == '~' || c == ','; }),
                     tokens.end());
        entry.tokens = leading_int(tokens, 0);
        if (cells.size() >= 5) {
            entry.status = parse_file_status(cells[4]).value_or(FileStatus::Included);
        }
        entries.push_back(entry);
    }
    return entries;
}

BatchInfo parse_batch_block(const std::string& body) {
    BatchInfo batch;
    for (const auto& [key, value] : key_value_lines(body, true)) {
        if (key == "current") {
            batch.current = leading_int(value, 1);
            if (batch.current == 0) batch.current = 1;
        } else if (key == "total") {
            batch.total = leading_int(value, 1);
            if (batch.total == 0) batch.total = 1;
        } else if (key == "iscomplete") {
            batch.is_complete = to_lower(value) == "true";
        } else if (key == "completed") {
            batch.completed = split_list(value, ',');
        } else if (key == "remaining") {
            batch.remaining = split_list(value, ',');
        } else if (key == "nextbatchhint") {
            batch.next_batch_hint = value;
        }
    }
    return batch;
}

BatchInfo parse_generation_meta_block(const std::string& body) {
    BatchInfo batch;
    for (const auto& [key, value] : key_value_lines(body, true)) {
        if (key == "currentbatch") {
            batch.current = leading_int(value, 1);
            if (batch.current == 0) batch.current = 1;
        } else if (key == "totalbatches") {
            batch.total = leading_int(value, 1);
            if (batch.total == 0) batch.total = 1;
        } else if (key == "iscomplete") {
            batch.is_complete = to_lower(value) == "true";
        } else if (key == "completedfiles") {
            batch.completed = split_list(value, ',');
        } else if (key == "remainingfiles") {
            batch.remaining = split_list(value, ',');
        }
    }
    return batch;
}

// ============================================================================
// Marker extraction
// ============================================================================

void extract_marker(const std::string& response, ParseResult& result,
                    const ParserOptions& options) {
    const std::string text = strip_invisible(response);
    const auto tokens = scan_markers(text);
    const size_t limit = content_limit(text);

    // Next FILE delimiter (either kind) after token i.
    auto next_file_token = [&](size_t i) -> size_t {
        for (size_t j = i + 1; j < tokens.size(); ++j) {
            if (tokens[j].name == "FILE") return j;
        }
        return tokens.size();
    };
    auto content_end = [&](size_t i) -> size_t {
        return i + 1 < tokens.size() ? std::min(tokens[i + 1].begin, limit) : limit;
    };
    auto body_between = [&](size_t begin, size_t end) -> std::string {
        if (end <= begin) return std::string();
        return strip_blank_lines(text.substr(begin, end - begin));
    };

    // Well-formed blocks: the next FILE delimiter closes the same path.
    std::vector<FileOpening> unclosed;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const auto& open = tokens[i];
        if (open.name != "FILE" || open.kind != MarkerKind::Open) continue;

        size_t j = next_file_token(i);
        bool closed = j < tokens.size() && tokens[j].kind == MarkerKind::Close &&
                      (tokens[j].path.empty() || tokens[j].path == open.path);
        if (!closed) {
            unclosed.push_back({i, open.path});
            continue;
        }

        if (is_ignored_path(open.path)) {
            spdlog::debug("skipping ignored path {}", open.path);
            continue;
        }
        std::string body = body_between(open.end, tokens[j].begin);
        if (!store_extracted_file(open.path, body, result, options, 1)) {
            result.warnings.push_back("Skipped empty file: " + open.path);
        }
    }

    // Unclosed openings: implicitly closed by a later opening, or still streaming.
    for (size_t k = 0; k < unclosed.size(); ++k) {
        const auto& opening = unclosed[k];
        const auto& token = tokens[opening.token];
        bool later_opening = false;
        for (size_t j = opening.token + 1; j < tokens.size(); ++j) {
            if (tokens[j].name == "FILE" && tokens[j].kind == MarkerKind::Open) {
                later_opening = true;
                break;
            }
        }

        if (result.files.count(opening.path) > 0) {
            spdlog::debug("keeping completed copy of reopened path {}", opening.path);
            continue;
        }
        std::string body = body_between(token.end, content_end(opening.token));
        if (is_ignored_path(opening.path)) {
            spdlog::debug("skipping ignored path {}", opening.path);
            continue;
        }

        if (later_opening) {
            if (store_extracted_file(opening.path, body, result, options, 1)) {
                result.recovered_files.push_back(opening.path);
                result.warnings.push_back("File \"" + opening.path +
                                          "\" had missing closing marker - recovered");
            } else {
                result.warnings.push_back("Skipped empty file: " + opening.path);
            }
            continue;
        }

        if (std::find(result.incomplete_files.begin(), result.incomplete_files.end(),
                      opening.path) == result.incomplete_files.end()) {
            result.incomplete_files.push_back(opening.path);
        }
        result.truncated = true;
    }

    // Singleton blocks
    if (auto body = block_body(text, tokens, "META")) {
        result.meta = parse_meta_block(*body);
    }
    if (auto body = block_body(text, tokens, "PLAN")) {
        result.plan = parse_plan_block(*body);
        result.deleted_files = result.plan->deleted;
    }
    if (auto body = block_body(text, tokens, "EXPLANATION")) {
        result.explanation = trim(*body);
    }
    if (auto body = block_body(text, tokens, "MANIFEST")) {
        auto entries = parse_manifest_block(*body);
        if (!entries.empty()) result.manifest = entries;
    }
    if (auto body = block_body(text, tokens, "BATCH")) {
        result.batch = parse_batch_block(*body);
    } else if (auto legacy = block_body(text, tokens, "GENERATION_META")) {
        result.batch = parse_generation_meta_block(*legacy);
    }
    if (result.batch && !result.batch->is_complete) result.truncated = true;

    apply_manifest_validation(result);
}

} // namespace salvage
