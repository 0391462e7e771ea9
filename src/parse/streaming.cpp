#include "salvage/streaming.hpp"
#include "salvage/extractors.hpp"
#include "salvage/markers.hpp"
#include "salvage/parser.hpp"
#include "salvage/text_utils.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace salvage {

namespace {

void add_unique(std::vector<std::string>& v, const std::string& s) {
    if (std::find(v.begin(), v.end(), s) == v.end()) v.push_back(s);
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

StreamingStatus streaming_status(const ParseResult& result, const std::set<std::string>& rendered) {
    StreamingStatus status;
    for (const auto& [path, content] : result.files) {
        (void)content;
        status.complete.push_back(path);
    }

    for (const auto& path : result.incomplete_files) {
        if (!result.files.count(path)) add_unique(status.streaming, path);
    }
    for (const auto& path : rendered) {
        if (!result.files.count(path)) add_unique(status.streaming, path);
    }

    std::vector<std::string> planned;
    if (result.plan) {
        for (const auto& p : result.plan->create) add_unique(planned, p);
        for (const auto& p : result.plan->update) add_unique(planned, p);
    }
    if (result.manifest) {
        for (const auto& entry : *result.manifest) {
            if (entry.status == FileStatus::Included && entry.action != FileAction::Delete) {
                add_unique(planned, entry.path);
            }
        }
    }
    for (const auto& path : planned) {
        if (result.files.count(path) || contains(status.streaming, path)) continue;
        status.pending.push_back(path);
    }
    return status;
}

std::optional<std::string> batch_continuation_prompt(const ParseResult& result) {
    if (!result.batch || result.batch->is_complete || result.batch->remaining.empty()) {
        return std::nullopt;
    }
    const BatchInfo& batch = *result.batch;

    std::string prompt = "Continue generating the remaining " +
                         std::to_string(batch.remaining.size()) + " files.\n\n";
    prompt += "ALREADY COMPLETED (" + std::to_string(batch.completed.size()) + " files):\n";
    for (const auto& path : batch.completed) prompt += "- " + path + "\n";
    prompt += "\nREMAINING FILES TO GENERATE:\n";
    for (const auto& path : batch.remaining) prompt += "- " + path + "\n";
    prompt += "\nUse the same format and structure. This is batch " +
              std::to_string(batch.current + 1) + " of " + std::to_string(batch.total) + ".";
    return prompt;
}

std::vector<std::string> extract_file_list(const std::string& text) {
    const std::string clean = strip_invisible(text);
    const auto tokens = scan_markers(clean);
    std::set<std::string> paths;

    if (auto body = block_body(clean, tokens, "PLAN")) {
        PlanInfo plan = parse_plan_block(*body);
        paths.insert(plan.create.begin(), plan.create.end());
        paths.insert(plan.update.begin(), plan.update.end());
    }
    for (const auto& token : tokens) {
        if (token.name == "FILE" && token.kind == MarkerKind::Open) paths.insert(token.path);
    }
    return std::vector<std::string>(paths.begin(), paths.end());
}

bool has_files(const std::string& text) {
    const std::string clean = strip_invisible(text);
    if (has_file_opening(clean)) return true;
    std::string json = prepare_json_text(clean);
    return json.find("\"files\"") != std::string::npos ||
           json.find("\"fileChanges\"") != std::string::npos;
}

// ============================================================================
// StreamSession
// ============================================================================

const ParseResult& StreamSession::append(const std::string& chunk) {
    buffer_ += chunk;
    ++chunks_;

    ParseResult next = parse(buffer_, options_);
    newly_completed_.clear();
    for (const auto& [path, content] : next.files) {
        (void)content;
        if (!result_.files.count(path)) newly_completed_.push_back(path);
    }
    for (const auto& path : next.incomplete_files) rendered_.insert(path);
    for (const auto& path : newly_completed_) rendered_.insert(path);
    result_ = std::move(next);

    if (!newly_completed_.empty()) {
        spdlog::debug("chunk {}: {} file(s) completed", chunks_, newly_completed_.size());
    }
    return result_;
}

StreamingStatus StreamSession::status() const {
    return streaming_status(result_, rendered_);
}

void StreamSession::reset() {
    buffer_.clear();
    result_ = ParseResult{};
    rendered_.clear();
    newly_completed_.clear();
    chunks_ = 0;
}

} // namespace salvage
