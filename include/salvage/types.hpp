#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace salvage {

// Upper bound on the size of a single response (characters).
constexpr size_t DEFAULT_MAX_SIZE = 500000;

// Cleaned file bodies shorter than this are dropped by the JSON and fallback extractors.
constexpr size_t DEFAULT_MIN_FILE_LENGTH = 10;

constexpr int DEFAULT_REPAIR_ROUNDS = 3;

// ============================================================================
// Response Format
// ============================================================================

enum class ResponseFormat {
    JsonV1,
    JsonV2,
    MarkerV1,
    MarkerV2,
    Fallback,
    Unknown
};

inline const char* format_to_string(ResponseFormat f) {
    switch (f) {
        case ResponseFormat::JsonV1: return "json-v1";
        case ResponseFormat::JsonV2: return "json-v2";
        case ResponseFormat::MarkerV1: return "marker-v1";
        case ResponseFormat::MarkerV2: return "marker-v2";
        case ResponseFormat::Fallback: return "fallback";
        case ResponseFormat::Unknown: return "unknown";
        default: return "unknown";
    }
}

std::optional<ResponseFormat> parse_response_format(const std::string& s);

inline bool is_marker_format(ResponseFormat f) {
    return f == ResponseFormat::MarkerV1 || f == ResponseFormat::MarkerV2;
}

inline bool is_json_format(ResponseFormat f) {
    return f == ResponseFormat::JsonV1 || f == ResponseFormat::JsonV2;
}

// ============================================================================
// File Action / Status
// ============================================================================

enum class FileAction {
    Create,
    Update,
    Delete
};

inline const char* action_to_string(FileAction a) {
    switch (a) {
        case FileAction::Create: return "create";
        case FileAction::Update: return "update";
        case FileAction::Delete: return "delete";
        default: return "create";
    }
}

std::optional<FileAction> parse_file_action(const std::string& s);

enum class FileStatus {
    Included,
    Pending,
    Marked,
    Skipped
};

inline const char* status_to_string(FileStatus s) {
    switch (s) {
        case FileStatus::Included: return "included";
        case FileStatus::Pending: return "pending";
        case FileStatus::Marked: return "marked";
        case FileStatus::Skipped: return "skipped";
        default: return "included";
    }
}

std::optional<FileStatus> parse_file_status(const std::string& s);

// ============================================================================
// Declared metadata
// ============================================================================

struct PlanInfo {
    std::vector<std::string> create;
    std::vector<std::string> update;
    std::vector<std::string> deleted;
    std::map<std::string, int> sizes;  // estimated lines per path (marker "sizes:" line)
};

struct ManifestEntry {
    std::string path;
    FileAction action = FileAction::Create;
    int lines = 0;
    int tokens = 0;
    FileStatus status = FileStatus::Included;
};

struct BatchInfo {
    int current = 1;
    int total = 1;
    bool is_complete = true;
    std::vector<std::string> completed;
    std::vector<std::string> remaining;
    std::optional<std::string> next_batch_hint;
};

struct MetaInfo {
    std::string format;
    std::string version;
    std::optional<std::string> timestamp;
};

struct ManifestValidation {
    std::vector<std::string> expected;
    std::vector<std::string> received;
    std::vector<std::string> missing;
    std::vector<std::string> extra;
    bool is_valid = true;
};

// ============================================================================
// Parse Result
// ============================================================================

using FileMap = std::map<std::string, std::string>;

struct ParseResult {
    ResponseFormat format = ResponseFormat::Unknown;
    FileMap files;                        // complete files only
    std::optional<std::string> explanation;
    std::optional<PlanInfo> plan;
    std::optional<std::vector<ManifestEntry>> manifest;
    std::optional<BatchInfo> batch;
    std::optional<MetaInfo> meta;
    std::optional<ManifestValidation> validation;
    bool truncated = false;
    std::vector<std::string> incomplete_files;
    std::vector<std::string> recovered_files;
    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    std::vector<std::string> deleted_files;
    std::optional<std::string> raw_response;
};

// ============================================================================
// Parser Options
// ============================================================================

struct ParserOptions {
    size_t max_size = DEFAULT_MAX_SIZE;
    bool aggressive_recovery = true;
    bool include_raw = false;
    bool auto_repair = true;             // run the syntax pipeline on script files
    int repair_rounds = DEFAULT_REPAIR_ROUNDS;
    size_t min_file_length = DEFAULT_MIN_FILE_LENGTH;
};

// ============================================================================
// Streaming Status
// ============================================================================

struct StreamingStatus {
    std::vector<std::string> pending;
    std::vector<std::string> streaming;
    std::vector<std::string> complete;
};

} // namespace salvage
