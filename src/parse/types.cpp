#include "salvage/types.hpp"
#include "salvage/text_utils.hpp"

namespace salvage {

std::optional<ResponseFormat> parse_response_format(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "json-v1") return ResponseFormat::JsonV1;
    if (v == "json-v2") return ResponseFormat::JsonV2;
    if (v == "marker-v1") return ResponseFormat::MarkerV1;
    if (v == "marker-v2") return ResponseFormat::MarkerV2;
    if (v == "fallback") return ResponseFormat::Fallback;
    if (v == "unknown") return ResponseFormat::Unknown;
    return std::nullopt;
}

std::optional<FileAction> parse_file_action(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "create") return FileAction::Create;
    if (v == "update") return FileAction::Update;
    if (v == "delete") return FileAction::Delete;
    return std::nullopt;
}

std::optional<FileStatus> parse_file_status(const std::string& s) {
    std::string v = to_lower(trim(s));
    if (v == "included") return FileStatus::Included;
    if (v == "pending") return FileStatus::Pending;
    if (v == "marked") return FileStatus::Marked;
    if (v == "skipped") return FileStatus::Skipped;
    return std::nullopt;
}

} // namespace salvage
