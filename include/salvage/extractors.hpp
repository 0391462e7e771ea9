#pragma once

#include "salvage/types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace salvage {

// ============================================================================
// Extractors
// ============================================================================
//
// Each extractor reads the raw response and fills the caller's result. None
// of them throw for malformed content; problems become warnings/errors.

// Strip invisible characters, unwrap a leading fence and remove a leading
// "// PLAN: {...}" comment (its object text goes to plan_json).
std::string prepare_json_text(const std::string& response, std::string* plan_json = nullptr);

// First '{' through the close of that object; to the end of the text when
// the object never closes. Empty when there is no '{'.
std::string json_region(const std::string& text);

void extract_json_v1(const std::string& response, ParseResult& result,
                     const ParserOptions& options = {});
void extract_json_v2(const std::string& response, ParseResult& result,
                     const ParserOptions& options = {});

// Marker formats v1 and v2 share one extractor; v2 only adds blocks.
void extract_marker(const std::string& response, ParseResult& result,
                    const ParserOptions& options = {});

// Heuristic recovery from fenced code blocks.
void extract_fallback(const std::string& response, ParseResult& result,
                      const ParserOptions& options = {});

// Clean one extracted body and store it under path. Ignored paths and
// bodies that clean down to fewer than min_length characters are skipped.
// Returns true when the file was stored.
bool store_extracted_file(const std::string& path, const std::string& body, ParseResult& result,
                          const ParserOptions& options, size_t min_length);

// Marker block bodies (text between <!-- NAME --> and <!-- /NAME -->)
MetaInfo parse_meta_block(const std::string& body);
PlanInfo parse_plan_block(const std::string& body);
std::vector<ManifestEntry> parse_manifest_block(const std::string& body);
BatchInfo parse_batch_block(const std::string& body);
BatchInfo parse_generation_meta_block(const std::string& body);

} // namespace salvage
