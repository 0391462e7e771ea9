#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace salvage {

// ============================================================================
// Marker delimiters
// ============================================================================
//
//   <!-- FILE:path -->  ...  <!-- /FILE:path -->
//   <!-- PLAN -->       ...  <!-- /PLAN -->
//
// Whitespace inside the comment is not significant.

enum class MarkerKind {
    Open,
    Close
};

struct MarkerToken {
    MarkerKind kind = MarkerKind::Open;
    std::string name;   // FILE, META, PLAN, EXPLANATION, MANIFEST, BATCH, GENERATION_META
    std::string path;   // FILE delimiters only; may be empty on a bare <!-- /FILE -->
    size_t begin = 0;   // index of "<!--"
    size_t end = 0;     // index one past "-->"
};

// Singleton block names understood by the marker grammar.
bool is_block_name(const std::string& name);

// All complete delimiters in document order. HTML comments that are not
// delimiters are skipped.
std::vector<MarkerToken> scan_markers(const std::string& text);

bool has_marker(const std::vector<MarkerToken>& tokens, const std::string& name,
                MarkerKind kind = MarkerKind::Open);

// True when a "<!-- FILE:" opening is present, even if the comment itself has
// not been terminated yet.
bool has_file_opening(const std::string& text);

// Body between the first <!-- NAME --> and the next <!-- /NAME -->.
std::optional<std::string> block_body(const std::string& text,
                                      const std::vector<MarkerToken>& tokens,
                                      const std::string& name);

} // namespace salvage
