#pragma once

#include "salvage/types.hpp"

#include <string>

namespace salvage {

// ============================================================================
// Unified parse
// ============================================================================

// Parse one complete (or partially streamed) response.
//
// Empty input yields a result carrying the error "Empty or invalid response".
// Input longer than options.max_size throws InputTooLarge before any scanning.
// Otherwise the detected format selects one extractor. Only a response of
// unknown format, with aggressive_recovery enabled, is handed to the JSON,
// marker and fallback extractors in turn until one of them yields a file;
// warnings and errors from every attempt are kept.
//
// Each call builds a fresh result. Streaming callers re-parse the whole
// accumulated buffer.
ParseResult parse(const std::string& text, const ParserOptions& options = {});

} // namespace salvage
