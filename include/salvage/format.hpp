#pragma once

#include "salvage/types.hpp"

#include <string>

namespace salvage {

// Classify a raw response. Pure: the text is never modified or repaired.
// First match wins:
//   marker-v2  META block and a FILE: delimiter
//   marker-v1  FILE: delimiter, or PLAN and EXPLANATION blocks
//   json-v2    format/version declaration, or batch object + manifest array
//   json-v1    files/fileChanges object or explanation key; else a parse of
//              the first balanced {...} region
//   fallback   a fence tagged ts/tsx/js/jsx/typescript/javascript
//   unknown
ResponseFormat detect_format(const std::string& text);

// True when the text opens a fenced block tagged with a script language.
bool has_source_fence(const std::string& text);

} // namespace salvage
