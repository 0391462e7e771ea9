#pragma once

#include "salvage/types.hpp"

#include <string>

namespace salvage {

// Prepare an extracted file body for storage:
// - markdown fences and bare language-tag lines are removed
// - marker delimiters and metadata blocks that leaked into the body are removed
// - script paths get bare-specifier import rewriting and, when
//   options.auto_repair is set, safe_apply
// The result is trimmed.
std::string clean_generated_code(const std::string& code, const std::string& path,
                                 const ParserOptions& options = {});

std::string strip_code_fences(const std::string& code, const std::string& path);
std::string strip_marker_artifacts(const std::string& code);

// from 'components/Button'  becomes  from '/components/Button'
std::string fix_bare_specifier_imports(const std::string& code);

} // namespace salvage
