#pragma once

#include "salvage/types.hpp"

#include <optional>
#include <vector>

namespace salvage {

// ============================================================================
// Manifest Validation
// ============================================================================

// Compare a declared manifest with the extracted files.
//   expected  manifest paths with status included and action other than delete
//   received  extracted paths
//   missing   expected but not received
//   extra     received but not expected
// Without a manifest the result is valid, with every received path as extra.
ManifestValidation validate_manifest(const std::optional<std::vector<ManifestEntry>>& manifest,
                                     const FileMap& files);

// Store the validation on the result when a manifest was extracted and add a
// warning listing missing files. Never changes result.files.
void apply_manifest_validation(ParseResult& result);

} // namespace salvage
