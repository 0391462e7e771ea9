#include "salvage/manifest.hpp"

#include <algorithm>

namespace salvage {

namespace {

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

std::string join(const std::vector<std::string>& v, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < v.size(); ++i) {
        if (i > 0) out += sep;
        out += v[i];
    }
    return out;
}

} // namespace

ManifestValidation validate_manifest(const std::optional<std::vector<ManifestEntry>>& manifest,
                                     const FileMap& files) {
    ManifestValidation v;
    for (const auto& [path, content] : files) {
        (void)content;
        v.received.push_back(path);
    }

    if (!manifest) {
        v.extra = v.received;
        v.is_valid = true;
        return v;
    }

    for (const auto& entry : *manifest) {
        if (entry.status == FileStatus::Included && entry.action != FileAction::Delete &&
            !contains(v.expected, entry.path)) {
            v.expected.push_back(entry.path);
        }
    }
    for (const auto& path : v.expected) {
        if (files.find(path) == files.end()) v.missing.push_back(path);
    }
    for (const auto& path : v.received) {
        if (!contains(v.expected, path)) v.extra.push_back(path);
    }
    v.is_valid = v.missing.empty();
    return v;
}

void apply_manifest_validation(ParseResult& result) {
    if (!result.manifest) return;
    result.validation = validate_manifest(result.manifest, result.files);
    if (!result.validation->missing.empty()) {
        result.warnings.push_back("Manifest validation: missing files: " +
                                  join(result.validation->missing, ", "));
    }
}

} // namespace salvage
