#pragma once

#include <string>

namespace salvage {

// Build/VCS/editor artifact directories and files that are never extracted.
// A path is ignored when any of its segments equals one of these names.
bool is_ignored_path(const std::string& path);

// Replace backslashes with forward slashes and drop a leading "./".
std::string to_portable_path(const std::string& path);

// Lower-case extension without the dot ("tsx"), or empty.
std::string get_file_extension(const std::string& path);

// .ts .tsx .js .jsx .mjs .cjs
bool is_script_path(const std::string& path);

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::Empty: return "empty path";
        case PathError::ContainsNul: return "path contains NUL byte";
        case PathError::AbsoluteNotAllowed: return "absolute path not allowed";
        case PathError::EscapesRoot: return "path escapes output directory";
        default: return "invalid path";
    }
}

struct PathResult {
    bool ok;
    std::string path;  // normalized path under root when ok
    PathError error;
};

// Normalize a path relative to a root without touching the filesystem.
// - Rejects NUL bytes
// - Rejects absolute relative_path when allow_absolute is false
// - Collapses "." and ".." segments
// - Fails if the resulting path would escape root
PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute = false);

} // namespace salvage
