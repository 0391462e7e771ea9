#include "salvage/path_utils.hpp"
#include "salvage/text_utils.hpp"

#include <filesystem>
#include <set>
#include <sstream>
#include <vector>

namespace salvage {

namespace {

bool contains_nul(const std::string& s) {
    return s.find('\0') != std::string::npos;
}

std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::string current;
    std::istringstream ss(s);
    while (std::getline(ss, current, delim)) {
        parts.push_back(current);
    }
    return parts;
}

std::string join_components(const std::string& root, const std::vector<std::string>& comps) {
    std::filesystem::path p(root);
    for (const auto& c : comps) {
        p /= c;
    }
    return to_portable_path(p.lexically_normal().string());
}

const std::set<std::string>& ignored_names() {
    static const std::set<std::string> names = {
        ".git", "node_modules", ".next", ".nuxt", "dist", "build", ".output",
        ".cache", ".turbo", ".parcel-cache", ".DS_Store", "Thumbs.db", ".idea", ".vscode"};
    return names;
}

} // namespace

std::string to_portable_path(const std::string& path) {
    std::string out = path;
    for (auto& c : out) {
        if (c == '\\') c = '/';
    }
    while (starts_with(out, "./")) out.erase(0, 2);
    return out;
}

bool is_ignored_path(const std::string& path) {
    for (const auto& segment : split(to_portable_path(path), '/')) {
        if (ignored_names().count(segment) > 0) return true;
    }
    return false;
}

std::string get_file_extension(const std::string& path) {
    std::string portable = to_portable_path(path);
    size_t slash = portable.rfind('/');
    size_t dot = portable.rfind('.');
    if (dot == std::string::npos || (slash != std::string::npos && dot < slash)) return "";
    return to_lower(portable.substr(dot + 1));
}

bool is_script_path(const std::string& path) {
    static const std::set<std::string> script_extensions = {"ts", "tsx", "js", "jsx", "mjs", "cjs"};
    return script_extensions.count(get_file_extension(path)) > 0;
}

PathResult normalize_under_root(const std::string& root,
                                const std::string& relative_path,
                                bool allow_absolute) {
    if (relative_path.empty()) {
        return {false, {}, PathError::Empty};
    }
    if (contains_nul(root) || contains_nul(relative_path)) {
        return {false, {}, PathError::ContainsNul};
    }

    std::string rel = to_portable_path(relative_path);
    if (rel.empty()) {
        return {false, {}, PathError::Empty};
    }
    std::vector<std::string> components;

    bool drive_letter = rel.size() >= 2 && rel[1] == ':';
    if (rel[0] == '/' || drive_letter) {
        if (!allow_absolute) {
            return {false, {}, PathError::AbsoluteNotAllowed};
        }
        size_t first = drive_letter ? 2 : 0;
        while (first < rel.size() && rel[first] == '/') ++first;
        rel = rel.substr(first);
    }
    components = split(rel, '/');

    std::vector<std::string> normalized;
    for (const auto& part : components) {
        if (part.empty() || part == ".") {
            continue;
        }
        if (part == "..") {
            if (normalized.empty()) {
                return {false, {}, PathError::EscapesRoot};
            }
            normalized.pop_back();
        } else {
            normalized.push_back(part);
        }
    }
    if (normalized.empty()) {
        return {false, {}, PathError::Empty};
    }

    std::string out = join_components(root, normalized);
    // Containment is checked lexically; symlinks are not followed.
    auto lex_root = std::filesystem::path(root).lexically_normal();
    auto lex_out = std::filesystem::path(out).lexically_normal();
    auto root_it = lex_root.begin();
    auto out_it = lex_out.begin();
    for (; root_it != lex_root.end() && out_it != lex_out.end(); ++root_it, ++out_it) {
        if (root_it->empty()) break;  // trailing separator on root
        if (*root_it != *out_it) {
            return {false, {}, PathError::EscapesRoot};
        }
    }
    if (root_it != lex_root.end() && !root_it->empty()) {
        return {false, {}, PathError::EscapesRoot};
    }

    return {true, out, PathError::None};
}

} // namespace salvage
