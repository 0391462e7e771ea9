#include "salvage/code_cleaner.hpp"
#include "salvage/markers.hpp"
#include "salvage/path_utils.hpp"
#include "salvage/syntax_repair.hpp"
#include "salvage/text_utils.hpp"

#include <cctype>
#include <cstddef>
#include <set>
#include <vector>

namespace salvage {

namespace {

bool is_fence_line(const std::string& line) {
    std::string t = trim(line);
    if (!starts_with(t, "```")) return false;
    for (size_t i = 3; i < t.size(); ++i) {
        char c = t[i];
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '+')) {
            return false;
        }
    }
    return true;
}

bool is_language_tag(const std::string& line) {
    static const std::set<std::string> tags = {
        "javascript", "typescript", "tsx", "jsx", "ts", "js", "react"};
    return tags.count(to_lower(trim(line))) > 0;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

bool is_bare_root(const std::string& source) {
    static const std::set<std::string> roots = {
        "src", "components", "hooks", "utils", "services", "contexts", "types",
        "lib", "pages", "features", "modules", "assets", "styles", "api"};
    size_t slash = source.find('/');
    return slash != std::string::npos && roots.count(source.substr(0, slash)) > 0;
}

} // namespace

std::string strip_code_fences(const std::string& code, const std::string& path) {
    std::vector<std::string> lines = split_lines(code);
    std::string ext = get_file_extension(path);

    if (ext == "md" || ext == "mdx") {
        // Markdown keeps its own fences; only a fence wrapping the whole file goes.
        size_t first = 0;
        while (first < lines.size() && trim(lines[first]).empty()) ++first;
        size_t last = lines.size();
        while (last > first && trim(lines[last - 1]).empty()) --last;
        if (last - first >= 2 && is_fence_line(lines[first]) && trim(lines[last - 1]) == "```") {
            return join_lines(std::vector<std::string>(lines.begin() + static_cast<std::ptrdiff_t>(first) + 1,
                                                       lines.begin() + static_cast<std::ptrdiff_t>(last) - 1));
        }
        return code;
    }

    std::vector<std::string> kept;
    for (const auto& line : lines) {
        if (is_fence_line(line)) continue;
        kept.push_back(line);
    }
    size_t first = 0;
    while (first < kept.size() && trim(kept[first]).empty()) ++first;
    if (first < kept.size() && is_language_tag(kept[first])) {
        kept.erase(kept.begin() + static_cast<std::ptrdiff_t>(first));
    }
    return join_lines(kept);
}

std::string strip_marker_artifacts(const std::string& code) {
    std::vector<MarkerToken> tokens = scan_markers(code);
    if (tokens.empty()) return code;

    std::string out;
    size_t pos = 0;
    for (size_t i = 0; i < tokens.size(); ++i) {
        const MarkerToken& t = tokens[i];
        size_t end = t.end;
        if (t.kind == MarkerKind::Open && t.name != "FILE") {
            // A metadata block goes with its body.
            for (size_t j = i + 1; j < tokens.size(); ++j) {
                if (tokens[j].kind == MarkerKind::Close && tokens[j].name == t.name) {
                    end = tokens[j].end;
                    i = j;
                    break;
                }
            }
        }
        out.append(code, pos, t.begin - pos);
        pos = end;
    }
    out.append(code, pos, std::string::npos);
    return out;
}

std::string fix_bare_specifier_imports(const std::string& code) {
    std::string out;
    out.reserve(code.size());
    size_t pos = 0;
    for (size_t i = 0; i < code.size(); ++i) {
        char q = code[i];
        if (q != '\'' && q != '"') continue;

        // preceding word must be "from" or "import"
        size_t p = i;
        while (p > 0 && std::isspace(static_cast<unsigned char>(code[p - 1]))) --p;
        size_t w = p;
        while (w > 0 && std::isalpha(static_cast<unsigned char>(code[w - 1]))) --w;
        std::string word = code.substr(w, p - w);
        if (word != "from" && word != "import") continue;

        size_t close = code.find(q, i + 1);
        if (close == std::string::npos) break;
        if (is_bare_root(code.substr(i + 1, close - i - 1))) {
            out.append(code, pos, i + 1 - pos);
            out += '/';
            pos = i + 1;
        }
        i = close;
    }
    out.append(code, pos, std::string::npos);
    return out;
}

std::string clean_generated_code(const std::string& code, const std::string& path,
                                 const ParserOptions& options) {
    std::string out = strip_code_fences(code, path);
    out = trim(strip_marker_artifacts(out));
    if (is_script_path(path)) {
        out = fix_bare_specifier_imports(out);
        if (options.auto_repair) {
            out = safe_apply(out, options.repair_rounds);
        }
    }
    return trim(out);
}

} // namespace salvage
