#include "salvage/extractors.hpp"
#include "salvage/path_utils.hpp"
#include "salvage/text_utils.hpp"

#include <cctype>

#include <spdlog/spdlog.h>

namespace salvage {

namespace {

struct FencedBlock {
    std::string lang;
    std::vector<std::string> lines;
    size_t open_line = 0;
};

// Closed ``` blocks in document order. An unterminated fence is not a block.
std::vector<FencedBlock> fenced_blocks(const std::vector<std::string>& lines) {
    std::vector<FencedBlock> blocks;
    size_t i = 0;
    while (i < lines.size()) {
        std::string open = trim(lines[i]);
        if (!starts_with(open, "```")) {
            ++i;
            continue;
        }
        FencedBlock block;
        block.open_line = i;
        block.lang = to_lower(trim(open.substr(3)));
        size_t j = i + 1;
        while (j < lines.size() && trim(lines[j]) != "```") {
            block.lines.push_back(lines[j]);
            ++j;
        }
        if (j >= lines.size()) break;
        blocks.push_back(block);
        i = j + 1;
    }
    return blocks;
}

std::string join_lines(const std::vector<std::string>& lines, size_t from = 0) {
    std::string out;
    for (size_t i = from; i < lines.size(); ++i) {
        if (i > from) out += '\n';
        out += lines[i];
    }
    return out;
}

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

// "src/App.tsx", "`src/App.tsx`", "**src/App.tsx**" or "### src/App.tsx"
std::string path_label(const std::string& line) {
    std::string s = trim(line);
    while (!s.empty() && s[0] == '#') s = trim(s.substr(1));
    while (!s.empty() && (s.front() == '`' || s.front() == '*')) s.erase(0, 1);
    while (!s.empty() && (s.back() == '`' || s.back() == '*' || s.back() == ':')) s.pop_back();
    if (s.empty()) return std::string();
    for (char c : s) {
        if (!is_word_char(c) && c != '.' && c != '/' && c != '-') return std::string();
    }
    static const char* const extensions[] = {"ts", "tsx", "js", "jsx", "css",
                                             "json", "md", "html", "htm"};
    std::string ext = get_file_extension(s);
    for (const char* e : extensions) {
        if (ext == e && ends_with(s, std::string(".") + e)) return s;
    }
    return std::string();
}

bool is_source_lang(const std::string& lang) {
    return lang == "ts" || lang == "tsx" || lang == "js" || lang == "jsx" ||
           lang == "typescript" || lang == "javascript";
}

bool keep(const std::string& path, const std::string& body, ParseResult& result,
          const ParserOptions& options) {
    if (!store_extracted_file(path, trim(body), result, options, options.min_file_length)) {
        return false;
    }
    result.recovered_files.push_back(path);
    return true;
}

} // namespace

void extract_fallback(const std::string& response, ParseResult& result,
                      const ParserOptions& options) {
    result.warnings.push_back("Using fallback parser - response format not recognized");

    const auto lines = split_lines(strip_invisible(response));
    const auto blocks = fenced_blocks(lines);
    size_t kept = 0;

    // A path on its own line directly above a fence
    for (const auto& block : blocks) {
        if (block.open_line == 0) continue;
        std::string path = path_label(lines[block.open_line - 1]);
        if (path.empty()) continue;
        if (keep(path, join_lines(block.lines), result, options)) ++kept;
    }
    if (kept > 0) return;

    // "File: path" as the first line inside a fence
    for (const auto& block : blocks) {
        if (block.lines.empty()) continue;
        std::string first = trim(block.lines[0]);
        if (!starts_with(first, "File:")) continue;
        std::string path = trim(first.substr(5));
        if (path.empty() || result.files.count(path)) continue;
        if (keep(path, join_lines(block.lines, 1), result, options)) ++kept;
    }
    if (kept > 0) return;

    // Source-tagged fences with synthetic names
    int index = 1;
    for (const auto& block : blocks) {
        if (!is_source_lang(block.lang)) continue;
        std::string content = trim(join_lines(block.lines));
        bool component = content.find("import React") != std::string::npos ||
                         content.find("export default") != std::string::npos ||
                         (content.find("function ") != std::string::npos &&
                          content.find("return") != std::string::npos);
        bool module = content.find("export ") != std::string::npos;
        std::string n = std::to_string(index);
        std::string path = component ? "component" + n + ".tsx"
                           : module  ? "module" + n + ".ts"
                                     : "code" + n + ".js";
        if (keep(path, content, result, options)) ++index;
    }

    spdlog::debug("fallback extractor recovered {} file(s)", result.files.size());
}

} // namespace salvage
