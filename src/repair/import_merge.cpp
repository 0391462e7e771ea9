#include "salvage/syntax_repair.hpp"
#include "salvage/balance.hpp"
#include "salvage/text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <optional>

namespace salvage {

namespace {

struct ImportLine {
    size_t line = 0;
    bool type_only = false;
    std::string default_name;
    std::string namespace_name;
    std::vector<std::string> named;
    bool has_braces = false;
    std::string source;
    char quote = '\'';
    bool semicolon = false;
};

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

void skip_blanks(const std::string& s, size_t& pos) {
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
}

std::string read_ident(const std::string& s, size_t& pos) {
    size_t start = pos;
    while (pos < s.size() && is_ident_char(s[pos])) ++pos;
    return s.substr(start, pos - start);
}

bool read_keyword(const std::string& s, size_t& pos, const std::string& word) {
    if (s.compare(pos, word.size(), word) != 0) return false;
    size_t after = pos + word.size();
    if (after < s.size() && is_ident_char(s[after])) return false;
    pos = after;
    return true;
}

// import [type] Default[, {a, b} | , * as NS] from 'source';
std::optional<ImportLine> parse_import_line(const std::string& line, size_t index) {
    ImportLine imp;
    imp.line = index;
    size_t pos = 0;
    if (!read_keyword(line, pos, "import")) return std::nullopt;
    skip_blanks(line, pos);

    size_t probe = pos;
    if (read_keyword(line, probe, "type")) {
        size_t after = probe;
        skip_blanks(line, after);
        if (!read_keyword(line, after, "from") && after > probe) {
            imp.type_only = true;
            pos = probe;
            skip_blanks(line, pos);
        }
    }

    auto read_braces = [&]() -> bool {
        size_t close = line.find('}', pos);
        if (close == std::string::npos) return false;
        imp.named = split_list(line.substr(pos + 1, close - pos - 1), ',');
        imp.has_braces = true;
        pos = close + 1;
        return true;
    };
    auto read_namespace = [&]() -> bool {
        ++pos;
        skip_blanks(line, pos);
        if (!read_keyword(line, pos, "as")) return false;
        skip_blanks(line, pos);
        imp.namespace_name = read_ident(line, pos);
        return !imp.namespace_name.empty();
    };

    if (pos < line.size() && line[pos] == '{') {
        if (!read_braces()) return std::nullopt;
    } else if (pos < line.size() && line[pos] == '*') {
        if (!read_namespace()) return std::nullopt;
    } else {
        imp.default_name = read_ident(line, pos);
        if (imp.default_name.empty()) return std::nullopt;
        skip_blanks(line, pos);
        if (pos < line.size() && line[pos] == ',') {
            ++pos;
            skip_blanks(line, pos);
            if (pos < line.size() && line[pos] == '{') {
                if (!read_braces()) return std::nullopt;
            } else if (pos < line.size() && line[pos] == '*') {
                if (!read_namespace()) return std::nullopt;
            } else {
                return std::nullopt;
            }
        }
    }

    skip_blanks(line, pos);
    if (!read_keyword(line, pos, "from")) return std::nullopt;
    skip_blanks(line, pos);
    if (pos >= line.size() || (line[pos] != '\'' && line[pos] != '"')) return std::nullopt;
    imp.quote = line[pos];
    size_t close = line.find(imp.quote, pos + 1);
    if (close == std::string::npos) return std::nullopt;
    imp.source = line.substr(pos + 1, close - pos - 1);
    pos = close + 1;
    skip_blanks(line, pos);
    if (pos < line.size() && line[pos] == ';') {
        imp.semicolon = true;
        ++pos;
    }
    skip_blanks(line, pos);
    if (pos != line.size()) return std::nullopt;
    return imp;
}

std::optional<std::string> merge_group(const std::vector<ImportLine>& group) {
    std::string default_name;
    std::vector<std::string> named;
    bool type_only = true;
    bool braces = false;
    for (const auto& imp : group) {
        if (!imp.namespace_name.empty()) return std::nullopt;
        if (!imp.default_name.empty()) {
            if (!default_name.empty() && default_name != imp.default_name) return std::nullopt;
            default_name = imp.default_name;
        }
        type_only = type_only && imp.type_only;
        braces = braces || imp.has_braces;
        for (const auto& n : imp.named) {
            if (std::find(named.begin(), named.end(), n) == named.end()) named.push_back(n);
        }
    }

    const ImportLine& first = group.front();
    std::string out = "import ";
    if (type_only) out += "type ";
    out += default_name;
    if (braces) {
        if (!default_name.empty()) out += ", ";
        out += "{ ";
        for (size_t i = 0; i < named.size(); ++i) {
            if (i > 0) out += ", ";
            out += named[i];
        }
        out += " }";
    }
    out += " from ";
    out += first.quote;
    out += first.source;
    out += first.quote;
    if (first.semicolon) out += ";";
    return out;
}

} // namespace

std::string merge_duplicate_imports(const std::string& code) {
    if (code.find("import") == std::string::npos) return code;

    // Lines keep their own '\r' so the output preserves line endings.
    std::vector<std::string> lines;
    std::vector<size_t> offsets;
    size_t start = 0;
    while (start <= code.size()) {
        size_t nl = code.find('\n', start);
        if (nl == std::string::npos) nl = code.size();
        lines.push_back(code.substr(start, nl - start));
        offsets.push_back(start);
        start = nl + 1;
    }
    std::vector<bool> mask = code_mask(code);

    std::map<std::string, std::vector<ImportLine>> by_source;
    std::vector<std::string> order;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (offsets[i] >= mask.size() || !mask[offsets[i]]) continue;
        std::string line = lines[i];
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (auto imp = parse_import_line(line, i)) {
            auto& group = by_source[imp->source];
            if (group.empty()) order.push_back(imp->source);
            group.push_back(*imp);
        }
    }

    std::map<size_t, std::string> replaced;
    std::vector<bool> removed(lines.size(), false);
    for (const auto& source : order) {
        const auto& group = by_source[source];
        if (group.size() < 2) continue;
        auto merged = merge_group(group);
        if (!merged) continue;
        replaced[group.front().line] = *merged;
        for (size_t g = 1; g < group.size(); ++g) removed[group[g].line] = true;
    }
    if (replaced.empty()) return code;

    std::string out;
    bool first = true;
    for (size_t i = 0; i < lines.size(); ++i) {
        if (removed[i]) continue;
        if (!first) out += '\n';
        first = false;
        auto it = replaced.find(i);
        if (it == replaced.end()) {
            out += lines[i];
        } else {
            out += it->second;
            if (!lines[i].empty() && lines[i].back() == '\r') out += '\r';
        }
    }
    return out;
}

} // namespace salvage
