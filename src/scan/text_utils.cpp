#include "salvage/text_utils.hpp"
#include "salvage/balance.hpp"

#include <algorithm>
#include <cctype>

namespace salvage {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> split_list(const std::string& s, char delim) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find(delim, start);
        if (pos == std::string::npos) pos = s.size();
        std::string piece = trim(s.substr(start, pos - start));
        if (!piece.empty()) parts.push_back(piece);
        start = pos + 1;
    }
    return parts;
}

std::vector<std::string> split_lines(const std::string& s) {
    std::vector<std::string> lines;
    size_t start = 0;
    while (start <= s.size()) {
        size_t pos = s.find('\n', start);
        if (pos == std::string::npos) pos = s.size();
        std::string line = s.substr(start, pos - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(line);
        start = pos + 1;
    }
    return lines;
}

std::string strip_invisible(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(s[i]);
        // U+FEFF (EF BB BF)
        if (c == 0xEF && i + 2 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xBB &&
            static_cast<unsigned char>(s[i + 2]) == 0xBF) {
            i += 2;
            continue;
        }
        // U+200B..U+200D (E2 80 8B..8D)
        if (c == 0xE2 && i + 2 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0x80) {
            unsigned char third = static_cast<unsigned char>(s[i + 2]);
            if (third >= 0x8B && third <= 0x8D) {
                i += 2;
                continue;
            }
        }
        // U+00A0 (C2 A0)
        if (c == 0xC2 && i + 1 < s.size() && static_cast<unsigned char>(s[i + 1]) == 0xA0) {
            out += ' ';
            i += 1;
            continue;
        }
        out += s[i];
    }
    return trim(out);
}

std::string unwrap_leading_fence(const std::string& s) {
    if (!starts_with(s, "```")) return s;

    size_t pos = 3;
    while (pos < s.size() && (std::isalnum(static_cast<unsigned char>(s[pos])) || s[pos] == '_' ||
                              s[pos] == '-')) {
        ++pos;
    }
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t' || s[pos] == '\r')) ++pos;
    if (pos < s.size() && s[pos] == '\n') ++pos;

    size_t close = s.find("\n```", pos);
    if (close != std::string::npos) {
        return s.substr(pos, close - pos);
    }
    std::string body = s.substr(pos);
    if (ends_with(body, "```")) body.erase(body.size() - 3);
    return body;
}

std::string strip_plan_comment(const std::string& s, std::string* plan_json) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    if (s.compare(start, 8, "// PLAN:") != 0) return s;

    size_t pos = start + 8;
    while (pos < s.size() && (s[pos] == ' ' || s[pos] == '\t')) ++pos;
    if (pos >= s.size() || s[pos] != '{') {
        size_t eol = s.find('\n', start);
        return eol == std::string::npos ? std::string() : trim(s.substr(eol + 1));
    }

    size_t close = find_matching_close(s, pos, ScanMode::Json);
    if (close == std::string::npos) {
        // The plan itself was cut off; nothing follows it.
        if (plan_json) *plan_json = s.substr(pos);
        return std::string();
    }
    if (plan_json) *plan_json = s.substr(pos, close - pos + 1);
    return trim(s.substr(close + 1));
}

} // namespace salvage
