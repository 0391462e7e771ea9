#include "salvage/markers.hpp"
#include "salvage/text_utils.hpp"

#include <cctype>

namespace salvage {

namespace {

bool is_path_char(char c) {
    unsigned char u = static_cast<unsigned char>(c);
    if (std::isspace(u)) return false;
    return c != '<' && c != '>' && c != '"' && c != '\'' && c != '`' && u >= 0x20;
}

bool is_valid_path(const std::string& path) {
    if (path.empty()) return false;
    for (char c : path) {
        if (!is_path_char(c)) return false;
    }
    return true;
}

// Classify the trimmed body of an HTML comment.
std::optional<MarkerToken> classify(const std::string& raw_body) {
    std::string body = trim(raw_body);
    MarkerToken token;
    if (!body.empty() && body[0] == '/') {
        token.kind = MarkerKind::Close;
        body = trim(body.substr(1));
    }

    if (starts_with(body, "FILE")) {
        std::string rest = trim(body.substr(4));
        if (rest.empty()) {
            if (token.kind != MarkerKind::Close) return std::nullopt;
            token.name = "FILE";
            return token;
        }
        if (rest[0] != ':') return std::nullopt;
        std::string path = trim(rest.substr(1));
        if (!is_valid_path(path)) return std::nullopt;
        token.name = "FILE";
        token.path = path;
        return token;
    }

    if (is_block_name(body)) {
        token.name = body;
        return token;
    }
    return std::nullopt;
}

} // namespace

bool is_block_name(const std::string& name) {
    return name == "META" || name == "PLAN" || name == "EXPLANATION" || name == "MANIFEST" ||
           name == "BATCH" || name == "GENERATION_META";
}

std::vector<MarkerToken> scan_markers(const std::string& text) {
    std::vector<MarkerToken> tokens;
    size_t pos = text.find("<!--");
    while (pos != std::string::npos) {
        size_t close = text.find("-->", pos + 4);
        if (close == std::string::npos) break;

        // An unterminated comment inside file content must not swallow the
        // delimiter that follows it.
        size_t reopen = text.find("<!--", pos + 4);
        if (reopen != std::string::npos && reopen < close) {
            pos = reopen;
            continue;
        }

        if (auto token = classify(text.substr(pos + 4, close - pos - 4))) {
            token->begin = pos;
            token->end = close + 3;
            tokens.push_back(*token);
        }
        pos = text.find("<!--", close + 3);
    }
    return tokens;
}

bool has_marker(const std::vector<MarkerToken>& tokens, const std::string& name,
                MarkerKind kind) {
    for (const auto& t : tokens) {
        if (t.kind == kind && t.name == name) return true;
    }
    return false;
}

bool has_file_opening(const std::string& text) {
    size_t pos = text.find("<!--");
    while (pos != std::string::npos) {
        size_t i = pos + 4;
        while (i < text.size() && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (text.compare(i, 5, "FILE:") == 0) return true;
        pos = text.find("<!--", pos + 4);
    }
    return false;
}

std::optional<std::string> block_body(const std::string& text,
                                      const std::vector<MarkerToken>& tokens,
                                      const std::string& name) {
    for (size_t i = 0; i < tokens.size(); ++i) {
        if (tokens[i].kind != MarkerKind::Open || tokens[i].name != name) continue;
        for (size_t j = i + 1; j < tokens.size(); ++j) {
            if (tokens[j].kind == MarkerKind::Close && tokens[j].name == name) {
                return text.substr(tokens[i].end, tokens[j].begin - tokens[i].end);
            }
        }
        return std::nullopt;
    }
    return std::nullopt;
}

} // namespace salvage
