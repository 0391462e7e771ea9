#include "salvage/balance.hpp"

#include <cctype>
#include <set>

namespace salvage {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool is_opener(char c) {
    return c == '{' || c == '[' || c == '(';
}

bool is_closer(char c) {
    return c == '}' || c == ']' || c == ')';
}

char opener_for(char closer) {
    switch (closer) {
        case '}': return '{';
        case ']': return '[';
        case ')': return '(';
        default: return 0;
    }
}

char closer_for(char opener) {
    switch (opener) {
        case '{': return '}';
        case '[': return ']';
        case '(': return ')';
        default: return 0;
    }
}

// A '/' starts a regex literal where an expression may begin: at the start,
// after an operator or opening bracket, after "=>", or after a keyword such
// as return.
bool regex_can_start(const std::string& text, size_t i) {
    size_t k = i;
    while (k > 0 && std::isspace(static_cast<unsigned char>(text[k - 1]))) --k;
    if (k == 0) return true;
    char p = text[k - 1];
    if (is_word_char(p) || p == '$') {
        static const std::set<std::string> keywords = {
            "return", "typeof", "case", "do", "else", "in", "of", "void",
            "yield", "await", "delete", "new", "throw", "instanceof"};
        size_t w = k;
        while (w > 0 && (is_word_char(text[w - 1]) || text[w - 1] == '$')) --w;
        return keywords.count(text.substr(w, k - w)) > 0;
    }
    if (p == '>') return k >= 2 && text[k - 2] == '=';
    static const std::string starters = "(,=:[!&|?{};+-*%~^";
    return starters.find(p) != std::string::npos;
}

// Index of the '/' closing a regex literal opened at i, or npos when the
// line holds no complete literal. A body ending in '<' is markup ("</p>").
size_t regex_literal_end(const std::string& text, size_t i) {
    if (i + 1 >= text.size()) return std::string::npos;
    char first = text[i + 1];
    if (first == '/' || first == '*' || first == '>') return std::string::npos;
    bool in_class = false;
    for (size_t j = i + 1; j < text.size(); ++j) {
        char c = text[j];
        if (c == '\n' || c == '\r') return std::string::npos;
        if (c == '\\') {
            ++j;
            continue;
        }
        if (in_class) {
            if (c == ']') in_class = false;
            continue;
        }
        if (c == '[') {
            in_class = true;
        } else if (c == '/') {
            return text[j - 1] == '<' ? std::string::npos : j;
        }
    }
    return std::string::npos;
}

} // namespace

ScanChar ScanState::step(const std::string& text, size_t i) {
    ScanChar out;
    const char c = text[i];
    const char prev = i > 0 ? text[i - 1] : '\0';
    const char next = i + 1 < text.size() ? text[i + 1] : '\0';
    out.ch = c;
    out.index = i;
    out.depth = stack.size();

    // Comments (Code mode only ever enters these states)
    if (line_comment) {
        if (c == '\n') {
            line_comment = false;
            return out;
        }
        out.in_comment = true;
        return out;
    }
    if (block_comment) {
        out.in_comment = true;
        if (opening_comment) {
            opening_comment = false;
        } else if (closing_block) {
            closing_block = false;
            block_comment = false;
        } else if (c == '*' && next == '/') {
            closing_block = true;
        }
        return out;
    }

    // Inside a string literal
    if (quote != 0) {
        out.in_string = true;
        if (quote == '/') {
            if (i >= regex_end) {
                quote = 0;
                regex_end = std::string::npos;
                string_start = std::string::npos;
            }
            return out;
        }
        if (escape_next) {
            escape_next = false;
            return out;
        }
        if (c == '\\') {
            escape_next = true;
            return out;
        }
        if (c == quote) {
            quote = 0;
            string_start = std::string::npos;
            return out;
        }
        if (mode == ScanMode::Code) {
            if (quote == '`' && c == '$' && next == '{') {
                templates.push_back(stack.size());
                quote = 0;
                return out;
            }
            if (c == '\n' && (quote == '\'' || quote == '"')) {
                // A plain literal cannot span lines; treat it as unterminated.
                quote = 0;
                string_start = std::string::npos;
                out.in_string = false;
            }
        }
        return out;
    }

    if (mode == ScanMode::Code && c == '/') {
        // "://" in markup text is a URL, not a comment
        if (next == '/' && prev != ':') {
            line_comment = true;
            out.in_comment = true;
            return out;
        }
        if (next == '*') {
            block_comment = true;
            opening_comment = true;
            out.in_comment = true;
            return out;
        }
        if (regex_can_start(text, i)) {
            size_t end = regex_literal_end(text, i);
            if (end != std::string::npos) {
                quote = '/';
                regex_end = end;
                string_start = i;
                out.in_string = true;
                return out;
            }
        }
    }

    bool opens_string = c == '"';
    if (mode == ScanMode::Code && (c == '\'' || c == '`')) {
        // Apostrophe inside a word (Don't) is text, not a delimiter
        opens_string = !(c == '\'' && is_word_char(prev) && is_word_char(next));
    }
    if (opens_string) {
        quote = c;
        string_start = i;
        out.in_string = true;
        return out;
    }

    if (is_opener(c)) {
        stack.push_back(c);
    } else if (is_closer(c)) {
        if (!stack.empty() && stack.back() == opener_for(c)) {
            stack.pop_back();
            if (c == '}' && !templates.empty() && templates.back() == stack.size()) {
                templates.pop_back();
                quote = '`';
                string_start = i;
            }
        } else {
            ++stray_closers;
        }
    }
    return out;
}

BalanceReport check_balance(const std::string& text, ScanMode mode) {
    CharCursor cursor(text, mode);
    ScanChar ch;
    while (cursor.next(ch)) {
    }

    const ScanState& state = cursor.state();
    BalanceReport report;
    report.in_string = state.in_string();
    report.in_comment = state.in_comment();
    report.in_line_comment = state.line_comment;
    report.open_stack = state.stack;
    report.stray_closers = state.stray_closers;
    report.string_start = state.string_start;
    report.escape_pending = state.in_string() && state.escape_next;
    report.balanced = state.stack.empty() && state.stray_closers == 0 &&
                      !state.in_string() && !state.block_comment && state.templates.empty();
    return report;
}

std::string closers_for(const std::vector<char>& open_stack) {
    std::string out;
    for (auto it = open_stack.rbegin(); it != open_stack.rend(); ++it) {
        out += closer_for(*it);
    }
    return out;
}

size_t find_matching_close(const std::string& text, size_t open_index, ScanMode mode) {
    if (open_index >= text.size() || !is_opener(text[open_index])) {
        return std::string::npos;
    }
    CharCursor cursor(text, mode, open_index);
    ScanChar ch;
    while (cursor.next(ch)) {
        if (ch.in_string || ch.in_comment) continue;
        if (is_closer(ch.ch) && ch.depth == 1 && cursor.state().stack.empty()) {
            return ch.index;
        }
    }
    return std::string::npos;
}

std::vector<bool> code_mask(const std::string& text, ScanMode mode) {
    std::vector<bool> mask(text.size(), false);
    CharCursor cursor(text, mode);
    ScanChar ch;
    while (cursor.next(ch)) {
        mask[ch.index] = !ch.in_string && !ch.in_comment;
    }
    return mask;
}

} // namespace salvage
