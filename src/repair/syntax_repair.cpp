#include "salvage/syntax_repair.hpp"
#include "salvage/balance.hpp"

#include <algorithm>
#include <cctype>
#include <set>

#include <spdlog/spdlog.h>

namespace salvage {

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

size_t skip_ws(const std::string& s, size_t i) {
    while (i < s.size() && std::isspace(static_cast<unsigned char>(s[i]))) ++i;
    return i;
}

// Index of the last non-whitespace character before i, or npos.
size_t skip_ws_back(const std::string& s, size_t i) {
    while (i > 0) {
        --i;
        if (!std::isspace(static_cast<unsigned char>(s[i]))) return i;
    }
    return std::string::npos;
}

// Identifier ending at index last (inclusive); start is written back.
std::string word_ending_at(const std::string& s, size_t last, size_t& start) {
    start = last + 1;
    while (start > 0 && is_ident_char(s[start - 1])) --start;
    return s.substr(start, last + 1 - start);
}

bool starts_word_at(const std::string& s, size_t i, const std::string& word) {
    if (s.compare(i, word.size(), word) != 0) return false;
    if (i > 0 && is_ident_char(s[i - 1])) return false;
    size_t after = i + word.size();
    return after >= s.size() || !is_ident_char(s[after]);
}

struct Edit {
    size_t begin;
    size_t end;
    std::string text;
};

std::string apply_edits(const std::string& code, std::vector<Edit> edits) {
    if (edits.empty()) return code;
    std::stable_sort(edits.begin(), edits.end(),
                     [](const Edit& a, const Edit& b) { return a.begin < b.begin; });
    std::string out;
    out.reserve(code.size() + 16);
    size_t pos = 0;
    for (const auto& e : edits) {
        if (e.begin < pos) continue;  // overlaps an earlier edit
        out.append(code, pos, e.begin - pos);
        out += e.text;
        pos = e.end;
    }
    out.append(code, pos, std::string::npos);
    return out;
}

// Innermost open bracket at each position.
std::vector<char> enclosing_brackets(const std::string& code) {
    std::vector<char> enclosing(code.size(), '\0');
    CharCursor cursor(code, ScanMode::Code);
    ScanChar ch;
    while (cursor.next(ch)) {
        // State before this character was applied: depth is unchanged for
        // everything except brackets, which only affect what follows them.
        const auto& stack = cursor.state().stack;
        if (ch.depth == 0) continue;
        if (stack.size() >= ch.depth) {
            enclosing[ch.index] = stack[ch.depth - 1];
        }
    }
    return enclosing;
}

// ============================================================================
// Arrow functions
// ============================================================================

// "= >" becomes "=>"
std::string normalize_spaced_arrows(const std::string& code) {
    std::vector<bool> mask = code_mask(code);
    std::vector<Edit> edits;
    for (size_t i = 0; i + 2 < code.size(); ++i) {
        if (code[i] != '=' || !mask[i]) continue;
        if (i > 0 && (code[i - 1] == '=' || code[i - 1] == '!' || code[i - 1] == '<' ||
                      code[i - 1] == '>')) {
            continue;
        }
        size_t j = i + 1;
        while (j < code.size() && is_blank(code[j])) ++j;
        if (j == i + 1 || j >= code.size() || code[j] != '>' || !mask[j]) continue;
        edits.push_back({i, j + 1, "=>"});
        i = j;
    }
    return apply_edits(code, edits);
}

// function Name(params) => {   becomes   function Name(params) {
std::string collapse_hybrid_functions(const std::string& code) {
    std::vector<bool> mask = code_mask(code);
    std::vector<Edit> edits;
    for (size_t i = 0; i < code.size(); ++i) {
        if (!mask[i] || !starts_word_at(code, i, "function")) continue;
        size_t j = skip_ws(code, i + 8);
        if (j < code.size() && code[j] == '*') j = skip_ws(code, j + 1);
        size_t name_start = j;
        while (j < code.size() && is_ident_char(code[j])) ++j;
        if (j == name_start) continue;
        j = skip_ws(code, j);
        if (j >= code.size() || code[j] != '(') continue;
        size_t close = find_matching_close(code, j, ScanMode::Code);
        if (close == std::string::npos) continue;

        size_t k = skip_ws(code, close + 1);
        size_t arrow = std::string::npos;
        if (k < code.size() && code[k] == ':') {
            // return type annotation up to the stray arrow
            size_t t = k + 1;
            while (t + 1 < code.size() && code[t] != '{' && code[t] != ';' && code[t] != '}' &&
                   code[t] != '\n' && code.compare(t, 2, "=>") != 0) {
                ++t;
            }
            if (code.compare(t, 2, "=>") == 0) arrow = t;
        } else if (code.compare(k, 2, "=>") == 0) {
            arrow = k;
        }
        if (arrow == std::string::npos) continue;

        size_t brace = skip_ws(code, arrow + 2);
        if (brace >= code.size() || code[brace] != '{') continue;

        size_t from = arrow;
        while (from > close + 1 && std::isspace(static_cast<unsigned char>(code[from - 1]))) --from;
        edits.push_back({from, brace, " "});
        i = brace;
    }
    return apply_edits(code, edits);
}

// Decide whether "(params) {" at open_index is an arrow function that lost
// its "=>".
bool arrow_context(const std::string& code, size_t open_index, const std::vector<char>& enclosing) {
    size_t p = skip_ws_back(code, open_index);
    if (p == std::string::npos) return false;

    size_t word_start = 0;
    if (is_ident_char(code[p])) {
        std::string word = word_ending_at(code, p, word_start);
        return word == "async" || word == "return";
    }

    switch (code[p]) {
        case '=':
            return p == 0 || (code[p - 1] != '=' && code[p - 1] != '!' && code[p - 1] != '<' &&
                              code[p - 1] != '>');
        case '(': {
            size_t q = skip_ws_back(code, p);
            if (q == std::string::npos || !is_ident_char(code[q])) return true;
            static const std::set<std::string> keywords = {
                "function", "if", "for", "while", "switch", "catch", "with"};
            return keywords.count(word_ending_at(code, q, word_start)) == 0;
        }
        case ',':
            return enclosing[open_index] == '(';
        case '{': {
            size_t q = skip_ws_back(code, p);
            return q != std::string::npos && code[q] == '=';
        }
        case ':': {
            size_t q = skip_ws_back(code, p);
            return q != std::string::npos && is_ident_char(code[q]) &&
                   enclosing[open_index] == '{';
        }
        default:
            return false;
    }
}

std::string insert_missing_arrows(const std::string& code) {
    std::vector<bool> mask = code_mask(code);
    std::vector<char> enclosing = enclosing_brackets(code);
    std::vector<Edit> edits;
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] != '(' || !mask[i]) continue;
        size_t close = find_matching_close(code, i, ScanMode::Code);
        if (close == std::string::npos) continue;
        size_t brace = skip_ws(code, close + 1);
        if (brace >= code.size() || code[brace] != '{') continue;
        if (!arrow_context(code, i, enclosing)) continue;
        edits.push_back({close + 1, brace, " => "});
    }
    return apply_edits(code, edits);
}

// "( ) =>" becomes "() =>"
std::string normalize_empty_params(const std::string& code) {
    std::vector<bool> mask = code_mask(code);
    std::vector<Edit> edits;
    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] != '(' || !mask[i]) continue;
        size_t j = i + 1;
        while (j < code.size() && is_blank(code[j])) ++j;
        if (j == i + 1 || j >= code.size() || code[j] != ')') continue;
        size_t k = skip_ws(code, j + 1);
        if (code.compare(k, 2, "=>") != 0) continue;
        edits.push_back({i, j + 1, "()"});
    }
    return apply_edits(code, edits);
}

// ============================================================================
// Attributes
// ============================================================================

const std::set<std::string>& quoted_attributes() {
    static const std::set<std::string> names = {
        "className", "class", "key", "href", "src", "alt", "id", "name", "type",
        "value", "placeholder", "htmlFor", "title", "role", "target", "rel"};
    return names;
}

bool is_event_attribute(const std::string& name) {
    return name.size() > 2 && name[0] == 'o' && name[1] == 'n' &&
           std::isupper(static_cast<unsigned char>(name[2]));
}

bool is_expression_name(const std::string& value) {
    if (value.empty()) return false;
    for (char c : value) {
        if (!is_ident_char(c) && c != '.') return false;
    }
    return true;
}

// True when pos sits between an element's name and its closing '>'.
bool inside_open_tag(const std::string& code, const std::vector<bool>& mask, size_t pos) {
    int braces = 0;
    size_t k = pos;
    while (k > 0) {
        --k;
        if (!mask[k]) continue;
        char c = code[k];
        if (c == '}') {
            ++braces;
        } else if (c == '{') {
            if (braces == 0) return false;
            --braces;
        } else if (braces == 0) {
            if (c == '<') return k + 1 < code.size() && std::isalpha(static_cast<unsigned char>(code[k + 1]));
            if (c == ';' || c == '(' || c == ')' || c == '>') return false;
        }
    }
    return false;
}

} // namespace

std::string fix_attribute_quoting(const std::string& code) {
    std::vector<bool> mask = code_mask(code);
    std::vector<Edit> edits;
    for (size_t i = 0; i < code.size(); ++i) {
        if (!mask[i] || !is_ident_char(code[i]) || (i > 0 && is_ident_char(code[i - 1]))) continue;
        size_t end = i;
        while (end < code.size() && is_ident_char(code[end])) ++end;
        std::string name = code.substr(i, end - i);
        bool known = quoted_attributes().count(name) > 0;
        bool event = is_event_attribute(name);
        bool style = name == "style";
        if (!known && !event && !style) {
            i = end - 1;
            continue;
        }

        // name=="value"
        if (code.compare(end, 2, "==") == 0 && end + 2 < code.size() &&
            (code[end + 2] == '"' || code[end + 2] == '\'' || code[end + 2] == '{') &&
            inside_open_tag(code, mask, i)) {
            edits.push_back({end, end + 2, "="});
            i = end + 1;
            continue;
        }

        // name"value"
        if (end < code.size() && (code[end] == '"' || code[end] == '\'')) {
            char quote = code[end];
            size_t close = code.find(quote, end + 1);
            size_t eol = code.find('\n', end + 1);
            if (close == std::string::npos || (eol != std::string::npos && eol < close)) {
                i = end - 1;
                continue;
            }
            std::string value = code.substr(end + 1, close - end - 1);
            if (style) {
                edits.push_back({end, close + 1, "={{" + value + "}}"});
            } else if (event && is_expression_name(value)) {
                edits.push_back({end, close + 1, "={" + value + "}"});
            } else if (known) {
                edits.push_back({end, end, "="});
            }
            i = close;
            continue;
        }
        i = end - 1;
    }
    return apply_edits(code, edits);
}

namespace {

// ============================================================================
// Conditionals
// ============================================================================

bool is_ternary_mark(const std::string& code, const std::vector<bool>& mask, size_t i) {
    if (code[i] != '?' || !mask[i]) return false;
    if (i + 1 < code.size() && (code[i + 1] == '.' || code[i + 1] == '?')) return false;
    if (i > 0 && code[i - 1] == '?') return false;
    return true;
}

// End positions of ternaries whose element true-branch runs straight into '}'.
std::vector<size_t> unfinished_ternaries(const std::string& code, const std::vector<bool>& mask,
                                         const std::vector<TagToken>& tags) {
    std::vector<size_t> ends;
    for (size_t i = 0; i < code.size(); ++i) {
        if (!is_ternary_mark(code, mask, i)) continue;
        size_t j = skip_ws(code, i + 1);
        if (j >= code.size() || code[j] != '<') continue;
        size_t true_end = find_element_end(tags, j);
        if (true_end == std::string::npos) continue;
        size_t k = skip_ws(code, true_end);
        if (k < code.size() && code[k] == '}') ends.push_back(true_end);
    }
    return ends;
}

} // namespace

std::string fix_conditional_expressions(const std::string& code) {
    std::vector<bool> mask = code_mask(code);
    std::vector<TagToken> tags = scan_tags(code);
    if (tags.empty()) return code;

    std::vector<Edit> edits;
    for (size_t end : unfinished_ternaries(code, mask, tags)) {
        edits.push_back({end, end, " : null"});
    }

    // cond ? <A/> : flag && <B/>   becomes   cond ? <A/> : (flag && <B/>)
    for (size_t i = 0; i < code.size(); ++i) {
        if (!is_ternary_mark(code, mask, i)) continue;
        size_t j = skip_ws(code, i + 1);
        if (j >= code.size() || code[j] != '<') continue;
        size_t true_end = find_element_end(tags, j);
        if (true_end == std::string::npos) continue;
        size_t colon = skip_ws(code, true_end);
        if (colon >= code.size() || code[colon] != ':') continue;

        size_t cond = skip_ws(code, colon + 1);
        size_t c = cond;
        if (c < code.size() && code[c] == '!') ++c;
        size_t ident_start = c;
        while (c < code.size() && (is_ident_char(code[c]) || code[c] == '.')) ++c;
        if (c == ident_start) continue;
        size_t amp = skip_ws(code, c);
        if (code.compare(amp, 2, "&&") != 0) continue;
        size_t second = skip_ws(code, amp + 2);
        if (second >= code.size() || code[second] != '<') continue;
        size_t false_end = find_element_end(tags, second);
        if (false_end == std::string::npos) continue;

        edits.push_back({cond, cond, "("});
        edits.push_back({false_end, false_end, ")"});
    }
    return apply_edits(code, edits);
}

// ============================================================================
// Declarations
// ============================================================================

std::string fix_declarations(const std::string& code) {
    std::vector<bool> mask = code_mask(code);
    std::vector<Edit> edits;
    for (size_t i = 0; i < code.size(); ++i) {
        if (!mask[i]) continue;
        if (code[i] == ':') {
            size_t j = i + 1;
            while (j < code.size() && is_blank(code[j])) ++j;
            if (j < code.size() && code[j] == ':' && mask[j]) {
                size_t k = j + 1;
                while (k < code.size() && is_blank(code[k])) ++k;
                edits.push_back({i, k, ": "});
                i = k - 1;
            }
        } else if (code[i] == ',') {
            size_t j = skip_ws(code, i + 1);
            if (j < code.size() && code[j] == '}' && mask[j]) {
                edits.push_back({i, i + 1, ""});
            }
        }
    }
    return apply_edits(code, edits);
}

// ============================================================================
// Brackets
// ============================================================================

std::string fix_bracket_balance(const std::string& code) {
    BalanceReport report = check_balance(code, ScanMode::Code);
    if (report.open_stack.empty() || report.in_string) return code;
    if (report.in_comment && !report.in_line_comment) return code;

    std::string out = code;
    if (report.in_line_comment) out += '\n';
    out += closers_for(report.open_stack);
    return out;
}

std::string fix_arrow_functions(const std::string& code) {
    std::string out = normalize_spaced_arrows(code);
    out = collapse_hybrid_functions(out);
    out = insert_missing_arrows(out);
    return normalize_empty_params(out);
}

// ============================================================================
// Pipeline
// ============================================================================

FixResult apply_all(const std::string& code, int max_rounds) {
    struct Pass {
        const char* name;
        std::string (*fn)(const std::string&);
    };
    static const Pass passes[] = {
        {"imports", merge_duplicate_imports},
        {"arrow-functions", fix_arrow_functions},
        {"attributes", fix_attribute_quoting},
        {"conditionals", fix_conditional_expressions},
        {"declarations", fix_declarations},
        {"brackets", fix_bracket_balance},
        {"tags", fix_tag_balance},
    };

    FixResult result;
    result.code = code;
    for (int round = 0; round < max_rounds; ++round) {
        bool changed = false;
        for (const auto& pass : passes) {
            std::string next = pass.fn(result.code);
            if (next != result.code) {
                result.fixes_applied.push_back(pass.name);
                result.code = std::move(next);
                changed = true;
            }
        }
        if (!changed) break;
    }
    return result;
}

bool quick_validate(const std::string& code) {
    if (!check_balance(code, ScanMode::Code).balanced) return false;

    std::vector<bool> mask = code_mask(code);
    for (size_t i = 0; i < code.size(); ++i) {
        if (!mask[i]) continue;
        char c = code[i];
        if (c == '=' && i + 1 < code.size() && is_blank(code[i + 1])) {
            size_t j = i + 1;
            while (j < code.size() && is_blank(code[j])) ++j;
            bool comparison = i > 0 && (code[i - 1] == '=' || code[i - 1] == '!' ||
                                        code[i - 1] == '<' || code[i - 1] == '>');
            if (!comparison && j < code.size() && code[j] == '>') return false;
        } else if (c == ':') {
            size_t j = i + 1;
            while (j < code.size() && is_blank(code[j])) ++j;
            if (j < code.size() && code[j] == ':') return false;
        } else if (c == 'c' && starts_word_at(code, i, "className")) {
            size_t j = i + 9;
            if (j < code.size() && code[j] == '"') return false;
        }
    }

    std::vector<TagToken> tags = scan_tags(code);
    return unfinished_ternaries(code, mask, tags).empty();
}

RepairSession::RepairSession(std::string original)
    : original_(std::move(original)), candidate_(original_) {}

void RepairSession::run(int max_rounds) {
    FixResult result = apply_all(original_, max_rounds);
    candidate_ = std::move(result.code);
    fixes_ = std::move(result.fixes_applied);
}

std::string safe_apply(const std::string& code, int max_rounds) {
    RepairSession session(code);
    session.run(max_rounds);
    if (!session.changed()) return session.original();
    if (session.validate()) return session.commit();

    spdlog::debug("syntax repair reverted after {} change(s): result failed validation",
                  session.fixes().size());
    return session.discard();
}

} // namespace salvage
