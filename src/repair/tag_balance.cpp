#include "salvage/syntax_repair.hpp"
#include "salvage/balance.hpp"

#include <algorithm>
#include <cctype>
#include <set>

namespace salvage {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool is_name_char(char c) {
    return is_word_char(c) || c == '.' || c == '-' || c == ':';
}

bool is_void_element(const std::string& name) {
    static const std::set<std::string> void_elements = {
        "area", "base", "br", "col", "embed", "hr", "img",
        "input", "link", "meta", "source", "track", "wbr"};
    return void_elements.count(name) > 0;
}

struct ScanInfo {
    std::vector<bool> code;
    std::vector<size_t> depth;
};

ScanInfo scan_info(const std::string& text) {
    ScanInfo info;
    info.code.assign(text.size(), false);
    info.depth.assign(text.size(), 0);
    CharCursor cursor(text, ScanMode::Code);
    ScanChar ch;
    while (cursor.next(ch)) {
        info.code[ch.index] = !ch.in_string && !ch.in_comment;
        info.depth[ch.index] = ch.depth;
    }
    return info;
}

// Scan the attribute section of an opening tag starting at pos. Returns the
// index of the terminating '>' or npos when this is not a tag.
size_t scan_attributes(const std::string& code, size_t pos) {
    size_t k = pos;
    while (k < code.size() && std::isspace(static_cast<unsigned char>(code[k]))) ++k;
    if (k >= code.size()) return std::string::npos;
    char first = code[k];
    if (!(std::isalpha(static_cast<unsigned char>(first)) || first == '_' || first == '{' ||
          first == '/' || first == '>')) {
        return std::string::npos;
    }

    int braces = 0;
    char quote = 0;
    for (; k < code.size(); ++k) {
        char c = code[k];
        if (quote != 0) {
            if (c == '\\' && braces > 0) {
                ++k;
            } else if (c == quote) {
                quote = 0;
            }
            continue;
        }
        if (c == '"' || c == '\'' || (c == '`' && braces > 0)) {
            quote = c;
            continue;
        }
        if (c == '{') {
            ++braces;
            continue;
        }
        if (c == '}') {
            if (--braces < 0) return std::string::npos;
            continue;
        }
        if (braces > 0) continue;
        if (c == '>') return k;
        if (c == ';' || c == '<' || c == ')' || c == '(') return std::string::npos;
    }
    return std::string::npos;
}

} // namespace

std::vector<TagToken> scan_tags(const std::string& code) {
    std::vector<TagToken> tags;
    ScanInfo info = scan_info(code);

    for (size_t i = 0; i < code.size(); ++i) {
        if (code[i] != '<' || !info.code[i]) continue;
        if (i + 1 >= code.size()) break;
        // a<b and Array<T> are comparisons and generics; "text</p>" still closes
        char prev = i > 0 ? code[i - 1] : '\0';
        if (code[i + 1] != '/' && (is_word_char(prev) || prev == ')' || prev == ']')) continue;

        TagToken tag;
        tag.begin = i;
        tag.depth = info.depth[i];
        size_t j = i + 1;

        if (code[j] == '/') {
            ++j;
            size_t name_start = j;
            while (j < code.size() && is_name_char(code[j])) ++j;
            tag.name = code.substr(name_start, j - name_start);
            while (j < code.size() && std::isspace(static_cast<unsigned char>(code[j]))) ++j;
            if (j >= code.size() || code[j] != '>') continue;
            tag.kind = TagKind::Close;
            tag.end = j + 1;
        } else if (code[j] == '>') {
            tag.kind = TagKind::Open;
            tag.end = j + 1;
        } else if (std::isalpha(static_cast<unsigned char>(code[j]))) {
            size_t name_start = j;
            while (j < code.size() && is_name_char(code[j])) ++j;
            tag.name = code.substr(name_start, j - name_start);
            size_t close = scan_attributes(code, j);
            if (close == std::string::npos) continue;
            // <T>(x) => ... is a generic arrow, not an element
            if (close + 1 < code.size() && code[close + 1] == '(') continue;
            size_t last = close;
            while (last > j && std::isspace(static_cast<unsigned char>(code[last - 1]))) --last;
            bool self_closing = last > j && code[last - 1] == '/';
            tag.kind = (self_closing || is_void_element(tag.name)) ? TagKind::SelfClosing
                                                                    : TagKind::Open;
            tag.end = close + 1;
        } else {
            continue;
        }

        tags.push_back(tag);
        i = tag.end - 1;
    }
    return tags;
}

size_t find_element_end(const std::vector<TagToken>& tags, size_t open_index) {
    size_t first = tags.size();
    for (size_t i = 0; i < tags.size(); ++i) {
        if (tags[i].begin == open_index) {
            first = i;
            break;
        }
    }
    if (first == tags.size()) return std::string::npos;
    if (tags[first].kind == TagKind::SelfClosing) return tags[first].end;
    if (tags[first].kind == TagKind::Close) return std::string::npos;

    int open = 1;
    for (size_t i = first + 1; i < tags.size(); ++i) {
        if (tags[i].kind == TagKind::Open) {
            ++open;
        } else if (tags[i].kind == TagKind::Close) {
            if (--open == 0) return tags[i].end;
        }
    }
    return std::string::npos;
}

size_t find_element_end(const std::string& code, size_t open_index) {
    return find_element_end(scan_tags(code), open_index);
}

std::string fix_tag_balance(const std::string& code) {
    std::vector<TagToken> tags = scan_tags(code);
    if (tags.empty()) return code;

    struct Insertion {
        size_t pos;
        std::string text;
    };
    std::vector<Insertion> insertions;
    std::vector<size_t> stack;

    for (size_t t = 0; t < tags.size(); ++t) {
        const TagToken& tag = tags[t];
        if (tag.kind == TagKind::Open) {
            stack.push_back(t);
        } else if (tag.kind == TagKind::Close) {
            auto match = std::find_if(stack.rbegin(), stack.rend(),
                                      [&](size_t s) { return tags[s].name == tag.name; });
            if (match == stack.rend()) continue;  // stray closing tag
            size_t keep = static_cast<size_t>(stack.rend() - match) - 1;
            // Elements opened inside the matched one but never closed end here.
            for (size_t s = stack.size() - 1; s > keep; --s) {
                insertions.push_back({tag.begin, "</" + tags[stack[s]].name + ">"});
            }
            stack.resize(keep);
        }
    }

    if (stack.empty() && insertions.empty()) return code;

    // Still-open elements close where their enclosing bracket closes.
    std::vector<std::pair<size_t, size_t>> closers;  // index, depth before
    CharCursor cursor(code, ScanMode::Code);
    ScanChar ch;
    while (cursor.next(ch)) {
        if (ch.in_string || ch.in_comment) continue;
        if ((ch.ch == ')' || ch.ch == '}' || ch.ch == ']') && ch.depth > 0 &&
            cursor.state().stack.size() == ch.depth - 1) {
            closers.emplace_back(ch.index, ch.depth);
        }
    }

    for (auto it = stack.rbegin(); it != stack.rend(); ++it) {
        const TagToken& tag = tags[*it];
        size_t pos = code.size();
        if (tag.depth > 0) {
            for (const auto& closer : closers) {
                if (closer.first >= tag.end && closer.second == tag.depth) {
                    pos = closer.first;
                    break;
                }
            }
        }
        insertions.push_back({pos, "</" + tag.name + ">"});
    }

    std::stable_sort(insertions.begin(), insertions.end(),
                     [](const Insertion& a, const Insertion& b) { return a.pos < b.pos; });

    std::string out;
    out.reserve(code.size() + insertions.size() * 8);
    size_t cursor_pos = 0;
    for (const auto& ins : insertions) {
        out.append(code, cursor_pos, ins.pos - cursor_pos);
        out += ins.text;
        cursor_pos = ins.pos;
    }
    out.append(code, cursor_pos, std::string::npos);
    return out;
}

} // namespace salvage
