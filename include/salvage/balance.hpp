#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace salvage {

// ============================================================================
// Balance Scanner
// ============================================================================
//
// One character-level state machine shared by JSON repair, the syntax repair
// passes, the format detector and the JSON extractor. It knows string
// literals and escapes, and keeps a stack of open brackets seen outside
// strings (and outside comments in Code mode).

enum class ScanMode {
    Json,  // double-quoted strings only
    Code   // '', "", `` (with ${...}), /regex/, // and /* */ comments
};

// Classification of a single character, as produced by CharCursor.
struct ScanChar {
    char ch = 0;
    size_t index = 0;
    bool in_string = false;   // part of a string literal, delimiters included
    bool in_comment = false;  // part of a comment, delimiters included
    size_t depth = 0;         // open bracket count before this character
};

struct ScanState {
    explicit ScanState(ScanMode m = ScanMode::Json) : mode(m) {}

    ScanMode mode;
    char quote = 0;                 // active string delimiter, 0 outside strings
    bool escape_next = false;
    bool line_comment = false;
    bool block_comment = false;
    bool closing_block = false;     // saw '*' of a block comment terminator
    bool opening_comment = false;   // saw first '/' of a comment opener
    size_t string_start = std::string::npos;
    size_t regex_end = std::string::npos;  // closing '/' of the active regex literal
    std::vector<char> stack;        // open brackets outside strings
    std::vector<size_t> templates;  // stack sizes at which a ${ substitution began
    size_t stray_closers = 0;

    // Advance over text[i]. Lookahead and lookbehind come from the text so
    // comment openers, template substitutions and in-word apostrophes are
    // recognised. Returns the classification of text[i].
    ScanChar step(const std::string& text, size_t i);

    bool in_string() const { return quote != 0; }
    bool in_comment() const { return line_comment || block_comment; }
};

struct BalanceReport {
    bool balanced = true;            // nothing open, no strays, not inside a string
    bool in_string = false;          // text ends inside a string literal
    bool in_comment = false;         // text ends inside a comment (Code mode)
    bool in_line_comment = false;
    std::vector<char> open_stack;    // open brackets, outermost first
    size_t stray_closers = 0;        // closers that matched nothing
    size_t string_start = std::string::npos;
    bool escape_pending = false;     // text ends right after a backslash in a string
};

BalanceReport check_balance(const std::string& text, ScanMode mode = ScanMode::Json);

// Closing characters for an open stack, innermost first.
std::string closers_for(const std::vector<char>& open_stack);

// Index of the bracket closing the one at open_index, or npos when it never
// closes within the text.
size_t find_matching_close(const std::string& text, size_t open_index,
                           ScanMode mode = ScanMode::Json);

// Per-character mask: true where the character is structural code (outside
// strings and comments).
std::vector<bool> code_mask(const std::string& text, ScanMode mode = ScanMode::Code);

// Iterates a text, classifying each character.
class CharCursor {
public:
    CharCursor(const std::string& text, ScanMode mode, size_t start = 0)
        : text_(text), state_(mode), pos_(start) {}

    bool next(ScanChar& out) {
        if (pos_ >= text_.size()) return false;
        out = state_.step(text_, pos_);
        ++pos_;
        return true;
    }

    const ScanState& state() const { return state_; }
    size_t position() const { return pos_; }

private:
    const std::string& text_;
    ScanState state_;
    size_t pos_;
};

} // namespace salvage
