#pragma once

#include "salvage/types.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace salvage {

// ============================================================================
// Syntax Auto-Repair
// ============================================================================
//
// Textual passes over generated script/markup source, each aimed at one
// class of mistake a model makes. Every pass returns its input unchanged
// when nothing matches. Scanning is string- and comment-aware through the
// Balance Scanner, so literal text is never rewritten.

// Individual passes, in pipeline order.
std::string merge_duplicate_imports(const std::string& code);
std::string fix_arrow_functions(const std::string& code);
std::string fix_attribute_quoting(const std::string& code);
std::string fix_conditional_expressions(const std::string& code);
std::string fix_declarations(const std::string& code);
std::string fix_bracket_balance(const std::string& code);
std::string fix_tag_balance(const std::string& code);

struct FixResult {
    std::string code;
    std::vector<std::string> fixes_applied;  // pass names, once per round that changed text
};

// Run all passes until a round changes nothing or max_rounds is reached.
FixResult apply_all(const std::string& code, int max_rounds = DEFAULT_REPAIR_ROUNDS);

// Cheap structural check: brackets balance outside strings and comments and
// no known-bad residual pattern remains.
bool quick_validate(const std::string& code);

// apply_all, but the original text is returned whenever the repaired text
// fails quick_validate.
std::string safe_apply(const std::string& code, int max_rounds = DEFAULT_REPAIR_ROUNDS);

// Holds an original text and a repaired candidate until the caller decides
// which one survives.
class RepairSession {
public:
    explicit RepairSession(std::string original);

    void run(int max_rounds = DEFAULT_REPAIR_ROUNDS);

    const std::string& original() const { return original_; }
    const std::string& candidate() const { return candidate_; }
    const std::vector<std::string>& fixes() const { return fixes_; }
    bool changed() const { return candidate_ != original_; }
    bool validate() const { return quick_validate(candidate_); }

    std::string commit() const { return candidate_; }
    std::string discard() const { return original_; }

private:
    std::string original_;
    std::string candidate_;
    std::vector<std::string> fixes_;
};

// ============================================================================
// Element tags
// ============================================================================

enum class TagKind {
    Open,
    Close,
    SelfClosing
};

struct TagToken {
    TagKind kind = TagKind::Open;
    std::string name;   // empty for fragments <> </>
    size_t begin = 0;   // index of '<'
    size_t end = 0;     // one past '>'
    size_t depth = 0;   // open bracket count at '<'
};

// Element tags found outside strings and comments, in document order.
std::vector<TagToken> scan_tags(const std::string& code);

// One past the end of the element starting at open_index (a '<'), or npos
// when the element is never closed.
size_t find_element_end(const std::string& code, size_t open_index);
size_t find_element_end(const std::vector<TagToken>& tags, size_t open_index);

} // namespace salvage
