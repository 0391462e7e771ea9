#include "salvage/json_repair.hpp"
#include "salvage/balance.hpp"
#include "salvage/errors.hpp"
#include "salvage/text_utils.hpp"

#include <cctype>

namespace salvage {

namespace {

bool is_ws(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

// Index of the last non-whitespace character before limit, or npos.
size_t last_non_ws(const std::string& s, size_t limit) {
    size_t i = limit < s.size() ? limit : s.size();
    while (i > 0) {
        --i;
        if (!is_ws(s[i])) return i;
    }
    return std::string::npos;
}

// Drop a dangling backslash or a \u escape with fewer than four hex digits
// from the end of an unterminated string.
void drop_dangling_escape(std::string& json, bool escape_pending) {
    if (escape_pending) {
        json.pop_back();
        return;
    }
    size_t slash = json.rfind('\\');
    if (slash == std::string::npos || slash + 1 >= json.size() || json[slash + 1] != 'u') return;
    if (json.size() - slash - 2 >= 4) return;
    for (size_t i = slash + 2; i < json.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(json[i]))) return;
    }
    size_t run = 0;
    for (size_t i = slash; i > 0 && json[i - 1] == '\\'; --i) ++run;
    if (run % 2 == 0) json.erase(slash);
}

struct TrailingString {
    size_t start = std::string::npos;
    char container = 0;  // innermost open bracket around the string
};

// The complete string literal that ends the text, if any.
TrailingString trailing_string(const std::string& json) {
    TrailingString out;
    size_t end = last_non_ws(json, json.size());
    if (end == std::string::npos || json[end] != '"') return out;

    CharCursor cursor(json, ScanMode::Json);
    ScanChar ch;
    bool inside = false;
    size_t start = std::string::npos;
    char container = 0;
    while (cursor.next(ch)) {
        if (!inside && ch.in_string) {
            start = ch.index;
            const auto& stack = cursor.state().stack;
            container = stack.empty() ? 0 : stack.back();
        }
        inside = cursor.state().in_string();
        if (ch.index == end) break;
    }
    if (inside) return out;
    out.start = start;
    out.container = container;
    return out;
}

// Pull an erase position back over whitespace and one separating comma.
size_t erase_from(const std::string& json, size_t start) {
    size_t i = start;
    while (i > 0 && is_ws(json[i - 1])) --i;
    if (i > 0 && json[i - 1] == ',') --i;
    return i;
}

bool strip_trailing_fragment(std::string& json, std::vector<std::string>& repairs) {
    size_t end = last_non_ws(json, json.size());
    if (end == std::string::npos) return false;

    if (json[end] == ',') {
        json.erase(end);
        repairs.push_back("Removed trailing comma");
        return true;
    }

    if (json[end] == ':') {
        TrailingString key = trailing_string(json.substr(0, end));
        if (key.start == std::string::npos) return false;
        json.erase(erase_from(json, key.start));
        repairs.push_back("Removed incomplete key-value");
        return true;
    }

    if (json[end] == '"') {
        // A lone key with no colon: {"a": 1, "ke
        TrailingString str = trailing_string(json);
        if (str.start == std::string::npos || str.container != '{') return false;
        size_t before = last_non_ws(json, str.start);
        if (before == std::string::npos || (json[before] != ',' && json[before] != '{')) {
            return false;
        }
        json.erase(erase_from(json, str.start));
        repairs.push_back("Removed incomplete key");
        return true;
    }
    return false;
}

} // namespace

JsonRepairResult repair_json(const std::string& text, const JsonRepairOptions& options) {
    JsonRepairResult result;
    std::string json = trim(text);

    if (json.size() > options.max_size) {
        throw InputTooLarge(json.size(), options.max_size, "JSON too large to repair safely");
    }

    BalanceReport report = check_balance(json, ScanMode::Json);
    if (report.balanced) {
        result.json = json;
        return result;
    }

    // Step 1: close an unterminated string
    if (report.in_string) {
        drop_dangling_escape(json, report.escape_pending);
        json += '"';
        result.repairs.push_back("Closed unclosed string");
        report = check_balance(json, ScanMode::Json);
    }

    // Step 2: drop one incomplete trailing fragment
    if (!report.balanced && strip_trailing_fragment(json, result.repairs)) {
        report = check_balance(json, ScanMode::Json);
    }

    // Step 3: close what is still open, innermost first
    if (!report.balanced && !report.in_string && !report.open_stack.empty()) {
        std::string closers = closers_for(report.open_stack);
        json += closers;
        result.repairs.push_back("Closed " + std::to_string(closers.size()) +
                                 " unclosed bracket(s)");
    }

    result.json = json;
    result.was_repaired = !result.repairs.empty();
    return result;
}

JsonParseOutcome parse_json_with_repair(const std::string& text, const JsonRepairOptions& options) {
    JsonParseOutcome outcome;

    auto direct = nlohmann::json::parse(text, nullptr, false);
    if (!direct.is_discarded()) {
        outcome.ok = true;
        outcome.value = std::move(direct);
        return outcome;
    }

    try {
        JsonRepairResult repaired = repair_json(text, options);
        outcome.value = nlohmann::json::parse(repaired.json);
        outcome.ok = true;
        outcome.repaired = repaired.was_repaired;
    } catch (const nlohmann::json::parse_error& e) {
        outcome.error = e.what();
    } catch (const InputTooLarge& e) {
        outcome.error = e.what();
    }
    return outcome;
}

} // namespace salvage
