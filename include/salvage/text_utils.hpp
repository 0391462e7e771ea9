#pragma once

#include <string>
#include <vector>

namespace salvage {

std::string trim(const std::string& s);
std::string to_lower(const std::string& s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Split on a delimiter; pieces are trimmed and empty pieces dropped.
std::vector<std::string> split_list(const std::string& s, char delim);

// Split into lines on '\n', dropping a trailing '\r' from each line.
std::vector<std::string> split_lines(const std::string& s);

// Remove byte-order marks and zero-width characters, turn no-break spaces
// into plain spaces, then trim.
std::string strip_invisible(const std::string& s);

// If the text opens with a ``` fence (optionally tagged), return the fenced
// body. An unterminated fence runs to the end of the text.
std::string unwrap_leading_fence(const std::string& s);

// Remove a leading "// PLAN: {...}" comment whose object is found by brace
// counting. The object text is stored in plan_json when requested.
std::string strip_plan_comment(const std::string& s, std::string* plan_json = nullptr);

} // namespace salvage
