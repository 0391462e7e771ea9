#include "salvage/parser.hpp"
#include "salvage/errors.hpp"
#include "salvage/extractors.hpp"
#include "salvage/format.hpp"
#include "salvage/text_utils.hpp"

#include <spdlog/spdlog.h>

namespace salvage {

namespace {

using Extractor = void (*)(const std::string&, ParseResult&, const ParserOptions&);

void append(std::vector<std::string>& to, const std::vector<std::string>& from) {
    to.insert(to.end(), from.begin(), from.end());
}

void dispatch(ResponseFormat format, const std::string& text, ParseResult& result,
              const ParserOptions& options) {
    switch (format) {
        case ResponseFormat::JsonV1:
            extract_json_v1(text, result, options);
            break;
        case ResponseFormat::JsonV2:
            extract_json_v2(text, result, options);
            break;
        case ResponseFormat::MarkerV1:
        case ResponseFormat::MarkerV2:
            extract_marker(text, result, options);
            break;
        case ResponseFormat::Fallback:
            extract_fallback(text, result, options);
            break;
        case ResponseFormat::Unknown:
            break;
    }
}

// Unknown format: try each extractor on a fresh result. The first one that
// yields a file supplies the data; diagnostics of every attempt are kept.
void recover_unknown(const std::string& text, ParseResult& result, const ParserOptions& options) {
    struct Attempt {
        ResponseFormat format;
        Extractor extract;
    };
    const Attempt attempts[] = {
        {ResponseFormat::JsonV1, &extract_json_v1},
        {ResponseFormat::MarkerV1, &extract_marker},
        {ResponseFormat::Fallback, &extract_fallback},
    };

    std::vector<std::string> warnings;
    std::vector<std::string> errors;
    for (const auto& attempt : attempts) {
        ParseResult candidate;
        attempt.extract(text, candidate, options);
        append(warnings, candidate.warnings);
        append(errors, candidate.errors);
        if (!candidate.files.empty()) {
            // Report the format that recovered the files, not Unknown.
            candidate.format = attempt.format;
            candidate.warnings = std::move(warnings);
            candidate.errors = std::move(errors);
            result = std::move(candidate);
            return;
        }
    }
    result.warnings = std::move(warnings);
    result.errors = std::move(errors);
}

} // namespace

ParseResult parse(const std::string& text, const ParserOptions& options) {
    ParseResult result;
    if (trim(text).empty()) {
        result.errors.push_back("Empty or invalid response");
        return result;
    }
    if (text.size() > options.max_size) {
        throw InputTooLarge(text.size(), options.max_size, "Response too large");
    }

    ResponseFormat format = detect_format(text);
    if (format == ResponseFormat::Unknown) {
        if (options.aggressive_recovery) recover_unknown(text, result, options);
    } else {
        result.format = format;
        dispatch(format, text, result, options);
    }

    if (result.files.empty() && result.incomplete_files.empty()) {
        result.errors.push_back("No structured content found");
    }
    if (options.include_raw) result.raw_response = text;

    spdlog::debug("parsed {} response: {} file(s), {} incomplete, {} warning(s), {} error(s)",
                  format_to_string(result.format), result.files.size(),
                  result.incomplete_files.size(), result.warnings.size(),
                  result.errors.size());
    return result;
}

} // namespace salvage
