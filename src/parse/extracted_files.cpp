#include "salvage/code_cleaner.hpp"
#include "salvage/extractors.hpp"
#include "salvage/path_utils.hpp"

#include <spdlog/spdlog.h>

namespace salvage {

bool store_extracted_file(const std::string& path, const std::string& body, ParseResult& result,
                          const ParserOptions& options, size_t min_length) {
    if (is_ignored_path(path)) {
        spdlog::debug("skipping ignored path {}", path);
        return false;
    }
    std::string cleaned = clean_generated_code(body, path, options);
    if (cleaned.empty() || cleaned.size() < min_length) {
        spdlog::debug("dropping {}: {} character(s) after cleaning", path, cleaned.size());
        return false;
    }
    result.files[path] = std::move(cleaned);
    return true;
}

} // namespace salvage
