#pragma once

#include "salvage/types.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace salvage {

// ============================================================================
// Streaming helpers
// ============================================================================

// Progress view over an already computed result.
//   complete   extracted files
//   streaming  incomplete files, then rendered paths that are not complete
//   pending    planned or manifest-included paths not yet started
StreamingStatus streaming_status(const ParseResult& result,
                                 const std::set<std::string>& rendered = {});

// Prompt asking the model for the rest of a multi-batch generation.
// Empty when there is no batch, the batch is complete, or nothing remains.
std::optional<std::string> batch_continuation_prompt(const ParseResult& result);

// Sorted, de-duplicated paths named by the PLAN block and FILE openings.
std::vector<std::string> extract_file_list(const std::string& text);

// Cheap check for file content: a FILE opening, or a JSON files object.
bool has_files(const std::string& text);

// Owns the growing buffer of one generation and re-parses it from scratch on
// every append. Not thread-safe; one session per generation.
class StreamSession {
public:
    explicit StreamSession(ParserOptions options = {}) : options_(options) {}

    // Append a chunk and re-parse the whole buffer. Throws InputTooLarge when
    // the buffer outgrows options.max_size.
    const ParseResult& append(const std::string& chunk);

    const ParseResult& result() const { return result_; }
    const std::string& buffer() const { return buffer_; }
    size_t chunks() const { return chunks_; }

    // Paths that became complete in the most recent append.
    const std::vector<std::string>& newly_completed() const { return newly_completed_; }

    StreamingStatus status() const;

    void reset();

private:
    ParserOptions options_;
    std::string buffer_;
    ParseResult result_;
    std::set<std::string> rendered_;
    std::vector<std::string> newly_completed_;
    size_t chunks_ = 0;
};

} // namespace salvage
