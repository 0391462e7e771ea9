#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace salvage {

// Thrown before any scanning when an input exceeds its configured ceiling.
// This is the only exception the parsing core raises; content problems are
// reported through ParseResult::warnings / ParseResult::errors.
class InputTooLarge : public std::runtime_error {
public:
    InputTooLarge(size_t size, size_t limit, const std::string& subject = "Input too large")
        : std::runtime_error(subject + " (" + std::to_string((size + 500) / 1000) + "KB exceeds " +
                             std::to_string((limit + 500) / 1000) + "KB limit)"),
          size_(size), limit_(limit) {}

    size_t size() const { return size_; }
    size_t limit() const { return limit_; }

private:
    size_t size_;
    size_t limit_;
};

} // namespace salvage
