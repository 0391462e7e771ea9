#pragma once

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <sstream>
#include <string>

namespace salvage {
namespace fs {

namespace stdfs = std::filesystem;

// ============================================================================
// FILE OPERATIONS
// ============================================================================

/**
 * Read entire file contents as string.
 */
inline std::optional<std::string> read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }
    std::stringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

/**
 * Read a file, or all of stdin when path is "-".
 */
inline std::optional<std::string> read_input(const std::string& path) {
    if (path == "-") {
        return std::string(std::istreambuf_iterator<char>(std::cin),
                           std::istreambuf_iterator<char>());
    }
    return read_file(path);
}

/**
 * Write string to file, creating parent directories.
 */
inline bool write_file(const std::string& path, const std::string& content) {
    std::error_code ec;
    auto parent = stdfs::path(path).parent_path();
    if (!parent.empty()) {
        stdfs::create_directories(parent, ec);
        if (ec) {
            return false;
        }
    }
    std::ofstream file(path, std::ios::binary);
    if (!file) {
        return false;
    }
    file << content;
    return file.good();
}

inline bool exists(const std::string& path) {
    return stdfs::exists(path);
}

/**
 * Create directories recursively.
 */
inline bool create_directories(const std::string& path) {
    std::error_code ec;
    stdfs::create_directories(path, ec);
    return !ec;
}

} // namespace fs
} // namespace salvage
