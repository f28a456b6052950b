/**
 * MatBridge - File utilities
 */

#pragma once

#include "matbridge/result.hpp"
#include <string>
#include <string_view>
#include <vector>
#include <filesystem>
#include <cstdint>

namespace matbridge {

namespace fs = std::filesystem;

/**
 * Read entire file into memory.
 */
Result<std::vector<uint8_t>> read_file(const fs::path& path);

/**
 * Read entire file as text (no newline translation).
 */
Result<std::string> read_text_file(const fs::path& path);

/**
 * Write data to file, creating parent directories.
 */
Result<void> write_file(const fs::path& path, const uint8_t* data, size_t size);
Result<void> write_file(const fs::path& path, std::string_view text);

/**
 * Get file extension (lowercase, including the dot).
 */
std::string get_extension(const fs::path& path);

} // namespace matbridge
