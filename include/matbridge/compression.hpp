/**
 * MatBridge - Compression utilities
 */

#pragma once

#include <vector>
#include <cstdint>
#include <cstddef>

namespace matbridge {

/**
 * Compression type enum.
 */
enum class CompressionType {
    None,
    Zlib,
    Gzip
};

/**
 * Detect compression type from data.
 */
CompressionType detect_compression(const uint8_t* data, size_t size);

/**
 * Decompress a gzip stream of unknown output size.
 * Throws std::runtime_error on corrupt or truncated input.
 */
std::vector<uint8_t> decompress_gzip(const uint8_t* data, size_t size);
std::vector<uint8_t> decompress_gzip(const std::vector<uint8_t>& data);

/**
 * Compress data into a gzip stream.
 */
std::vector<uint8_t> compress_gzip(const uint8_t* data, size_t size, int level = 6);
std::vector<uint8_t> compress_gzip(const std::vector<uint8_t>& data, int level = 6);

} // namespace matbridge
