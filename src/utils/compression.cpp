/**
 * MatBridge - Compression Implementation
 */

#include "matbridge/compression.hpp"
#include <zlib.h>
#include <stdexcept>
#include <string>

namespace matbridge {

// gzip wrapper selection for inflateInit2/deflateInit2
constexpr int kGzipWindowBits = 16 + MAX_WBITS;
constexpr size_t kInflateChunk = 256 * 1024;

// Helper to convert zlib error code to string
static const char* zlib_error_string(int err) {
    switch (err) {
        case Z_OK:            return "Z_OK";
        case Z_STREAM_END:    return "Z_STREAM_END";
        case Z_NEED_DICT:     return "Z_NEED_DICT";
        case Z_ERRNO:         return "Z_ERRNO";
        case Z_STREAM_ERROR:  return "Z_STREAM_ERROR";
        case Z_DATA_ERROR:    return "Z_DATA_ERROR";
        case Z_MEM_ERROR:     return "Z_MEM_ERROR";
        case Z_BUF_ERROR:     return "Z_BUF_ERROR";
        case Z_VERSION_ERROR: return "Z_VERSION_ERROR";
        default:              return "UNKNOWN_ERROR";
    }
}

std::vector<uint8_t> decompress_gzip(const uint8_t* data, size_t size) {
    z_stream strm = {};
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);

    int ret = inflateInit2(&strm, kGzipWindowBits);
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Failed to initialize gzip decompression: ") + zlib_error_string(ret));
    }

    std::vector<uint8_t> result;
    do {
        size_t offset = result.size();
        result.resize(offset + kInflateChunk);
        strm.next_out = result.data() + offset;
        strm.avail_out = static_cast<uInt>(kInflateChunk);

        ret = inflate(&strm, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) {
            inflateEnd(&strm);
            throw std::runtime_error(std::string("Gzip decompression failed: ") + zlib_error_string(ret) +
                                     " (input=" + std::to_string(size) + ", produced=" + std::to_string(strm.total_out) + ")");
        }
        result.resize(offset + (kInflateChunk - strm.avail_out));

        // Input exhausted before the end marker
        if (ret == Z_OK && strm.avail_in == 0 && strm.avail_out != 0) {
            inflateEnd(&strm);
            throw std::runtime_error("Gzip stream truncated (input=" + std::to_string(size) + ")");
        }
    } while (ret != Z_STREAM_END);

    inflateEnd(&strm);
    return result;
}

std::vector<uint8_t> decompress_gzip(const std::vector<uint8_t>& data) {
    return decompress_gzip(data.data(), data.size());
}

CompressionType detect_compression(const uint8_t* data, size_t size) {
    if (size < 2) {
        return CompressionType::None;
    }

    // gzip member header
    if (data[0] == 0x1F && data[1] == 0x8B) {
        return CompressionType::Gzip;
    }

    // Check for zlib header
    // 78 01 - low compression
    // 78 9C - default compression
    // 78 DA - best compression
    if (data[0] == 0x78 && (data[1] == 0x01 || data[1] == 0x9C || data[1] == 0xDA)) {
        return CompressionType::Zlib;
    }

    return CompressionType::None;
}

std::vector<uint8_t> compress_gzip(const uint8_t* data, size_t size, int level) {
    z_stream strm = {};
    int ret = deflateInit2(&strm, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
    if (ret != Z_OK) {
        throw std::runtime_error(std::string("Failed to initialize gzip compression: ") + zlib_error_string(ret));
    }

    std::vector<uint8_t> result(deflateBound(&strm, static_cast<uLong>(size)));
    strm.next_in = const_cast<Bytef*>(data);
    strm.avail_in = static_cast<uInt>(size);
    strm.next_out = result.data();
    strm.avail_out = static_cast<uInt>(result.size());

    ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        throw std::runtime_error(std::string("Gzip compression failed: ") + zlib_error_string(ret));
    }

    result.resize(strm.total_out);
    return result;
}

std::vector<uint8_t> compress_gzip(const std::vector<uint8_t>& data, int level) {
    return compress_gzip(data.data(), data.size(), level);
}

} // namespace matbridge
