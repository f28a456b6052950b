/**
 * MatBridge - Tar Archive Reader
 *
 * Reads ustar/GNU/pax tar streams held in memory. Entry data is exposed
 * as spans into the caller's buffer, which must outlive the reader.
 */

#pragma once

#include "matbridge/result.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace matbridge {

struct TarEntry {
    std::string name;                 // Full member name ("guid/asset")
    char type = '0';                  // Tar typeflag
    std::span<const uint8_t> data;

    bool is_file() const { return type == '0' || type == '\0' || type == '7'; }
    bool is_directory() const { return type == '5'; }
};

class TarReader {
public:
    static constexpr size_t BLOCK_SIZE = 512;

    explicit TarReader(std::span<const uint8_t> data) : data_(data) {}

    /**
     * Walk all headers. Fails on a bad checksum or a truncated member.
     */
    Result<void> parse();

    const std::vector<TarEntry>& entries() const { return entries_; }

private:
    std::span<const uint8_t> data_;
    std::vector<TarEntry> entries_;
};

/**
 * Checks whether a block looks like a tar header (valid checksum).
 */
bool looks_like_tar(std::span<const uint8_t> data);

} // namespace matbridge
