/**
 * MatBridge - Tar Archive Reader Implementation
 */

#include "matbridge/tar_reader.hpp"
#include "matbridge/logging.hpp"
#include <algorithm>
#include <optional>
#include <string_view>

namespace matbridge {

namespace {

// ustar header field offsets
constexpr size_t NAME_OFFSET = 0;
constexpr size_t NAME_SIZE = 100;
constexpr size_t SIZE_OFFSET = 124;
constexpr size_t SIZE_SIZE = 12;
constexpr size_t CHKSUM_OFFSET = 148;
constexpr size_t CHKSUM_SIZE = 8;
constexpr size_t TYPE_OFFSET = 156;
constexpr size_t MAGIC_OFFSET = 257;
constexpr size_t PREFIX_OFFSET = 345;
constexpr size_t PREFIX_SIZE = 155;

std::string read_field(const uint8_t* header, size_t offset, size_t size) {
    const char* begin = reinterpret_cast<const char*>(header + offset);
    const char* end = std::find(begin, begin + size, '\0');
    return std::string(begin, end);
}

// Numeric fields are octal text, or big-endian base-256 when the high bit is set
std::optional<uint64_t> read_number(const uint8_t* header, size_t offset, size_t size) {
    const uint8_t* field = header + offset;

    if (field[0] & 0x80) {
        // Only the low eight bytes fit in the result
        size_t high = size > sizeof(uint64_t) ? size - sizeof(uint64_t) : 0;
        if (high > 0 && (field[0] & 0x7F)) return std::nullopt;
        for (size_t i = 1; i < high; i++) {
            if (field[i] != 0) return std::nullopt;
        }

        uint64_t value = high > 0 ? 0 : field[0] & 0x7F;
        for (size_t i = high > 0 ? high : 1; i < size; i++) {
            value = (value << 8) | field[i];
        }
        return value;
    }

    size_t i = 0;
    while (i < size && (field[i] == ' ' || field[i] == '\0')) i++;

    uint64_t value = 0;
    bool any = false;
    for (; i < size; i++) {
        uint8_t c = field[i];
        if (c == ' ' || c == '\0') break;
        if (c < '0' || c > '7') return std::nullopt;
        value = (value << 3) | static_cast<uint64_t>(c - '0');
        any = true;
    }
    if (!any) return 0;
    return value;
}

bool is_zero_block(const uint8_t* block) {
    return std::all_of(block, block + TarReader::BLOCK_SIZE, [](uint8_t b) { return b == 0; });
}

bool checksum_matches(const uint8_t* header) {
    auto stored = read_number(header, CHKSUM_OFFSET, CHKSUM_SIZE);
    if (!stored) return false;

    uint64_t unsigned_sum = 0;
    int64_t signed_sum = 0;
    for (size_t i = 0; i < TarReader::BLOCK_SIZE; i++) {
        bool in_chksum = i >= CHKSUM_OFFSET && i < CHKSUM_OFFSET + CHKSUM_SIZE;
        uint8_t b = in_chksum ? static_cast<uint8_t>(' ') : header[i];
        unsigned_sum += b;
        signed_sum += static_cast<int8_t>(b);
    }
    return *stored == unsigned_sum || static_cast<int64_t>(*stored) == signed_sum;
}

size_t padded_size(uint64_t size) {
    return static_cast<size_t>((size + TarReader::BLOCK_SIZE - 1) / TarReader::BLOCK_SIZE * TarReader::BLOCK_SIZE);
}

// Extract "path" from a pax extended header body ("<len> key=value\n" records)
std::optional<std::string> pax_path(std::span<const uint8_t> body) {
    std::string_view text(reinterpret_cast<const char*>(body.data()), body.size());
    std::optional<std::string> path;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t space = text.find(' ', pos);
        if (space == std::string_view::npos) break;

        size_t length = 0;
        for (size_t i = pos; i < space; i++) {
            if (text[i] < '0' || text[i] > '9') return path;
            length = length * 10 + static_cast<size_t>(text[i] - '0');
        }
        if (length == 0 || pos + length > text.size()) break;

        std::string_view record = text.substr(space + 1, pos + length - space - 1);
        if (!record.empty() && record.back() == '\n') record.remove_suffix(1);

        size_t eq = record.find('=');
        if (eq != std::string_view::npos && record.substr(0, eq) == "path") {
            path = std::string(record.substr(eq + 1));
        }
        pos += length;
    }
    return path;
}

} // namespace

Result<void> TarReader::parse() {
    entries_.clear();

    std::optional<std::string> pending_name;
    size_t pos = 0;

    while (pos + BLOCK_SIZE <= data_.size()) {
        const uint8_t* header = data_.data() + pos;

        if (is_zero_block(header)) {
            LOG_DEBUG("TarReader", "End-of-archive marker at offset " << pos);
            break;
        }

        if (!checksum_matches(header)) {
            return Error::extraction("Tar header checksum mismatch at offset " + std::to_string(pos));
        }

        auto size = read_number(header, SIZE_OFFSET, SIZE_SIZE);
        if (!size) {
            return Error::extraction("Invalid tar size field at offset " + std::to_string(pos));
        }

        size_t data_start = pos + BLOCK_SIZE;
        if (*size > data_.size() - data_start) {
            return Error::extraction("Truncated tar member at offset " + std::to_string(pos),
                                     read_field(header, NAME_OFFSET, NAME_SIZE));
        }

        auto body = data_.subspan(data_start, static_cast<size_t>(*size));
        char type = static_cast<char>(header[TYPE_OFFSET]);

        if (type == 'L') {
            // GNU long name applies to the next header
            std::string name(reinterpret_cast<const char*>(body.data()), body.size());
            name.erase(std::find(name.begin(), name.end(), '\0'), name.end());
            pending_name = std::move(name);
        } else if (type == 'x') {
            if (auto path = pax_path(body)) {
                pending_name = std::move(*path);
            }
        } else if (type == 'g') {
            // Global pax header: nothing we need
        } else {
            TarEntry entry;
            entry.type = type;
            entry.data = body;

            if (pending_name) {
                entry.name = std::move(*pending_name);
                pending_name.reset();
            } else {
                entry.name = read_field(header, NAME_OFFSET, NAME_SIZE);
                bool ustar = std::string_view(reinterpret_cast<const char*>(header + MAGIC_OFFSET), 5) == "ustar";
                if (ustar) {
                    std::string prefix = read_field(header, PREFIX_OFFSET, PREFIX_SIZE);
                    if (!prefix.empty()) {
                        entry.name = prefix + "/" + entry.name;
                    }
                }
            }

            entries_.push_back(std::move(entry));
        }

        pos = data_start + padded_size(*size);
    }

    if (pos < data_.size() && pos + BLOCK_SIZE > data_.size()) {
        LOG_DEBUG("TarReader", "Ignoring " << (data_.size() - pos) << " trailing bytes");
    }

    LOG_DEBUG("TarReader", "Parsed " << entries_.size() << " tar entries");
    return Result<void>::success();
}

bool looks_like_tar(std::span<const uint8_t> data) {
    if (data.size() < TarReader::BLOCK_SIZE) return false;
    if (is_zero_block(data.data())) return false;
    return checksum_matches(data.data());
}

} // namespace matbridge
