/**
 * MatBridge - File Utilities Implementation
 */

#include "matbridge/files.hpp"
#include <fstream>
#include <algorithm>
#include <cctype>
#include <iterator>

namespace matbridge {

Result<std::vector<uint8_t>> read_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error::file_not_found(path.string());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io_error("Cannot open file", path.string());
    }

    file.seekg(0, std::ios::end);
    auto size = static_cast<size_t>(file.tellg());
    file.seekg(0, std::ios::beg);

    std::vector<uint8_t> data(size);
    if (size > 0 && !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(size))) {
        return Error::io_error("Short read", path.string());
    }
    return data;
}

Result<std::string> read_text_file(const fs::path& path) {
    TRY_ASSIGN(bytes, read_file(path));
    return std::string(bytes.begin(), bytes.end());
}

Result<void> write_file(const fs::path& path, const uint8_t* data, size_t size) {
    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error::io_error("Cannot create directory: " + ec.message(), path.parent_path().string());
        }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        return Error::io_error("Cannot open file for writing", path.string());
    }
    file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file) {
        return Error::io_error("Write failed", path.string());
    }
    return Result<void>::success();
}

Result<void> write_file(const fs::path& path, std::string_view text) {
    return write_file(path, reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

std::string get_extension(const fs::path& path) {
    auto ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace matbridge
