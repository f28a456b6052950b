/**
 * MatBridge - Scoped temporary directory implementation
 */

#include "matbridge/temp_directory.hpp"
#include "matbridge/logging.hpp"
#include <random>
#include <sstream>
#include <iomanip>

namespace matbridge {

namespace fs = std::filesystem;

Result<TempDirectory> TempDirectory::create(const std::string& prefix, const fs::path& root) {
    std::error_code ec;
    fs::path base = root.empty() ? fs::temp_directory_path(ec) : root;
    if (ec) {
        return Error::io_error("No temporary directory available: " + ec.message());
    }

    fs::create_directories(base, ec);
    if (ec) {
        return Error::io_error("Cannot create temporary root: " + ec.message(), base.string());
    }

    std::random_device rd;
    std::mt19937_64 rng(rd());

    constexpr int MAX_ATTEMPTS = 100;
    for (int attempt = 0; attempt < MAX_ATTEMPTS; ++attempt) {
        std::ostringstream name;
        name << prefix << std::hex << std::setw(12) << std::setfill('0')
             << (rng() & 0xFFFFFFFFFFFFull);

        fs::path candidate = base / name.str();
        if (fs::create_directory(candidate, ec)) {
            LOG_DEBUG("TempDirectory", "Created " << candidate.string());
            return TempDirectory(candidate);
        }
        if (ec) {
            return Error::io_error("Cannot create temporary directory: " + ec.message(), candidate.string());
        }
    }

    return Error::io_error("Could not find a free temporary directory name", base.string());
}

TempDirectory::~TempDirectory() {
    remove();
}

TempDirectory::TempDirectory(TempDirectory&& other) noexcept
    : path_(std::move(other.path_)) {
    other.path_.clear();
}

TempDirectory& TempDirectory::operator=(TempDirectory&& other) noexcept {
    if (this != &other) {
        remove();
        path_ = std::move(other.path_);
        other.path_.clear();
    }
    return *this;
}

void TempDirectory::remove() {
    if (path_.empty()) return;

    std::error_code ec;
    fs::remove_all(path_, ec);
    if (ec) {
        LOG_WARNING("TempDirectory", "Failed to remove " << path_.string() << ": " << ec.message());
    } else {
        LOG_DEBUG("TempDirectory", "Removed " << path_.string());
    }
    path_.clear();
}

} // namespace matbridge
