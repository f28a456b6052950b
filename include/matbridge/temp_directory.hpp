/**
 * MatBridge - Scoped temporary directory
 *
 * Owns a uniquely named directory and removes it, with its contents,
 * when destroyed.
 */

#pragma once

#include "matbridge/result.hpp"
#include <filesystem>
#include <string>

namespace matbridge {

class TempDirectory {
public:
    /**
     * Create "<root>/<prefix><random>". An empty root means the system
     * temporary directory.
     */
    static Result<TempDirectory> create(const std::string& prefix,
                                        const std::filesystem::path& root = {});

    TempDirectory() = default;
    ~TempDirectory();

    TempDirectory(TempDirectory&& other) noexcept;
    TempDirectory& operator=(TempDirectory&& other) noexcept;
    TempDirectory(const TempDirectory&) = delete;
    TempDirectory& operator=(const TempDirectory&) = delete;

    const std::filesystem::path& path() const { return path_; }
    bool valid() const { return !path_.empty(); }

    /**
     * Remove the directory now. Safe to call more than once.
     */
    void remove();

private:
    explicit TempDirectory(std::filesystem::path path) : path_(std::move(path)) {}

    std::filesystem::path path_;
};

} // namespace matbridge
