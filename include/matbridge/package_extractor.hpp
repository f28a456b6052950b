/**
 * MatBridge - Unity Package Extractor
 *
 * Decodes a .unitypackage (gzip-compressed tar whose members are grouped
 * under per-asset GUID directories) into an AssetIndex.
 *
 * Each GUID directory may hold:
 *   <guid>/pathname    first line is the asset's original project path
 *   <guid>/asset       raw asset bytes
 *   <guid>/asset.meta  Unity import settings (not needed)
 */

#pragma once

#include "matbridge/types.hpp"
#include "matbridge/result.hpp"
#include "matbridge/temp_directory.hpp"
#include <cstdint>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

namespace matbridge {

/**
 * Texture asset written to temporary storage.
 */
struct ExtractedTexture {
    fs::path path;          // <temp>/<guid><ext>
    std::string filename;   // Basename of the declared pathname
};

/**
 * Extraction tuning.
 */
struct ExtractOptions {
    size_t content_size_limit = 16 * 1024 * 1024;  // Larger non-texture assets are skipped
    std::string temp_prefix = "matbridge_textures_";
    fs::path temp_root;                            // Empty = system temp directory
};

/**
 * Extract a package held in memory (gzip-compressed or bare tar).
 * Only an unreadable or corrupt archive is an error.
 */
Result<AssetIndex> extract_package(std::span<const uint8_t> data, const ExtractOptions& options = {});

/**
 * GUID-indexed view of one package. Immutable once built; owns the
 * temporary directory holding extracted textures.
 */
class AssetIndex {
public:
    AssetIndex() = default;
    AssetIndex(AssetIndex&&) noexcept = default;
    AssetIndex& operator=(AssetIndex&&) noexcept = default;
    AssetIndex(const AssetIndex&) = delete;
    AssetIndex& operator=(const AssetIndex&) = delete;

    const std::string* pathname(const std::string& guid) const;
    const std::vector<uint8_t>* content(const std::string& guid) const;
    const ExtractedTexture* texture(const std::string& guid) const;

    /**
     * Original filename of a texture asset, or nullptr when the GUID is
     * not a texture in this package.
     */
    const std::string* texture_filename(const std::string& guid) const;

    const std::map<std::string, std::string>& pathnames() const { return pathnames_; }
    const std::map<std::string, std::vector<uint8_t>>& contents() const { return contents_; }
    const std::map<std::string, ExtractedTexture>& textures() const { return textures_; }

    /**
     * GUIDs whose pathname ends in ".mat" and whose content was retained.
     */
    std::vector<std::string> material_guids() const;

    /**
     * Material name for a GUID (pathname stem), empty when unknown.
     */
    std::string material_name(const std::string& guid) const;

    /**
     * Number of pathnames per lowercase extension ("" for none).
     */
    std::map<std::string, size_t> extension_summary() const;

    const Diagnostics& diagnostics() const { return diagnostics_; }

    /**
     * Directory holding extracted textures (empty if none were written).
     */
    fs::path texture_directory() const;

private:
    friend Result<AssetIndex> extract_package(std::span<const uint8_t> data, const ExtractOptions& options);

    std::map<std::string, std::string> pathnames_;
    std::map<std::string, std::vector<uint8_t>> contents_;
    std::map<std::string, ExtractedTexture> textures_;
    Diagnostics diagnostics_;
    std::unique_ptr<TempDirectory> temp_dir_;
};

/**
 * Extract a package from disk.
 */
Result<AssetIndex> extract_package(const fs::path& path, const ExtractOptions& options = {});

/**
 * True for .png/.tga/.jpg/.jpeg in any letter case.
 */
bool is_texture_path(const std::string& pathname);

} // namespace matbridge
