/**
 * MatBridge - Unity Package Extractor Implementation
 */

#include "matbridge/package_extractor.hpp"
#include "matbridge/compression.hpp"
#include "matbridge/tar_reader.hpp"
#include "matbridge/files.hpp"
#include "matbridge/path_utils.hpp"
#include "matbridge/logging.hpp"
#include <array>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace matbridge {

namespace {

constexpr std::array<std::string_view, 4> TEXTURE_EXTENSIONS = {".png", ".tga", ".jpg", ".jpeg"};

/**
 * Members of one GUID directory, collected before resolution.
 */
struct AssetGroup {
    std::optional<std::string> pathname;
    std::optional<std::span<const uint8_t>> asset;
    bool has_meta = false;
};

// First line, NULs removed, trimmed
std::string decode_pathname(std::span<const uint8_t> data) {
    std::string text;
    text.reserve(data.size());
    for (uint8_t b : data) {
        if (b == '\n') break;
        if (b == '\0') continue;
        text.push_back(static_cast<char>(b));
    }
    return std::string(trim(text));
}

// Split "./guid/asset" into ("guid", "asset")
bool split_member_name(const std::string& name, std::string& guid, std::string& component) {
    std::string_view view(name);
    while (view.substr(0, 2) == "./") view.remove_prefix(2);

    size_t slash = view.find('/');
    if (slash == std::string_view::npos || slash == 0) return false;

    guid = std::string(view.substr(0, slash));
    component = std::string(view.substr(slash + 1));
    while (!component.empty() && component.back() == '/') component.pop_back();
    return !component.empty();
}

} // namespace

bool is_texture_path(const std::string& pathname) {
    std::string ext = extension_lower(pathname);
    for (auto known : TEXTURE_EXTENSIONS) {
        if (ext == known) return true;
    }
    return false;
}

const std::string* AssetIndex::pathname(const std::string& guid) const {
    auto it = pathnames_.find(guid);
    return it != pathnames_.end() ? &it->second : nullptr;
}

const std::vector<uint8_t>* AssetIndex::content(const std::string& guid) const {
    auto it = contents_.find(guid);
    return it != contents_.end() ? &it->second : nullptr;
}

const ExtractedTexture* AssetIndex::texture(const std::string& guid) const {
    auto it = textures_.find(guid);
    return it != textures_.end() ? &it->second : nullptr;
}

const std::string* AssetIndex::texture_filename(const std::string& guid) const {
    const auto* tex = texture(guid);
    return tex ? &tex->filename : nullptr;
}

std::vector<std::string> AssetIndex::material_guids() const {
    std::vector<std::string> guids;
    for (const auto& [guid, path] : pathnames_) {
        if (extension_lower(path) == ".mat" && contents_.count(guid)) {
            guids.push_back(guid);
        }
    }
    return guids;
}

std::string AssetIndex::material_name(const std::string& guid) const {
    const auto* path = pathname(guid);
    return path ? path_stem(*path) : std::string();
}

std::map<std::string, size_t> AssetIndex::extension_summary() const {
    std::map<std::string, size_t> summary;
    for (const auto& [guid, path] : pathnames_) {
        summary[extension_lower(path)]++;
    }
    return summary;
}

fs::path AssetIndex::texture_directory() const {
    return temp_dir_ ? temp_dir_->path() : fs::path();
}

Result<AssetIndex> extract_package(std::span<const uint8_t> data, const ExtractOptions& options) {
    // Decompressed tar stream must outlive the spans the reader hands out
    std::vector<uint8_t> tar_storage;
    std::span<const uint8_t> tar_data = data;

    switch (detect_compression(data.data(), data.size())) {
        case CompressionType::Gzip:
            try {
                tar_storage = decompress_gzip(data.data(), data.size());
            } catch (const std::runtime_error& e) {
                LOG_ERROR("Extractor", "Decompression failed: " << e.what());
                return Error::extraction(std::string("Package decompression failed: ") + e.what());
            }
            tar_data = tar_storage;
            LOG_DEBUG("Extractor", "Decompressed " << data.size() << " -> " << tar_storage.size() << " bytes");
            break;
        case CompressionType::None:
            break;
        case CompressionType::Zlib:
            return Error::extraction("Raw zlib streams are not a supported package encoding");
    }

    if (!looks_like_tar(tar_data)) {
        return Error::extraction("Package is not a tar archive");
    }

    TarReader reader(tar_data);
    TRY(reader.parse());

    // Phase 1: collect members by GUID, in any order
    std::map<std::string, AssetGroup> groups;
    for (const auto& entry : reader.entries()) {
        if (!entry.is_file()) continue;

        std::string guid, component;
        if (!split_member_name(entry.name, guid, component)) {
            LOG_DEBUG("Extractor", "Skipping member outside a GUID directory: " << entry.name);
            continue;
        }

        auto& group = groups[guid];
        if (component == "pathname") {
            group.pathname = decode_pathname(entry.data);
        } else if (component == "asset") {
            group.asset = entry.data;
        } else if (component == "asset.meta") {
            group.has_meta = true;
        } else {
            LOG_DEBUG("Extractor", "Ignoring unknown member: " << entry.name);
        }
    }

    // Phase 2: resolve each group
    AssetIndex index;

    for (const auto& [guid, group] : groups) {
        if (!group.pathname || group.pathname->empty()) {
            LOG_WARNING("Extractor", "Asset without pathname skipped: " << guid);
            index.diagnostics_.push_back({DiagnosticKind::Warning, "Asset group has no pathname", guid});
            continue;
        }

        const std::string& path = *group.pathname;

        if (!group.asset) {
            if (extension_lower(path) == ".mat") {
                LOG_WARNING("Extractor", "Material without asset data: " << path);
                index.diagnostics_.push_back({DiagnosticKind::Warning, "Material has no asset data", guid});
            } else {
                LOG_DEBUG("Extractor", "No asset for " << path << " (folder or meta-only)");
            }
            continue;
        }

        const auto& asset = *group.asset;

        if (is_texture_path(path)) {
            if (!index.temp_dir_) {
                auto temp = TempDirectory::create(options.temp_prefix, options.temp_root);
                if (!temp) {
                    return Error::extraction("Cannot create texture storage: " + temp.error().full_message());
                }
                index.temp_dir_ = std::make_unique<TempDirectory>(std::move(temp.value()));
            }

            ExtractedTexture texture;
            texture.filename = path_basename(path);
            texture.path = index.temp_dir_->path() / (guid + extension_lower(path));

            auto written = write_file(texture.path, asset.data(), asset.size());
            if (!written) {
                LOG_WARNING("Extractor", "Texture not extracted: " << written.error().full_message());
                index.diagnostics_.push_back({DiagnosticKind::Warning,
                                              "Cannot write extracted texture: " + written.error().message, guid});
                continue;
            }

            index.pathnames_[guid] = path;
            index.textures_[guid] = std::move(texture);
            continue;
        }

        index.pathnames_[guid] = path;

        if (asset.size() > options.content_size_limit) {
            LOG_DEBUG("Extractor", "Content of " << path << " exceeds " << options.content_size_limit
                      << " bytes, not retained");
            continue;
        }

        index.contents_[guid] = std::vector<uint8_t>(asset.begin(), asset.end());
    }

    LOG_INFO("Extractor", "Indexed " << index.pathnames_.size() << " assets ("
             << index.textures_.size() << " textures, " << index.contents_.size() << " retained)");

    return Result<AssetIndex>(std::move(index));
}

Result<AssetIndex> extract_package(const fs::path& path, const ExtractOptions& options) {
    auto data = read_file(path);
    if (!data) {
        return Error::extraction("Cannot read package: " + data.error().full_message(), path.string());
    }

    LOG_INFO("Extractor", "Reading package " << path.string() << " (" << data->size() << " bytes)");
    return extract_package(std::span<const uint8_t>(data->data(), data->size()), options);
}

} // namespace matbridge
