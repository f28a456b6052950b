/**
 * MatBridge - Property Mapper
 *
 * Rewrites a Unity MaterialRecord into the uniform set of the Godot
 * shader family it was classified into.
 */

#pragma once

#include "matbridge/types.hpp"
#include "matbridge/result.hpp"
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace matbridge {

/**
 * Texture GUID -> original filename, nullopt when the package lacks it.
 */
using TextureResolver = std::function<std::optional<std::string>(const std::string& texture_id)>;

/**
 * Map one record. The decision is computed with classify() unless one is
 * given (e.g. from the shader cache). Fails with Error::Code::Mapping only
 * when the record has no properties and no resolved shader.
 */
Result<MappedMaterial> map_material(const MaterialRecord& record,
                                    const TextureResolver& resolve_texture,
                                    const std::optional<ShaderDecision>& decision = std::nullopt);

Result<MappedMaterial> map_material(const MaterialRecord& record,
                                    const AssetIndex& index,
                                    const std::optional<ShaderDecision>& decision = std::nullopt);

Result<MappedMaterial> map_material(const MaterialRecord& record,
                                    const std::map<std::string, std::string>& texture_filenames,
                                    const std::optional<ShaderDecision>& decision = std::nullopt);

/**
 * Stand-in for a material the manifest references but the package does
 * not contain: family defaults plus placeholder colors, no textures.
 */
MappedMaterial make_placeholder(const std::string& name, const ShaderDecision& decision);

/**
 * Every bound texture slot, missing ones included.
 */
std::vector<RequiredTexture> required_textures(const MappedMaterial& mapped);

} // namespace matbridge
