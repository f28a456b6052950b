/**
 * MatBridge - Material List Parser
 *
 * Reads the MaterialList.txt manifests shipped in Synty SourceFiles:
 *
 *   Prefab Name: SM_Prop_Crystal_01
 *       Mesh Name: SM_Prop_Crystal_01_LOD0
 *           Slot: Crystal_Mat_01 (Uses custom shader)
 *           Slot: PolygonNature_Mat_01 (PolygonNature_Texture_01)
 *       Mesh Name: SM_Prop_Crystal_01_LOD1
 *           Slot: Crystal_Mat_01 (Uses custom shader)
 */

#pragma once

#include "matbridge/types.hpp"
#include "matbridge/result.hpp"
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace matbridge {

struct MaterialList {
    std::vector<PrefabMaterials> prefabs;
    Diagnostics diagnostics;   // One ManifestParseError per skipped line
};

/**
 * Parse manifest text. Never fails: unusable lines are skipped and
 * reported. `source` names the manifest in diagnostics.
 */
MaterialList parse_material_list(std::string_view text, const std::string& source = "");

/**
 * Read and parse a manifest file. Only I/O errors fail.
 */
Result<MaterialList> load_material_list(const fs::path& path);

/**
 * LOD index from a "_LOD<n>" suffix (any case), 0 without one.
 */
int lod_index_from_name(std::string_view name);

/**
 * Name with a trailing "_LOD<n>" removed.
 */
std::string strip_lod_suffix(std::string_view name);

/**
 * Merge prefabs whose names match after strip_lod_suffix(). Groups keep
 * first-seen order and take the stripped name; meshes are stably sorted
 * by LOD index.
 */
std::vector<PrefabMaterials> group_lod_variants(const std::vector<PrefabMaterials>& prefabs);

/**
 * Every material name referenced by a slot.
 */
std::set<std::string> all_material_names(const std::vector<PrefabMaterials>& prefabs);

/**
 * Materials of slots marked "(Uses custom shader)".
 */
std::set<std::string> custom_shader_materials(const std::vector<PrefabMaterials>& prefabs);

/**
 * Material -> texture hint for standard (non custom shader) slots. The
 * first hint seen for a material wins.
 */
std::map<std::string, std::string> texture_hinted_materials(const std::vector<PrefabMaterials>& prefabs);

} // namespace matbridge
