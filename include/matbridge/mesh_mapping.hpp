/**
 * MatBridge - Mesh/Material Mapping
 *
 * JSON handed to the scene converter so it can reattach the generated
 * materials to mesh surfaces:
 *
 *   {
 *     "prefabs": [
 *       {"name": "SM_Env_Tree_01", "meshes": [
 *         {"name": "SM_Env_Tree_01_LOD0", "lod": 0,
 *          "slots": [{"index": 0, "material": "Foliage_Mat"}, ...]}]}
 *     ],
 *     "meshes": {"SM_Env_Tree_01_LOD0": ["Foliage_Mat", "Trunk_Mat"]}
 *   }
 */

#pragma once

#include "matbridge/types.hpp"
#include "matbridge/result.hpp"
#include <string>
#include <vector>

namespace matbridge {

/**
 * Serialize prefabs (already LOD grouped). Slot order is kept; empty slots
 * are null. A mesh listed twice keeps its last slot list in "meshes".
 */
std::string mesh_material_mapping_json(const std::vector<PrefabMaterials>& prefabs, int indent = 2);

/**
 * Read a mapping written by mesh_material_mapping_json().
 */
Result<std::vector<PrefabMaterials>> parse_mesh_material_mapping(std::string_view json_text);

} // namespace matbridge
