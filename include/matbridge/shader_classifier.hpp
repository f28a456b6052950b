/**
 * MatBridge - Shader Classifier
 *
 * Picks a target shader family per material. classify() is pure;
 * build_cache() applies LOD inheritance across the meshes of a prefab.
 */

#pragma once

#include "matbridge/types.hpp"
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace matbridge {

/**
 * Classify one record: known shader, then property signatures, then
 * name heuristics, then the generic default.
 */
ShaderDecision classify(const MaterialRecord& record);

/**
 * Signature step alone. Default basis when no family signature matches.
 */
ShaderDecision classify_by_signature(const MaterialRecord& record);

/**
 * Name heuristic alone. Default basis below NAME_SCORE_THRESHOLD.
 */
ShaderDecision classify_by_name(std::string_view material_name);

/**
 * Decision for a manifest slot without a source record: standard slots
 * use the generic shader, custom shader slots go through the name heuristic.
 */
ShaderDecision determine_shader(std::string_view material_name, bool uses_custom_shader);

struct CacheBuildResult {
    ShaderCache cache;
    std::vector<std::string> unmatched;   // Classified outside any LOD0 slot, sorted
};

/**
 * Build the per-run cache. Prefabs are grouped by LOD-stripped name; the
 * lowest LOD mesh of each group decides per slot index and every other
 * LOD inherits that decision. The first decision for a name wins.
 */
CacheBuildResult build_cache(const std::vector<PrefabMaterials>& prefabs,
                             const std::map<std::string, MaterialRecord>& records);

} // namespace matbridge
