/**
 * MatBridge - Shader Classifier Implementation
 */

#include "matbridge/shader_classifier.hpp"
#include "matbridge/shader_tables.hpp"
#include "matbridge/material_list.hpp"
#include "matbridge/path_utils.hpp"
#include "matbridge/logging.hpp"
#include <algorithm>
#include <array>
#include <set>

namespace matbridge {

namespace {

struct PropertyKeys {
    std::set<std::string> textures;
    std::set<std::string> floats;
    std::set<std::string> colors;

    const std::set<std::string>& of(PropertyKind kind) const {
        switch (kind) {
            case PropertyKind::Texture: return textures;
            case PropertyKind::Float:   return floats;
            default:                    return colors;
        }
    }
};

PropertyKeys collect_keys(const MaterialRecord& record) {
    PropertyKeys keys;
    for (const auto& [name, slot] : record.textures) keys.textures.insert(property_key(name));
    for (const auto& [name, value] : record.floats) keys.floats.insert(property_key(name));
    for (const auto& [name, value] : record.colors) keys.colors.insert(property_key(name));
    return keys;
}

// Highest score wins; families are visited in priority order so the
// earlier family keeps a tie
ShaderDecision pick_best(const std::array<int, 7>& scores, int minimum, DecisionBasis basis) {
    ShaderDecision best;
    for (ShaderFamily family : kAllFamilies) {
        int score = scores[static_cast<size_t>(family)];
        if (score >= minimum && score > best.score) {
            best.family = family;
            best.basis = basis;
            best.score = score;
        }
    }
    return best;
}

} // namespace

ShaderDecision classify_by_signature(const MaterialRecord& record) {
    PropertyKeys keys = collect_keys(record);

    std::array<int, 7> scores{};
    for (const auto& signature : family_signatures()) {
        int present = 0;
        for (const auto& key : signature.keys) {
            if (keys.of(key.kind).count(property_key(key.name))) present++;
        }
        scores[static_cast<size_t>(signature.family)] = present;
    }
    return pick_best(scores, 1, DecisionBasis::SignatureMatch);
}

ShaderDecision classify_by_name(std::string_view material_name) {
    std::string lower = to_lower(material_name);

    std::array<int, 7> scores{};
    for (const auto& pattern : name_patterns()) {
        for (auto needle : pattern.needles) {
            if (lower.find(needle) != std::string::npos) {
                scores[static_cast<size_t>(pattern.family)] += pattern.score;
                break;
            }
        }
    }
    return pick_best(scores, NAME_SCORE_THRESHOLD, DecisionBasis::NameHeuristic);
}

ShaderDecision classify(const MaterialRecord& record) {
    if (record.shader.shader_name) {
        if (auto family = family_for_shader_name(*record.shader.shader_name)) {
            ShaderDecision decision;
            decision.family = *family;
            decision.basis = DecisionBasis::ExplicitReference;
            return decision;
        }
    }

    ShaderDecision decision = classify_by_signature(record);
    if (decision.basis == DecisionBasis::SignatureMatch) {
        LOG_DEBUG("Classifier", record.name << " -> " << family_name(decision.family)
                  << " (signature, " << decision.score << " keys)");
        return decision;
    }

    decision = classify_by_name(record.name);
    if (decision.basis == DecisionBasis::NameHeuristic) {
        LOG_DEBUG("Classifier", record.name << " -> " << family_name(decision.family)
                  << " (name score " << decision.score << ")");
    }
    return decision;
}

ShaderDecision determine_shader(std::string_view material_name, bool uses_custom_shader) {
    if (!uses_custom_shader) {
        return ShaderDecision{};
    }
    return classify_by_name(material_name);
}

CacheBuildResult build_cache(const std::vector<PrefabMaterials>& prefabs,
                             const std::map<std::string, MaterialRecord>& records) {
    CacheBuildResult result;
    ShaderCache& cache = result.cache;

    for (const auto& group : group_lod_variants(prefabs)) {
        if (group.meshes.empty()) continue;

        // Meshes are sorted by LOD, the first one decides
        const MeshMaterials& lod0 = group.meshes.front();
        std::map<int, ShaderDecision> slot_decisions;

        for (const auto& slot : lod0.slots) {
            if (!slot.material) continue;
            auto record = records.find(*slot.material);
            if (record == records.end()) continue;

            auto existing = cache.find(*slot.material);
            ShaderDecision decision = existing != cache.end() ? existing->second : classify(record->second);
            cache.emplace(*slot.material, decision);

            decision.inherited_from = *slot.material;
            slot_decisions.emplace(slot.index, decision);
        }

        if (slot_decisions.empty()) continue;

        for (size_t m = 1; m < group.meshes.size(); m++) {
            const MeshMaterials& mesh = group.meshes[m];
            if (mesh.lod == lod0.lod) continue;

            for (const auto& slot : mesh.slots) {
                if (!slot.material || cache.count(*slot.material)) continue;

                auto decided = slot_decisions.find(slot.index);
                if (decided == slot_decisions.end()) {
                    bool extra_slot = slot.index >= static_cast<int>(lod0.slots.size());
                    if (!extra_slot || slot_decisions.size() != 1) continue;
                    decided = slot_decisions.begin();
                }

                LOG_DEBUG("Classifier", *slot.material << " inherits " << family_name(decided->second.family)
                          << " from " << decided->second.inherited_from << " (" << group.name << ")");
                cache.emplace(*slot.material, decided->second);
            }
        }
    }

    std::set<std::string> unmatched;
    std::set<std::string> custom = custom_shader_materials(prefabs);

    for (const auto& name : all_material_names(prefabs)) {
        if (cache.count(name)) continue;
        auto record = records.find(name);
        ShaderDecision decision = record != records.end() ? classify(record->second)
                                                          : determine_shader(name, custom.count(name) > 0);
        cache.emplace(name, decision);
        unmatched.insert(name);
    }

    for (const auto& [name, record] : records) {
        if (cache.count(name)) continue;
        cache.emplace(name, classify(record));
        unmatched.insert(name);
    }

    result.unmatched.assign(unmatched.begin(), unmatched.end());

    LOG_INFO("Classifier", "Shader cache: " << cache.size() << " materials, "
             << result.unmatched.size() << " classified outside a prefab LOD0");
    return result;
}

} // namespace matbridge
