/**
 * MatBridge - Common types and definitions
 */

#pragma once

#include <glm/glm.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include <map>
#include <optional>
#include <variant>
#include <filesystem>

namespace matbridge {

namespace fs = std::filesystem;

// Forward declarations
class AssetIndex;
class TempDirectory;

/**
 * Target shader families, in classification priority order
 * (earlier wins ties).
 */
enum class ShaderFamily {
    Vegetation,
    Water,
    Crystal,
    Clouds,
    Particles,
    SkyDome,
    Generic
};

constexpr ShaderFamily kAllFamilies[] = {
    ShaderFamily::Vegetation,
    ShaderFamily::Water,
    ShaderFamily::Crystal,
    ShaderFamily::Clouds,
    ShaderFamily::Particles,
    ShaderFamily::SkyDome,
    ShaderFamily::Generic,
};

/**
 * Why the classifier picked a family.
 */
enum class DecisionBasis {
    ExplicitReference,
    SignatureMatch,
    NameHeuristic,
    Default
};

/**
 * Reference to a material's shader asset.
 */
struct ShaderReference {
    std::string guid;                       // Lowercase, empty when absent
    int64_t file_id = 0;
    std::optional<std::string> shader_name; // Known name, nullopt when unresolved

    bool empty() const { return guid.empty(); }
    bool resolved() const { return shader_name.has_value(); }
};

/**
 * One texture slot of a source material.
 */
struct TextureSlot {
    std::string texture_id;       // Archive identifier of the texture asset
    glm::vec2 scale{1.0f, 1.0f};
    glm::vec2 offset{0.0f, 0.0f};
};

/**
 * One parsed source material.
 */
struct MaterialRecord {
    std::string name;
    std::string source_id;        // Archive identifier the record was read from
    ShaderReference shader;
    std::vector<std::pair<std::string, TextureSlot>> textures;  // Declaration order
    std::map<std::string, float> floats;
    std::map<std::string, glm::vec4> colors;

    bool has_properties() const {
        return !textures.empty() || !floats.empty() || !colors.empty();
    }

    const TextureSlot* find_texture(const std::string& slot) const {
        for (const auto& [name, tex] : textures) {
            if (name == slot) return &tex;
        }
        return nullptr;
    }

    std::optional<float> find_float(const std::string& key) const {
        auto it = floats.find(key);
        if (it == floats.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * Material slot of a mesh as listed in a material manifest.
 */
struct MaterialSlot {
    int index = 0;
    std::optional<std::string> material;  // Absent when the slot is empty
    std::string texture_hint;             // Text in parentheses, unless the custom shader marker
    bool uses_custom_shader = false;
};

struct MeshMaterials {
    std::string name;
    int lod = 0;                          // 0 = highest detail
    std::vector<MaterialSlot> slots;
};

/**
 * One prefab's mesh/material topology.
 */
struct PrefabMaterials {
    std::string name;
    std::vector<MeshMaterials> meshes;
};

/**
 * Classification result.
 */
struct ShaderDecision {
    ShaderFamily family = ShaderFamily::Generic;
    DecisionBasis basis = DecisionBasis::Default;
    int score = 0;                        // Signature key count or name score
    std::string inherited_from;           // LOD0 material when inherited

    bool operator==(const ShaderDecision& other) const {
        return family == other.family && basis == other.basis;
    }
};

using ShaderCache = std::map<std::string, ShaderDecision>;

/**
 * Target texture slot after mapping. A missing filename is the explicit
 * marker for an identifier the archive did not resolve.
 */
struct TextureBinding {
    std::string slot;                     // Target uniform name
    std::string source_property;
    std::string texture_id;
    std::optional<std::string> filename;

    bool missing() const { return !filename.has_value(); }
};

using UniformValue = std::variant<bool, float, glm::vec4, glm::vec2>;

struct Uniform {
    std::string name;
    UniformValue value;
};

/**
 * Target-ready material.
 */
struct MappedMaterial {
    std::string name;
    ShaderFamily family = ShaderFamily::Generic;
    ShaderDecision decision;
    std::vector<TextureBinding> textures;
    std::vector<Uniform> uniforms;

    const TextureBinding* find_texture(const std::string& slot) const {
        for (const auto& t : textures) {
            if (t.slot == slot) return &t;
        }
        return nullptr;
    }

    const Uniform* find_uniform(const std::string& uniform) const {
        for (const auto& u : uniforms) {
            if (u.name == uniform) return &u;
        }
        return nullptr;
    }
};

/**
 * Entry of the required-texture set handed to the texture-copy step.
 */
struct RequiredTexture {
    std::string material;
    std::string slot;
    std::string texture_id;
    std::optional<std::string> filename;

    bool missing() const { return !filename.has_value(); }
};

const char* family_name(ShaderFamily family);
const char* family_shader_file(ShaderFamily family);
const char* basis_name(DecisionBasis basis);
std::optional<ShaderFamily> parse_family(const std::string& name);

} // namespace matbridge
