/**
 * MatBridge - Shader Lookup Tables
 *
 * Immutable data driving classification and property mapping:
 * known shader GUIDs, per-family signatures, material-name scores and
 * the per-family source-to-uniform rename tables.
 */

#pragma once

#include "matbridge/types.hpp"
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace matbridge {

// ============================================================================
// Known shaders
// ============================================================================

struct KnownShader {
    std::string_view guid;
    std::string_view name;
    ShaderFamily family;
};

/**
 * Look up a shader asset GUID (lowercase). nullptr when unknown.
 */
const KnownShader* find_known_shader(std::string_view guid);

/**
 * Family for a resolved shader name, if the name is a known shader. A
 * bare file stem ("Foliage") matches the table name after its last '/',
 * ignoring case.
 */
std::optional<ShaderFamily> family_for_shader_name(std::string_view name);

std::span<const KnownShader> known_shaders();

// ============================================================================
// Signatures and name heuristics
// ============================================================================

enum class PropertyKind {
    Texture,
    Float,
    Color
};

struct SignatureKey {
    PropertyKind kind;
    std::string_view name;
};

struct FamilySignature {
    ShaderFamily family;
    std::vector<SignatureKey> keys;
};

/**
 * Signatures in family priority order.
 */
const std::vector<FamilySignature>& family_signatures();

struct NamePattern {
    std::vector<std::string_view> needles;   // Any one matching adds the score
    ShaderFamily family;
    int score;
};

const std::vector<NamePattern>& name_patterns();

/**
 * Minimum accumulated name score for a heuristic decision.
 */
constexpr int NAME_SCORE_THRESHOLD = 20;

// ============================================================================
// Property mapping
// ============================================================================

enum class ColorTransform {
    None,
    OpaqueAlpha   // alpha 0 with visible RGB becomes 1 (opaque materials only)
};

struct PropertyMapping {
    std::string_view source;
    std::string_view target;
    float scale = 1.0f;                                // Floats only
    ColorTransform color = ColorTransform::None;       // Colors only
    bool carries_tiling = false;                       // Textures only
};

struct FamilyTable {
    std::vector<PropertyMapping> textures;
    std::vector<PropertyMapping> floats;
    std::vector<PropertyMapping> colors;
};

const FamilyTable& family_table(ShaderFamily family);

/**
 * Mapping entry for a source property. The family's own table is searched
 * first, then the generic table. Names compare with property_key().
 */
const PropertyMapping* find_mapping(ShaderFamily family, PropertyKind kind, std::string_view source);

/**
 * Unity toggles stored as 0/1 floats.
 */
bool is_boolean_toggle(std::string_view name);

/**
 * "_Enable_Breeze" -> "enable_breeze", "_BaseColor" -> "base_color".
 */
std::string to_uniform_name(std::string_view unity_name);

struct AutoEnableRule {
    std::string_view slot_prefix;    // Bound texture slot (prefix match)
    std::string_view toggle;         // Bool uniform switched on
};

std::span<const AutoEnableRule> auto_enable_rules();

struct DefaultUniform {
    std::string_view name;
    UniformValue value;
};

/**
 * Values added when the material does not set them.
 */
const std::vector<DefaultUniform>& family_defaults(ShaderFamily family);

/**
 * Extra values for placeholder materials (no source record).
 */
const std::vector<DefaultUniform>& placeholder_defaults(ShaderFamily family);

/**
 * Uniform names in the family's declared emission order.
 */
const std::vector<std::string>& uniform_order(ShaderFamily family);

/**
 * Position in uniform_order(), or SIZE_MAX for undeclared names.
 */
size_t uniform_rank(ShaderFamily family, std::string_view uniform);

/**
 * Colors whose RGB channels may exceed 1.
 */
bool is_hdr_color(std::string_view name);

constexpr std::string_view TILING_SCALE_UNIFORM = "uv_scale";
constexpr std::string_view TILING_OFFSET_UNIFORM = "uv_offset";

} // namespace matbridge
