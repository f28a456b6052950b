/**
 * MatBridge - Shader Lookup Tables
 *
 * GUIDs and property names follow Synty's Unity shaders (PolygonLit,
 * Foliage, Water, Crystal, Particles, Skydome, Clouds and the pack
 * specific variants). Target names are the uniforms declared by the
 * matching Godot .gdshader files.
 */

#include "matbridge/shader_tables.hpp"
#include "matbridge/path_utils.hpp"
#include <array>
#include <climits>
#include <cstdint>
#include <map>
#include <set>
#include <unordered_map>

namespace matbridge {

// ============================================================================
// Family names
// ============================================================================

const char* family_name(ShaderFamily family) {
    switch (family) {
        case ShaderFamily::Vegetation: return "vegetation";
        case ShaderFamily::Water:      return "water";
        case ShaderFamily::Crystal:    return "crystal";
        case ShaderFamily::Clouds:     return "clouds";
        case ShaderFamily::Particles:  return "particles";
        case ShaderFamily::SkyDome:    return "skydome";
        case ShaderFamily::Generic:    return "generic";
        default:                       return "unknown";
    }
}

const char* family_shader_file(ShaderFamily family) {
    switch (family) {
        case ShaderFamily::Vegetation: return "foliage.gdshader";
        case ShaderFamily::Water:      return "water.gdshader";
        case ShaderFamily::Crystal:    return "crystal.gdshader";
        case ShaderFamily::Clouds:     return "clouds.gdshader";
        case ShaderFamily::Particles:  return "particles.gdshader";
        case ShaderFamily::SkyDome:    return "skydome.gdshader";
        case ShaderFamily::Generic:    return "polygon.gdshader";
        default:                       return "polygon.gdshader";
    }
}

const char* basis_name(DecisionBasis basis) {
    switch (basis) {
        case DecisionBasis::ExplicitReference: return "explicit-reference";
        case DecisionBasis::SignatureMatch:    return "signature-match";
        case DecisionBasis::NameHeuristic:     return "name-heuristic";
        case DecisionBasis::Default:           return "default";
        default:                               return "unknown";
    }
}

std::optional<ShaderFamily> parse_family(const std::string& name) {
    std::string lower = to_lower(name);
    for (ShaderFamily family : kAllFamilies) {
        if (lower == family_name(family) || lower == family_shader_file(family)) {
            return family;
        }
    }
    if (lower == "foliage") return ShaderFamily::Vegetation;
    if (lower == "polygon") return ShaderFamily::Generic;
    return std::nullopt;
}

// ============================================================================
// Known shaders
// ============================================================================

namespace {

using F = ShaderFamily;

constexpr std::array KNOWN_SHADERS = {
    // Core Synty shaders
    KnownShader{"0730dae39bc73f34796280af9875ce14", "Synty/PolygonLit", F::Generic},
    KnownShader{"9b98a126c8d4d7a4baeb81b16e4f7b97", "Synty/Foliage", F::Vegetation},
    KnownShader{"0736e099ec10c9e46b9551b2337d0cc7", "Synty/Particles", F::Particles},
    KnownShader{"19e269a311c45cd4482cf0ac0e694503", "Synty/Triplanar", F::Generic},
    KnownShader{"436db39b4e2ae5e46a17e21865226b19", "Synty/Water", F::Water},
    KnownShader{"5808064c5204e554c89f589a7059c558", "Synty/Crystal", F::Crystal},
    KnownShader{"de1d86872962c37429cb628a7de53613", "Synty/Skydome", F::SkyDome},
    KnownShader{"4a6c8c23090929241b2a55476a46a9b1", "Synty/Clouds", F::Clouds},
    KnownShader{"dfec08fb273e4674bb5398df25a5932c", "Synty/LeafCard", F::Vegetation},
    KnownShader{"fdea4239d29733541b44cd6960afefcd", "Synty/Glass", F::Crystal},
    KnownShader{"3b44a38ec6f81134ab0f820ac54d6a93", "Synty/Generic_Standard", F::Generic},
    KnownShader{"3d532bc2d70158948859b7839127e562", "Synty/Skybox_Generic", F::SkyDome},
    KnownShader{"74fa94d128fe4f348889c6f5f182e0e1", "Synty/Skydome_NatureBiomes", F::SkyDome},

    // Pack specific shaders
    KnownShader{"0835602ed30128f4a88a652bf920fcaa", "Synty/Polygon_UVScroll", F::Generic},
    KnownShader{"2b5804ffd3081d344bed894a653e3014", "Synty/Hologram", F::Generic},
    KnownShader{"5c2ccdfe181d55b42bd5313305f194e4", "Synty/SciFiHorror_Screens", F::Generic},
    KnownShader{"77e5bdd170fa4a4459dea431aba43e3c", "Synty/SciFiHorror_Decals", F::Generic},
    KnownShader{"972cd3fede1c33342b0f52ad57f47d90", "Synty/SciFiHorror_BlinkingLights", F::Generic},
    KnownShader{"c48a4461fec61fc45a01e7d6a50e520f", "Synty/SciFiPlant", F::Vegetation},
    KnownShader{"325b924500ba5804aa4b407d80084502", "Synty/Neon", F::Generic},
    KnownShader{"0ecc70cac2c8895439f5094ba6660db8", "Synty/GrungeTriplanar", F::Generic},
    KnownShader{"5d828b280155912429aa717d34cd8879", "Synty/Ghost", F::Generic},
    KnownShader{"62e87ad08a1afa642830420bf8e0dd4d", "Synty/CyberCity_Triplanar", F::Generic},
    KnownShader{"2a33a166317493947a7be330dcc78a05", "Synty/Parallax_Full", F::Generic},
    KnownShader{"e9556606a5f42464fa7dd78d624dc180", "Synty/Hologram_01", F::Generic},
    KnownShader{"a49be8e7504a48b4fba9b0c2a7fad57b", "Synty/EmissiveScroll", F::Generic},
    KnownShader{"1f67b66c29dfd4f45aa8cc07bf5e901a", "Synty/EmissiveColourChange", F::Generic},
    KnownShader{"a711ca3b984db6a4e81ec2d50ca4c0ca", "Synty/Building", F::Generic},
    KnownShader{"5d014726978e80a43b6178cba929343b", "Synty/FlipbookCutout", F::Generic},
    KnownShader{"a7331fc07349b124c8c15d545676f9ed", "Synty/Zombies", F::Generic},
    KnownShader{"d0be6b296f23e8d459e94b4007017ea0", "Synty/MagicGlow", F::Generic},
    KnownShader{"e8b857c3d7fea464e942e1c1f0940e96", "Synty/MagicalPortal", F::Generic},
    KnownShader{"e312e3877c798a44dba23093a3417a94", "Synty/Liquid", F::Generic},
    KnownShader{"a2cae5b0e99e16249b9a2163a7087bcb", "Synty/WindAnimation", F::Vegetation},
    KnownShader{"d2820334f2975bb47ab3f2fffa1b4cbe", "Synty/Aurora", F::SkyDome},
    KnownShader{"b83105300c9f7fb42a6e1b790fd2bd29", "Synty/ParticlesLit", F::Particles},
    KnownShader{"00eec7c5cd1f4c6429ffee9a690c3d16", "Synty/ParticlesUnlit", F::Particles},
    KnownShader{"f3534f26c7b573c45a1346e0634d57fc", "Synty/Generic_Basic_Bloody", F::Generic},
    KnownShader{"e17f8fe2503580447a3784d34b316d11", "Synty/Triplanar_Basic", F::Generic},
    KnownShader{"933532a4fcc9baf4fa0491de14d08ed7", "Universal Render Pipeline/Lit", F::Generic},
    KnownShader{"56ef766d507df464fb2a1726a99c925f", "Synty/HeatShimmer", F::Particles},
    KnownShader{"1ab581f9e0198304996581171522f458", "Synty/Water_Amplify", F::Water},
    KnownShader{"4b0390819f518774fa1a44198298459a", "Synty/Foliage_Amplify", F::Vegetation},
    KnownShader{"0000000000000000f000000000000000", "Unity/BuiltIn", F::Generic},
    KnownShader{"e854bc7dc0cde7044b9000faaf0c4e11", "Synty/RockTriplanar", F::Generic},
    KnownShader{"9b1e1d14d7778714391ae095571c3d4f", "Synty/WaterFall", F::Water},
    KnownShader{"df6b3a02955954d41bb15c534388ba14", "Synty/NoFog", F::Generic},
    KnownShader{"903fe97c2d85c8147a64932806c92eb1", "Synty/Waterfall_ElvenRealm", F::Water},
    KnownShader{"ca9b700964f37d84a90b00c70d981934", "Synty/Aurora_ElvenRealm", F::SkyDome},
    KnownShader{"ab6da834753539b4989259dbf4bcc39b", "Synty/ProRacer_Standard", F::Generic},
    KnownShader{"22e3738818284144eb7ada0a62acca66", "Synty/ProRacer_Decal", F::Generic},
    KnownShader{"402ae1c33e4c28c45876b1bc945b77e6", "Synty/ProRacer_ParticlesUnlit", F::Particles},
    KnownShader{"da24369d453e6a547aaa57ebee28fc81", "Synty/ProRacer_CutoutFlipbook", F::Generic},
    KnownShader{"8e5d248915e86014095ff0547bc0c755", "Synty/ProRacerAdvanced", F::Generic},
    KnownShader{"1bf4a2dc982313347912f313ba25f563", "Synty/RoadSHD", F::Generic},
    KnownShader{"e603b0446c7f2804db0c8dd0fb5c1af0", "Synty/POLYGON_CustomCharacters", F::Generic},
};

size_t family_index(ShaderFamily family) {
    return static_cast<size_t>(family);
}

} // namespace

const KnownShader* find_known_shader(std::string_view guid) {
    for (const auto& shader : KNOWN_SHADERS) {
        if (shader.guid == guid) return &shader;
    }
    return nullptr;
}

std::optional<ShaderFamily> family_for_shader_name(std::string_view name) {
    for (const auto& shader : KNOWN_SHADERS) {
        if (shader.name == name) return shader.family;
    }

    // Shaders resolved from the package are named by file stem ("Foliage")
    std::string lower = to_lower(name);
    for (const auto& shader : KNOWN_SHADERS) {
        std::string_view stem = shader.name.substr(shader.name.rfind('/') + 1);
        if (to_lower(stem) == lower) return shader.family;
    }
    return std::nullopt;
}

std::span<const KnownShader> known_shaders() {
    return KNOWN_SHADERS;
}

// ============================================================================
// Signatures
// ============================================================================

const std::vector<FamilySignature>& family_signatures() {
    using K = PropertyKind;
    static const std::vector<FamilySignature> signatures = {
        {F::Vegetation, {
            {K::Texture, "_Leaf_Texture"}, {K::Texture, "_Trunk_Texture"},
            {K::Texture, "_Leaf_Normal"}, {K::Texture, "_Trunk_Normal"},
            {K::Texture, "_Breeze_Noise_Map"},
            {K::Texture, "_Leaf_Ambient_Occlusion"}, {K::Texture, "_Trunk_Ambient_Occlusion"},
            {K::Float, "_Wind_Direction"}, {K::Float, "_WindDirection"},
            {K::Float, "_Breeze_Strength"}, {K::Float, "_Light_Wind_Strength"},
            {K::Float, "_Strong_Wind_Strength"}, {K::Float, "_Enable_Breeze"},
            {K::Float, "_Leaf_Smoothness"}, {K::Float, "_LeafSmoothness"},
            {K::Float, "_Trunk_Smoothness"}, {K::Float, "_TrunkSmoothness"},
            {K::Float, "_Leaf_Metallic"}, {K::Float, "_Trunk_Metallic"},
            {K::Color, "_Leaf_Base_Color"}, {K::Color, "_Trunk_Base_Color"},
        }},
        {F::Water, {
            {K::Texture, "_Wave_Gradient"}, {K::Texture, "_WaveGradient"},
            {K::Texture, "_Caustics_Flipbook"}, {K::Texture, "_Foam_Noise_Texture"},
            {K::Texture, "_Shore_Foam_Noise_Texture"}, {K::Texture, "_Scrolling_Texture"},
            {K::Texture, "_Water_Normal_Texture"}, {K::Texture, "_Foam_Texture"},
            {K::Float, "_Maximum_Depth"}, {K::Float, "_Shore_Wave_Speed"},
            {K::Float, "_Ocean_Wave_Height"}, {K::Float, "_Shore_Foam_Intensity"},
            {K::Float, "_Caustics_Intensity"}, {K::Float, "_Base_Opacity"},
            {K::Float, "_Shallows_Opacity"},
            {K::Color, "_Shallow_Color"}, {K::Color, "_Deep_Color"},
            {K::Color, "_Very_Deep_Color"}, {K::Color, "_Foam_Color"},
            {K::Color, "_Caustics_Color"},
        }},
        {F::Crystal, {
            {K::Texture, "_Refraction_Height"}, {K::Texture, "_Refraction_Texture"},
            {K::Texture, "_Top_Albedo"}, {K::Texture, "_Base_Albedo"},
            {K::Texture, "_Top_Normal"}, {K::Texture, "_Base_Normal"},
            {K::Float, "_Fresnel_Power"}, {K::Float, "_Refraction_Strength"},
            {K::Float, "_Deep_Depth"}, {K::Float, "_Shallow_Depth"},
            {K::Float, "_Enable_Fresnel"}, {K::Float, "_Enable_Refraction"},
            {K::Color, "_Deep_Color"}, {K::Color, "_Shallow_Color"},
            {K::Color, "_Fresnel_Color"}, {K::Color, "_Refraction_Color"},
        }},
        {F::Clouds, {
            {K::Float, "_Light_Intensity"}, {K::Float, "_Scattering_Multiplier"},
            {K::Float, "_Cloud_Speed"}, {K::Float, "_Cloud_Strength"},
            {K::Float, "_CloudCoverage"},
            {K::Color, "_Scattering_Color"}, {K::Color, "_Aurora_Color_01"},
            {K::Color, "_Aurora_Color_02"},
        }},
        {F::Particles, {
            {K::Float, "_Soft_Power"}, {K::Float, "_Soft_Distance"},
            {K::Float, "_Camera_Fade_Near"}, {K::Float, "_Camera_Fade_Far"},
            {K::Float, "_View_Edge_Power"}, {K::Float, "_Fog_Density"},
            {K::Color, "_Fog_Color"},
        }},
        {F::SkyDome, {
            {K::Float, "_Falloff"}, {K::Float, "_Offset"}, {K::Float, "_Distance"},
            {K::Color, "_Top_Color"}, {K::Color, "_Bottom_Color"},
        }},
        {F::Generic, {
            {K::Texture, "_Triplanar_Texture_Top"}, {K::Texture, "_Triplanar_Texture_Side"},
            {K::Texture, "_Triplanar_Texture_Bottom"},
            {K::Float, "_Enable_Triplanar_Texture"}, {K::Float, "_Triplanar_Fade"},
        }},
    };
    return signatures;
}

// Scores follow how specific a term is: rendering techniques score highest,
// generic vegetation words lowest
const std::vector<NamePattern>& name_patterns() {
    static const std::vector<NamePattern> patterns = {
        {{"triplanar"}, F::Generic, 60},
        {{"caustics"}, F::Water, 55},
        {{"fresnel", "refractive", "refraction"}, F::Crystal, 55},
        {{"softparticle", "soft_particle", "soft particle", "soft-particle"}, F::Particles, 55},
        {{"skydome", "sky_dome", "skybox", "sky_box"}, F::SkyDome, 55},

        {{"crystal", "gem", "jewel", "diamond", "ruby", "emerald", "sapphire", "amethyst", "quartz"}, F::Crystal, 45},
        {{"water", "ocean", "river", "lake", "waterfall"}, F::Water, 45},
        {{"particle", "fx_"}, F::Particles, 45},
        {{"cloud", "sky_cloud"}, F::Clouds, 45},

        {{"glass", "ice", "transparent", "translucent"}, F::Crystal, 35},
        {{"pond", "stream", "liquid", "aqua", "sea"}, F::Water, 35},
        {{"fog", "mist", "atmosphere"}, F::Clouds, 35},
        {{"spark", "dust", "debris", "smoke", "fire", "rain", "snow", "splash"}, F::Particles, 35},
        {{"aurora", "sky_gradient"}, F::SkyDome, 35},
        {{"foliage", "vegetation"}, F::Vegetation, 35},

        {{"tree", "fern", "grass", "vine", "branch", "willow", "bush", "shrub", "hedge", "bamboo", "koru"}, F::Vegetation, 25},
        {{"leaf", "leaves"}, F::Vegetation, 20},
        {{"bark", "trunk", "undergrowth", "plant"}, F::Vegetation, 20},

        {{"moss", "dirt"}, F::Generic, 15},
        {{"effect", "additive"}, F::Particles, 15},
    };
    return patterns;
}

// ============================================================================
// Property tables
// ============================================================================

namespace {

using CT = ColorTransform;

PropertyMapping tex(std::string_view source, std::string_view target, bool tiling = false) {
    PropertyMapping m{source, target};
    m.carries_tiling = tiling;
    return m;
}

PropertyMapping num(std::string_view source, std::string_view target, float scale = 1.0f) {
    PropertyMapping m{source, target};
    m.scale = scale;
    return m;
}

PropertyMapping col(std::string_view source, std::string_view target, CT transform = CT::OpaqueAlpha) {
    PropertyMapping m{source, target};
    m.color = transform;
    return m;
}

FamilyTable make_generic_table() {
    FamilyTable t;
    t.textures = {
        tex("_Base_Texture", "base_texture", true),
        tex("_Albedo_Map", "base_texture", true),
        tex("_Albedo", "base_texture", true),
        tex("_BaseMap", "base_texture", true),
        tex("_MainTex", "base_texture", true),
        tex("_MainTexture", "base_texture", true),
        tex("_Normal_Texture", "normal_texture"),
        tex("_Normal_Map", "normal_texture"),
        tex("_Normal", "normal_texture"),
        tex("_BumpMap", "normal_texture"),
        tex("_Emission_Texture", "emission_texture"),
        tex("_Emission_Map", "emission_texture"),
        tex("_EmissionMap", "emission_texture"),
        tex("_Emission", "emission_texture"),
        tex("_AO_Texture", "ao_texture"),
        tex("_OcclusionMap", "ao_texture"),
        tex("_Metallic_Smoothness_Texture", "metallic_texture"),
        tex("_MetallicGlossMap", "metallic_texture"),
        tex("_Metallic_Map", "metallic_texture"),
        tex("_Triplanar_Texture_Top", "triplanar_texture_top"),
        tex("_Triplanar_Texture_Side", "triplanar_texture_side"),
        tex("_Triplanar_Texture_Bottom", "triplanar_texture_bottom"),
        tex("_Triplanar_Normal_Texture_Top", "triplanar_normal_top"),
        tex("_Triplanar_Normal_Texture_Side", "triplanar_normal_side"),
        tex("_Triplanar_Normal_Texture_Bottom", "triplanar_normal_bottom"),
        tex("_Triplanar_Emission_Texture", "triplanar_emission_texture"),
        tex("_Hair_Mask", "hair_mask"),
        tex("_Skin_Mask", "skin_mask"),
        tex("_Mask_01", "mask_01"),
        tex("_Mask_02", "mask_02"),
        tex("_Mask_03", "mask_03"),
        tex("_Mask_04", "mask_04"),
        tex("_Mask_05", "mask_05"),
        tex("_Grunge_Map", "grunge_map"),
        tex("_Blood_Mask", "blood_mask"),
        tex("_Blood_Texture", "blood_texture"),
        tex("_Rune_Texture", "rune_texture"),
        tex("_Overlay_Texture", "overlay_texture"),
        tex("_Moss", "overlay_texture"),
        tex("_MossTexture", "overlay_texture"),
        tex("_ParallaxMap", "height_texture"),
        tex("_HeightMap", "height_texture"),
        tex("_Alpha_Texture", "alpha_texture"),
        tex("_Snow_Normal_Texture", "snow_normal_texture"),
        tex("_Snow_Metallic_Smoothness_Texture", "snow_metallic_smoothness"),
        tex("_Snow_Edge_Noise", "snow_edge_noise"),
        tex("_DetailAlbedoMap", "detail_albedo"),
        tex("_DetailNormalMap", "detail_normal"),
        tex("_DetailMask", "detail_mask"),
    };
    t.floats = {
        num("_Smoothness", "smoothness"),
        num("_Glossiness", "smoothness"),
        num("_Metallic", "metallic"),
        num("_Normal_Intensity", "normal_intensity"),
        num("_Normal_Amount", "normal_intensity"),
        num("_BumpScale", "normal_intensity"),
        num("_AO_Intensity", "ao_intensity"),
        num("_OcclusionStrength", "ao_intensity"),
        num("_Alpha_Clip_Threshold", "alpha_clip_threshold"),
        num("_Cutoff", "alpha_clip_threshold"),
        num("_AlphaCutoff", "alpha_clip_threshold"),
        num("_Emission_Intensity", "emission_intensity"),
        num("_Opacity", "opacity"),
        num("_Snow_Level", "snow_level"),
        num("_Snow_Transition", "snow_transition"),
        num("_Snow_Metallic", "snow_metallic"),
        num("_Snow_Smoothness", "snow_smoothness"),
        num("_Snow_Normal_Intensity", "snow_normal_intensity"),
        num("_Triplanar_Fade", "triplanar_fade"),
        num("_Triplanar_Intensity", "triplanar_intensity"),
        num("_Triplanar_Normal_Intensity_Top", "triplanar_normal_intensity_top"),
        num("_Triplanar_Normal_Intensity_Side", "triplanar_normal_intensity_side"),
        num("_Triplanar_Normal_Intensity_Bottom", "triplanar_normal_intensity_bottom"),
        num("_HoloLines", "holo_lines"),
        num("_Scroll_Speed", "scroll_speed"),
        num("_UVScrollSpeed", "uv_scroll_speed"),
        num("_Hologram_Intensity", "hologram_intensity"),
        num("_Transparency", "transparency"),
        num("_RimPower", "rim_power"),
        num("_Dirt_Amount", "dirt_amount"),
        num("_Dust_Amount", "dust_amount"),
        num("_Grunge_Intensity", "grunge_intensity"),
        num("_Glow_Amount", "glow_amount"),
        num("_Glow_Falloff", "glow_falloff"),
        num("_BloodAmount", "blood_amount"),
        num("_Blood_Intensity", "blood_intensity"),
        num("_Brightness", "brightness"),
        num("_Saturation", "saturation"),
        num("_Neon_Intensity", "neon_intensity"),
        num("_Pulse_Speed", "pulse_speed"),
        num("_Flipbook_Width", "flipbook_width"),
        num("_Flipbook_Height", "flipbook_height"),
        num("_Flipbook_Speed", "flipbook_speed"),
        num("_DetailNormalMapScale", "detail_normal_scale"),
    };
    t.colors = {
        col("_Color_Tint", "color_tint"),
        col("_Color", "color_tint"),
        col("_ColorTint", "color_tint"),
        col("_BaseColor", "color_tint"),
        col("_BaseColour", "color_tint"),
        col("_Emission_Color", "emission_color"),
        col("_EmissionColor", "emission_color"),
        col("_Snow_Color", "snow_color"),
        col("_Hair_Color", "hair_color"),
        col("_Skin_Color", "skin_color"),
        col("_Neon_Colour_01", "neon_color_01"),
        col("_Neon_Colour_02", "neon_color_02"),
        col("_Hologram_Color", "hologram_color"),
        col("_RimColor", "rim_color"),
        col("_Dust_Colour", "dust_color"),
        col("_Glow_Colour", "glow_color"),
        col("_Glow_Tint", "glow_tint"),
        col("_Liquid_Color", "liquid_color"),
        col("_BloodColor", "blood_color"),
        col("_Blood_Color", "blood_color"),
        col("_Color_Primary", "color_primary"),
        col("_Color_Secondary", "color_secondary"),
        col("_Color_Tertiary", "color_tertiary"),
        col("_Color_Metal_Primary", "color_metal_primary"),
        col("_Color_Metal_Secondary", "color_metal_secondary"),
        col("_Color_Metal_Dark", "color_metal_dark"),
        col("_Color_Leather_Primary", "color_leather_primary"),
        col("_Color_Leather_Secondary", "color_leather_secondary"),
        col("_Color_Skin", "color_skin"),
        col("_Color_Hair", "color_hair"),
        col("_Color_Eyes", "color_eyes"),
        col("_Color_Stubble", "color_stubble"),
        col("_Color_Scar", "color_scar"),
        col("_Color_BodyArt", "color_bodyart"),
    };
    return t;
}

FamilyTable make_vegetation_table() {
    FamilyTable t;
    t.textures = {
        tex("_Leaf_Texture", "leaf_color", true),
        tex("_Leaf_Normal", "leaf_normal"),
        tex("_Trunk_Texture", "trunk_color"),
        tex("_Trunk_Normal", "trunk_normal"),
        tex("_Leaf_Ambient_Occlusion", "leaf_ao"),
        tex("_Trunk_Ambient_Occlusion", "trunk_ao"),
        tex("_Emissive_Mask", "emissive_mask"),
        tex("_Emissive_2_Mask", "emissive_2_mask"),
        tex("_Emissive_Pulse_Map", "emissive_pulse_mask"),
        tex("_Trunk_Emissive_Mask", "trunk_emissive_mask"),
        tex("_Breeze_Noise_Map", "breeze_noise_map"),
    };
    t.floats = {
        num("_Leaf_Smoothness", "leaf_smoothness"),
        num("_LeafSmoothness", "leaf_smoothness"),
        num("_Leaf_Metallic", "leaf_metallic"),
        num("_Trunk_Smoothness", "trunk_smoothness"),
        num("_TrunkSmoothness", "trunk_smoothness"),
        num("_Trunk_Metallic", "trunk_metallic"),
        num("_Wind_Direction", "wind_direction"),
        num("_WindDirection", "wind_direction"),
        num("_Breeze_Strength", "breeze_strength"),
        num("_Leaves_WindAmount", "breeze_strength"),
        num("_Light_Wind_Strength", "light_wind_strength"),
        num("_Tree_WindAmount", "light_wind_strength"),
        num("_Strong_Wind_Strength", "strong_wind_strength"),
        num("_Wind_Twist_Strength", "wind_twist_strength"),
        num("_Gale_Blend", "gale_blend"),
        num("_Light_Wind_Y_Strength", "light_wind_y_strength"),
        num("_Light_Wind_Y_Offset", "light_wind_y_offset"),
        num("_Frosting_Falloff", "frosting_falloff"),
        num("_Frosting_Height", "frosting_height"),
    };
    t.colors = {
        col("_Leaf_Base_Color", "leaf_base_color"),
        col("_Trunk_Base_Color", "trunk_base_color"),
        col("_Leaf_Noise_Color", "leaf_noise_color"),
        col("_Trunk_Noise_Color", "trunk_noise_color"),
        col("_Emissive_Color", "emissive_color"),
        col("_Emissive_2_Color", "emissive_2_color"),
        col("_Trunk_Emissive_Color", "trunk_emissive_color"),
        col("_Frosting_Color", "frosting_color"),
    };
    return t;
}

FamilyTable make_water_table() {
    FamilyTable t;
    t.textures = {
        tex("_Water_Normal_Texture", "normal_texture"),
        tex("_WaterNormal", "normal_texture"),
        tex("_Normal_Texture", "normal_texture"),
        tex("_Normal_Map", "normal_texture"),
        tex("_RipplesNormal", "normal_texture"),
        tex("_MainTex", "normal_texture"),
        tex("_BumpMap", "normal_texture"),
        tex("_BaseMap", "normal_texture"),
        tex("_Wave_Gradient", "wave_gradient"),
        tex("_WaveGradient", "wave_gradient"),
        tex("_Caustics_Flipbook", "caustics_flipbook"),
        tex("_Foam_Noise_Texture", "noise_texture"),
        tex("_Foam_Texture", "noise_texture"),
        tex("_Noise_Texture", "noise_texture"),
        tex("_Water_Noise_Texture", "noise_texture"),
        tex("_WaveNoise", "noise_texture"),
        tex("_Scrolling_Texture", "scrolling_texture"),
        tex("_Shore_Foam_Noise_Texture", "shore_foam_noise_texture"),
        tex("_Shore_Wave_Foam_Noise_Texture", "shore_foam_noise_texture"),
    };
    t.floats = {
        num("_Smoothness", "smoothness"),
        num("_Glossiness", "smoothness"),
        num("_Metallic", "metallic"),
        num("_Base_Opacity", "base_opacity"),
        num("_OverallFalloff", "base_opacity"),
        num("_Shallows_Opacity", "shallows_opacity"),
        num("_OpacityFalloff", "shallows_opacity"),
        num("_Maximum_Depth", "maximum_depth"),
        num("_Normal_Intensity", "normal_intensity"),
        num("_BumpScale", "normal_intensity"),
        num("_Shore_Wave_Speed", "shore_wave_speed"),
        num("_Ocean_Wave_Height", "ocean_wave_height"),
        num("_Ocean_Wave_Speed", "ocean_wave_speed"),
        num("_Distortion_Strength", "distortion_strength"),
        num("_Deep_Height", "deep_height"),
        num("_Very_Deep_Height", "very_deep_height"),
        num("_Depth_Distance", "depth_distance"),
        num("_Water_Depth", "water_depth"),
        num("_Shallow_Intensity", "shallow_intensity"),
        num("_ShallowFalloff", "shallow_intensity"),
        num("_Shore_Foam_Intensity", "shore_foam_intensity"),
        num("_FoamShoreline", "shore_foam_intensity"),
        num("_FoamFalloff", "ocean_foam_opacity"),
        num("_Caustics_Intensity", "caustics_intensity"),
        num("_CausticDepthFade", "caustics_intensity"),
        num("_CausticScale", "caustics_scale"),
        num("_CausticSpeed", "caustics_speed"),
        num("_FresnelPower", "fresnel_power"),
        num("_UVScrollSpeed", "uv_scroll_speed"),
    };
    t.colors = {
        col("_Shallow_Color", "shallow_color"),
        col("_ShallowColour", "shallow_color"),
        col("_Water_Shallow_Color", "shallow_color"),
        col("_WaterShallowColor", "shallow_color"),
        col("_Water_Near_Color", "shallow_color"),
        col("_Deep_Color", "deep_color"),
        col("_DeepColour", "deep_color"),
        col("_Water_Deep_Color", "deep_color"),
        col("_WaterDeepColor", "deep_color"),
        col("_Water_Far_Color", "deep_color"),
        col("_Very_Deep_Color", "very_deep_color"),
        col("_VeryDeepColour", "very_deep_color"),
        col("_DepthGlowColour", "very_deep_color"),
        col("_Foam_Color", "foam_color"),
        col("_Caustics_Color", "caustics_color"),
        col("_CausticColour", "caustics_color"),
        col("_Shore_Foam_Color_Tint", "shore_foam_color_tint"),
        col("_FoamEmitColour", "shore_foam_color_tint"),
        col("_Shore_Wave_Color_Tint", "shore_wave_color_tint"),
        col("_WaterColour", "water_color"),
        col("_FresnelColour", "fresnel_color"),
    };
    return t;
}

FamilyTable make_crystal_table() {
    FamilyTable t;
    t.textures = {
        tex("_Base_Albedo", "base_albedo", true),
        tex("_MainTex", "base_albedo", true),
        tex("_BaseMap", "base_albedo", true),
        tex("_Base_Normal", "base_normal"),
        tex("_BumpMap", "base_normal"),
        tex("_Top_Albedo", "top_albedo"),
        tex("_Top_Normal", "top_normal"),
        tex("_Refraction_Height", "refraction_height"),
        tex("_Refraction_Texture", "refraction_texture"),
    };
    t.floats = {
        num("_Smoothness", "smoothness"),
        num("_Glossiness", "smoothness"),
        num("_Metallic", "metallic"),
        num("_Opacity", "opacity"),
        num("_Fresnel_Power", "fresnel_power"),
        num("_Refraction_Strength", "refraction_strength"),
        num("_Deep_Depth", "deep_depth"),
        num("_Shallow_Depth", "shallow_depth"),
        num("_Normal_Intensity", "normal_intensity"),
        num("_BumpScale", "normal_intensity"),
    };
    t.colors = {
        col("_Base_Color", "base_color"),
        col("_Base_Color_Multiplier", "base_color"),
        col("_Top_Color_Multiplier", "top_color"),
        col("_Deep_Color", "deep_color"),
        col("_Shallow_Color", "shallow_color"),
        col("_Fresnel_Color", "fresnel_color"),
        col("_Refraction_Color", "refraction_color"),
    };
    return t;
}

FamilyTable make_clouds_table() {
    FamilyTable t;
    t.floats = {
        num("_Light_Intensity", "light_intensity"),
        num("_Fresnel_Power", "fresnel_power"),
        num("_Fog_Density", "fog_density"),
        num("_Cloud_Falloff", "fog_density"),
        num("_Scattering_Multiplier", "scattering_multiplier"),
        num("_Cloud_Contrast", "scattering_multiplier"),
        num("_Cloud_Speed", "cloud_speed"),
        num("_CloudSpeed", "cloud_speed"),
        num("_Cloud_Strength", "cloud_strength"),
        num("_CloudCoverage", "cloud_strength"),
        num("_CloudPower", "cloud_strength"),
        num("_Aurora_Speed", "aurora_speed"),
        num("_Aurora_Intensity", "aurora_intensity"),
        num("_Aurora_Scale", "aurora_scale"),
    };
    t.colors = {
        col("_Top_Color", "top_color"),
        col("_CloudColor", "top_color", CT::None),
        col("_Base_Color", "base_color"),
        col("_Fresnel_Color", "fresnel_color"),
        col("_Scattering_Color", "scattering_color"),
        col("_Aurora_Color_01", "aurora_color_01"),
        col("_Aurora_Color_02", "aurora_color_02"),
    };
    return t;
}

FamilyTable make_particles_table() {
    FamilyTable t;
    t.textures = {
        tex("_Albedo_Map", "albedo_map", true),
        tex("_MainTex", "albedo_map", true),
        tex("_BaseMap", "albedo_map", true),
    };
    t.floats = {
        num("_Alpha_Clip_Threshold", "alpha_clip_threshold"),
        num("_Alpha_Clip_Treshold", "alpha_clip_threshold"),
        num("_Cutoff", "alpha_clip_threshold"),
        num("_AlphaCutoff", "alpha_clip_threshold"),
        num("_Soft_Power", "soft_power"),
        num("_Soft_Distance", "soft_distance"),
        num("_Camera_Fade_Near", "camera_fade_near"),
        num("_Camera_Fade_Far", "camera_fade_far"),
        num("_Camera_Fade_Smoothness", "camera_fade_smoothness"),
        num("_View_Edge_Power", "view_edge_power"),
        num("_Fog_Density", "fog_density"),
    };
    t.colors = {
        col("_Base_Color", "base_color"),
        col("_Color", "base_color"),
        col("_Color_Tint", "base_color"),
        col("_BaseColor", "base_color"),
        col("_Fog_Color", "fog_color", CT::None),
        col("_EmissionColor", "emission_color"),
    };
    return t;
}

FamilyTable make_skydome_table() {
    FamilyTable t;
    t.floats = {
        num("_Falloff", "falloff"),
        num("_Offset", "offset"),
        num("_Distance", "distance_"),
    };
    t.colors = {
        col("_Top_Color", "top_color"),
        col("_Bottom_Color", "bottom_color"),
    };
    return t;
}

const std::array<FamilyTable, 7>& all_tables() {
    static const std::array<FamilyTable, 7> tables = {
        make_vegetation_table(),
        make_water_table(),
        make_crystal_table(),
        make_clouds_table(),
        make_particles_table(),
        make_skydome_table(),
        make_generic_table(),
    };
    return tables;
}

const std::vector<PropertyMapping>& bucket(const FamilyTable& table, PropertyKind kind) {
    switch (kind) {
        case PropertyKind::Texture: return table.textures;
        case PropertyKind::Float:   return table.floats;
        default:                    return table.colors;
    }
}

// property_key -> entry, per family and kind
using MappingIndex = std::unordered_map<std::string, const PropertyMapping*>;

const std::array<std::array<MappingIndex, 3>, 7>& mapping_indices() {
    static const auto indices = [] {
        std::array<std::array<MappingIndex, 3>, 7> result;
        const auto& tables = all_tables();
        for (size_t f = 0; f < tables.size(); f++) {
            for (size_t k = 0; k < 3; k++) {
                for (const auto& entry : bucket(tables[f], static_cast<PropertyKind>(k))) {
                    // First declaration of a key wins
                    result[f][k].emplace(property_key(entry.source), &entry);
                }
            }
        }
        return result;
    }();
    return indices;
}

constexpr std::array<std::string_view, 49> BOOLEAN_TOGGLES = {
    // Foliage wind
    "_Enable_Breeze", "_Enable_Light_Wind", "_Enable_Strong_Wind", "_Enable_Wind_Twist",
    "_Enable_Frosting", "_Wind_Enabled", "_Leaves_Wave", "_Tree_Wave",
    // Crystal / glass
    "_Enable_Fresnel", "_Enable_Side_Fresnel", "_Enable_Depth", "_Enable_Refraction",
    "_Enable_Triplanar",
    // Polygon
    "_Enable_Triplanar_Texture", "_Enable_Snow", "_Enable_Emission", "_Enable_Normals",
    "_AlphaClip", "_Enable_Hologram", "_Enable_Ghost", "_Use_Metallic_Map",
    "_Use_Weather_Controller", "_Use_Vertex_Color_Wind", "_Randomize_Flipbook_From_Location",
    "_Enable_UV_Distortion", "_Enable_Brightness_Breakup", "_Enable_Wave", "_Enable_Detail_Map",
    "_Enable_Parallax", "_Enable_AO",
    // Water
    "_Enable_Shore_Wave_Foam", "_Enable_Shore_Foam", "_Enable_Shore_Waves", "_Enable_Ocean_Waves",
    "_Enable_Ocean_Wave", "_Enable_Caustics", "_Enable_Distortion", "_VertexOffset_Toggle",
    // Particles
    "_Enable_Soft_Particles", "_Enable_Camera_Fade", "_Enable_Scene_Fog",
    // Skydome / clouds
    "_Enable_UV_Based", "_Use_Environment_Override", "_Enable_Fog", "_Enable_Scattering",
    // Older packs
    "_Enable_Wind", "_Enable_Emissive", "_Enable_Vertex_Color", "_Use_Texture_Mask",
};

constexpr std::array AUTO_ENABLE_RULES = {
    AutoEnableRule{"leaf_normal", "enable_leaf_normal"},
    AutoEnableRule{"trunk_normal", "enable_trunk_normal"},
    AutoEnableRule{"normal_texture", "enable_normal_texture"},
    AutoEnableRule{"emission_texture", "enable_emission_texture"},
    AutoEnableRule{"ao_texture", "enable_ambient_occlusion"},
    AutoEnableRule{"triplanar_texture_", "enable_triplanar_texture"},
};

} // namespace

const FamilyTable& family_table(ShaderFamily family) {
    return all_tables()[family_index(family)];
}

const PropertyMapping* find_mapping(ShaderFamily family, PropertyKind kind, std::string_view source) {
    const auto& indices = mapping_indices();
    std::string key = property_key(source);
    auto k = static_cast<size_t>(kind);

    const auto& own = indices[family_index(family)][k];
    if (auto it = own.find(key); it != own.end()) {
        return it->second;
    }

    if (family != ShaderFamily::Generic) {
        const auto& generic = indices[family_index(ShaderFamily::Generic)][k];
        if (auto it = generic.find(key); it != generic.end()) {
            return it->second;
        }
    }
    return nullptr;
}

bool is_boolean_toggle(std::string_view name) {
    std::string key = property_key(name);
    for (auto toggle : BOOLEAN_TOGGLES) {
        if (property_key(toggle) == key) return true;
    }
    return false;
}

std::string to_uniform_name(std::string_view unity_name) {
    size_t start = 0;
    while (start < unity_name.size() && unity_name[start] == '_') start++;

    std::string result;
    for (size_t i = start; i < unity_name.size(); i++) {
        char c = unity_name[i];
        bool upper = c >= 'A' && c <= 'Z';
        if (upper && i > start) {
            char prev = unity_name[i - 1];
            bool prev_lower = (prev >= 'a' && prev <= 'z') || (prev >= '0' && prev <= '9');
            if (prev_lower) result.push_back('_');
        }
        char out = upper ? static_cast<char>(c - 'A' + 'a') : c;
        if (out == '_' && !result.empty() && result.back() == '_') continue;
        result.push_back(out);
    }
    return result;
}

std::span<const AutoEnableRule> auto_enable_rules() {
    return AUTO_ENABLE_RULES;
}

const std::vector<DefaultUniform>& family_defaults(ShaderFamily family) {
    static const std::array<std::vector<DefaultUniform>, 7> defaults = {{
        // Vegetation: matte leaves and bark
        {{"leaf_smoothness", 0.1f}, {"trunk_smoothness", 0.15f},
         {"leaf_metallic", 0.0f}, {"trunk_metallic", 0.0f}},
        // Water
        {{"smoothness", 0.95f}, {"metallic", 0.0f}},
        // Crystal
        {{"opacity", 0.7f}},
        // Clouds
        {},
        // Particles
        {},
        // SkyDome
        {},
        // Generic
        {{"smoothness", 0.5f}, {"metallic", 0.0f}},
    }};
    return defaults[family_index(family)];
}

const std::vector<DefaultUniform>& placeholder_defaults(ShaderFamily family) {
    static const std::array<std::vector<DefaultUniform>, 7> defaults = {{
        {{"leaf_base_color", glm::vec4(0.2f, 0.5f, 0.2f, 1.0f)}},
        {{"deep_color", glm::vec4(0.0f, 0.2f, 0.4f, 1.0f)},
         {"shallow_color", glm::vec4(0.2f, 0.5f, 0.7f, 1.0f)}},
        {{"base_color", glm::vec4(0.5f, 0.7f, 1.0f, 1.0f)},
         {"enable_fresnel", true}},
        {},
        {},
        {},
        {},
    }};
    return defaults[family_index(family)];
}

const std::vector<std::string>& uniform_order(ShaderFamily family) {
    static const auto orders = [] {
        std::array<std::vector<std::string>, 7> result;
        for (ShaderFamily f : kAllFamilies) {
            auto& order = result[family_index(f)];
            std::set<std::string> seen;
            auto add = [&](std::string_view name) {
                if (seen.insert(std::string(name)).second) {
                    order.emplace_back(name);
                }
            };

            const FamilyTable& own = family_table(f);
            const FamilyTable* fallback = (f != ShaderFamily::Generic) ? &family_table(ShaderFamily::Generic) : nullptr;

            for (const auto& m : own.textures) add(m.target);
            if (fallback) for (const auto& m : fallback->textures) add(m.target);
            for (const auto& rule : AUTO_ENABLE_RULES) add(rule.toggle);
            for (auto toggle : BOOLEAN_TOGGLES) add(to_uniform_name(toggle));
            for (const auto& m : own.floats) add(m.target);
            if (fallback) for (const auto& m : fallback->floats) add(m.target);
            for (const auto& m : own.colors) add(m.target);
            if (fallback) for (const auto& m : fallback->colors) add(m.target);
            add(TILING_SCALE_UNIFORM);
            add(TILING_OFFSET_UNIFORM);
        }
        return result;
    }();
    return orders[family_index(family)];
}

size_t uniform_rank(ShaderFamily family, std::string_view uniform) {
    static const auto ranks = [] {
        std::array<std::unordered_map<std::string, size_t>, 7> result;
        for (ShaderFamily f : kAllFamilies) {
            const auto& order = uniform_order(f);
            for (size_t i = 0; i < order.size(); i++) {
                result[family_index(f)].emplace(order[i], i);
            }
        }
        return result;
    }();

    const auto& map = ranks[family_index(family)];
    auto it = map.find(std::string(uniform));
    return it != map.end() ? it->second : SIZE_MAX;
}

bool is_hdr_color(std::string_view name) {
    return contains_ci(name, "emission") || contains_ci(name, "emissive") ||
           contains_ci(name, "glow") || contains_ci(name, "hdr");
}

} // namespace matbridge
