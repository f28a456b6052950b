/**
 * MatBridge - Unity Material Parser
 *
 * Decodes one .mat asset (Unity YAML, class 21) into a MaterialRecord.
 */

#pragma once

#include "matbridge/types.hpp"
#include "matbridge/result.hpp"
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace matbridge {

/**
 * Parse a material asset. Fails with Error::Code::MaterialParse when the
 * text has no Material document or the document has no name.
 */
Result<MaterialRecord> parse_material(std::string_view text, const std::string& source_id = "");
Result<MaterialRecord> parse_material(std::span<const uint8_t> data, const std::string& source_id = "");

/**
 * Clamp one color channel. Values within [0, 1] (with 1e-4 tolerance) pass
 * through; others are clamped to [0, 1], or to [0, inf) for the RGB
 * channels of HDR colors.
 */
float clamp_color_channel(float value, bool hdr_rgb);

/**
 * Resolve a shader reference the static table did not know by looking
 * for the shader asset in the package. The asset's pathname stem becomes
 * the shader name. Returns true when the reference was resolved.
 */
bool resolve_shader_reference(ShaderReference& shader, const AssetIndex& index);

/**
 * Material records from every .mat asset in a package. Records that fail
 * to parse are skipped and reported.
 */
struct MaterialBatch {
    std::vector<MaterialRecord> records;
    Diagnostics diagnostics;
};

MaterialBatch parse_package_materials(const AssetIndex& index);

} // namespace matbridge
