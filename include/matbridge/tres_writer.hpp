/**
 * MatBridge - Godot .tres Writer
 *
 * Serializes a MappedMaterial as a Godot 4 ShaderMaterial text resource.
 * Output depends only on its inputs, so identical materials produce
 * byte-identical files.
 */

#pragma once

#include "matbridge/types.hpp"
#include <string>
#include <string_view>

namespace matbridge {

/**
 * File referenced in place of textures the package did not contain.
 */
constexpr std::string_view MISSING_TEXTURE_FILE = "__missing_texture__.png";

struct TresOptions {
    std::string shader_base = "res://shaders";
    std::string texture_base = "res://textures";
};

std::string serialize_tres(const MappedMaterial& mapped, const TresOptions& options = {});

/**
 * Godot float literal: up to 6 decimals, trailing zeros removed, at least
 * one decimal ("1.0", "0.25"). Negative zero prints as "0.0".
 */
std::string format_float(float value);

std::string format_color(const glm::vec4& color);
std::string format_vector2(const glm::vec2& vec);

/**
 * Material name made safe for a file name. Never empty.
 */
std::string sanitize_filename(std::string_view name);

} // namespace matbridge
