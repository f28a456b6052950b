/**
 * MatBridge - Converter Settings
 */

#pragma once

#include "matbridge/types.hpp"
#include "matbridge/result.hpp"
#include "matbridge/logging.hpp"
#include <string>

namespace matbridge {

struct Settings {
    std::string shader_base = "res://shaders";
    std::string texture_base = "res://textures";
    size_t content_size_limit = 16 * 1024 * 1024;
    std::string temp_prefix = "matbridge_textures_";
    fs::path temp_root;
    LogLevel log_level = LogLevel::Info;
    fs::path log_file;
    std::string mapping_file = "mesh_material_mapping.json";
};

/**
 * Load settings from a JSON file. Missing keys keep their defaults; a
 * file that is not valid JSON is an InvalidFormat error.
 */
Result<Settings> load_settings(const fs::path& path);

/**
 * Parse settings from JSON text.
 */
Result<Settings> parse_settings(std::string_view text);

Result<void> save_settings(const Settings& settings, const fs::path& path);

} // namespace matbridge
