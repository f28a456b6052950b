/**
 * MatBridge - Converter Settings Implementation
 */

#include "matbridge/settings.hpp"
#include "matbridge/files.hpp"
#include "matbridge/path_utils.hpp"
#include <nlohmann/json.hpp>

namespace matbridge {

Result<Settings> parse_settings(std::string_view text) {
    Settings settings;

    try {
        nlohmann::json j = nlohmann::json::parse(text);
        if (!j.is_object()) {
            return Error::invalid_format("Settings must be a JSON object");
        }

        if (j.contains("shader_base")) settings.shader_base = j["shader_base"].get<std::string>();
        if (j.contains("texture_base")) settings.texture_base = j["texture_base"].get<std::string>();
        if (j.contains("content_size_limit")) settings.content_size_limit = j["content_size_limit"].get<size_t>();
        if (j.contains("temp_prefix")) settings.temp_prefix = j["temp_prefix"].get<std::string>();
        if (j.contains("temp_root")) settings.temp_root = j["temp_root"].get<std::string>();
        if (j.contains("log_file")) settings.log_file = j["log_file"].get<std::string>();
        if (j.contains("mapping_file")) settings.mapping_file = j["mapping_file"].get<std::string>();
        if (j.contains("log_level")) {
            std::string name = j["log_level"].get<std::string>();
            auto level = parse_log_level(name);
            if (!level) {
                return Error::invalid_format("Unknown log level: " + name);
            }
            settings.log_level = *level;
        }
    } catch (const nlohmann::json::exception& e) {
        return Error::invalid_format(std::string("Invalid settings JSON: ") + e.what());
    }

    return settings;
}

Result<Settings> load_settings(const fs::path& path) {
    auto text = read_text_file(path);
    if (!text) {
        return text.error();
    }

    auto settings = parse_settings(text.value());
    if (!settings) {
        return Error::invalid_format(settings.error().message, path.string());
    }

    LOG_DEBUG("Settings", "Loaded " << path.string());
    return settings;
}

Result<void> save_settings(const Settings& settings, const fs::path& path) {
    nlohmann::json j;
    j["shader_base"] = settings.shader_base;
    j["texture_base"] = settings.texture_base;
    j["content_size_limit"] = settings.content_size_limit;
    j["temp_prefix"] = settings.temp_prefix;
    j["temp_root"] = settings.temp_root.string();
    j["log_level"] = to_lower(log_level_string(settings.log_level));
    j["log_file"] = settings.log_file.string();
    j["mapping_file"] = settings.mapping_file;

    return write_file(path, j.dump(2) + "\n");
}

} // namespace matbridge
