/**
 * MatBridge - Conversion Pipeline
 *
 * One run: extract the package, parse materials and manifests, build the
 * shader cache, map and serialize every material. Only an extraction
 * failure aborts; everything else is collected as diagnostics.
 */

#pragma once

#include "matbridge/types.hpp"
#include "matbridge/result.hpp"
#include "matbridge/settings.hpp"
#include "matbridge/package_extractor.hpp"
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace matbridge {

struct ConversionInputs {
    fs::path package;                             // .unitypackage on disk
    std::vector<uint8_t> package_data;            // Used when package is empty
    std::vector<fs::path> material_lists;
    std::vector<std::string> material_list_texts;
};

struct ConvertedMaterial {
    std::string output_name;      // Sanitized and unique within the run, no extension
    MappedMaterial material;
    std::string tres;
    bool placeholder = false;     // Referenced by a manifest but absent from the package
};

struct ConversionReport {
    AssetIndex index;                             // Keeps extracted textures alive
    std::vector<PrefabMaterials> prefabs;         // LOD grouped
    ShaderCache cache;
    std::vector<std::string> unmatched;
    std::vector<ConvertedMaterial> materials;
    std::vector<RequiredTexture> required_textures;
    Diagnostics diagnostics;

    size_t materials_parsed = 0;
    size_t placeholders = 0;

    const ConvertedMaterial* find(const std::string& material_name) const;
};

Result<ConversionReport> convert_package(const ConversionInputs& inputs, const Settings& settings = {});

/**
 * Write <output>/materials/<name>.tres for every material and the
 * mesh/material mapping JSON to <output>/<settings.mapping_file>.
 */
Result<void> write_report_outputs(const ConversionReport& report, const fs::path& output_dir,
                                  const Settings& settings = {});

/**
 * Make `name` unique against `used` by appending _2, _3, ... Comparison
 * ignores case so outputs survive case-insensitive file systems.
 */
std::string unique_output_name(const std::string& name, std::map<std::string, int>& used);

} // namespace matbridge
