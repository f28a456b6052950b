/**
 * MatBridge - Conversion Pipeline Implementation
 */

#include "matbridge/pipeline.hpp"
#include "matbridge/material_parser.hpp"
#include "matbridge/material_list.hpp"
#include "matbridge/shader_classifier.hpp"
#include "matbridge/property_mapper.hpp"
#include "matbridge/tres_writer.hpp"
#include "matbridge/mesh_mapping.hpp"
#include "matbridge/files.hpp"
#include "matbridge/path_utils.hpp"
#include "matbridge/logging.hpp"

namespace matbridge {

namespace {

void append(Diagnostics& to, const Diagnostics& from) {
    to.insert(to.end(), from.begin(), from.end());
}

std::vector<PrefabMaterials> load_manifests(const ConversionInputs& inputs, Diagnostics& diagnostics) {
    std::vector<PrefabMaterials> prefabs;

    auto take = [&](MaterialList list) {
        append(diagnostics, list.diagnostics);
        for (auto& prefab : list.prefabs) prefabs.push_back(std::move(prefab));
    };

    for (const auto& path : inputs.material_lists) {
        auto list = load_material_list(path);
        if (!list) {
            LOG_WARNING("Pipeline", "Cannot read material list: " << list.error().full_message());
            diagnostics.push_back({DiagnosticKind::ManifestParseError, list.error().message, path.string()});
            continue;
        }
        take(std::move(list.value()));
    }

    for (size_t i = 0; i < inputs.material_list_texts.size(); i++) {
        take(parse_material_list(inputs.material_list_texts[i], "material list " + std::to_string(i + 1)));
    }

    return prefabs;
}

// Keyed by material name; the first record of a name wins
std::map<std::string, MaterialRecord> index_records(std::vector<MaterialRecord> records, Diagnostics& diagnostics) {
    std::map<std::string, MaterialRecord> by_name;
    for (auto& record : records) {
        std::string name = record.name;
        std::string source = record.source_id;
        if (!by_name.emplace(name, std::move(record)).second) {
            diagnostics.push_back({DiagnosticKind::Warning, "Duplicate material name, keeping the first record", name + " (" + source + ")"});
        }
    }
    return by_name;
}

} // namespace

const ConvertedMaterial* ConversionReport::find(const std::string& material_name) const {
    for (const auto& converted : materials) {
        if (converted.material.name == material_name) return &converted;
    }
    return nullptr;
}

std::string unique_output_name(const std::string& name, std::map<std::string, int>& used) {
    std::string key = to_lower(name);
    auto it = used.find(key);
    if (it == used.end()) {
        used.emplace(key, 1);
        return name;
    }

    int n = it->second;
    std::string candidate;
    do {
        n++;
        candidate = name + "_" + std::to_string(n);
    } while (used.count(to_lower(candidate)));

    used[key] = n;
    used.emplace(to_lower(candidate), 1);
    return candidate;
}

Result<ConversionReport> convert_package(const ConversionInputs& inputs, const Settings& settings) {
    ConversionReport report;

    ExtractOptions options;
    options.content_size_limit = settings.content_size_limit;
    options.temp_prefix = settings.temp_prefix;
    options.temp_root = settings.temp_root;

    auto extracted = inputs.package.empty()
        ? extract_package(std::span<const uint8_t>(inputs.package_data), options)
        : extract_package(inputs.package, options);
    if (!extracted) {
        LOG_ERROR("Pipeline", "Extraction failed: " << extracted.error().full_message());
        return extracted.error();
    }
    report.index = std::move(extracted.value());
    append(report.diagnostics, report.index.diagnostics());

    // Materials
    MaterialBatch batch = parse_package_materials(report.index);
    append(report.diagnostics, batch.diagnostics);
    report.materials_parsed = batch.records.size();
    auto records = index_records(std::move(batch.records), report.diagnostics);

    // Manifests
    auto prefabs = load_manifests(inputs, report.diagnostics);
    report.prefabs = group_lod_variants(prefabs);

    auto built = build_cache(report.prefabs, records);
    report.cache = std::move(built.cache);
    report.unmatched = std::move(built.unmatched);

    TresOptions tres_options{settings.shader_base, settings.texture_base};
    std::map<std::string, int> used_names;

    auto emit = [&](MappedMaterial mapped, bool placeholder) {
        if (mapped.decision.basis == DecisionBasis::Default) {
            report.diagnostics.push_back({DiagnosticKind::ClassificationFallback,
                                          "No shader evidence, using the generic shader", mapped.name});
        }
        for (const auto& binding : mapped.textures) {
            if (binding.missing()) {
                report.diagnostics.push_back({DiagnosticKind::UnresolvedReference,
                                              "Texture " + binding.texture_id + " for " + binding.slot + " is not in the package",
                                              mapped.name});
            }
        }

        auto required = required_textures(mapped);
        report.required_textures.insert(report.required_textures.end(), required.begin(), required.end());

        ConvertedMaterial converted;
        converted.output_name = unique_output_name(sanitize_filename(mapped.name), used_names);
        converted.tres = serialize_tres(mapped, tres_options);
        converted.material = std::move(mapped);
        converted.placeholder = placeholder;
        report.materials.push_back(std::move(converted));
    };

    for (const auto& [name, record] : records) {
        auto cached = report.cache.find(name);
        std::optional<ShaderDecision> decision;
        if (cached != report.cache.end()) decision = cached->second;

        auto mapped = map_material(record, report.index, decision);
        if (!mapped) {
            LOG_WARNING("Pipeline", "Skipping " << name << ": " << mapped.error().message);
            report.diagnostics.push_back({DiagnosticKind::MappingError, mapped.error().message, name});
            continue;
        }
        emit(std::move(mapped.value()), false);
    }

    // Manifest materials the package does not contain; build_cache has
    // already decided each of them
    for (const auto& name : all_material_names(report.prefabs)) {
        if (records.count(name)) continue;

        const ShaderDecision& decision = report.cache.at(name);
        report.diagnostics.push_back({DiagnosticKind::UnresolvedReference,
                                      "Material referenced by a material list is not in the package", name});
        emit(make_placeholder(name, decision), true);
        report.placeholders++;
    }

    LOG_INFO("Pipeline", "Converted " << report.materials.size() << " materials ("
             << report.placeholders << " placeholders), " << report.required_textures.size()
             << " texture bindings, " << report.diagnostics.size() << " diagnostics");
    return report;
}

Result<void> write_report_outputs(const ConversionReport& report, const fs::path& output_dir,
                                  const Settings& settings) {
    fs::path materials_dir = output_dir / "materials";

    for (const auto& converted : report.materials) {
        fs::path path = materials_dir / (converted.output_name + ".tres");
        TRY(write_file(path, converted.tres));
    }

    fs::path mapping_path = output_dir / settings.mapping_file;
    TRY(write_file(mapping_path, mesh_material_mapping_json(report.prefabs)));

    LOG_INFO("Pipeline", "Wrote " << report.materials.size() << " materials to " << materials_dir.string());
    return Result<void>::success();
}

} // namespace matbridge
