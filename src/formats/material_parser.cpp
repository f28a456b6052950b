/**
 * MatBridge - Unity Material Parser Implementation
 */

#include "matbridge/material_parser.hpp"
#include "matbridge/yaml_reader.hpp"
#include "matbridge/package_extractor.hpp"
#include "matbridge/shader_tables.hpp"
#include "matbridge/path_utils.hpp"
#include "matbridge/logging.hpp"
#include <algorithm>
#include <limits>
#include <optional>

namespace matbridge {

namespace {

constexpr float COLOR_EPSILON = 1e-4f;
constexpr size_t GUID_LENGTH = 32;

bool is_null_guid(const std::string& guid) {
    return std::all_of(guid.begin(), guid.end(), [](char c) { return c == '0'; });
}

float number_or(const YAML::Node& node, float fallback) {
    auto value = yaml_number(node);
    return value ? static_cast<float>(*value) : fallback;
}

glm::vec2 read_vec2(const YAML::Node& node, glm::vec2 fallback) {
    if (!node || !node.IsMap()) return fallback;
    return glm::vec2(number_or(yaml_child(node, "x"), fallback.x),
                     number_or(yaml_child(node, "y"), fallback.y));
}

ShaderReference read_shader_reference(const YAML::Node& node) {
    ShaderReference ref;
    if (!node || !node.IsMap()) return ref;

    if (auto file_id = yaml_number(yaml_child(node, "fileID"))) {
        ref.file_id = static_cast<int64_t>(*file_id);
    }

    std::string value = to_lower(trim(yaml_text(yaml_child(node, "guid"))));
    if (value.empty() || is_null_guid(value)) return ref;

    ref.guid = value;
    if (const KnownShader* known = find_known_shader(ref.guid)) {
        ref.shader_name = std::string(known->name);
    }
    return ref;
}

struct PropertyEntry {
    std::string name;
    YAML::Node value;
};

// Unity writes entries either as "- _Name: value" or, in older assets,
// as "- first: {name: _Name}\n  second: value".
std::optional<PropertyEntry> split_property_entry(const YAML::Node& item) {
    if (!item.IsMap() || item.size() == 0) return std::nullopt;

    YAML::Node first = yaml_child(item, "first");
    YAML::Node second = yaml_child(item, "second");
    if (first && second) {
        std::string name = first.IsMap() ? yaml_text(yaml_child(first, "name")) : yaml_text(first);
        if (name.empty()) return std::nullopt;
        return PropertyEntry{name, second};
    }

    auto entry = item.begin();
    std::string name = yaml_text(entry->first);
    if (name.empty()) return std::nullopt;
    return PropertyEntry{name, entry->second};
}

void add_texture(MaterialRecord& record, const std::string& name, const YAML::Node& value) {
    std::string id = to_lower(trim(yaml_text(yaml_child(yaml_child(value, "m_Texture"), "guid"))));
    if (id.size() < GUID_LENGTH || is_null_guid(id)) return;

    TextureSlot slot;
    slot.texture_id = id;
    slot.scale = read_vec2(yaml_child(value, "m_Scale"), glm::vec2(1.0f, 1.0f));
    slot.offset = read_vec2(yaml_child(value, "m_Offset"), glm::vec2(0.0f, 0.0f));

    for (auto& [existing, tex_slot] : record.textures) {
        if (existing == name) {
            tex_slot = slot;
            return;
        }
    }
    record.textures.emplace_back(name, slot);
}

void add_color(MaterialRecord& record, const std::string& name, const YAML::Node& value) {
    bool hdr = is_hdr_color(name);
    glm::vec4 color(
        clamp_color_channel(number_or(yaml_child(value, "r"), 0.0f), hdr),
        clamp_color_channel(number_or(yaml_child(value, "g"), 0.0f), hdr),
        clamp_color_channel(number_or(yaml_child(value, "b"), 0.0f), hdr),
        clamp_color_channel(number_or(yaml_child(value, "a"), 1.0f), false));
    record.colors[name] = color;
}

void read_property_section(MaterialRecord& record, const YAML::Node& section) {
    if (!section.IsSequence()) return;

    for (const auto& item : section) {
        auto entry = split_property_entry(item);
        if (!entry) continue;
        const YAML::Node& value = entry->value;

        if (value.IsMap()) {
            if (yaml_child(value, "m_Texture")) {
                add_texture(record, entry->name, value);
            } else if (yaml_child(value, "r") && yaml_child(value, "g") && yaml_child(value, "b")) {
                add_color(record, entry->name, value);
            }
        } else if (auto number = yaml_number(value)) {
            record.floats[entry->name] = static_cast<float>(*number);
        }
    }
}

} // namespace

float clamp_color_channel(float value, bool hdr_rgb) {
    if (value >= -COLOR_EPSILON && value <= 1.0f + COLOR_EPSILON) {
        return value;
    }
    float upper = hdr_rgb ? std::numeric_limits<float>::infinity() : 1.0f;
    return std::clamp(value, 0.0f, upper);
}

Result<MaterialRecord> parse_material(std::string_view text, const std::string& source_id) {
    auto docs = parse_yaml_documents(text);
    if (!docs) {
        return Error::material_parse("Malformed material YAML: " + docs.error().full_message(), source_id);
    }

    const YamlDocument* doc = find_document(docs.value(), "Material");
    YAML::Node material = doc ? yaml_child(doc->root, "Material") : YAML::Node(YAML::NodeType::Undefined);
    if (!material || !material.IsMap()) {
        return Error::material_parse("No Material document", source_id);
    }

    MaterialRecord record;
    record.source_id = source_id;
    record.name = std::string(trim(yaml_text(yaml_child(material, "m_Name"))));
    if (record.name.empty()) {
        return Error::material_parse("Material has no m_Name", source_id);
    }

    record.shader = read_shader_reference(yaml_child(material, "m_Shader"));

    YAML::Node saved = yaml_child(material, "m_SavedProperties");
    if (saved && saved.IsMap()) {
        for (const auto& section : saved) {
            read_property_section(record, section.second);
        }
    }

    LOG_DEBUG("MaterialParser", record.name << ": " << record.textures.size() << " textures, "
              << record.floats.size() << " floats, " << record.colors.size() << " colors, shader "
              << (record.shader.empty() ? "none" : record.shader.guid));

    return record;
}

Result<MaterialRecord> parse_material(std::span<const uint8_t> data, const std::string& source_id) {
    std::string_view text(reinterpret_cast<const char*>(data.data()), data.size());
    return parse_material(text, source_id);
}

bool resolve_shader_reference(ShaderReference& shader, const AssetIndex& index) {
    if (shader.empty() || shader.resolved()) return shader.resolved();

    const std::string* path = index.pathname(shader.guid);
    if (!path) return false;

    std::string ext = extension_lower(*path);
    if (ext != ".shader" && ext != ".shadergraph") return false;

    shader.shader_name = path_stem(*path);
    LOG_DEBUG("MaterialParser", "Resolved shader " << shader.guid << " -> " << *shader.shader_name);
    return true;
}

MaterialBatch parse_package_materials(const AssetIndex& index) {
    MaterialBatch batch;

    for (const auto& guid : index.material_guids()) {
        const std::vector<uint8_t>* content = index.content(guid);
        if (!content) continue;

        auto record = parse_material(std::span<const uint8_t>(*content), guid);
        if (!record) {
            const std::string* path = index.pathname(guid);
            std::string subject = path ? *path : guid;
            LOG_WARNING("MaterialParser", "Skipping " << subject << ": " << record.error().message);
            batch.diagnostics.push_back({DiagnosticKind::MaterialParseError, record.error().message, subject});
            continue;
        }

        MaterialRecord& parsed = record.value();
        if (!parsed.shader.empty() && !parsed.shader.resolved()) {
            if (!resolve_shader_reference(parsed.shader, index)) {
                batch.diagnostics.push_back({DiagnosticKind::UnresolvedReference,
                                             "Unknown shader " + parsed.shader.guid, parsed.name});
            }
        }
        batch.records.push_back(std::move(parsed));
    }

    LOG_INFO("MaterialParser", "Parsed " << batch.records.size() << " materials ("
             << count_diagnostics(batch.diagnostics, DiagnosticKind::MaterialParseError) << " failed)");
    return batch;
}

} // namespace matbridge
