/**
 * MatBridge - Property Mapper Implementation
 */

#include "matbridge/property_mapper.hpp"
#include "matbridge/shader_classifier.hpp"
#include "matbridge/shader_tables.hpp"
#include "matbridge/package_extractor.hpp"
#include "matbridge/path_utils.hpp"
#include "matbridge/logging.hpp"

namespace matbridge {

namespace {

// First value for a uniform wins
bool set_uniform(MappedMaterial& mapped, std::string_view name, UniformValue value) {
    if (mapped.find_uniform(std::string(name))) return false;
    mapped.uniforms.push_back(Uniform{std::string(name), std::move(value)});
    return true;
}

void add_defaults(MappedMaterial& mapped, const std::vector<DefaultUniform>& defaults) {
    for (const auto& def : defaults) {
        set_uniform(mapped, def.name, def.value);
    }
}

bool is_identity_tiling(const TextureSlot& slot) {
    return slot.scale == glm::vec2(1.0f, 1.0f) && slot.offset == glm::vec2(0.0f, 0.0f);
}

// Unity's _Mode: 0 opaque, 1 cutout, 2 fade, 3 transparent
bool is_opaque(const MaterialRecord& record) {
    for (const auto& [name, value] : record.floats) {
        if (property_key(name) == "mode") return value < 1.0f;
    }
    return true;
}

void map_textures(const MaterialRecord& record, const TextureResolver& resolve, MappedMaterial& mapped) {
    bool tiling_done = false;

    for (const auto& [name, slot] : record.textures) {
        const PropertyMapping* mapping = find_mapping(mapped.family, PropertyKind::Texture, name);
        if (!mapping) {
            LOG_DEBUG("PropertyMapper", record.name << ": no " << family_name(mapped.family)
                      << " slot for texture " << name);
            continue;
        }

        std::string target(mapping->target);
        if (mapped.find_texture(target)) continue;

        TextureBinding binding;
        binding.slot = target;
        binding.source_property = name;
        binding.texture_id = slot.texture_id;
        binding.filename = resolve ? resolve(slot.texture_id) : std::nullopt;
        if (binding.missing()) {
            LOG_DEBUG("PropertyMapper", record.name << ": texture " << slot.texture_id
                      << " for " << name << " is not in the package");
        }
        mapped.textures.push_back(std::move(binding));

        if (mapping->carries_tiling && !tiling_done) {
            tiling_done = true;
            if (!is_identity_tiling(slot)) {
                set_uniform(mapped, TILING_SCALE_UNIFORM, UniformValue(std::in_place_type<glm::vec2>, slot.scale));
                set_uniform(mapped, TILING_OFFSET_UNIFORM, UniformValue(std::in_place_type<glm::vec2>, slot.offset));
            }
        }
    }
}

void map_floats(const MaterialRecord& record, MappedMaterial& mapped) {
    for (const auto& [name, value] : record.floats) {
        if (is_boolean_toggle(name)) {
            set_uniform(mapped, to_uniform_name(name), value != 0.0f);
            continue;
        }

        const PropertyMapping* mapping = find_mapping(mapped.family, PropertyKind::Float, name);
        if (mapping) {
            set_uniform(mapped, mapping->target, value * mapping->scale);
        }
    }
}

void map_colors(const MaterialRecord& record, MappedMaterial& mapped) {
    bool opaque = is_opaque(record);

    for (const auto& [name, value] : record.colors) {
        const PropertyMapping* mapping = find_mapping(mapped.family, PropertyKind::Color, name);
        if (!mapping) continue;

        glm::vec4 color = value;
        if (mapping->color == ColorTransform::OpaqueAlpha && opaque && color.a == 0.0f &&
            (color.r != 0.0f || color.g != 0.0f || color.b != 0.0f)) {
            color.a = 1.0f;
        }
        set_uniform(mapped, mapping->target, color);
    }
}

void apply_auto_enable(MappedMaterial& mapped) {
    for (const auto& binding : mapped.textures) {
        for (const auto& rule : auto_enable_rules()) {
            if (std::string_view(binding.slot).starts_with(rule.slot_prefix)) {
                set_uniform(mapped, rule.toggle, true);
            }
        }
    }
}

} // namespace

Result<MappedMaterial> map_material(const MaterialRecord& record,
                                    const TextureResolver& resolve_texture,
                                    const std::optional<ShaderDecision>& decision) {
    if (!record.has_properties() && !record.shader.resolved()) {
        return Error::mapping("Material has no properties and an unresolved shader", record.name);
    }

    MappedMaterial mapped;
    mapped.name = record.name;
    mapped.decision = decision ? *decision : classify(record);
    mapped.family = mapped.decision.family;

    map_textures(record, resolve_texture, mapped);
    map_floats(record, mapped);
    map_colors(record, mapped);
    apply_auto_enable(mapped);
    add_defaults(mapped, family_defaults(mapped.family));

    LOG_DEBUG("PropertyMapper", record.name << " -> " << family_shader_file(mapped.family) << ": "
              << mapped.textures.size() << " textures, " << mapped.uniforms.size() << " uniforms");
    return mapped;
}

Result<MappedMaterial> map_material(const MaterialRecord& record,
                                    const AssetIndex& index,
                                    const std::optional<ShaderDecision>& decision) {
    TextureResolver resolve = [&index](const std::string& id) -> std::optional<std::string> {
        if (const std::string* filename = index.texture_filename(id)) return *filename;
        return std::nullopt;
    };
    return map_material(record, resolve, decision);
}

Result<MappedMaterial> map_material(const MaterialRecord& record,
                                    const std::map<std::string, std::string>& texture_filenames,
                                    const std::optional<ShaderDecision>& decision) {
    TextureResolver resolve = [&texture_filenames](const std::string& id) -> std::optional<std::string> {
        auto it = texture_filenames.find(id);
        if (it == texture_filenames.end()) return std::nullopt;
        return it->second;
    };
    return map_material(record, resolve, decision);
}

MappedMaterial make_placeholder(const std::string& name, const ShaderDecision& decision) {
    MappedMaterial mapped;
    mapped.name = name;
    mapped.decision = decision;
    mapped.family = decision.family;

    add_defaults(mapped, placeholder_defaults(mapped.family));
    add_defaults(mapped, family_defaults(mapped.family));
    return mapped;
}

std::vector<RequiredTexture> required_textures(const MappedMaterial& mapped) {
    std::vector<RequiredTexture> required;
    required.reserve(mapped.textures.size());
    for (const auto& binding : mapped.textures) {
        required.push_back(RequiredTexture{mapped.name, binding.slot, binding.texture_id, binding.filename});
    }
    return required;
}

} // namespace matbridge
