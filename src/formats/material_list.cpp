/**
 * MatBridge - Material List Parser Implementation
 */

#include "matbridge/material_list.hpp"
#include "matbridge/files.hpp"
#include "matbridge/path_utils.hpp"
#include "matbridge/logging.hpp"
#include <algorithm>
#include <charconv>

namespace matbridge {

namespace {

constexpr std::string_view PREFAB_MARKER = "prefab name:";
constexpr std::string_view MESH_MARKER = "mesh name:";
constexpr std::string_view SLOT_MARKER = "slot:";
constexpr std::string_view CUSTOM_SHADER_HINT = "uses custom shader";

bool is_comment(std::string_view line) {
    return line.starts_with('#') || line.starts_with("//") || line.starts_with(';');
}

// Text after a case-insensitive marker, or nullopt when the line does not start with it
std::optional<std::string_view> after_marker(std::string_view line, std::string_view marker) {
    if (line.size() < marker.size()) return std::nullopt;
    if (to_lower(line.substr(0, marker.size())) != marker) return std::nullopt;
    return trim(line.substr(marker.size()));
}

// Position of "_lod" that starts a trailing "_LOD<digits>", npos otherwise
size_t lod_suffix_position(std::string_view name) {
    std::string lower = to_lower(name);
    size_t pos = lower.rfind("_lod");
    if (pos == std::string::npos) return std::string::npos;

    size_t digits = pos + 4;
    if (digits >= lower.size()) return std::string::npos;
    for (size_t i = digits; i < lower.size(); i++) {
        if (lower[i] < '0' || lower[i] > '9') return std::string::npos;
    }
    return pos;
}

MaterialSlot parse_slot(std::string_view body, int index) {
    MaterialSlot slot;
    slot.index = index;

    std::string_view material = body;
    if (body.ends_with(')')) {
        size_t open = body.rfind('(');
        if (open != std::string_view::npos) {
            std::string_view hint = trim(body.substr(open + 1, body.size() - open - 2));
            material = trim(body.substr(0, open));
            if (to_lower(hint) == CUSTOM_SHADER_HINT) {
                slot.uses_custom_shader = true;
            } else {
                slot.texture_hint = std::string(hint);
            }
        }
    }

    if (!material.empty()) {
        slot.material = std::string(material);
    }
    return slot;
}

} // namespace

int lod_index_from_name(std::string_view name) {
    size_t pos = lod_suffix_position(name);
    if (pos == std::string::npos) return 0;

    int lod = 0;
    std::string_view digits = name.substr(pos + 4);
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), lod);
    if (ec != std::errc()) return 0;
    return lod;
}

std::string strip_lod_suffix(std::string_view name) {
    size_t pos = lod_suffix_position(name);
    if (pos == std::string::npos) return std::string(name);
    return std::string(name.substr(0, pos));
}

MaterialList parse_material_list(std::string_view text, const std::string& source) {
    MaterialList result;
    PrefabMaterials* prefab = nullptr;
    MeshMaterials* mesh = nullptr;

    auto skip = [&](size_t line_number, const std::string& message) {
        std::string where = source.empty() ? "line " + std::to_string(line_number)
                                           : source + ":" + std::to_string(line_number);
        LOG_DEBUG("MaterialList", where << ": " << message);
        result.diagnostics.push_back({DiagnosticKind::ManifestParseError, message, where});
    };

    size_t line_number = 0;
    size_t start = 0;
    while (start <= text.size()) {
        size_t end = text.find('\n', start);
        if (end == std::string_view::npos) end = text.size();
        std::string_view line = trim(text.substr(start, end - start));
        start = end + 1;
        line_number++;

        if (line.empty() || is_comment(line)) continue;

        if (auto prefab_name = after_marker(line, PREFAB_MARKER)) {
            if (prefab_name->empty()) {
                skip(line_number, "Prefab without a name");
                prefab = nullptr;
                mesh = nullptr;
                continue;
            }
            result.prefabs.push_back(PrefabMaterials{std::string(*prefab_name), {}});
            prefab = &result.prefabs.back();
            mesh = nullptr;
        } else if (auto mesh_name = after_marker(line, MESH_MARKER)) {
            if (!prefab) {
                skip(line_number, "Mesh outside a prefab");
                continue;
            }
            if (mesh_name->empty()) {
                skip(line_number, "Mesh without a name");
                mesh = nullptr;
                continue;
            }
            prefab->meshes.push_back(MeshMaterials{std::string(*mesh_name), lod_index_from_name(*mesh_name), {}});
            mesh = &prefab->meshes.back();
        } else if (auto body = after_marker(line, SLOT_MARKER)) {
            if (!mesh) {
                skip(line_number, "Slot outside a mesh");
                continue;
            }
            mesh->slots.push_back(parse_slot(*body, static_cast<int>(mesh->slots.size())));
        } else {
            skip(line_number, "Unrecognized line: " + std::string(line));
        }
    }

    LOG_DEBUG("MaterialList", "Parsed " << result.prefabs.size() << " prefabs"
              << (source.empty() ? "" : " from " + source));
    return result;
}

Result<MaterialList> load_material_list(const fs::path& path) {
    auto text = read_text_file(path);
    if (!text) {
        return Error(Error::Code::ManifestParse, text.error().message, path.string());
    }

    MaterialList list = parse_material_list(text.value(), path.filename().string());
    LOG_INFO("MaterialList", "Loaded " << list.prefabs.size() << " prefabs from " << path.filename().string());
    return list;
}

std::vector<PrefabMaterials> group_lod_variants(const std::vector<PrefabMaterials>& prefabs) {
    std::vector<PrefabMaterials> groups;
    std::map<std::string, size_t> group_index;

    for (const auto& prefab : prefabs) {
        std::string base = strip_lod_suffix(prefab.name);
        auto it = group_index.find(base);
        if (it == group_index.end()) {
            group_index.emplace(base, groups.size());
            groups.push_back(PrefabMaterials{base, prefab.meshes});
        } else {
            auto& meshes = groups[it->second].meshes;
            meshes.insert(meshes.end(), prefab.meshes.begin(), prefab.meshes.end());
        }
    }

    for (auto& group : groups) {
        std::stable_sort(group.meshes.begin(), group.meshes.end(),
                         [](const MeshMaterials& a, const MeshMaterials& b) { return a.lod < b.lod; });
    }
    return groups;
}

std::set<std::string> all_material_names(const std::vector<PrefabMaterials>& prefabs) {
    std::set<std::string> names;
    for (const auto& prefab : prefabs) {
        for (const auto& mesh : prefab.meshes) {
            for (const auto& slot : mesh.slots) {
                if (slot.material) names.insert(*slot.material);
            }
        }
    }
    return names;
}

std::set<std::string> custom_shader_materials(const std::vector<PrefabMaterials>& prefabs) {
    std::set<std::string> names;
    for (const auto& prefab : prefabs) {
        for (const auto& mesh : prefab.meshes) {
            for (const auto& slot : mesh.slots) {
                if (slot.material && slot.uses_custom_shader) names.insert(*slot.material);
            }
        }
    }
    return names;
}

std::map<std::string, std::string> texture_hinted_materials(const std::vector<PrefabMaterials>& prefabs) {
    std::map<std::string, std::string> hints;
    for (const auto& prefab : prefabs) {
        for (const auto& mesh : prefab.meshes) {
            for (const auto& slot : mesh.slots) {
                if (!slot.material || slot.uses_custom_shader || slot.texture_hint.empty()) continue;
                hints.emplace(*slot.material, slot.texture_hint);
            }
        }
    }
    return hints;
}

} // namespace matbridge
