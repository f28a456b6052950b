/**
 * MatBridge - Mesh/Material Mapping Implementation
 */

#include "matbridge/mesh_mapping.hpp"
#include "matbridge/logging.hpp"
#include <nlohmann/json.hpp>

namespace matbridge {

using ordered_json = nlohmann::ordered_json;

std::string mesh_material_mapping_json(const std::vector<PrefabMaterials>& prefabs, int indent) {
    ordered_json root;
    root["prefabs"] = ordered_json::array();
    root["meshes"] = ordered_json::object();

    for (const auto& prefab : prefabs) {
        ordered_json p;
        p["name"] = prefab.name;
        p["meshes"] = ordered_json::array();

        for (const auto& mesh : prefab.meshes) {
            ordered_json m;
            m["name"] = mesh.name;
            m["lod"] = mesh.lod;
            m["slots"] = ordered_json::array();

            ordered_json materials = ordered_json::array();
            for (const auto& slot : mesh.slots) {
                ordered_json s;
                s["index"] = slot.index;
                s["material"] = slot.material ? ordered_json(*slot.material) : ordered_json(nullptr);
                m["slots"].push_back(s);
                materials.push_back(s["material"]);
            }

            if (root["meshes"].contains(mesh.name)) {
                LOG_DEBUG("MeshMapping", "Duplicate mesh " << mesh.name << ", keeping the later slot list");
            }
            root["meshes"][mesh.name] = materials;
            p["meshes"].push_back(m);
        }

        root["prefabs"].push_back(p);
    }

    return root.dump(indent) + "\n";
}

Result<std::vector<PrefabMaterials>> parse_mesh_material_mapping(std::string_view json_text) {
    std::vector<PrefabMaterials> prefabs;

    try {
        ordered_json root = ordered_json::parse(json_text);
        if (!root.is_object() || !root.contains("prefabs") || !root["prefabs"].is_array()) {
            return Error::invalid_format("Mapping has no prefabs array");
        }

        for (const auto& p : root["prefabs"]) {
            PrefabMaterials prefab;
            prefab.name = p.at("name").get<std::string>();

            for (const auto& m : p.at("meshes")) {
                MeshMaterials mesh;
                mesh.name = m.at("name").get<std::string>();
                mesh.lod = m.value("lod", 0);

                for (const auto& s : m.at("slots")) {
                    MaterialSlot slot;
                    slot.index = s.value("index", static_cast<int>(mesh.slots.size()));
                    if (s.contains("material") && !s["material"].is_null()) {
                        slot.material = s["material"].get<std::string>();
                    }
                    mesh.slots.push_back(std::move(slot));
                }
                prefab.meshes.push_back(std::move(mesh));
            }
            prefabs.push_back(std::move(prefab));
        }
    } catch (const nlohmann::json::exception& e) {
        return Error::invalid_format(std::string("Invalid mesh mapping JSON: ") + e.what());
    }

    return prefabs;
}

} // namespace matbridge
