/**
 * MatBridge - Material list parser tests
 */

#include "matbridge/material_list.hpp"
#include "matbridge/files.hpp"
#include <gtest/gtest.h>

using namespace matbridge;

namespace {

const char* SAMPLE_LIST = R"(# POLYGON Nature Biomes
Prefab Name: SM_Env_Tree_01
    Mesh Name: SM_Env_Tree_01_LOD0
        Slot: Leaf_Bark_01 (Leaf_Bark_Albedo)
        Slot: Leaves_01 (Uses custom shader)
    Mesh Name: SM_Env_Tree_01_LOD1
        Slot: Leaf_Bark_01_LOD1
        Slot: Leaves_01_LOD1

Prefab Name: SM_Env_Rock_01
    Mesh Name: SM_Env_Rock_01
        Slot: Rock_01
        Slot:
)";

} // namespace

TEST(MaterialListTest, ParsesPrefabsMeshesAndSlots) {
    MaterialList list = parse_material_list(SAMPLE_LIST);
    EXPECT_TRUE(list.diagnostics.empty());
    ASSERT_EQ(list.prefabs.size(), 2u);

    const PrefabMaterials& tree = list.prefabs[0];
    EXPECT_EQ(tree.name, "SM_Env_Tree_01");
    ASSERT_EQ(tree.meshes.size(), 2u);
    EXPECT_EQ(tree.meshes[0].name, "SM_Env_Tree_01_LOD0");
    EXPECT_EQ(tree.meshes[0].lod, 0);
    EXPECT_EQ(tree.meshes[1].lod, 1);

    const auto& slots = tree.meshes[0].slots;
    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(slots[0].index, 0);
    EXPECT_EQ(*slots[0].material, "Leaf_Bark_01");
    EXPECT_EQ(slots[0].texture_hint, "Leaf_Bark_Albedo");
    EXPECT_FALSE(slots[0].uses_custom_shader);

    EXPECT_EQ(slots[1].index, 1);
    EXPECT_EQ(*slots[1].material, "Leaves_01");
    EXPECT_TRUE(slots[1].uses_custom_shader);
    EXPECT_TRUE(slots[1].texture_hint.empty());
}

TEST(MaterialListTest, EmptySlotHasNoMaterial) {
    MaterialList list = parse_material_list(SAMPLE_LIST);
    ASSERT_EQ(list.prefabs.size(), 2u);

    const auto& slots = list.prefabs[1].meshes[0].slots;
    ASSERT_EQ(slots.size(), 2u);
    EXPECT_EQ(*slots[0].material, "Rock_01");
    EXPECT_FALSE(slots[1].material.has_value());
    EXPECT_EQ(slots[1].index, 1);
}

TEST(MaterialListTest, MarkersAreCaseInsensitive) {
    MaterialList list = parse_material_list(
        "PREFAB NAME: A\n"
        "mesh name: A_Mesh\n"
        "SLOT: Mat_A\n");
    ASSERT_EQ(list.prefabs.size(), 1u);
    ASSERT_EQ(list.prefabs[0].meshes.size(), 1u);
    EXPECT_EQ(*list.prefabs[0].meshes[0].slots[0].material, "Mat_A");
}

TEST(MaterialListTest, MalformedLinesAreReportedAndSkipped) {
    MaterialList list = parse_material_list(
        "Slot: Orphan\n"
        "Mesh Name: Lonely\n"
        "Prefab Name: P\n"
        "    Mesh Name: P_Mesh\n"
        "        Slot: Mat\n"
        "        garbage here\n"
        "        Slot: Mat_2\n",
        "MaterialList.txt");

    ASSERT_EQ(list.diagnostics.size(), 3u);
    for (const auto& d : list.diagnostics) {
        EXPECT_EQ(d.kind, DiagnosticKind::ManifestParseError);
    }
    EXPECT_EQ(list.diagnostics[0].subject, "MaterialList.txt:1");
    EXPECT_EQ(list.diagnostics[1].subject, "MaterialList.txt:2");
    EXPECT_EQ(list.diagnostics[2].subject, "MaterialList.txt:6");

    ASSERT_EQ(list.prefabs.size(), 1u);
    ASSERT_EQ(list.prefabs[0].meshes[0].slots.size(), 2u);
    EXPECT_EQ(*list.prefabs[0].meshes[0].slots[1].material, "Mat_2");
}

TEST(MaterialListTest, CommentsAndWindowsLineEndings) {
    MaterialList list = parse_material_list(
        "// generated\r\n"
        "; exported\r\n"
        "Prefab Name: P\r\n"
        "Mesh Name: M\r\n"
        "Slot: Mat\r\n");
    EXPECT_TRUE(list.diagnostics.empty());
    ASSERT_EQ(list.prefabs.size(), 1u);
    EXPECT_EQ(*list.prefabs[0].meshes[0].slots[0].material, "Mat");
}

TEST(MaterialListTest, LodSuffix) {
    EXPECT_EQ(lod_index_from_name("SM_Tree_LOD0"), 0);
    EXPECT_EQ(lod_index_from_name("SM_Tree_LOD2"), 2);
    EXPECT_EQ(lod_index_from_name("SM_Tree_lod12"), 12);
    EXPECT_EQ(lod_index_from_name("SM_Tree"), 0);
    EXPECT_EQ(lod_index_from_name("SM_Tree_LOD"), 0);
    EXPECT_EQ(lod_index_from_name("SM_LOD1_Tree"), 0);

    EXPECT_EQ(strip_lod_suffix("SM_Tree_LOD1"), "SM_Tree");
    EXPECT_EQ(strip_lod_suffix("SM_Tree_Lod03"), "SM_Tree");
    EXPECT_EQ(strip_lod_suffix("SM_Tree"), "SM_Tree");
    EXPECT_EQ(strip_lod_suffix("SM_LOD1_Tree"), "SM_LOD1_Tree");
}

TEST(MaterialListTest, GroupLodVariantsMergesAndSorts) {
    std::vector<PrefabMaterials> prefabs = {
        {"SM_Bush_LOD2", {{"SM_Bush_LOD2", 2, {}}}},
        {"SM_Rock", {{"SM_Rock", 0, {}}}},
        {"SM_Bush_LOD0", {{"SM_Bush_LOD0", 0, {}}}},
        {"SM_Bush_LOD1", {{"SM_Bush_LOD1", 1, {}}}},
    };

    auto groups = group_lod_variants(prefabs);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].name, "SM_Bush");
    EXPECT_EQ(groups[1].name, "SM_Rock");

    ASSERT_EQ(groups[0].meshes.size(), 3u);
    EXPECT_EQ(groups[0].meshes[0].name, "SM_Bush_LOD0");
    EXPECT_EQ(groups[0].meshes[1].name, "SM_Bush_LOD1");
    EXPECT_EQ(groups[0].meshes[2].name, "SM_Bush_LOD2");
}

TEST(MaterialListTest, MaterialQueries) {
    MaterialList list = parse_material_list(SAMPLE_LIST);

    auto names = all_material_names(list.prefabs);
    EXPECT_EQ(names.size(), 5u);
    EXPECT_TRUE(names.count("Leaves_01_LOD1"));

    auto custom = custom_shader_materials(list.prefabs);
    EXPECT_EQ(custom, std::set<std::string>{"Leaves_01"});

    auto hints = texture_hinted_materials(list.prefabs);
    ASSERT_EQ(hints.size(), 1u);
    EXPECT_EQ(hints.at("Leaf_Bark_01"), "Leaf_Bark_Albedo");
}

TEST(MaterialListTest, LoadFromDisk) {
    fs::path path = fs::temp_directory_path() / "matbridge_material_list_test.txt";
    ASSERT_TRUE(write_file(path, std::string_view(SAMPLE_LIST)).ok());

    auto list = load_material_list(path);
    fs::remove(path);
    ASSERT_TRUE(list.ok());
    EXPECT_EQ(list->prefabs.size(), 2u);
}

TEST(MaterialListTest, MissingFileIsManifestError) {
    auto list = load_material_list("/nonexistent/matbridge/MaterialList.txt");
    ASSERT_FALSE(list.ok());
    EXPECT_EQ(list.error().code, Error::Code::ManifestParse);
}
