/**
 * MatBridge - Conversion pipeline tests
 */

#include "matbridge/pipeline.hpp"
#include "matbridge/files.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>

using namespace matbridge;
using namespace matbridge::test;

namespace {

const std::string POLYGON_LIT = "0730dae39bc73f34796280af9875ce14";

const std::string LEAF_GUID = guid("1a");
const std::string ALBEDO_GUID = guid("2b");
const std::string NORMAL_GUID = guid("4d");   // Not shipped in the package
const std::string ROCK_GUID = guid("5e");
const std::string EMPTY_GUID = guid("6f");

const char* TREE_LIST =
    "Prefab Name: SM_Env_Tree_01\n"
    "    Mesh Name: SM_Env_Tree_01_LOD0\n"
    "        Slot: Leaf_Bark_01 (Uses custom shader)\n"
    "    Mesh Name: SM_Env_Tree_01_LOD1\n"
    "        Slot: Leaf_Bark_01_LOD1 (Uses custom shader)\n"
    "Prefab Name: SM_Prop_Crystal_01\n"
    "    Mesh Name: SM_Prop_Crystal_01\n"
    "        Slot: Crystal_Mat_01 (Uses custom shader)\n";

std::vector<uint8_t> sample_package() {
    MaterialYaml leaf;
    leaf.name = "Leaf_Bark_01";
    leaf.textures = {{"_Albedo", ALBEDO_GUID}, {"_Normal", NORMAL_GUID}};
    leaf.floats = {{"_Wind_Direction", "0.5"}};

    MaterialYaml rock;
    rock.name = "Rock_01";
    rock.shader_guid = POLYGON_LIT;
    rock.floats = {{"_Smoothness", "0.3"}};

    MaterialYaml empty;
    empty.name = "Empty_Thing";
    empty.shader_guid = "ffffffffffffffffffffffffffffffff";

    return make_package({
        {LEAF_GUID, "Assets/Materials/Leaf_Bark_01.mat", material_yaml(leaf)},
        {ALBEDO_GUID, "Assets/Textures/Leaf_Bark_Albedo.png", std::string("\x89PNG fake", 9)},
        {ROCK_GUID, "Assets/Materials/Rock_01.mat", material_yaml(rock)},
        {EMPTY_GUID, "Assets/Materials/Empty_Thing.mat", material_yaml(empty)},
    });
}

ConversionInputs sample_inputs() {
    ConversionInputs inputs;
    inputs.package_data = sample_package();
    inputs.material_list_texts.push_back(TREE_LIST);
    return inputs;
}

bool has_diagnostic(const Diagnostics& diagnostics, DiagnosticKind kind, const std::string& subject) {
    return std::any_of(diagnostics.begin(), diagnostics.end(), [&](const Diagnostic& d) {
        return d.kind == kind && d.subject == subject;
    });
}

} // namespace

TEST(PipelineTest, ConvertsPackageMaterials) {
    auto report = convert_package(sample_inputs());
    ASSERT_TRUE(report.ok()) << report.error().full_message();

    EXPECT_EQ(report->materials_parsed, 3u);
    ASSERT_EQ(report->materials.size(), 4u);

    const ConvertedMaterial* leaf = report->find("Leaf_Bark_01");
    ASSERT_NE(leaf, nullptr);
    EXPECT_FALSE(leaf->placeholder);
    EXPECT_EQ(leaf->output_name, "Leaf_Bark_01");
    EXPECT_EQ(leaf->material.family, ShaderFamily::Vegetation);
    EXPECT_NE(leaf->tres.find("path=\"res://shaders/foliage.gdshader\""), std::string::npos);
    EXPECT_NE(leaf->tres.find("path=\"res://textures/Leaf_Bark_Albedo.png\""), std::string::npos);
    EXPECT_NE(leaf->tres.find("__missing_texture__.png"), std::string::npos);
    EXPECT_NE(leaf->tres.find("shader_parameter/wind_direction = 0.5"), std::string::npos);

    const ConvertedMaterial* rock = report->find("Rock_01");
    ASSERT_NE(rock, nullptr);
    EXPECT_EQ(rock->material.family, ShaderFamily::Generic);
    EXPECT_NE(rock->tres.find("polygon.gdshader"), std::string::npos);
    EXPECT_NE(rock->tres.find("shader_parameter/smoothness = 0.3"), std::string::npos);
}

TEST(PipelineTest, MissingTexturesAreReported) {
    auto report = convert_package(sample_inputs());
    ASSERT_TRUE(report.ok());

    EXPECT_TRUE(has_diagnostic(report->diagnostics, DiagnosticKind::UnresolvedReference, "Leaf_Bark_01"));

    auto missing = std::count_if(report->required_textures.begin(), report->required_textures.end(),
                                 [](const RequiredTexture& t) { return t.missing(); });
    EXPECT_EQ(missing, 1);
}

TEST(PipelineTest, LodVariantsInheritAndManifestOnlyBecomePlaceholders) {
    auto report = convert_package(sample_inputs());
    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->placeholders, 2u);

    const ConvertedMaterial* lod1 = report->find("Leaf_Bark_01_LOD1");
    ASSERT_NE(lod1, nullptr);
    EXPECT_TRUE(lod1->placeholder);
    EXPECT_EQ(lod1->material.family, ShaderFamily::Vegetation);
    EXPECT_EQ(lod1->material.decision.inherited_from, "Leaf_Bark_01");

    const ConvertedMaterial* crystal = report->find("Crystal_Mat_01");
    ASSERT_NE(crystal, nullptr);
    EXPECT_TRUE(crystal->placeholder);
    EXPECT_EQ(crystal->material.family, ShaderFamily::Crystal);
    EXPECT_NE(crystal->tres.find("crystal.gdshader"), std::string::npos);

    EXPECT_TRUE(has_diagnostic(report->diagnostics, DiagnosticKind::UnresolvedReference, "Crystal_Mat_01"));
    EXPECT_EQ(report->unmatched, (std::vector<std::string>{"Crystal_Mat_01", "Empty_Thing", "Rock_01"}));
}

TEST(PipelineTest, PlaceholderFamilyMatchesCache) {
    ConversionInputs inputs;
    inputs.package_data = sample_package();
    inputs.material_list_texts.push_back(
        "Prefab Name: SM_Env_Lake_01\n"
        "    Mesh Name: SM_Env_Lake_01\n"
        "        Slot: Water_Plane\n"
        "        Slot: Lake_Surface (Uses custom shader)\n");

    auto report = convert_package(inputs);
    ASSERT_TRUE(report.ok()) << report.error().full_message();

    // A standard slot keeps the generic shader whatever its name says
    const ConvertedMaterial* plane = report->find("Water_Plane");
    ASSERT_NE(plane, nullptr);
    EXPECT_TRUE(plane->placeholder);
    EXPECT_EQ(report->cache.at("Water_Plane").family, ShaderFamily::Generic);
    EXPECT_EQ(plane->material.family, report->cache.at("Water_Plane").family);
    EXPECT_NE(plane->tres.find("polygon.gdshader"), std::string::npos);

    const ConvertedMaterial* lake = report->find("Lake_Surface");
    ASSERT_NE(lake, nullptr);
    EXPECT_EQ(report->cache.at("Lake_Surface").family, ShaderFamily::Water);
    EXPECT_EQ(lake->material.family, report->cache.at("Lake_Surface").family);
}

TEST(PipelineTest, UnmappableMaterialIsSkipped) {
    auto report = convert_package(sample_inputs());
    ASSERT_TRUE(report.ok());

    EXPECT_EQ(report->find("Empty_Thing"), nullptr);
    EXPECT_TRUE(has_diagnostic(report->diagnostics, DiagnosticKind::MappingError, "Empty_Thing"));
    EXPECT_TRUE(has_diagnostic(report->diagnostics, DiagnosticKind::UnresolvedReference, "Empty_Thing"));
}

TEST(PipelineTest, PrefabsAreLodGrouped) {
    auto report = convert_package(sample_inputs());
    ASSERT_TRUE(report.ok());

    ASSERT_EQ(report->prefabs.size(), 2u);
    EXPECT_EQ(report->prefabs[0].name, "SM_Env_Tree_01");
    ASSERT_EQ(report->prefabs[0].meshes.size(), 2u);
    EXPECT_EQ(report->prefabs[0].meshes[1].lod, 1);
}

TEST(PipelineTest, CorruptPackageFails) {
    ConversionInputs inputs;
    inputs.package_data = {0x1f, 0x8b, 0x08, 0x00, 0x01};

    auto report = convert_package(inputs);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.error().code, Error::Code::Extraction);
}

TEST(PipelineTest, WritesMaterialsAndMapping) {
    auto report = convert_package(sample_inputs());
    ASSERT_TRUE(report.ok());

    Settings settings;
    settings.mapping_file = "mapping.json";

    fs::path out = fs::temp_directory_path() / "matbridge_pipeline_test";
    fs::remove_all(out);
    ASSERT_TRUE(write_report_outputs(report.value(), out, settings).ok());

    EXPECT_TRUE(fs::exists(out / "materials" / "Leaf_Bark_01.tres"));
    EXPECT_TRUE(fs::exists(out / "materials" / "Leaf_Bark_01_LOD1.tres"));
    EXPECT_TRUE(fs::exists(out / "materials" / "Crystal_Mat_01.tres"));
    EXPECT_TRUE(fs::exists(out / "mapping.json"));

    auto tres = read_text_file(out / "materials" / "Rock_01.tres");
    ASSERT_TRUE(tres.ok());
    EXPECT_EQ(tres.value(), report->find("Rock_01")->tres);

    fs::remove_all(out);
}

TEST(PipelineTest, UniqueOutputNamesIgnoreCase) {
    std::map<std::string, int> used;
    EXPECT_EQ(unique_output_name("Rock", used), "Rock");
    EXPECT_EQ(unique_output_name("rock", used), "rock_2");
    EXPECT_EQ(unique_output_name("ROCK", used), "ROCK_3");
    EXPECT_EQ(unique_output_name("Rock_2", used), "Rock_2_2");
    EXPECT_EQ(unique_output_name("Water", used), "Water");
}
