/**
 * MatBridge - Material parser tests
 */

#include "matbridge/material_parser.hpp"
#include "matbridge/package_extractor.hpp"
#include "matbridge/shader_classifier.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <cmath>

using namespace matbridge;
using namespace matbridge::test;

namespace {

const std::string POLYGON_LIT = "0730dae39bc73f34796280af9875ce14";
const std::string FOLIAGE = "9b98a126c8d4d7a4baeb81b16e4f7b97";

} // namespace

TEST(MaterialParserTest, ReadsNameShaderAndProperties) {
    std::string yaml = material_yaml({
        "Leaf_Bark_01",
        FOLIAGE,
        {{"_Leaf_Texture", guid("a1")}, {"_Trunk_Texture", guid("b2")}},
        {{"_Leaf_Smoothness", "0.25"}, {"_Enable_Breeze", "1"}},
        {{"_Leaf_Base_Color", "{r: 0.2, g: 0.6, b: 0.1, a: 1}"}},
    });

    auto record = parse_material(yaml, "guid-1");
    ASSERT_TRUE(record.ok()) << record.error().full_message();

    EXPECT_EQ(record->name, "Leaf_Bark_01");
    EXPECT_EQ(record->source_id, "guid-1");
    EXPECT_EQ(record->shader.guid, FOLIAGE);
    ASSERT_TRUE(record->shader.resolved());
    EXPECT_EQ(*record->shader.shader_name, "Synty/Foliage");

    ASSERT_EQ(record->textures.size(), 2u);
    EXPECT_EQ(record->textures[0].first, "_Leaf_Texture");
    EXPECT_EQ(record->textures[0].second.texture_id, guid("a1"));
    EXPECT_EQ(record->textures[1].first, "_Trunk_Texture");

    EXPECT_FLOAT_EQ(record->floats.at("_Leaf_Smoothness"), 0.25f);
    EXPECT_FLOAT_EQ(record->floats.at("_Enable_Breeze"), 1.0f);

    const glm::vec4& color = record->colors.at("_Leaf_Base_Color");
    EXPECT_FLOAT_EQ(color.g, 0.6f);
    EXPECT_FLOAT_EQ(color.a, 1.0f);
}

TEST(MaterialParserTest, ReadsTextureScaleAndOffset) {
    std::string yaml =
        "--- !u!21 &2100000\n"
        "Material:\n"
        "  m_Name: Tiled\n"
        "  m_Shader: {fileID: 4800000, guid: " + POLYGON_LIT + ", type: 3}\n"
        "  m_SavedProperties:\n"
        "    m_TexEnvs:\n"
        "    - _Base_Texture:\n"
        "        m_Texture: {fileID: 2800000, guid: " + guid("c3") + ", type: 3}\n"
        "        m_Scale: {x: 4, y: 2}\n"
        "        m_Offset: {x: 0.5, y: 0}\n";

    auto record = parse_material(yaml);
    ASSERT_TRUE(record.ok()) << record.error().full_message();

    const TextureSlot* slot = record->find_texture("_Base_Texture");
    ASSERT_NE(slot, nullptr);
    EXPECT_FLOAT_EQ(slot->scale.x, 4.0f);
    EXPECT_FLOAT_EQ(slot->scale.y, 2.0f);
    EXPECT_FLOAT_EQ(slot->offset.x, 0.5f);
}

TEST(MaterialParserTest, LegacyFirstSecondForm) {
    std::string yaml =
        "--- !u!21 &2100000\n"
        "Material:\n"
        "  m_Name: Old_Rock\n"
        "  m_Shader: {fileID: 46, guid: 0000000000000000f000000000000000, type: 0}\n"
        "  m_SavedProperties:\n"
        "    serializedVersion: 2\n"
        "    m_TexEnvs:\n"
        "    - first:\n"
        "        name: _MainTex\n"
        "      second:\n"
        "        m_Texture: {fileID: 2800000, guid: " + guid("d4") + ", type: 3}\n"
        "        m_Scale: {x: 1, y: 1}\n"
        "        m_Offset: {x: 0, y: 0}\n"
        "    m_Floats:\n"
        "    - first:\n"
        "        name: _Glossiness\n"
        "      second: 0.3\n"
        "    m_Colors:\n"
        "    - first:\n"
        "        name: _Color\n"
        "      second: {r: 0.5, g: 0.4, b: 0.3, a: 1}\n";

    auto record = parse_material(yaml);
    ASSERT_TRUE(record.ok()) << record.error().full_message();

    EXPECT_EQ(record->name, "Old_Rock");
    ASSERT_NE(record->find_texture("_MainTex"), nullptr);
    EXPECT_EQ(record->find_texture("_MainTex")->texture_id, guid("d4"));
    ASSERT_TRUE(record->find_float("_Glossiness").has_value());
    EXPECT_FLOAT_EQ(*record->find_float("_Glossiness"), 0.3f);
    EXPECT_FLOAT_EQ(record->colors.at("_Color").r, 0.5f);
    EXPECT_EQ(*record->shader.shader_name, "Unity/BuiltIn");
}

TEST(MaterialParserTest, EmptyAndNullTexturesAreSkipped) {
    std::string yaml = material_yaml({
        "Sparse",
        POLYGON_LIT,
        {{"_Base_Texture", guid("e5")}, {"_Emission_Texture", "00000000000000000000000000000000"}},
        {},
        {},
    });
    yaml.insert(yaml.find("    m_Ints"),
                "    - _Normal_Texture:\n"
                "        m_Texture: {fileID: 0}\n"
                "        m_Scale: {x: 1, y: 1}\n"
                "        m_Offset: {x: 0, y: 0}\n");

    auto record = parse_material(yaml);
    ASSERT_TRUE(record.ok()) << record.error().full_message();
    ASSERT_EQ(record->textures.size(), 1u);
    EXPECT_EQ(record->textures[0].first, "_Base_Texture");
}

TEST(MaterialParserTest, ZeroShaderGuidIsEmptyReference) {
    auto record = parse_material(material_yaml({"NoShader"}));
    ASSERT_TRUE(record.ok());
    EXPECT_TRUE(record->shader.empty());
    EXPECT_FALSE(record->shader.resolved());

    std::string yaml = material_yaml({"ZeroShader", "00000000000000000000000000000000"});
    auto zero = parse_material(yaml);
    ASSERT_TRUE(zero.ok());
    EXPECT_TRUE(zero->shader.empty());
}

TEST(MaterialParserTest, UnknownShaderGuidStaysUnresolved) {
    auto record = parse_material(material_yaml({"Custom", guid("F7")}));
    ASSERT_TRUE(record.ok());
    EXPECT_EQ(record->shader.guid, guid("f7"));
    EXPECT_FALSE(record->shader.resolved());
}

TEST(MaterialParserTest, MissingNameIsError) {
    std::string yaml = material_yaml({"X"});
    yaml.replace(yaml.find("m_Name: X"), 9, "m_Name: ");

    auto record = parse_material(yaml, "guid-2");
    ASSERT_FALSE(record.ok());
    EXPECT_EQ(record.error().code, Error::Code::MaterialParse);
    EXPECT_EQ(record.error().context, "guid-2");
}

TEST(MaterialParserTest, NonMaterialDocumentIsError) {
    auto record = parse_material("--- !u!1 &1\nGameObject:\n  m_Name: Tree\n");
    ASSERT_FALSE(record.ok());
    EXPECT_EQ(record.error().code, Error::Code::MaterialParse);
}

TEST(MaterialParserTest, MalformedYamlIsError) {
    auto record = parse_material("Material:\n  m_Name: A\n  m_Shader: {fileID: 0\n");
    ASSERT_FALSE(record.ok());
    EXPECT_EQ(record.error().code, Error::Code::MaterialParse);
}

TEST(MaterialParserTest, ByteOrderMarkIsIgnored) {
    auto record = parse_material("\xEF\xBB\xBF" + material_yaml({"Bom"}));
    ASSERT_TRUE(record.ok()) << record.error().full_message();
    EXPECT_EQ(record->name, "Bom");
}

TEST(MaterialParserTest, ColorsAreClamped) {
    auto record = parse_material(material_yaml({
        "Bright",
        "",
        {},
        {},
        {{"_Color", "{r: 1.5, g: -0.2, b: 0.5, a: 2}"},
         {"_Emission_Color", "{r: 4, g: 2.5, b: -1, a: 3}"}},
    }));
    ASSERT_TRUE(record.ok());

    const glm::vec4& color = record->colors.at("_Color");
    EXPECT_FLOAT_EQ(color.r, 1.0f);
    EXPECT_FLOAT_EQ(color.g, 0.0f);
    EXPECT_FLOAT_EQ(color.b, 0.5f);
    EXPECT_FLOAT_EQ(color.a, 1.0f);

    const glm::vec4& emission = record->colors.at("_Emission_Color");
    EXPECT_FLOAT_EQ(emission.r, 4.0f);
    EXPECT_FLOAT_EQ(emission.g, 2.5f);
    EXPECT_FLOAT_EQ(emission.b, 0.0f);
    EXPECT_FLOAT_EQ(emission.a, 1.0f);
}

TEST(MaterialParserTest, ClampKeepsValuesWithinTolerance) {
    EXPECT_FLOAT_EQ(clamp_color_channel(1.00005f, false), 1.00005f);
    EXPECT_FLOAT_EQ(clamp_color_channel(1.01f, false), 1.0f);
    EXPECT_FLOAT_EQ(clamp_color_channel(-0.5f, true), 0.0f);
    EXPECT_FLOAT_EQ(clamp_color_channel(8.0f, true), 8.0f);
}

TEST(MaterialParserTest, BatchIsolatesFailures) {
    std::vector<PackageAsset> assets = {
        {guid("01"), "Assets/Materials/Good_A.mat", material_yaml({"Good_A", POLYGON_LIT, {{"_Base_Texture", guid("aa")}}})},
        {guid("02"), "Assets/Materials/Broken.mat", std::string("Material:\n  m_Shader: {fileID: 0}\n")},
        {guid("03"), "Assets/Materials/Good_B.mat", material_yaml({"Good_B", FOLIAGE})},
        {guid("04"), "Assets/Materials/Mystery.mat", material_yaml({"Mystery", guid("9e")})},
    };

    auto package = make_package(assets);
    auto index = extract_package(bytes(package));
    ASSERT_TRUE(index.ok());

    MaterialBatch batch = parse_package_materials(index.value());
    ASSERT_EQ(batch.records.size(), 3u);

    EXPECT_EQ(count_diagnostics(batch.diagnostics, DiagnosticKind::MaterialParseError), 1u);
    EXPECT_EQ(count_diagnostics(batch.diagnostics, DiagnosticKind::UnresolvedReference), 1u);

    for (const auto& d : batch.diagnostics) {
        if (d.kind == DiagnosticKind::MaterialParseError) {
            EXPECT_EQ(d.subject, "Assets/Materials/Broken.mat");
        }
    }
    EXPECT_EQ(batch.records[0].source_id, guid("01"));
}

TEST(MaterialParserTest, ShaderResolvedFromPackagePathname) {
    const std::string shader_guid = guid("5a");
    std::vector<PackageAsset> assets = {
        {shader_guid, "Assets/Shaders/Custom_Water.shadergraph", std::string("{}")},
        {guid("06"), "Assets/Materials/Pond.mat", material_yaml({"Pond", shader_guid})},
    };

    auto package = make_package(assets);
    auto index = extract_package(bytes(package));
    ASSERT_TRUE(index.ok());

    MaterialBatch batch = parse_package_materials(index.value());
    ASSERT_EQ(batch.records.size(), 1u);
    ASSERT_TRUE(batch.records[0].shader.resolved());
    EXPECT_EQ(*batch.records[0].shader.shader_name, "Custom_Water");
    EXPECT_TRUE(batch.diagnostics.empty());
}

TEST(MaterialParserTest, PackageShaderStemSelectsFamily) {
    const std::string shader_guid = guid("5b");
    std::vector<PackageAsset> assets = {
        {shader_guid, "Assets/Shaders/Foliage.shader", std::string("Shader \"Foliage\" {}")},
        {guid("07"), "Assets/Materials/Hedge.mat", material_yaml({"Hedge", shader_guid})},
    };

    auto package = make_package(assets);
    auto index = extract_package(bytes(package));
    ASSERT_TRUE(index.ok());

    MaterialBatch batch = parse_package_materials(index.value());
    ASSERT_EQ(batch.records.size(), 1u);
    ShaderDecision decision = classify(batch.records[0]);
    EXPECT_EQ(decision.family, ShaderFamily::Vegetation);
    EXPECT_EQ(decision.basis, DecisionBasis::ExplicitReference);
}
