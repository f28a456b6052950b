/**
 * MatBridge - Package extractor tests
 */

#include "matbridge/package_extractor.hpp"
#include "matbridge/files.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <random>

using namespace matbridge;
using namespace matbridge::test;

namespace {

std::string as_text(const std::vector<uint8_t>& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

const std::string MAT_GUID = guid("1a");
const std::string TEX_GUID = guid("2b");
const std::string PREFAB_GUID = guid("3c");

std::vector<PackageAsset> sample_assets() {
    return {
        {MAT_GUID, "Assets/Materials/Leaf_Bark_01.mat", material_yaml({"Leaf_Bark_01"})},
        {TEX_GUID, "Assets/Textures/Leaf_Bark_Albedo.PNG", std::string("\x89PNG fake", 9)},
        {PREFAB_GUID, "Assets/Prefabs/SM_Tree_01.prefab", std::string("prefab")},
    };
}

} // namespace

TEST(PackageExtractorTest, IndexesAssetsByGuid) {
    auto package = make_package(sample_assets());
    auto index = extract_package(bytes(package));
    ASSERT_TRUE(index.ok()) << index.error().full_message();

    ASSERT_NE(index->pathname(MAT_GUID), nullptr);
    EXPECT_EQ(*index->pathname(MAT_GUID), "Assets/Materials/Leaf_Bark_01.mat");
    ASSERT_NE(index->content(MAT_GUID), nullptr);
    EXPECT_NE(as_text(*index->content(MAT_GUID)).find("m_Name: Leaf_Bark_01"), std::string::npos);

    EXPECT_EQ(index->material_guids(), std::vector<std::string>{MAT_GUID});
    EXPECT_EQ(index->material_name(MAT_GUID), "Leaf_Bark_01");
    EXPECT_TRUE(index->diagnostics().empty());
}

TEST(PackageExtractorTest, TexturesAreWrittenToTemporaryStorage) {
    auto package = make_package(sample_assets());
    auto index = extract_package(bytes(package));
    ASSERT_TRUE(index.ok());

    const ExtractedTexture* tex = index->texture(TEX_GUID);
    ASSERT_NE(tex, nullptr);
    EXPECT_EQ(tex->filename, "Leaf_Bark_Albedo.PNG");
    EXPECT_EQ(tex->path.filename().string(), TEX_GUID + ".png");
    EXPECT_TRUE(fs::exists(tex->path));

    auto written = read_file(tex->path);
    ASSERT_TRUE(written.ok());
    EXPECT_EQ(written->size(), 9u);

    ASSERT_NE(index->texture_filename(TEX_GUID), nullptr);
    EXPECT_EQ(*index->texture_filename(TEX_GUID), "Leaf_Bark_Albedo.PNG");
    EXPECT_EQ(index->texture_filename(MAT_GUID), nullptr);
}

TEST(PackageExtractorTest, TemporaryStorageIsRemovedWithIndex) {
    fs::path texture_dir;
    {
        auto package = make_package(sample_assets());
        auto index = extract_package(bytes(package));
        ASSERT_TRUE(index.ok());
        texture_dir = index->texture_directory();
        ASSERT_FALSE(texture_dir.empty());
        EXPECT_TRUE(fs::exists(texture_dir));
    }
    EXPECT_FALSE(fs::exists(texture_dir));
}

TEST(PackageExtractorTest, MemberOrderDoesNotMatter) {
    auto members = package_members(sample_assets());
    auto forward = extract_package(bytes(compress_gzip(make_tar(members))));

    std::reverse(members.begin(), members.end());
    auto reversed = extract_package(bytes(compress_gzip(make_tar(members))));

    std::mt19937 rng(1234);
    std::shuffle(members.begin(), members.end(), rng);
    auto shuffled = extract_package(bytes(compress_gzip(make_tar(members))));

    ASSERT_TRUE(forward.ok());
    ASSERT_TRUE(reversed.ok());
    ASSERT_TRUE(shuffled.ok());

    EXPECT_EQ(forward->pathnames(), reversed->pathnames());
    EXPECT_EQ(forward->pathnames(), shuffled->pathnames());
    EXPECT_EQ(forward->contents(), reversed->contents());
    EXPECT_EQ(forward->contents(), shuffled->contents());
    EXPECT_EQ(reversed->textures().size(), 1u);
}

TEST(PackageExtractorTest, BareTarIsAccepted) {
    auto tar = make_tar(package_members(sample_assets()));
    auto index = extract_package(bytes(tar));
    ASSERT_TRUE(index.ok());
    EXPECT_EQ(index->pathnames().size(), 3u);
}

TEST(PackageExtractorTest, GroupWithoutPathnameIsSkippedWithWarning) {
    auto assets = sample_assets();
    assets.push_back({guid("4d"), std::nullopt, std::string("orphan")});

    auto index = extract_package(bytes(make_package(assets)));
    ASSERT_TRUE(index.ok());
    EXPECT_EQ(index->pathname(guid("4d")), nullptr);
    EXPECT_EQ(index->content(guid("4d")), nullptr);
    ASSERT_EQ(index->diagnostics().size(), 1u);
    EXPECT_EQ(index->diagnostics()[0].kind, DiagnosticKind::Warning);
    EXPECT_EQ(index->diagnostics()[0].subject, guid("4d"));
}

TEST(PackageExtractorTest, MaterialWithoutAssetIsReported) {
    std::vector<PackageAsset> assets = {{guid("5e"), "Assets/Materials/Empty.mat", std::nullopt}};

    auto index = extract_package(bytes(make_package(assets)));
    ASSERT_TRUE(index.ok());
    EXPECT_TRUE(index->material_guids().empty());
    EXPECT_EQ(count_diagnostics(index->diagnostics(), DiagnosticKind::Warning), 1u);
}

TEST(PackageExtractorTest, TextureWriteFailureIsWarning) {
    // The stored file name exceeds NAME_MAX, so this texture cannot be written
    const std::string long_guid(300, 'a');
    auto assets = sample_assets();
    assets.push_back({long_guid, "Assets/Textures/Too_Long.png", std::string("\x89PNG", 4)});

    auto index = extract_package(bytes(make_package(assets)));
    ASSERT_TRUE(index.ok()) << index.error().full_message();

    EXPECT_EQ(index->texture(long_guid), nullptr);
    EXPECT_NE(index->texture(TEX_GUID), nullptr);
    ASSERT_EQ(index->diagnostics().size(), 1u);
    EXPECT_EQ(index->diagnostics()[0].kind, DiagnosticKind::Warning);
    EXPECT_EQ(index->diagnostics()[0].subject, long_guid);
    EXPECT_EQ(count_diagnostics(index->diagnostics(), DiagnosticKind::ExtractionError), 0u);
}

TEST(PackageExtractorTest, OversizedContentIsNotRetained) {
    std::vector<PackageAsset> assets = {
        {guid("6f"), "Assets/Meshes/Big.fbx", std::string(4096, 'm')},
        {MAT_GUID, "Assets/Materials/Leaf_Bark_01.mat", material_yaml({"Leaf_Bark_01"})},
    };

    ExtractOptions options;
    options.content_size_limit = 2048;
    auto index = extract_package(bytes(make_package(assets)), options);
    ASSERT_TRUE(index.ok());

    ASSERT_NE(index->pathname(guid("6f")), nullptr);
    EXPECT_EQ(index->content(guid("6f")), nullptr);
    EXPECT_NE(index->content(MAT_GUID), nullptr);
}

TEST(PackageExtractorTest, ExtensionSummaryIsCaseInsensitive) {
    auto index = extract_package(bytes(make_package(sample_assets())));
    ASSERT_TRUE(index.ok());

    auto summary = index->extension_summary();
    EXPECT_EQ(summary[".mat"], 1u);
    EXPECT_EQ(summary[".png"], 1u);
    EXPECT_EQ(summary[".prefab"], 1u);
}

TEST(PackageExtractorTest, CorruptInputIsExtractionError) {
    std::vector<uint8_t> garbage(2048, 0x42);
    auto index = extract_package(bytes(garbage));
    ASSERT_FALSE(index.ok());
    EXPECT_EQ(index.error().code, Error::Code::Extraction);
}

TEST(PackageExtractorTest, TruncatedGzipIsExtractionError) {
    auto package = make_package(sample_assets());
    package.resize(package.size() / 2);

    auto index = extract_package(bytes(package));
    ASSERT_FALSE(index.ok());
    EXPECT_EQ(index.error().code, Error::Code::Extraction);
}

TEST(PackageExtractorTest, MissingFileIsExtractionError) {
    auto index = extract_package(fs::path("/nonexistent/matbridge/missing.unitypackage"));
    ASSERT_FALSE(index.ok());
    EXPECT_EQ(index.error().code, Error::Code::Extraction);
}

TEST(PackageExtractorTest, TexturePathDetection) {
    EXPECT_TRUE(is_texture_path("Assets/T.png"));
    EXPECT_TRUE(is_texture_path("Assets/T.TGA"));
    EXPECT_TRUE(is_texture_path("Assets/T.jpeg"));
    EXPECT_FALSE(is_texture_path("Assets/T.psd"));
    EXPECT_FALSE(is_texture_path("Assets/png"));
}
