/**
 * MatBridge - Tar reader tests
 */

#include "matbridge/tar_reader.hpp"
#include "test_helpers.hpp"
#include <gtest/gtest.h>
#include <array>

using namespace matbridge;
using namespace matbridge::test;

namespace {

std::string entry_text(const TarEntry& entry) {
    return std::string(reinterpret_cast<const char*>(entry.data.data()), entry.data.size());
}

// Rewrites the first header's size field with raw base-256 bytes
void set_binary_size(std::vector<uint8_t>& tar, const std::array<uint8_t, 12>& size) {
    std::copy(size.begin(), size.end(), tar.begin() + 124);

    std::fill(tar.begin() + 148, tar.begin() + 156, static_cast<uint8_t>(' '));
    unsigned sum = 0;
    for (size_t i = 0; i < 512; i++) sum += tar[i];
    char chksum[8];
    std::snprintf(chksum, sizeof(chksum), "%06o", sum);
    std::copy(chksum, chksum + 7, tar.begin() + 148);
}

} // namespace

TEST(TarReaderTest, ReadsMembersInOrder) {
    auto tar = make_tar({
        {"abc/", "", '5'},
        {"abc/asset", "hello", '0'},
        {"abc/pathname", "Assets/Hello.txt", '0'},
    });

    TarReader reader(tar);
    ASSERT_TRUE(reader.parse().ok());
    ASSERT_EQ(reader.entries().size(), 3u);

    EXPECT_TRUE(reader.entries()[0].is_directory());
    EXPECT_EQ(reader.entries()[1].name, "abc/asset");
    EXPECT_TRUE(reader.entries()[1].is_file());
    EXPECT_EQ(entry_text(reader.entries()[1]), "hello");
    EXPECT_EQ(entry_text(reader.entries()[2]), "Assets/Hello.txt");
}

TEST(TarReaderTest, MemberDataSpansBlockBoundaries) {
    std::string big(1300, 'x');
    big[0] = 'a';
    big[1299] = 'z';

    auto tar = make_tar({{"big/asset", big, '0'}, {"big/pathname", "Assets/Big.bin", '0'}});

    TarReader reader(tar);
    ASSERT_TRUE(reader.parse().ok());
    ASSERT_EQ(reader.entries().size(), 2u);
    EXPECT_EQ(entry_text(reader.entries()[0]), big);
    EXPECT_EQ(reader.entries()[1].name, "big/pathname");
}

TEST(TarReaderTest, GnuLongNameAppliesToNextMember) {
    std::string long_name = guid("ab") + "/" + std::string(120, 'n');
    auto tar = make_tar({{long_name, "data", '0'}});

    TarReader reader(tar);
    ASSERT_TRUE(reader.parse().ok());
    ASSERT_EQ(reader.entries().size(), 1u);
    EXPECT_EQ(reader.entries()[0].name, long_name);
}

TEST(TarReaderTest, EmptyArchiveHasNoEntries) {
    std::vector<uint8_t> tar(1024, 0);
    TarReader reader(tar);
    ASSERT_TRUE(reader.parse().ok());
    EXPECT_TRUE(reader.entries().empty());
}

TEST(TarReaderTest, ChecksumMismatchIsExtractionError) {
    auto tar = make_tar({{"abc/asset", "hello", '0'}});
    tar[10] ^= 0x55;   // corrupt the name without fixing the checksum

    TarReader reader(tar);
    auto result = reader.parse();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, Error::Code::Extraction);
}

TEST(TarReaderTest, TruncatedMemberIsExtractionError) {
    auto tar = make_tar({{"abc/asset", std::string(2000, 'q'), '0'}});
    tar.resize(512 + 1024);   // header plus two of four data blocks

    TarReader reader(tar);
    auto result = reader.parse();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, Error::Code::Extraction);
}

TEST(TarReaderTest, BinarySizeField) {
    auto tar = make_tar({{"abc/asset", "hello", '0'}});
    set_binary_size(tar, {0x80, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 5});

    TarReader reader(tar);
    ASSERT_TRUE(reader.parse().ok());
    ASSERT_EQ(reader.entries().size(), 1u);
    EXPECT_EQ(entry_text(reader.entries()[0]), "hello");
}

TEST(TarReaderTest, BinarySizeBeyond64BitsIsExtractionError) {
    // 2^64 + 5 would wrap to 5 if the high bytes were dropped
    auto tar = make_tar({{"abc/asset", "hello", '0'}});
    set_binary_size(tar, {0x80, 0, 0, 1, 0, 0, 0, 0, 0, 0, 0, 5});

    TarReader reader(tar);
    auto result = reader.parse();
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, Error::Code::Extraction);

    set_binary_size(tar, {0x81, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 5});
    TarReader flagged(tar);
    EXPECT_FALSE(flagged.parse().ok());
}

TEST(TarReaderTest, LooksLikeTar) {
    auto tar = make_tar({{"abc/asset", "hello", '0'}});
    EXPECT_TRUE(looks_like_tar(tar));

    std::vector<uint8_t> text(600, 'x');
    EXPECT_FALSE(looks_like_tar(text));

    std::vector<uint8_t> zeros(1024, 0);
    EXPECT_FALSE(looks_like_tar(zeros));

    std::vector<uint8_t> short_input(100, 0);
    EXPECT_FALSE(looks_like_tar(short_input));
}
