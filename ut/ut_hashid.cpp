#include <stg/object/hashid.h>

#include <gtest/gtest.h>

#include <sstream>

using namespace Stg;

static constexpr std::string_view STR_TEST = "test";
static constexpr std::string_view STR_HEX_ID = "30d74d258442c7c65512eafab474568dd706c430";

TEST(HashId, Make) {
    EXPECT_EQ(HashId::Make(DataType::Blob, "").ToHex(), "e69de29bb2d1d6434b8b29ae775ad8c2e48c5391");
    EXPECT_EQ(HashId::Make(DataType::Blob, STR_TEST).ToHex(), STR_HEX_ID);
    EXPECT_EQ(HashId::Make(DataType::Tree, "").ToHex(), "4b825dc642cb6eb9a060e54bf8d69288fbee4904");

    // Type is a part of the hash.
    EXPECT_NE(HashId::Make(DataType::Blob, STR_TEST), HashId::Make(DataType::Commit, STR_TEST));
    EXPECT_THROW(HashId::Make(DataType::None, STR_TEST), std::invalid_argument);
}

TEST(HashId, Empty) {
    EXPECT_EQ(HashId().ToHex(), "0000000000000000000000000000000000000000");
    EXPECT_FALSE(bool(HashId()));
    EXPECT_TRUE(bool(HashId::FromHex(STR_HEX_ID)));
}

TEST(HashId, FromBytes) {
    constexpr unsigned char data[20] = {1, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 0, 255};
    constexpr std::string_view hex = "01000000000000000000000000000000000000ff";

    // Range of raw bytes.
    EXPECT_EQ(HashId::FromBytes(data, sizeof(data)).ToHex(), hex);
    // String of raw bytes.
    EXPECT_EQ(
        HashId::FromBytes(std::string_view(reinterpret_cast<const char*>(data), sizeof(data))).ToHex(), hex
    );
    // Fixed size array of raw bytes.
    EXPECT_EQ(HashId::FromBytes(data).ToHex(), hex);

    EXPECT_THROW(HashId::FromBytes(data, 19), std::invalid_argument);
}

TEST(HashId, FromHex) {
    EXPECT_EQ(HashId::Make(DataType::Blob, STR_TEST), HashId::FromHex(STR_HEX_ID));
    EXPECT_EQ(HashId::FromHex(STR_HEX_ID).ToHex(), STR_HEX_ID);
    EXPECT_EQ(HashId::FromHex("30D74D258442C7C65512EAFAB474568DD706C430").ToHex(), STR_HEX_ID);

    EXPECT_THROW(HashId::FromHex("30d74d"), std::invalid_argument);
    EXPECT_THROW(HashId::FromHex("x0d74d258442c7c65512eafab474568dd706c430"), std::invalid_argument);
}

TEST(HashId, IsHex) {
    EXPECT_TRUE(HashId::IsHex("a94a8fe5ccb19ba61c4c0873d391e987982fbbd3"));
    EXPECT_TRUE(HashId::IsHex("a94A8fe5ccb19ba61c4c0873D391e987982fbbd3"));

    EXPECT_FALSE(HashId::IsHex("a94A8fe5ccb19ba61c4c0873D391e987982fbbdz"));
    EXPECT_FALSE(HashId::IsHex("x94a8fe5ccb19ba61c4c0873d391e987982fbbd3"));
    EXPECT_FALSE(HashId::IsHex("a94a8fe5ccb19ba61c"));
    EXPECT_FALSE(HashId::IsHex(""));
}

TEST(HashId, IsHexPrefix) {
    EXPECT_TRUE(HashId::IsHexPrefix("30d7"));
    EXPECT_TRUE(HashId::IsHexPrefix("30D74d2"));
    EXPECT_TRUE(HashId::IsHexPrefix(STR_HEX_ID));
    EXPECT_TRUE(HashId::IsHexPrefix("3", 1));

    EXPECT_FALSE(HashId::IsHexPrefix("30d"));
    EXPECT_FALSE(HashId::IsHexPrefix("30dz"));
    EXPECT_FALSE(HashId::IsHexPrefix("p0p1"));
    EXPECT_FALSE(HashId::IsHexPrefix(std::string(STR_HEX_ID) + "0"));
    EXPECT_FALSE(HashId::IsHexPrefix("", 0));
}

TEST(HashId, HasPrefix) {
    const auto id = HashId::FromHex(STR_HEX_ID);

    EXPECT_TRUE(id.HasPrefix(""));
    EXPECT_TRUE(id.HasPrefix("30d7"));
    EXPECT_TRUE(id.HasPrefix("30D74D25"));
    EXPECT_TRUE(id.HasPrefix(STR_HEX_ID));

    EXPECT_FALSE(id.HasPrefix("30d8"));
    EXPECT_FALSE(id.HasPrefix(std::string(STR_HEX_ID) + "0"));
}

TEST(HashId, ToShortHex) {
    const auto id = HashId::FromHex(STR_HEX_ID);

    EXPECT_EQ(id.ToShortHex(7), "30d74d2");
    EXPECT_EQ(id.ToShortHex(12), "30d74d258442");
    // Clamped to the valid range.
    EXPECT_EQ(id.ToShortHex(0), "30d7");
    EXPECT_EQ(id.ToShortHex(100), STR_HEX_ID);
}

TEST(HashId, FmtOutput) {
    EXPECT_EQ(fmt::format("{}", HashId::FromHex(STR_HEX_ID)), STR_HEX_ID);
}

TEST(HashId, StreamOutput) {
    std::stringstream ss;

    ss << HashId::FromHex(STR_HEX_ID);

    EXPECT_EQ(ss.str(), STR_HEX_ID);
}
