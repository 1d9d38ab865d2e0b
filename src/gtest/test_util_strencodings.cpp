#include <gtest/gtest.h>

#include "uint256.h"
#include "utilstrencodings.h"

#include <stdexcept>

TEST(StrEncodings, ParseHex) {
    std::vector<unsigned char> expected = {0x04, 0x67, 0x8a, 0xfd, 0xb0};
    EXPECT_EQ(ParseHex("04678afdb0"), expected);
    // Spaces between bytes are allowed; parsing stops at a stray nibble.
    EXPECT_EQ(ParseHex("04 67 8a fd b0"), expected);
    EXPECT_EQ(ParseHex("04678afdb0f"), expected);
    EXPECT_TRUE(ParseHex("").empty());
}

TEST(StrEncodings, IsHex) {
    EXPECT_TRUE(IsHex("00"));
    EXPECT_TRUE(IsHex("ffAB12"));
    EXPECT_FALSE(IsHex(""));
    EXPECT_FALSE(IsHex("0"));
    EXPECT_FALSE(IsHex("0x00"));
    EXPECT_FALSE(IsHex("eleven"));
}

TEST(StrEncodings, HexStr) {
    std::vector<unsigned char> vch = {0x04, 0x67, 0x8a};
    EXPECT_EQ(HexStr(vch), "04678a");
    EXPECT_EQ(HexStr(vch, true), "04 67 8a");
    EXPECT_EQ(HexStr(vch.begin(), vch.begin()), "");
}

TEST(StrEncodings, ParseUInt32) {
    uint32_t n;
    EXPECT_TRUE(ParseUInt32("1234", &n));
    EXPECT_EQ(n, 1234u);
    EXPECT_TRUE(ParseUInt32("4294967295", &n));
    EXPECT_EQ(n, 4294967295u);
    EXPECT_FALSE(ParseUInt32("4294967296", nullptr));
    EXPECT_FALSE(ParseUInt32("-1", nullptr));
    EXPECT_FALSE(ParseUInt32(" 1", nullptr));
    EXPECT_FALSE(ParseUInt32("1a", nullptr));
    EXPECT_FALSE(ParseUInt32("", nullptr));
}

TEST(StrEncodings, ParseUInt32OrHex) {
    uint32_t n;
    EXPECT_TRUE(ParseUInt32OrHex("0x76b809bb", &n));
    EXPECT_EQ(n, 0x76b809bbu);
    EXPECT_TRUE(ParseUInt32OrHex("0X5BA81B19", &n));
    EXPECT_EQ(n, 0x5ba81b19u);
    EXPECT_TRUE(ParseUInt32OrHex("4", &n));
    EXPECT_EQ(n, 4u);
    EXPECT_FALSE(ParseUInt32OrHex("0x", nullptr));
    EXPECT_FALSE(ParseUInt32OrHex("0x123456789", nullptr));
    EXPECT_FALSE(ParseUInt32OrHex("0xzz", nullptr));
}

TEST(StrEncodings, ParseUInt64) {
    uint64_t n;
    EXPECT_TRUE(ParseUInt64("18446744073709551615", &n));
    EXPECT_EQ(n, 18446744073709551615ULL);
    EXPECT_FALSE(ParseUInt64("18446744073709551616", nullptr));
    EXPECT_FALSE(ParseUInt64("-5", nullptr));
}

TEST(Uint256, HexIsReversed) {
    std::vector<unsigned char> vch(32, 0);
    vch[0] = 0x01;
    vch[31] = 0xff;
    uint256 h(vch);
    EXPECT_EQ(h.GetHex(), "ff00000000000000000000000000000000000000000000000000000000000001");
    EXPECT_EQ(uint256S(h.GetHex()), h);
    EXPECT_FALSE(h.IsNull());
    h.SetNull();
    EXPECT_TRUE(h.IsNull());
}

TEST(Uint256, RejectsWrongLength) {
    EXPECT_THROW(uint256(std::vector<unsigned char>(31, 0)), std::invalid_argument);
    EXPECT_THROW(uint160(std::vector<unsigned char>(32, 0)), std::invalid_argument);
}
