// SEEDORDER - Hex and Hash Type Tests
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include <gtest/gtest.h>
#include "seedorder/core/hex.h"
#include "seedorder/core/types.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace seedorder {
namespace test {

// ============================================================================
// Hex Conversion
// ============================================================================

TEST(HexTest, EncodeLowercase) {
    std::vector<uint8_t> data = {0x00, 0x01, 0xab, 0xff};
    EXPECT_EQ(BytesToHex(data), "0001abff");
}

TEST(HexTest, EncodeEmpty) {
    EXPECT_EQ(BytesToHex(std::vector<uint8_t>{}), "");
}

TEST(HexTest, EncodeArray) {
    std::array<uint8_t, 3> data = {0xde, 0xad, 0x01};
    EXPECT_EQ(BytesToHex(data), "dead01");
}

TEST(HexTest, DecodeMixedCase) {
    auto bytes = HexToBytes("DeadBEEF");
    ASSERT_EQ(bytes.size(), 4u);
    EXPECT_EQ(bytes[0], 0xde);
    EXPECT_EQ(bytes[3], 0xef);
}

TEST(HexTest, DecodeRejectsOddLength) {
    EXPECT_THROW(HexToBytes("abc"), std::invalid_argument);
}

TEST(HexTest, DecodeRejectsBadCharacter) {
    EXPECT_THROW(HexToBytes("zz"), std::invalid_argument);
}

TEST(HexTest, IsValidHex) {
    EXPECT_TRUE(IsValidHex("00ff"));
    EXPECT_TRUE(IsValidHex("ABCDEF"));
    EXPECT_FALSE(IsValidHex(""));
    EXPECT_FALSE(IsValidHex("0"));
    EXPECT_FALSE(IsValidHex("0g"));
}

// ============================================================================
// Hash Types
// ============================================================================

TEST(HashTypeTest, DefaultIsNull) {
    Hash256 hash;
    EXPECT_TRUE(hash.IsNull());
    EXPECT_EQ(hash.size(), 32u);
    EXPECT_EQ(Hash160().size(), 20u);
    EXPECT_EQ(Hash512().size(), 64u);
}

TEST(HashTypeTest, HexIsInByteOrder) {
    std::string hex = "751e76e8199196d454941c45d1b3a323f1433bd6";
    Hash160 hash = Hash160::FromHex(hex);
    EXPECT_EQ(hash[0], 0x75);
    EXPECT_EQ(hash[19], 0xd6);
    EXPECT_EQ(hash.ToHex(), hex);
    EXPECT_FALSE(hash.IsNull());
}

TEST(HashTypeTest, FromHexRejectsWrongLength) {
    EXPECT_THROW(Hash160::FromHex("00"), std::invalid_argument);
}

TEST(HashTypeTest, ShortRawInputIsZeroPadded) {
    const Byte raw[2] = {0x01, 0x02};
    Hash256 hash(raw, sizeof(raw));
    EXPECT_EQ(hash[0], 0x01);
    EXPECT_EQ(hash[1], 0x02);
    EXPECT_EQ(hash[2], 0x00);
}

TEST(HashTypeTest, Equality) {
    Hash256 a = Hash256::FromHex(std::string(64, 'a'));
    Hash256 b = Hash256::FromHex(std::string(64, 'a'));
    Hash256 c;
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}

} // namespace test
} // namespace seedorder
