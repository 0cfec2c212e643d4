// SEEDORDER - secp256k1 and Key Tests
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include <gtest/gtest.h>
#include "seedorder/core/hex.h"
#include "seedorder/crypto/keys.h"
#include "seedorder/crypto/secp256k1.h"

#include <array>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace seedorder {
namespace test {

namespace {

std::array<uint8_t, 32> Scalar(const std::string& hex) {
    auto bytes = HexToBytes(hex);
    std::array<uint8_t, 32> out{};
    std::copy(bytes.begin(), bytes.end(), out.begin() + (32 - bytes.size()));
    return out;
}

const char* const ORDER_HEX =
    "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141";
const char* const ORDER_MINUS_ONE_HEX =
    "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364140";
const char* const G_COMPRESSED =
    "0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798";

} // namespace

// ============================================================================
// Scalar Validity
// ============================================================================

TEST(Secp256k1Test, CurveOrderConstant) {
    EXPECT_EQ(BytesToHex(secp256k1::CURVE_ORDER), ORDER_HEX);
}

TEST(Secp256k1Test, PrivateKeyRange) {
    EXPECT_FALSE(secp256k1::IsValidPrivateKey(Scalar("00").data()));
    EXPECT_TRUE(secp256k1::IsValidPrivateKey(Scalar("01").data()));
    EXPECT_TRUE(secp256k1::IsValidPrivateKey(Scalar(ORDER_MINUS_ONE_HEX).data()));
    EXPECT_FALSE(secp256k1::IsValidPrivateKey(Scalar(ORDER_HEX).data()));
    EXPECT_FALSE(secp256k1::IsValidPrivateKey(Scalar(std::string(64, 'f')).data()));
}

// ============================================================================
// Public Keys
// ============================================================================

TEST(Secp256k1Test, PublicKeyOfOneIsGenerator) {
    std::array<uint8_t, secp256k1::COMPRESSED_SIZE> out{};
    ASSERT_TRUE(secp256k1::ComputePublicKey(Scalar("01").data(), out));
    EXPECT_EQ(BytesToHex(out), G_COMPRESSED);
}

TEST(Secp256k1Test, PublicKeyOfOrderMinusOneIsNegatedGenerator) {
    std::array<uint8_t, secp256k1::COMPRESSED_SIZE> out{};
    ASSERT_TRUE(secp256k1::ComputePublicKey(Scalar(ORDER_MINUS_ONE_HEX).data(), out));
    EXPECT_EQ(BytesToHex(out),
              "0379be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
}

TEST(Secp256k1Test, PublicKeyRejectsZero) {
    std::array<uint8_t, secp256k1::COMPRESSED_SIZE> out{};
    EXPECT_FALSE(secp256k1::ComputePublicKey(Scalar("00").data(), out));
}

// ============================================================================
// Tweak Add
// ============================================================================

TEST(Secp256k1Test, TweakAddOnePlusOne) {
    std::array<uint8_t, secp256k1::SCALAR_SIZE> out{};
    ASSERT_TRUE(secp256k1::PrivateKeyTweakAdd(Scalar("01").data(), Scalar("01").data(), out));
    EXPECT_EQ(BytesToHex(out), BytesToHex(Scalar("02")));
}

TEST(Secp256k1Test, TweakAddWrapsModOrder) {
    std::array<uint8_t, secp256k1::SCALAR_SIZE> out{};
    ASSERT_TRUE(secp256k1::PrivateKeyTweakAdd(Scalar(ORDER_MINUS_ONE_HEX).data(),
                                              Scalar("02").data(), out));
    EXPECT_EQ(BytesToHex(out), BytesToHex(Scalar("01")));
}

TEST(Secp256k1Test, TweakAddRejectsZeroResult) {
    std::array<uint8_t, secp256k1::SCALAR_SIZE> out{};
    EXPECT_FALSE(secp256k1::PrivateKeyTweakAdd(Scalar("01").data(),
                                               Scalar(ORDER_MINUS_ONE_HEX).data(), out));
}

TEST(Secp256k1Test, TweakAddRejectsTweakAtOrder) {
    std::array<uint8_t, secp256k1::SCALAR_SIZE> out{};
    EXPECT_FALSE(secp256k1::PrivateKeyTweakAdd(Scalar("01").data(),
                                               Scalar(ORDER_HEX).data(), out));
}

// ============================================================================
// Key Classes
// ============================================================================

TEST(KeysTest, FromBytesValidatesRange) {
    EXPECT_FALSE(PrivateKey::FromBytes(Scalar("00").data()).has_value());
    EXPECT_FALSE(PrivateKey::FromBytes(Scalar(ORDER_HEX).data()).has_value());
    EXPECT_TRUE(PrivateKey::FromBytes(Scalar("01").data()).has_value());
}

TEST(KeysTest, PublicKeyAndHash160) {
    auto key = PrivateKey::FromBytes(Scalar("01").data());
    ASSERT_TRUE(key.has_value());
    PublicKey pub = key->GetPublicKey();
    EXPECT_TRUE(pub.IsValid());
    EXPECT_EQ(pub.ToHex(), G_COMPRESSED);
    EXPECT_EQ(pub.GetHash160().ToHex(), "751e76e8199196d454941c45d1b3a323f1433bd6");
}

TEST(KeysTest, DefaultPublicKeyIsInvalid) {
    EXPECT_FALSE(PublicKey().IsValid());
}

TEST(KeysTest, TweakAddProducesSum) {
    auto key = PrivateKey::FromBytes(Scalar("01").data());
    ASSERT_TRUE(key.has_value());
    auto child = key->TweakAdd(Scalar("01").data());
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->ToHex(), BytesToHex(Scalar("02")));
    EXPECT_EQ(child->GetPublicKey().ToHex(),
              "02c6047f9441ed7d6d3045406e95c07cd85c778e4b8cef3ca7abac09b95c709ee5");
}

TEST(KeysTest, TweakAddRejectsOverflowTweak) {
    auto key = PrivateKey::FromBytes(Scalar("05").data());
    ASSERT_TRUE(key.has_value());
    EXPECT_FALSE(key->TweakAdd(Scalar(ORDER_HEX).data()).has_value());
}

} // namespace test
} // namespace seedorder
