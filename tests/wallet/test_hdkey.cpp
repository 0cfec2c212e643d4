// SEEDORDER - BIP32 Derivation Tests
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include <gtest/gtest.h>

#include "seedorder/core/hex.h"
#include "seedorder/wallet/hdkey.h"

#include <stdexcept>
#include <string>
#include <vector>

namespace seedorder {
namespace test {

using wallet::DerivationPath;
using wallet::ExtendedKey;
using wallet::HARDENED_FLAG;
using wallet::PathComponent;

// ============================================================================
// Path Parsing
// ============================================================================

TEST(PathComponentTest, ParseMarkers) {
    auto plain = PathComponent::FromString("7");
    ASSERT_TRUE(plain.has_value());
    EXPECT_FALSE(plain->hardened);
    EXPECT_EQ(plain->GetFullIndex(), 7u);

    for (const char* text : {"84'", "84h", "84H"}) {
        auto comp = PathComponent::FromString(text);
        ASSERT_TRUE(comp.has_value()) << text;
        EXPECT_TRUE(comp->hardened);
        EXPECT_EQ(comp->GetFullIndex(), 84u | HARDENED_FLAG);
    }
}

TEST(PathComponentTest, RejectsMalformed) {
    EXPECT_FALSE(PathComponent::FromString("").has_value());
    EXPECT_FALSE(PathComponent::FromString("'").has_value());
    EXPECT_FALSE(PathComponent::FromString("-1").has_value());
    EXPECT_FALSE(PathComponent::FromString("1x").has_value());
    EXPECT_FALSE(PathComponent::FromString("2147483648").has_value());
    EXPECT_TRUE(PathComponent::FromString("2147483647").has_value());
}

TEST(DerivationPathTest, ParseAndFormat) {
    auto path = DerivationPath::FromString("m/84'/0h/0H/0/5");
    ASSERT_TRUE(path.has_value());
    EXPECT_EQ(path->Depth(), 5u);
    EXPECT_EQ(path->ToString(), "m/84'/0'/0'/0/5");
}

TEST(DerivationPathTest, MasterOnly) {
    auto path = DerivationPath::FromString("m");
    ASSERT_TRUE(path.has_value());
    EXPECT_TRUE(path->IsEmpty());
    EXPECT_EQ(path->ToString(), "m");
}

TEST(DerivationPathTest, RejectsMalformed) {
    EXPECT_FALSE(DerivationPath::FromString("").has_value());
    EXPECT_FALSE(DerivationPath::FromString("84'/0'/0'").has_value());
    EXPECT_FALSE(DerivationPath::FromString("m/").has_value());
    EXPECT_FALSE(DerivationPath::FromString("m//0").has_value());
    EXPECT_FALSE(DerivationPath::FromString("m0/1").has_value());
    EXPECT_FALSE(DerivationPath::FromString("m/0/").has_value());
}

TEST(DerivationPathTest, ChildAndEquality) {
    DerivationPath base = DerivationPath().HardenedChild(44).HardenedChild(0);
    DerivationPath expected = *DerivationPath::FromString("m/44'/0'/1");
    EXPECT_EQ(base.Child(1), expected);
    EXPECT_NE(base.Child(1, true), expected);
}

// ============================================================================
// BIP32 Test Vector 1
// ============================================================================

class HDKeyVectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        seed_ = HexToBytes("000102030405060708090a0b0c0d0e0f");
    }

    std::vector<Byte> seed_;
};

TEST_F(HDKeyVectorTest, MasterKey) {
    auto master = ExtendedKey::FromSeed(seed_);
    ASSERT_TRUE(master.has_value());
    EXPECT_EQ(master->GetPrivateKey().ToHex(),
              "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35");
    EXPECT_EQ(BytesToHex(master->GetChainCode()),
              "873dff81c02f525623fd1fe5167eac3a55a049de3d314bb42ee227ffed37d508");
    EXPECT_EQ(master->GetPublicKey().ToHex(),
              "0339a36013301597daef41fbe593a02cc513d0b55527ec2df1050e2e8ff49c85c2");
    EXPECT_EQ(master->GetDepth(), 0);
    EXPECT_EQ(master->GetFingerprint(), 0x3442193eu);
}

TEST_F(HDKeyVectorTest, HardenedChild) {
    auto master = ExtendedKey::FromSeed(seed_);
    ASSERT_TRUE(master.has_value());
    auto child = master->DeriveChild(0 | HARDENED_FLAG);
    ASSERT_TRUE(child.has_value());
    EXPECT_EQ(child->GetPrivateKey().ToHex(),
              "edb2e14f9ee77d26dd93b4ecede8d16ed408ce149b6cd80b0715a2d911a0afea");
    EXPECT_EQ(BytesToHex(child->GetChainCode()),
              "47fdacbd0f1097043b78c63c20c34ef4ed9a111d980047ad16282c7ae6236141");
    EXPECT_EQ(child->GetPublicKey().ToHex(),
              "035a784662a4a20a65bf6aab9ae98a6c068a81c52e4b032c0fb5400c706cfccc56");
    EXPECT_EQ(child->GetDepth(), 1);
    EXPECT_EQ(child->GetParentFingerprint(), 0x3442193eu);
    EXPECT_EQ(child->GetChildIndex(), HARDENED_FLAG);
}

TEST_F(HDKeyVectorTest, ParentFingerprintAlongPath) {
    auto master = ExtendedKey::FromSeed(seed_);
    ASSERT_TRUE(master.has_value());
    auto hardened = master->DeriveChild(0 | HARDENED_FLAG);
    ASSERT_TRUE(hardened.has_value());
    EXPECT_EQ(hardened->GetFingerprint(), 0x5c1bd648u);

    auto normal = hardened->DeriveChild(1);
    ASSERT_TRUE(normal.has_value());
    EXPECT_EQ(normal->GetParentFingerprint(), 0x5c1bd648u);

    // Explicitly constructed keys report the fingerprint they were given
    ExtendedKey copy(normal->GetPrivateKey(), normal->GetChainCode(), 2, 0xdeadbeef, 1);
    EXPECT_EQ(copy.GetParentFingerprint(), 0xdeadbeefu);
}

TEST_F(HDKeyVectorTest, NormalChildOfHardened) {
    auto master = ExtendedKey::FromSeed(seed_);
    ASSERT_TRUE(master.has_value());
    auto key = master->DerivePath(*DerivationPath::FromString("m/0'/1"));
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ(key->GetPrivateKey().ToHex(),
              "3c6cb8d0f6a264c91ea8b5030fadaa8e538b020f0a387421a12de9319dc93368");
    EXPECT_EQ(BytesToHex(key->GetChainCode()),
              "2a7857631386ba23dacac34180dd1983734e444fdbf774041578e9b6adb37c19");
    EXPECT_EQ(key->GetPublicKey().ToHex(),
              "03501e454bf00751f24b1b489aa925215d66af2234e3891c3b21a52bedb3cd711c");
    EXPECT_EQ(key->GetDepth(), 2);
}

TEST_F(HDKeyVectorTest, EmptyPathIsIdentity) {
    auto master = ExtendedKey::FromSeed(seed_);
    ASSERT_TRUE(master.has_value());
    auto same = master->DerivePath(DerivationPath());
    ASSERT_TRUE(same.has_value());
    EXPECT_EQ(same->GetPrivateKey().ToHex(), master->GetPrivateKey().ToHex());
}

TEST(HDKeyTest, SeedLengthIsChecked) {
    EXPECT_THROW(ExtendedKey::FromSeed(std::vector<Byte>(15, 1)), std::invalid_argument);
    EXPECT_THROW(ExtendedKey::FromSeed(std::vector<Byte>(65, 1)), std::invalid_argument);
    EXPECT_NO_THROW(ExtendedKey::FromSeed(std::vector<Byte>(64, 1)));
}

} // namespace test
} // namespace seedorder
