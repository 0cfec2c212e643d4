// SEEDORDER - Address Scheme Tests
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include <gtest/gtest.h>

#include "seedorder/recovery/errors.h"
#include "seedorder/recovery/scheme.h"

#include <array>
#include <string>

namespace seedorder {
namespace test {

using recovery::AddressScheme;
using recovery::SchemeFlags;

namespace {

ErrorCode ResolveError(const SchemeFlags& flags, const std::string& target) {
    try {
        recovery::ResolveScheme(flags, target);
    } catch (const RecoveryError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected RecoveryError for " << target;
    return ErrorCode::InvalidOption;
}

} // namespace

// ============================================================================
// Scheme Table
// ============================================================================

TEST(SchemeTest, Purposes) {
    EXPECT_EQ(recovery::GetSchemeInfo(AddressScheme::Legacy).purpose, 44u);
    EXPECT_EQ(recovery::GetSchemeInfo(AddressScheme::WrappedSegwit).purpose, 49u);
    EXPECT_EQ(recovery::GetSchemeInfo(AddressScheme::NativeSegwit).purpose, 84u);
    EXPECT_STREQ(recovery::SchemeName(AddressScheme::NativeSegwit), "BIP84 (Native SegWit)");
}

TEST(SchemeTest, ProducedAddressTypes) {
    EXPECT_TRUE(recovery::SchemeProducesType(AddressScheme::Legacy, wallet::AddressType::P2PKH));
    EXPECT_TRUE(recovery::SchemeProducesType(AddressScheme::WrappedSegwit,
                                             wallet::AddressType::P2SH));
    EXPECT_FALSE(recovery::SchemeProducesType(AddressScheme::NativeSegwit,
                                              wallet::AddressType::P2TR));
}

// ============================================================================
// Paths
// ============================================================================

TEST(SchemeTest, PathTemplates) {
    EXPECT_EQ(recovery::PathTemplate(AddressScheme::Legacy, 0).ToString(), "m/44'/0'/0'/0/0");
    EXPECT_EQ(recovery::PathTemplate(AddressScheme::WrappedSegwit, 3).ToString(),
              "m/49'/0'/0'/0/3");
    EXPECT_EQ(recovery::PathTemplate(AddressScheme::NativeSegwit, 7).ToString(),
              "m/84'/0'/0'/0/7");
}

TEST(SchemeTest, PathTemplateRejectsHardenedRange) {
    try {
        recovery::PathTemplate(AddressScheme::Legacy, 0x80000000u);
        FAIL() << "expected InvalidPath";
    } catch (const RecoveryError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::InvalidPath);
    }
}

TEST(SchemeTest, ParsePath) {
    EXPECT_EQ(recovery::ParsePath("m/84h/0h/0h/0/0"),
              recovery::PathTemplate(AddressScheme::NativeSegwit, 0));
    EXPECT_THROW(recovery::ParsePath("84'/0'"), RecoveryError);
}

// ============================================================================
// Resolution
// ============================================================================

TEST(SchemeTest, FlagSelectsScheme) {
    SchemeFlags flags;
    flags.bip49 = true;
    auto result = recovery::ResolveScheme(flags, "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    EXPECT_EQ(result.scheme, AddressScheme::WrappedSegwit);
    EXPECT_FALSE(result.autoDetected);
}

TEST(SchemeTest, PrefixDetection) {
    SchemeFlags none;
    auto native = recovery::ResolveScheme(none, "bc1qcr8te4kr609gcawutmrza0j4xv80jy8z306fyu");
    EXPECT_EQ(native.scheme, AddressScheme::NativeSegwit);
    EXPECT_TRUE(native.autoDetected);

    EXPECT_EQ(recovery::ResolveScheme(none, "37VucYSaXLCAsxYyAPfbSi9eh4iEcbShgf").scheme,
              AddressScheme::WrappedSegwit);
    EXPECT_EQ(recovery::ResolveScheme(none, "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA").scheme,
              AddressScheme::Legacy);
}

TEST(SchemeTest, UppercaseBech32IsAmbiguous) {
    SchemeFlags none;
    EXPECT_EQ(ResolveError(none, "BC1QCR8TE4KR609GCAWUTMRZA0J4XV80JY8Z306FYU"),
              ErrorCode::AmbiguousScheme);
}

TEST(SchemeTest, ConflictingFlags) {
    SchemeFlags flags;
    flags.bip44 = true;
    flags.bip84 = true;
    EXPECT_EQ(flags.Count(), 2u);
    EXPECT_EQ(ResolveError(flags, "1LqBGSKuX5yYUonjxT5qGfpUsXKYYWeabA"),
              ErrorCode::ConflictingSchemes);
}

TEST(SchemeTest, AmbiguousMessage) {
    try {
        recovery::ResolveScheme(SchemeFlags(), "xyz");
        FAIL() << "expected AmbiguousScheme";
    } catch (const RecoveryError& e) {
        EXPECT_STREQ(e.what(), "Cannot auto-detect address type. "
                               "Please specify --bip44, --bip49, or --bip84");
    }
}

TEST(SchemeTest, AutoDetectMessages) {
    EXPECT_EQ(recovery::AutoDetectMessage(AddressScheme::NativeSegwit),
              "Auto-detected BIP84 (Native SegWit) address");
    EXPECT_EQ(recovery::AutoDetectMessage(AddressScheme::Legacy),
              "Auto-detected BIP44 (Legacy) address");
}

// ============================================================================
// Encoding
// ============================================================================

TEST(SchemeTest, EncodeForEachScheme) {
    std::array<uint8_t, 32> raw{};
    raw[31] = 1;
    auto key = PrivateKey::FromBytes(raw.data());
    ASSERT_TRUE(key.has_value());
    PublicKey pub = key->GetPublicKey();

    EXPECT_EQ(recovery::EncodeSchemeAddress(AddressScheme::Legacy, pub),
              "1BgGZ9tcN4rm9KBzDn7KprQz87SZ26SAMH");
    EXPECT_EQ(recovery::EncodeSchemeAddress(AddressScheme::NativeSegwit, pub),
              "bc1qw508d6qejxtdg4y5r3zarvary0c5xw7kv8f3t4");
    EXPECT_EQ(recovery::EncodeSchemeAddress(AddressScheme::WrappedSegwit, pub)[0], '3');
}

} // namespace test
} // namespace seedorder
