// SEEDORDER - SHA256 and RIPEMD160 Tests
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include <gtest/gtest.h>
#include "seedorder/core/hex.h"
#include "seedorder/core/types.h"
#include "seedorder/crypto/ripemd160.h"
#include "seedorder/crypto/sha256.h"

#include <string>
#include <vector>

namespace seedorder {
namespace test {

namespace {

std::vector<Byte> Bytes(const std::string& str) {
    return std::vector<Byte>(str.begin(), str.end());
}

} // namespace

// ============================================================================
// SHA256
// ============================================================================

TEST(SHA256Test, OutputSizeIs32Bytes) {
    EXPECT_EQ(SHA256::OUTPUT_SIZE, 32u);
}

TEST(SHA256Test, EmptyString) {
    EXPECT_EQ(SHA256Hash(Bytes("")).ToHex(),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, Abc) {
    EXPECT_EQ(SHA256Hash(Bytes("abc")).ToHex(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(SHA256Test, TwoBlockMessage) {
    EXPECT_EQ(SHA256Hash(Bytes("abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq")).ToHex(),
              "248d6a61d20638b8e5c026930c3e6039a33ce45964ff2167f6ecedd419db06c1");
}

TEST(SHA256Test, IncrementalMatchesOneShot) {
    std::string msg = "abcdbcdecdefdefgefghfghighijhijkijkljklmklmnlmnomnopnopq";
    SHA256 hasher;
    hasher.Write(reinterpret_cast<const Byte*>(msg.data()), 10)
          .Write(reinterpret_cast<const Byte*>(msg.data()) + 10, msg.size() - 10);
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(BytesToHex(out, sizeof(out)), SHA256Hash(Bytes(msg)).ToHex());
}

TEST(SHA256Test, FinalizeResetsState) {
    SHA256 hasher;
    Byte first[SHA256::OUTPUT_SIZE];
    Byte second[SHA256::OUTPUT_SIZE];
    auto abc = Bytes("abc");
    hasher.Write(abc.data(), abc.size()).Finalize(first);
    hasher.Write(abc.data(), abc.size()).Finalize(second);
    EXPECT_EQ(BytesToHex(first, sizeof(first)), BytesToHex(second, sizeof(second)));
}

TEST(SHA256Test, ResetDiscardsInput) {
    SHA256 hasher;
    auto junk = Bytes("junk");
    hasher.Write(junk.data(), junk.size()).Reset();
    Byte out[SHA256::OUTPUT_SIZE];
    hasher.Finalize(out);
    EXPECT_EQ(BytesToHex(out, sizeof(out)),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(SHA256Test, DoubleHashOfEmpty) {
    EXPECT_EQ(DoubleSHA256(Bytes("")).ToHex(),
              "5df6e0e2761359d30a8275058e299fcc0381534545f55cf43e41983f5d4c9456");
}

// ============================================================================
// RIPEMD160
// ============================================================================

TEST(RIPEMD160Test, EmptyString) {
    EXPECT_EQ(RIPEMD160Hash(Bytes("")).ToHex(),
              "9c1185a5c5e9fc54612808977ee8f548b2258d31");
}

TEST(RIPEMD160Test, Abc) {
    EXPECT_EQ(RIPEMD160Hash(Bytes("abc")).ToHex(),
              "8eb208f7e05d987a9b044a8e98c6b087f15a0bfc");
}

TEST(RIPEMD160Test, MessageDigest) {
    EXPECT_EQ(RIPEMD160Hash(Bytes("message digest")).ToHex(),
              "5d0689ef49d2fae572b881b123a85ffa21595f36");
}

TEST(RIPEMD160Test, Hash160OfGeneratorPoint) {
    auto pubkey = HexToBytes("0279be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798");
    EXPECT_EQ(Hash160FromData(pubkey).ToHex(),
              "751e76e8199196d454941c45d1b3a323f1433bd6");
}

} // namespace test
} // namespace seedorder
