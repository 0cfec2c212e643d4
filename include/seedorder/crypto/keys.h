// SEEDORDER - Key Management
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// secp256k1 private and compressed public keys.

#ifndef SEEDORDER_CRYPTO_KEYS_H
#define SEEDORDER_CRYPTO_KEYS_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "seedorder/core/types.h"
#include "seedorder/crypto/secp256k1.h"

namespace seedorder {

// ============================================================================
// PublicKey
// ============================================================================

/**
 * A compressed secp256k1 public key (33 bytes, SEC1).
 *
 * Every address scheme this tool derives uses the compressed form, so the
 * uncompressed encoding is not represented.
 */
class PublicKey {
public:
    static constexpr size_t SIZE = secp256k1::COMPRESSED_SIZE;

    /// Default constructor - invalid/empty key
    PublicKey() { data_.fill(0); }

    /// Construct from a serialized compressed point
    explicit PublicKey(const std::array<uint8_t, SIZE>& data) : data_(data) {}

    /// A key is valid once it carries an 0x02/0x03 prefix
    bool IsValid() const { return data_[0] == 0x02 || data_[0] == 0x03; }

    size_t size() const { return SIZE; }
    const uint8_t* data() const { return data_.data(); }
    const uint8_t* begin() const { return data_.data(); }
    const uint8_t* end() const { return data_.data() + SIZE; }

    /// Compute Hash160 (RIPEMD160(SHA256(key)))
    Hash160 GetHash160() const;

    std::string ToHex() const;

    bool operator==(const PublicKey& other) const { return data_ == other.data_; }
    bool operator!=(const PublicKey& other) const { return !(*this == other); }

private:
    std::array<uint8_t, SIZE> data_;
};

// ============================================================================
// PrivateKey
// ============================================================================

/**
 * A secp256k1 private key.
 *
 * Always exactly 32 bytes in [1, n-1]. Key material is cleansed on
 * destruction.
 */
class PrivateKey {
public:
    static constexpr size_t SIZE = secp256k1::SCALAR_SIZE;

    /// Construct from 32 raw bytes; returns nullopt when out of range
    static std::optional<PrivateKey> FromBytes(const uint8_t* data);

    ~PrivateKey();

    PrivateKey(const PrivateKey& other) = default;
    PrivateKey& operator=(const PrivateKey& other) = default;

    const uint8_t* data() const { return data_.data(); }
    size_t size() const { return SIZE; }

    /// Derive the compressed public key
    PublicKey GetPublicKey() const;

    /// Add a tweak mod n (BIP-32 child derivation)
    /// @return nullopt if the tweak is >= n or the result is zero
    std::optional<PrivateKey> TweakAdd(const uint8_t* tweak) const;

    std::string ToHex() const;

private:
    PrivateKey() = default;

    std::array<uint8_t, SIZE> data_{};
};

} // namespace seedorder

#endif // SEEDORDER_CRYPTO_KEYS_H
