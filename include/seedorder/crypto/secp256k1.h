// SEEDORDER - secp256k1 Elliptic Curve Operations
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// The few secp256k1 operations BIP-32 private derivation needs, on top of
// the OpenSSL EC_GROUP/EC_POINT/BIGNUM API. For key objects see keys.h.

#ifndef SEEDORDER_CRYPTO_SECP256K1_H
#define SEEDORDER_CRYPTO_SECP256K1_H

#include <array>
#include <cstddef>
#include <cstdint>

namespace seedorder {
namespace secp256k1 {

// ============================================================================
// Constants
// ============================================================================

/// Private key / scalar size in bytes
constexpr size_t SCALAR_SIZE = 32;

/// Compressed public key size in bytes
constexpr size_t COMPRESSED_SIZE = 33;

/// Curve order n (big-endian)
extern const std::array<uint8_t, SCALAR_SIZE> CURVE_ORDER;

// ============================================================================
// Scalar and Point Operations
// ============================================================================

/// Check that a 32-byte big-endian scalar is in [1, n-1]
bool IsValidPrivateKey(const uint8_t* key);

/**
 * Compute the compressed public key priv*G.
 *
 * @param key 32-byte private key
 * @param out Receives the 33-byte SEC1 compressed point
 * @return false if the key is out of range
 * @throws std::runtime_error on an OpenSSL failure
 */
bool ComputePublicKey(const uint8_t* key, std::array<uint8_t, COMPRESSED_SIZE>& out);

/**
 * Compute (key + tweak) mod n.
 *
 * BIP-32 requires the tweak to be below n and the sum to be non-zero;
 * both conditions are reported as failure rather than wrapped.
 *
 * @param key 32-byte private key
 * @param tweak 32-byte big-endian tweak
 * @param out Receives the resulting private key
 * @return false if the tweak is >= n or the result is zero
 * @throws std::runtime_error on an OpenSSL failure
 */
bool PrivateKeyTweakAdd(const uint8_t* key, const uint8_t* tweak,
                        std::array<uint8_t, SCALAR_SIZE>& out);

} // namespace secp256k1
} // namespace seedorder

#endif // SEEDORDER_CRYPTO_SECP256K1_H
