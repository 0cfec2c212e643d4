// SEEDORDER - HMAC and PBKDF2
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// HMAC-SHA512 (RFC 2104) and PBKDF2-HMAC-SHA512 (RFC 8018), the two
// primitives BIP-32 and BIP-39 are built on.

#ifndef SEEDORDER_CRYPTO_HMAC_H
#define SEEDORDER_CRYPTO_HMAC_H

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "seedorder/core/types.h"

namespace seedorder {

// ============================================================================
// HMAC Constants
// ============================================================================

namespace hmac {
    /// HMAC-SHA512 output size
    constexpr size_t SHA512_SIZE = 64;

    /// SHA512 block size
    constexpr size_t SHA512_BLOCK_SIZE = 128;
}

// ============================================================================
// HMAC-SHA512
// ============================================================================

/**
 * Compute HMAC-SHA512 in one call.
 *
 * @param key Secret key
 * @param keyLen Key length
 * @param data Data to authenticate
 * @param dataLen Data length
 * @return 64-byte MAC
 * @throws std::runtime_error if the OpenSSL call fails
 */
Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen);

/// Compute HMAC-SHA512 with vectors
inline Hash512 ComputeHMAC_SHA512(const std::vector<Byte>& key,
                                  const std::vector<Byte>& data) {
    return ComputeHMAC_SHA512(key.data(), key.size(), data.data(), data.size());
}

// ============================================================================
// PBKDF2
// ============================================================================

/**
 * PBKDF2 with HMAC-SHA512 as the PRF.
 *
 * @param password Password bytes (not required to be NUL-terminated)
 * @param salt Salt bytes
 * @param iterations Iteration count (must be > 0)
 * @param outputLen Number of bytes to derive
 * @return Derived key of outputLen bytes
 * @throws std::invalid_argument on a zero iteration count
 * @throws std::runtime_error if the OpenSSL call fails
 */
std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::string& salt,
                                uint32_t iterations,
                                size_t outputLen);

} // namespace seedorder

#endif // SEEDORDER_CRYPTO_HMAC_H
