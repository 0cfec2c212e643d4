// SEEDORDER - HMAC and PBKDF2 Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/crypto/hmac.h"

#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <climits>
#include <stdexcept>

namespace seedorder {

// ============================================================================
// HMAC-SHA512
// ============================================================================

Hash512 ComputeHMAC_SHA512(const Byte* key, size_t keyLen,
                           const Byte* data, size_t dataLen) {
    if (keyLen > static_cast<size_t>(INT_MAX)) {
        throw std::invalid_argument("HMAC-SHA512: key too long");
    }

    // OpenSSL rejects a NULL key pointer even for a zero-length key
    static const Byte kEmpty = 0;
    const Byte* keyPtr = key ? key : &kEmpty;
    const Byte* dataPtr = data ? data : &kEmpty;

    Hash512 result;
    unsigned int outLen = 0;
    if (!HMAC(EVP_sha512(), keyPtr, static_cast<int>(keyLen),
              dataPtr, dataLen, result.data(), &outLen) ||
        outLen != hmac::SHA512_SIZE) {
        throw std::runtime_error("HMAC-SHA512: OpenSSL HMAC failed");
    }
    return result;
}

// ============================================================================
// PBKDF2
// ============================================================================

std::vector<Byte> PBKDF2_SHA512(const std::string& password,
                                const std::string& salt,
                                uint32_t iterations,
                                size_t outputLen) {
    if (iterations == 0) {
        throw std::invalid_argument("PBKDF2: iteration count must be positive");
    }
    if (password.size() > static_cast<size_t>(INT_MAX) ||
        salt.size() > static_cast<size_t>(INT_MAX) ||
        outputLen > static_cast<size_t>(INT_MAX) ||
        iterations > static_cast<uint32_t>(INT_MAX)) {
        throw std::invalid_argument("PBKDF2: parameter out of range");
    }

    std::vector<Byte> out(outputLen);
    if (outputLen == 0) {
        return out;
    }

    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha512(),
                          static_cast<int>(outputLen), out.data()) != 1) {
        throw std::runtime_error("PBKDF2: OpenSSL PKCS5_PBKDF2_HMAC failed");
    }
    return out;
}

} // namespace seedorder
