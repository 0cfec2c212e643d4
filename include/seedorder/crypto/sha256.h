// SEEDORDER - SHA256 Hash Function
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// SHA-256 (FIPS 180-4) backed by the OpenSSL EVP digest interface.

#ifndef SEEDORDER_CRYPTO_SHA256_H
#define SEEDORDER_CRYPTO_SHA256_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "seedorder/core/types.h"

namespace seedorder {

/// SHA-256 hasher class
/// Provides incremental hashing following Bitcoin's Write/Finalize pattern
class SHA256 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 32;

    /// Block size in bytes
    static constexpr size_t BLOCK_SIZE = 64;

    /// Default constructor - initializes to empty state
    SHA256();
    ~SHA256();

    SHA256(const SHA256&) = delete;
    SHA256& operator=(const SHA256&) = delete;

    /// Write data to the hasher
    /// @return Reference to this hasher (for chaining)
    SHA256& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output; the hasher is reset afterwards
    /// @param hash Output buffer (at least OUTPUT_SIZE bytes)
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    SHA256& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute SHA256 hash of data in a single call
Hash256 SHA256Hash(const Byte* data, size_t len);

inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256(SHA256(data)), used for Base58Check checksums
Hash256 DoubleSHA256(const Byte* data, size_t len);

inline Hash256 DoubleSHA256(const std::vector<Byte>& data) {
    return DoubleSHA256(data.data(), data.size());
}

} // namespace seedorder

#endif // SEEDORDER_CRYPTO_SHA256_H
