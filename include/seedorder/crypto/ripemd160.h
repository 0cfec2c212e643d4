// SEEDORDER - RIPEMD160 Hash Function
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// RIPEMD-160 and the Bitcoin Hash160 composite.

#ifndef SEEDORDER_CRYPTO_RIPEMD160_H
#define SEEDORDER_CRYPTO_RIPEMD160_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "seedorder/core/types.h"

namespace seedorder {

/// RIPEMD-160 hasher class
class RIPEMD160 {
public:
    /// Output size in bytes
    static constexpr size_t OUTPUT_SIZE = 20;

    RIPEMD160();
    ~RIPEMD160();

    RIPEMD160(const RIPEMD160&) = delete;
    RIPEMD160& operator=(const RIPEMD160&) = delete;

    /// Write data to the hasher
    RIPEMD160& Write(const Byte* data, size_t len);

    /// Finalize the hash and write to output; the hasher is reset afterwards
    void Finalize(Byte hash[OUTPUT_SIZE]);

    /// Reset hasher to initial state
    RIPEMD160& Reset();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Compute RIPEMD160 hash of data in a single call
Hash160 RIPEMD160Hash(const Byte* data, size_t len);

inline Hash160 RIPEMD160Hash(const std::vector<Byte>& data) {
    return RIPEMD160Hash(data.data(), data.size());
}

/// Compute Hash160 (RIPEMD160(SHA256(data)))
/// This is the standard key and script hash used in Bitcoin addresses
Hash160 Hash160FromData(const Byte* data, size_t len);

inline Hash160 Hash160FromData(const std::vector<Byte>& data) {
    return Hash160FromData(data.data(), data.size());
}

} // namespace seedorder

#endif // SEEDORDER_CRYPTO_RIPEMD160_H
