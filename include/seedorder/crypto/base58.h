// SEEDORDER - Base58 and Base58Check
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Bitcoin Base58 alphabet (no 0, O, I, l). Base58Check appends the first
// four bytes of SHA256(SHA256(payload)).

#ifndef SEEDORDER_CRYPTO_BASE58_H
#define SEEDORDER_CRYPTO_BASE58_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "seedorder/core/types.h"

namespace seedorder {

/// Encode bytes as Base58
std::string EncodeBase58(const Byte* data, size_t len);

inline std::string EncodeBase58(const std::vector<Byte>& data) {
    return EncodeBase58(data.data(), data.size());
}

/// Decode a Base58 string; nullopt on characters outside the alphabet
std::optional<std::vector<Byte>> DecodeBase58(const std::string& str);

/// Encode with a 4-byte double-SHA256 checksum
std::string EncodeBase58Check(const std::vector<Byte>& payload);

/// Decode and verify the checksum; returns the payload without it
std::optional<std::vector<Byte>> DecodeBase58Check(const std::string& str);

} // namespace seedorder

#endif // SEEDORDER_CRYPTO_BASE58_H
