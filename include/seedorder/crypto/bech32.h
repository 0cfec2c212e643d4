// SEEDORDER - Bech32 and Bech32m
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// BIP-173 (bech32) and BIP-350 (bech32m) string encoding, plus the segwit
// address layer: witness version 0 uses bech32, versions 1-16 use bech32m.

#ifndef SEEDORDER_CRYPTO_BECH32_H
#define SEEDORDER_CRYPTO_BECH32_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "seedorder/core/types.h"

namespace seedorder {
namespace bech32 {

// ============================================================================
// Constants
// ============================================================================

/// Maximum length of an encoded string
constexpr size_t MAX_LENGTH = 90;

/// Checksum length in 5-bit groups
constexpr size_t CHECKSUM_SIZE = 6;

/// Final polymod constant for bech32m
constexpr uint32_t BECH32M_CONST = 0x2bc830a3;

/// Checksum variant
enum class Encoding {
    Invalid,
    Bech32,     ///< BIP-173
    Bech32m     ///< BIP-350
};

// ============================================================================
// Generic Encoding
// ============================================================================

/// Result of decoding a bech32/bech32m string
struct DecodeResult {
    Encoding encoding{Encoding::Invalid};
    std::string hrp;                ///< Lowercase human-readable part
    std::vector<uint8_t> values;    ///< 5-bit groups, checksum removed
};

/**
 * Encode a human-readable part and 5-bit values.
 * The output is lowercase.
 */
std::string Encode(Encoding encoding, const std::string& hrp,
                   const std::vector<uint8_t>& values);

/**
 * Decode a bech32 or bech32m string.
 *
 * Rejects mixed case, strings longer than MAX_LENGTH, characters outside
 * the charset and bad checksums; encoding is Invalid in those cases.
 */
DecodeResult Decode(const std::string& str);

/// Regroup bits between widths (8->5 with padding, 5->8 without)
bool ConvertBits(const std::vector<uint8_t>& in, int fromBits, int toBits,
                 bool pad, std::vector<uint8_t>& out);

// ============================================================================
// Segwit Addresses
// ============================================================================

/// Decoded witness program
struct WitnessProgram {
    std::string hrp;
    int version{-1};
    std::vector<Byte> program;
};

/**
 * Encode a segwit address.
 * @return empty string if version or program length are not allowed
 */
std::string EncodeSegwit(const std::string& hrp, int version,
                         const std::vector<Byte>& program);

/**
 * Decode a segwit address of any human-readable part.
 *
 * Enforces the BIP-173/350 program rules: version 0 needs bech32 and a
 * 20 or 32 byte program, versions 1-16 need bech32m and 2-40 bytes.
 */
std::optional<WitnessProgram> DecodeSegwit(const std::string& addr);

} // namespace bech32
} // namespace seedorder

#endif // SEEDORDER_CRYPTO_BECH32_H
