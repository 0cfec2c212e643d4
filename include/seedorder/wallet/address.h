// SEEDORDER - Bitcoin Addresses
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Mainnet address encoding for the three single-key schemes, and parsing
// of target addresses with network checking.

#ifndef SEEDORDER_WALLET_ADDRESS_H
#define SEEDORDER_WALLET_ADDRESS_H

#include <cstdint>
#include <string>
#include <vector>

#include "seedorder/core/types.h"
#include "seedorder/crypto/keys.h"

namespace seedorder {
namespace wallet {

// ============================================================================
// Network Parameters
// ============================================================================

namespace mainnet {
    constexpr Byte P2PKH_VERSION = 0x00;
    constexpr Byte P2SH_VERSION = 0x05;
    constexpr const char* BECH32_HRP = "bc";
}

/// Only recognized so that a testnet target is reported as such
namespace testnet {
    constexpr Byte P2PKH_VERSION = 0x6f;
    constexpr Byte P2SH_VERSION = 0xc4;
    constexpr const char* BECH32_HRP = "tb";
    constexpr const char* REGTEST_BECH32_HRP = "bcrt";
}

// ============================================================================
// Address Types
// ============================================================================

enum class AddressType {
    P2PKH,              ///< Base58, version 0x00
    P2SH,               ///< Base58, version 0x05
    P2WPKH,             ///< Witness v0, 20-byte program
    P2WSH,              ///< Witness v0, 32-byte program
    P2TR,               ///< Witness v1, 32-byte program
    WitnessUnknown      ///< Other witness versions/lengths
};

const char* AddressTypeToString(AddressType type);

/// A decoded mainnet address
struct Address {
    AddressType type{AddressType::P2PKH};
    std::string canonical;      ///< Base58 as given, Bech32 lowercased
    std::vector<Byte> payload;  ///< Hash or witness program
    int witnessVersion{-1};     ///< -1 for Base58 addresses
};

enum class AddressStatus {
    Ok,
    Invalid,
    WrongNetwork
};

struct AddressDecodeResult {
    AddressStatus status{AddressStatus::Invalid};
    Address address;            ///< Valid when status == Ok
    std::string network;        ///< "testnet"/"regtest" for WrongNetwork
};

// ============================================================================
// Decoding
// ============================================================================

/// Decode and classify an address string without throwing
AddressDecodeResult DecodeAddress(const std::string& text);

/**
 * Parse a target address and require mainnet.
 *
 * @throws RecoveryError InvalidAddress or WrongNetwork
 */
Address ParseAndCheckAddress(const std::string& text);

// ============================================================================
// Encoding
// ============================================================================

/// Legacy P2PKH: Base58Check(0x00 || HASH160(pubkey))
std::string EncodeP2PKH(const PublicKey& pubkey);

/// BIP-49 P2SH-P2WPKH: Base58Check(0x05 || HASH160(0x00 0x14 || HASH160(pubkey)))
std::string EncodeP2SH_P2WPKH(const PublicKey& pubkey);

/// BIP-84 native P2WPKH: bech32 "bc", witness v0, HASH160(pubkey)
std::string EncodeP2WPKH(const PublicKey& pubkey);

/// Redeem script 0x00 0x14 <20-byte key hash>
std::vector<Byte> P2WPKHRedeemScript(const Hash160& keyHash);

} // namespace wallet
} // namespace seedorder

#endif // SEEDORDER_WALLET_ADDRESS_H
