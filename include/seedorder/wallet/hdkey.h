// SEEDORDER - Hierarchical Deterministic Key Derivation (BIP32)
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// BIP32 private derivation from a BIP39 seed along paths such as
// m/84'/0'/0'/0/0. Only private extended keys are represented; every
// path this tool walks starts at the master private key.

#ifndef SEEDORDER_WALLET_HDKEY_H
#define SEEDORDER_WALLET_HDKEY_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "seedorder/core/types.h"
#include "seedorder/crypto/keys.h"

namespace seedorder {
namespace wallet {

// ============================================================================
// Constants
// ============================================================================

/// Hardened key derivation threshold
constexpr uint32_t HARDENED_FLAG = 0x80000000;

/// BIP32 allows master seeds of 128 to 512 bits
constexpr size_t MIN_SEED_SIZE = 16;
constexpr size_t MAX_SEED_SIZE = 64;

// ============================================================================
// Key Derivation Path
// ============================================================================

/**
 * Represents a BIP32 derivation path component.
 */
struct PathComponent {
    uint32_t index;
    bool hardened;

    PathComponent(uint32_t idx = 0, bool hard = false)
        : index(idx), hardened(hard) {}

    /// Get the full index value (with hardened flag if applicable)
    uint32_t GetFullIndex() const {
        return hardened ? (index | HARDENED_FLAG) : index;
    }

    /// Parse from string ("44'", "44h", "44H" or "0"); index must be < 2^31
    static std::optional<PathComponent> FromString(const std::string& str);

    /// Convert to string, hardened components use the ' marker
    std::string ToString() const;
};

/**
 * A complete BIP32 derivation path.
 *
 * Example paths:
 * - m/44'/0'/0'/0/0  (legacy, first receiving address)
 * - m/84'/0'/0'/0/5  (native segwit, sixth receiving address)
 */
class DerivationPath {
public:
    /// Create empty path (master key)
    DerivationPath() = default;

    explicit DerivationPath(std::vector<PathComponent> components)
        : components_(std::move(components)) {}

    /// Parse from string. The leading "m" is required; empty segments,
    /// trailing slashes and out-of-range indices are rejected.
    static std::optional<DerivationPath> FromString(const std::string& path);

    const std::vector<PathComponent>& GetComponents() const { return components_; }

    size_t Depth() const { return components_.size(); }

    bool IsEmpty() const { return components_.empty(); }

    /// Append a component
    DerivationPath Child(uint32_t index, bool hardened = false) const;

    DerivationPath HardenedChild(uint32_t index) const {
        return Child(index, true);
    }

    std::string ToString() const;

    bool operator==(const DerivationPath& other) const;
    bool operator!=(const DerivationPath& other) const { return !(*this == other); }

private:
    std::vector<PathComponent> components_;
};

// ============================================================================
// Extended Key (BIP32)
// ============================================================================

/**
 * An extended private key: key, chain code and position in the tree.
 *
 * Child derivation fails (nullopt) in the cases BIP32 says to skip:
 * IL >= n or a zero child key. Depth is limited to 255.
 */
class ExtendedKey {
public:
    static constexpr size_t CHAIN_CODE_SIZE = 32;
    using ChainCode = std::array<Byte, CHAIN_CODE_SIZE>;

    ExtendedKey(const PrivateKey& key, const ChainCode& chainCode,
                uint8_t depth = 0, uint32_t parentFingerprint = 0,
                uint32_t childIndex = 0);

    /**
     * Generate the master key: HMAC-SHA512(Key = "Bitcoin seed", Data = seed).
     *
     * @return nullopt if the left half is not a valid private key
     * @throws std::invalid_argument if seedLen is outside 16..64
     */
    static std::optional<ExtendedKey> FromSeed(const Byte* seed, size_t seedLen);

    static std::optional<ExtendedKey> FromSeed(const std::vector<Byte>& seed) {
        return FromSeed(seed.data(), seed.size());
    }

    /// Derive child key
    /// @param index Child index (use | HARDENED_FLAG for hardened)
    std::optional<ExtendedKey> DeriveChild(uint32_t index) const;

    /// Derive key at path, relative to this key
    std::optional<ExtendedKey> DerivePath(const DerivationPath& path) const;

    const PrivateKey& GetPrivateKey() const { return key_; }

    /// Compressed public key of this node
    PublicKey GetPublicKey() const { return key_.GetPublicKey(); }

    const ChainCode& GetChainCode() const { return chainCode_; }

    uint8_t GetDepth() const { return depth_; }
    uint32_t GetChildIndex() const { return childIndex_; }

    /// Fingerprint of the parent; for derived keys it is computed on demand
    /// so path walks never pay for the parent's public key
    uint32_t GetParentFingerprint() const;

    /// Get fingerprint of this key (first 4 bytes of Hash160 of public key)
    uint32_t GetFingerprint() const;

private:
    PrivateKey key_;
    ChainCode chainCode_;
    uint8_t depth_{0};
    uint32_t parentFingerprint_{0};
    uint32_t childIndex_{0};

    /// Set on keys made by DeriveChild(); parentFingerprint_ is unused then
    std::optional<PrivateKey> parentKey_;
};

} // namespace wallet
} // namespace seedorder

#endif // SEEDORDER_WALLET_HDKEY_H
