// SEEDORDER - Address Scheme Resolution
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// The three single-key derivation schemes (BIP44, BIP49, BIP84), their
// path templates and address rules, and selection of the scheme from
// command-line flags or the target address prefix.

#ifndef SEEDORDER_RECOVERY_SCHEME_H
#define SEEDORDER_RECOVERY_SCHEME_H

#include <cstddef>
#include <cstdint>
#include <string>

#include "seedorder/crypto/keys.h"
#include "seedorder/wallet/address.h"
#include "seedorder/wallet/hdkey.h"

namespace seedorder {
namespace recovery {

// ============================================================================
// Schemes
// ============================================================================

enum class AddressScheme {
    Legacy,         ///< BIP44, P2PKH
    WrappedSegwit,  ///< BIP49, P2SH-P2WPKH
    NativeSegwit    ///< BIP84, P2WPKH
};

/// Static description of a scheme
struct SchemeInfo {
    AddressScheme scheme;
    uint32_t purpose;                   ///< 44, 49 or 84
    const char* name;                   ///< "BIP84 (Native SegWit)"
    const char* flag;                   ///< "bip84"
    wallet::AddressType addressType;    ///< Type of the addresses it derives
};

const SchemeInfo& GetSchemeInfo(AddressScheme scheme);

inline const char* SchemeName(AddressScheme scheme) {
    return GetSchemeInfo(scheme).name;
}

/// Coin type and account used by every template (Bitcoin mainnet, account 0)
constexpr uint32_t BITCOIN_COIN_TYPE = 0;
constexpr uint32_t DEFAULT_ACCOUNT = 0;

/**
 * Path template m/{purpose}'/0'/0'/0/{index}.
 *
 * @throws RecoveryError InvalidPath if index >= 2^31
 */
wallet::DerivationPath PathTemplate(AddressScheme scheme, uint32_t index);

/**
 * Parse a textual derivation path.
 *
 * @throws RecoveryError InvalidPath if it does not parse
 */
wallet::DerivationPath ParsePath(const std::string& text);

/// Encode the scheme's address for a compressed public key
std::string EncodeSchemeAddress(AddressScheme scheme, const PublicKey& pubkey);

// ============================================================================
// Resolution
// ============================================================================

/// Scheme flags as given on the command line
struct SchemeFlags {
    bool bip44{false};
    bool bip49{false};
    bool bip84{false};

    size_t Count() const {
        return static_cast<size_t>(bip44) + static_cast<size_t>(bip49) +
               static_cast<size_t>(bip84);
    }
};

struct SchemeResolution {
    AddressScheme scheme{AddressScheme::NativeSegwit};
    bool autoDetected{false};
};

/**
 * Choose the scheme.
 *
 * One flag selects its scheme. Without flags the literal prefix of the
 * target decides: "bc1" native segwit, "3" wrapped segwit, "1" legacy.
 *
 * @throws RecoveryError ConflictingSchemes for more than one flag,
 *         AmbiguousScheme when no flag is given and no prefix matches
 */
SchemeResolution ResolveScheme(const SchemeFlags& flags, const std::string& target);

/// "Auto-detected BIP84 (Native SegWit) address" and friends
std::string AutoDetectMessage(AddressScheme scheme);

/// True if the scheme can ever produce an address of this type
bool SchemeProducesType(AddressScheme scheme, wallet::AddressType type);

} // namespace recovery
} // namespace seedorder

#endif // SEEDORDER_RECOVERY_SCHEME_H
