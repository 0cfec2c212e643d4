// SEEDORDER - Address Scheme Resolution Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/recovery/scheme.h"
#include "seedorder/recovery/errors.h"

namespace seedorder {
namespace recovery {

using wallet::AddressType;
using wallet::DerivationPath;
using wallet::PathComponent;

namespace {

const SchemeInfo SCHEMES[] = {
    {AddressScheme::Legacy,        44, "BIP44 (Legacy P2PKH)",        "bip44", AddressType::P2PKH},
    {AddressScheme::WrappedSegwit, 49, "BIP49 (P2SH-wrapped SegWit)", "bip49", AddressType::P2SH},
    {AddressScheme::NativeSegwit,  84, "BIP84 (Native SegWit)",       "bip84", AddressType::P2WPKH},
};

bool StartsWith(const std::string& str, const char* prefix) {
    return str.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

} // namespace

const SchemeInfo& GetSchemeInfo(AddressScheme scheme) {
    return SCHEMES[static_cast<size_t>(scheme)];
}

DerivationPath PathTemplate(AddressScheme scheme, uint32_t index) {
    if (index >= wallet::HARDENED_FLAG) {
        throw RecoveryError(ErrorCode::InvalidPath,
                            "Derivation index out of range: " + std::to_string(index));
    }

    std::vector<PathComponent> components;
    components.emplace_back(GetSchemeInfo(scheme).purpose, true);   // purpose'
    components.emplace_back(BITCOIN_COIN_TYPE, true);              // 0'
    components.emplace_back(DEFAULT_ACCOUNT, true);                // account'
    components.emplace_back(0, false);                             // external chain
    components.emplace_back(index, false);                         // index
    return DerivationPath(std::move(components));
}

DerivationPath ParsePath(const std::string& text) {
    auto path = DerivationPath::FromString(text);
    if (!path) {
        throw RecoveryError(ErrorCode::InvalidPath, "Invalid derivation path: " + text);
    }
    return *path;
}

std::string EncodeSchemeAddress(AddressScheme scheme, const PublicKey& pubkey) {
    switch (scheme) {
        case AddressScheme::Legacy:        return wallet::EncodeP2PKH(pubkey);
        case AddressScheme::WrappedSegwit: return wallet::EncodeP2SH_P2WPKH(pubkey);
        case AddressScheme::NativeSegwit:  return wallet::EncodeP2WPKH(pubkey);
    }
    return std::string();
}

SchemeResolution ResolveScheme(const SchemeFlags& flags, const std::string& target) {
    if (flags.Count() > 1) {
        throw RecoveryError(ErrorCode::ConflictingSchemes,
                            "Only one of --bip44, --bip49 or --bip84 may be given");
    }

    SchemeResolution result;
    if (flags.bip44) {
        result.scheme = AddressScheme::Legacy;
        return result;
    }
    if (flags.bip49) {
        result.scheme = AddressScheme::WrappedSegwit;
        return result;
    }
    if (flags.bip84) {
        result.scheme = AddressScheme::NativeSegwit;
        return result;
    }

    result.autoDetected = true;
    if (StartsWith(target, "bc1")) {
        result.scheme = AddressScheme::NativeSegwit;
    } else if (StartsWith(target, "3")) {
        result.scheme = AddressScheme::WrappedSegwit;
    } else if (StartsWith(target, "1")) {
        result.scheme = AddressScheme::Legacy;
    } else {
        throw RecoveryError(ErrorCode::AmbiguousScheme,
                            "Cannot auto-detect address type. "
                            "Please specify --bip44, --bip49, or --bip84");
    }
    return result;
}

std::string AutoDetectMessage(AddressScheme scheme) {
    switch (scheme) {
        case AddressScheme::Legacy:        return "Auto-detected BIP44 (Legacy) address";
        case AddressScheme::WrappedSegwit: return "Auto-detected BIP49 (P2SH-wrapped SegWit) address";
        case AddressScheme::NativeSegwit:  return "Auto-detected BIP84 (Native SegWit) address";
    }
    return std::string();
}

bool SchemeProducesType(AddressScheme scheme, AddressType type) {
    return GetSchemeInfo(scheme).addressType == type;
}

} // namespace recovery
} // namespace seedorder
