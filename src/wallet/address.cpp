// SEEDORDER - Bitcoin Address Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/wallet/address.h"
#include "seedorder/crypto/base58.h"
#include "seedorder/crypto/bech32.h"
#include "seedorder/crypto/ripemd160.h"
#include "seedorder/wallet/wordlist.h"
#include "seedorder/recovery/errors.h"

namespace seedorder {
namespace wallet {

const char* AddressTypeToString(AddressType type) {
    switch (type) {
        case AddressType::P2PKH:          return "P2PKH";
        case AddressType::P2SH:           return "P2SH";
        case AddressType::P2WPKH:         return "P2WPKH";
        case AddressType::P2WSH:          return "P2WSH";
        case AddressType::P2TR:           return "P2TR";
        case AddressType::WitnessUnknown: return "WitnessUnknown";
    }
    return "Unknown";
}

// ============================================================================
// Decoding
// ============================================================================

namespace {

AddressDecodeResult DecodeBase58Address(const std::string& text,
                                        const std::vector<Byte>& data) {
    AddressDecodeResult result;
    if (data.size() != 1 + 20) {
        return result;
    }

    const Byte version = data[0];
    if (version == testnet::P2PKH_VERSION || version == testnet::P2SH_VERSION) {
        result.status = AddressStatus::WrongNetwork;
        result.network = "testnet";
        return result;
    }
    if (version != mainnet::P2PKH_VERSION && version != mainnet::P2SH_VERSION) {
        return result;
    }

    result.status = AddressStatus::Ok;
    result.address.type = version == mainnet::P2PKH_VERSION ? AddressType::P2PKH
                                                            : AddressType::P2SH;
    result.address.canonical = text;
    result.address.payload.assign(data.begin() + 1, data.end());
    return result;
}

AddressDecodeResult DecodeSegwitAddress(const bech32::WitnessProgram& wp,
                                        const std::string& lowered) {
    AddressDecodeResult result;
    if (wp.hrp == testnet::BECH32_HRP || wp.hrp == testnet::REGTEST_BECH32_HRP) {
        result.status = AddressStatus::WrongNetwork;
        result.network = wp.hrp == testnet::BECH32_HRP ? "testnet" : "regtest";
        return result;
    }
    if (wp.hrp != mainnet::BECH32_HRP) {
        return result;
    }

    Address& addr = result.address;
    addr.canonical = lowered;
    addr.payload = wp.program;
    addr.witnessVersion = wp.version;
    if (wp.version == 0) {
        addr.type = wp.program.size() == 20 ? AddressType::P2WPKH : AddressType::P2WSH;
    } else if (wp.version == 1 && wp.program.size() == 32) {
        addr.type = AddressType::P2TR;
    } else {
        addr.type = AddressType::WitnessUnknown;
    }
    result.status = AddressStatus::Ok;
    return result;
}

} // namespace

AddressDecodeResult DecodeAddress(const std::string& text) {
    if (text.empty()) {
        return AddressDecodeResult{};
    }

    if (auto data = DecodeBase58Check(text)) {
        return DecodeBase58Address(text, *data);
    }

    if (auto wp = bech32::DecodeSegwit(text)) {
        return DecodeSegwitAddress(*wp, ToLowerAscii(text));
    }

    return AddressDecodeResult{};
}

Address ParseAndCheckAddress(const std::string& text) {
    AddressDecodeResult decoded = DecodeAddress(text);
    switch (decoded.status) {
        case AddressStatus::Ok:
            return decoded.address;
        case AddressStatus::WrongNetwork:
            throw RecoveryError(ErrorCode::WrongNetwork,
                                "Address " + text + " belongs to " + decoded.network +
                                "; only mainnet addresses are supported");
        case AddressStatus::Invalid:
            break;
    }
    throw RecoveryError(ErrorCode::InvalidAddress,
                        "Invalid target Bitcoin address: " + text);
}

// ============================================================================
// Encoding
// ============================================================================

std::vector<Byte> P2WPKHRedeemScript(const Hash160& keyHash) {
    std::vector<Byte> script;
    script.reserve(2 + keyHash.size());
    script.push_back(0x00);     // OP_0
    script.push_back(0x14);     // push 20 bytes
    script.insert(script.end(), keyHash.begin(), keyHash.end());
    return script;
}

std::string EncodeP2PKH(const PublicKey& pubkey) {
    Hash160 keyHash = pubkey.GetHash160();
    std::vector<Byte> payload{mainnet::P2PKH_VERSION};
    payload.insert(payload.end(), keyHash.begin(), keyHash.end());
    return EncodeBase58Check(payload);
}

std::string EncodeP2SH_P2WPKH(const PublicKey& pubkey) {
    Hash160 scriptHash = Hash160FromData(P2WPKHRedeemScript(pubkey.GetHash160()));
    std::vector<Byte> payload{mainnet::P2SH_VERSION};
    payload.insert(payload.end(), scriptHash.begin(), scriptHash.end());
    return EncodeBase58Check(payload);
}

std::string EncodeP2WPKH(const PublicKey& pubkey) {
    Hash160 keyHash = pubkey.GetHash160();
    return bech32::EncodeSegwit(mainnet::BECH32_HRP, 0,
                                std::vector<Byte>(keyHash.begin(), keyHash.end()));
}

} // namespace wallet
} // namespace seedorder
