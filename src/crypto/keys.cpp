// SEEDORDER - Key Management Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/crypto/keys.h"
#include "seedorder/core/hex.h"
#include "seedorder/crypto/ripemd160.h"

#include <openssl/crypto.h>

#include <cstring>
#include <stdexcept>

namespace seedorder {

// ============================================================================
// PublicKey Implementation
// ============================================================================

Hash160 PublicKey::GetHash160() const {
    return Hash160FromData(data_.data(), data_.size());
}

std::string PublicKey::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

// ============================================================================
// PrivateKey Implementation
// ============================================================================

std::optional<PrivateKey> PrivateKey::FromBytes(const uint8_t* data) {
    if (!data || !secp256k1::IsValidPrivateKey(data)) {
        return std::nullopt;
    }
    PrivateKey key;
    std::memcpy(key.data_.data(), data, SIZE);
    return key;
}

PrivateKey::~PrivateKey() {
    OPENSSL_cleanse(data_.data(), data_.size());
}

PublicKey PrivateKey::GetPublicKey() const {
    std::array<uint8_t, PublicKey::SIZE> pub{};
    if (!secp256k1::ComputePublicKey(data_.data(), pub)) {
        // FromBytes and TweakAdd only ever produce in-range keys
        throw std::logic_error("PrivateKey holds an out-of-range scalar");
    }
    return PublicKey(pub);
}

std::optional<PrivateKey> PrivateKey::TweakAdd(const uint8_t* tweak) const {
    PrivateKey result;
    if (!secp256k1::PrivateKeyTweakAdd(data_.data(), tweak, result.data_)) {
        return std::nullopt;
    }
    return result;
}

std::string PrivateKey::ToHex() const {
    return BytesToHex(data_.data(), data_.size());
}

} // namespace seedorder
