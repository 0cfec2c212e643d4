// SEEDORDER - Hierarchical Deterministic Key Derivation Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/wallet/hdkey.h"
#include "seedorder/crypto/hmac.h"

#include <cstring>
#include <stdexcept>

namespace seedorder {
namespace wallet {

// ============================================================================
// PathComponent Implementation
// ============================================================================

std::optional<PathComponent> PathComponent::FromString(const std::string& str) {
    if (str.empty()) {
        return std::nullopt;
    }

    bool hardened = false;
    size_t digits = str.size();
    if (str.back() == '\'' || str.back() == 'h' || str.back() == 'H') {
        hardened = true;
        --digits;
    }
    if (digits == 0) {
        return std::nullopt;
    }

    uint64_t index = 0;
    for (size_t i = 0; i < digits; ++i) {
        char c = str[i];
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        index = index * 10 + static_cast<uint64_t>(c - '0');
        if (index >= HARDENED_FLAG) {
            return std::nullopt;
        }
    }

    return PathComponent(static_cast<uint32_t>(index), hardened);
}

std::string PathComponent::ToString() const {
    return std::to_string(index) + (hardened ? "'" : "");
}

// ============================================================================
// DerivationPath Implementation
// ============================================================================

std::optional<DerivationPath> DerivationPath::FromString(const std::string& path) {
    if (path.empty() || (path[0] != 'm' && path[0] != 'M')) {
        return std::nullopt;
    }
    if (path.size() == 1) {
        return DerivationPath();
    }
    if (path[1] != '/') {
        return std::nullopt;
    }

    std::vector<PathComponent> components;
    size_t pos = 2;
    while (true) {
        size_t slash = path.find('/', pos);
        std::string token = path.substr(pos, slash == std::string::npos
                                                 ? std::string::npos
                                                 : slash - pos);
        auto comp = PathComponent::FromString(token);
        if (!comp) {
            return std::nullopt;
        }
        components.push_back(*comp);

        if (slash == std::string::npos) {
            break;
        }
        pos = slash + 1;
    }

    return DerivationPath(std::move(components));
}

DerivationPath DerivationPath::Child(uint32_t index, bool hardened) const {
    std::vector<PathComponent> newComponents = components_;
    newComponents.emplace_back(index, hardened);
    return DerivationPath(std::move(newComponents));
}

std::string DerivationPath::ToString() const {
    std::string result = "m";
    for (const auto& comp : components_) {
        result += "/" + comp.ToString();
    }
    return result;
}

bool DerivationPath::operator==(const DerivationPath& other) const {
    if (components_.size() != other.components_.size()) {
        return false;
    }
    for (size_t i = 0; i < components_.size(); ++i) {
        if (components_[i].index != other.components_[i].index ||
            components_[i].hardened != other.components_[i].hardened) {
            return false;
        }
    }
    return true;
}

// ============================================================================
// ExtendedKey Implementation
// ============================================================================

ExtendedKey::ExtendedKey(const PrivateKey& key, const ChainCode& chainCode,
                         uint8_t depth, uint32_t parentFingerprint,
                         uint32_t childIndex)
    : key_(key)
    , chainCode_(chainCode)
    , depth_(depth)
    , parentFingerprint_(parentFingerprint)
    , childIndex_(childIndex) {}

std::optional<ExtendedKey> ExtendedKey::FromSeed(const Byte* seed, size_t seedLen) {
    if (seed == nullptr || seedLen < MIN_SEED_SIZE || seedLen > MAX_SEED_SIZE) {
        throw std::invalid_argument("BIP32 seed must be 16 to 64 bytes");
    }

    static const char KEY[] = "Bitcoin seed";
    Hash512 hash = ComputeHMAC_SHA512(reinterpret_cast<const Byte*>(KEY),
                                      sizeof(KEY) - 1, seed, seedLen);

    // Left 32 bytes = private key, right 32 bytes = chain code
    auto privKey = PrivateKey::FromBytes(hash.data());
    if (!privKey) {
        return std::nullopt;
    }

    ChainCode chainCode{};
    std::memcpy(chainCode.data(), hash.data() + 32, CHAIN_CODE_SIZE);

    return ExtendedKey(*privKey, chainCode, 0, 0, 0);
}

std::optional<ExtendedKey> ExtendedKey::DeriveChild(uint32_t index) const {
    if (depth_ == 0xFF) {
        return std::nullopt;
    }

    // Data for HMAC: 37 bytes either way
    std::array<Byte, 37> data{};
    if ((index & HARDENED_FLAG) != 0) {
        // Hardened: 0x00 || private key || index
        data[0] = 0x00;
        std::memcpy(data.data() + 1, key_.data(), PrivateKey::SIZE);
    } else {
        // Normal: compressed public key || index
        PublicKey pubKey = GetPublicKey();
        std::memcpy(data.data(), pubKey.data(), PublicKey::SIZE);
    }

    // Append index (big endian)
    data[33] = static_cast<Byte>((index >> 24) & 0xFF);
    data[34] = static_cast<Byte>((index >> 16) & 0xFF);
    data[35] = static_cast<Byte>((index >> 8) & 0xFF);
    data[36] = static_cast<Byte>(index & 0xFF);

    Hash512 hash = ComputeHMAC_SHA512(chainCode_.data(), chainCode_.size(),
                                      data.data(), data.size());

    // Child key = IL + parent key (mod n); IL >= n or zero result is skipped
    auto childKey = key_.TweakAdd(hash.data());
    if (!childKey) {
        return std::nullopt;
    }

    ChainCode newChainCode{};
    std::memcpy(newChainCode.data(), hash.data() + 32, CHAIN_CODE_SIZE);

    ExtendedKey child(*childKey, newChainCode, static_cast<uint8_t>(depth_ + 1), 0, index);
    child.parentKey_ = key_;
    return child;
}

std::optional<ExtendedKey> ExtendedKey::DerivePath(const DerivationPath& path) const {
    std::optional<ExtendedKey> current = *this;

    for (const auto& comp : path.GetComponents()) {
        current = current->DeriveChild(comp.GetFullIndex());
        if (!current) {
            return std::nullopt;
        }
    }

    return current;
}

uint32_t ExtendedKey::GetParentFingerprint() const {
    if (!parentKey_) {
        return parentFingerprint_;
    }
    return ExtendedKey(*parentKey_, ChainCode{}).GetFingerprint();
}

uint32_t ExtendedKey::GetFingerprint() const {
    Hash160 hash = GetPublicKey().GetHash160();
    return (static_cast<uint32_t>(hash[0]) << 24) |
           (static_cast<uint32_t>(hash[1]) << 16) |
           (static_cast<uint32_t>(hash[2]) << 8) |
           static_cast<uint32_t>(hash[3]);
}

} // namespace wallet
} // namespace seedorder
