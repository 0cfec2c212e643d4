// SEEDORDER - Core Types Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/core/types.h"
#include "seedorder/core/hex.h"

namespace seedorder {

// ============================================================================
// BaseHash Implementation
// ============================================================================

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    return BytesToHex(data_.data(), SIZE);
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.size() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }
    auto bytes = HexToBytes(hex);
    return BaseHash(bytes.data(), bytes.size());
}

// Explicit template instantiations
template class BaseHash<256>;
template class BaseHash<160>;
template class BaseHash<512>;

} // namespace seedorder
