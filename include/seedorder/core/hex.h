// SEEDORDER - Hex Encoding/Decoding Utilities
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#ifndef SEEDORDER_CORE_HEX_H
#define SEEDORDER_CORE_HEX_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace seedorder {

/// Convert bytes to lowercase hex string
std::string BytesToHex(const uint8_t* data, size_t len);
std::string BytesToHex(const std::vector<uint8_t>& data);

template<size_t N>
std::string BytesToHex(const std::array<uint8_t, N>& data) {
    return BytesToHex(data.data(), N);
}

/// Convert hex string to bytes (throws std::invalid_argument)
std::vector<uint8_t> HexToBytes(const std::string& hex);

/// Check if string is non-empty, even-length hex
bool IsValidHex(const std::string& str);

} // namespace seedorder

#endif // SEEDORDER_CORE_HEX_H
