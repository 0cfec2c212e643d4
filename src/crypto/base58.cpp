// SEEDORDER - Base58 Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/crypto/base58.h"
#include "seedorder/crypto/sha256.h"

#include <algorithm>
#include <cstring>

namespace seedorder {

namespace {

constexpr char kAlphabet[] = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

constexpr size_t kChecksumSize = 4;

/// Digit value of a Base58 character, or -1
int DigitOf(char c) {
    const char* pos = std::strchr(kAlphabet, c);
    if (c == '\0' || pos == nullptr) {
        return -1;
    }
    return static_cast<int>(pos - kAlphabet);
}

} // namespace

// ============================================================================
// Base58
// ============================================================================

std::string EncodeBase58(const Byte* data, size_t len) {
    size_t leadingZeros = 0;
    while (leadingZeros < len && data[leadingZeros] == 0) {
        ++leadingZeros;
    }

    // log(256) / log(58) ~= 1.38
    std::vector<Byte> digits((len - leadingZeros) * 138 / 100 + 1, 0);
    size_t used = 0;

    for (size_t i = leadingZeros; i < len; ++i) {
        int carry = data[i];
        size_t j = 0;
        for (auto it = digits.rbegin(); it != digits.rend() && (carry != 0 || j < used); ++it, ++j) {
            carry += 256 * (*it);
            *it = static_cast<Byte>(carry % 58);
            carry /= 58;
        }
        used = j;
    }

    auto it = digits.end() - static_cast<std::ptrdiff_t>(used);
    while (it != digits.end() && *it == 0) {
        ++it;
    }

    std::string result(leadingZeros, '1');
    result.reserve(leadingZeros + static_cast<size_t>(digits.end() - it));
    for (; it != digits.end(); ++it) {
        result += kAlphabet[*it];
    }
    return result;
}

std::optional<std::vector<Byte>> DecodeBase58(const std::string& str) {
    size_t leadingOnes = 0;
    while (leadingOnes < str.size() && str[leadingOnes] == '1') {
        ++leadingOnes;
    }

    // log(58) / log(256) ~= 0.733
    std::vector<Byte> bytes((str.size() - leadingOnes) * 733 / 1000 + 1, 0);
    size_t used = 0;

    for (size_t i = leadingOnes; i < str.size(); ++i) {
        int carry = DigitOf(str[i]);
        if (carry < 0) {
            return std::nullopt;
        }
        size_t j = 0;
        for (auto it = bytes.rbegin(); it != bytes.rend() && (carry != 0 || j < used); ++it, ++j) {
            carry += 58 * (*it);
            *it = static_cast<Byte>(carry % 256);
            carry /= 256;
        }
        used = j;
    }

    auto it = bytes.end() - static_cast<std::ptrdiff_t>(used);
    while (it != bytes.end() && *it == 0) {
        ++it;
    }

    std::vector<Byte> result(leadingOnes, 0x00);
    result.insert(result.end(), it, bytes.end());
    return result;
}

// ============================================================================
// Base58Check
// ============================================================================

std::string EncodeBase58Check(const std::vector<Byte>& payload) {
    Hash256 checksum = DoubleSHA256(payload);
    std::vector<Byte> buf(payload);
    buf.insert(buf.end(), checksum.begin(), checksum.begin() + kChecksumSize);
    return EncodeBase58(buf);
}

std::optional<std::vector<Byte>> DecodeBase58Check(const std::string& str) {
    auto decoded = DecodeBase58(str);
    if (!decoded || decoded->size() < kChecksumSize) {
        return std::nullopt;
    }

    const size_t payloadLen = decoded->size() - kChecksumSize;
    Hash256 checksum = DoubleSHA256(decoded->data(), payloadLen);
    if (!std::equal(checksum.begin(), checksum.begin() + kChecksumSize,
                    decoded->begin() + static_cast<std::ptrdiff_t>(payloadLen))) {
        return std::nullopt;
    }

    decoded->resize(payloadLen);
    return decoded;
}

} // namespace seedorder
