// SEEDORDER - Bech32 Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/crypto/bech32.h"

#include <cstring>

namespace seedorder {
namespace bech32 {

namespace {

constexpr char kCharset[] = "qpzry9x8gf2tvdw0s3jn54khce6mua7l";

/// Value of a lowercase charset character, or -1
int ValueOf(char c) {
    const char* pos = std::strchr(kCharset, c);
    if (c == '\0' || pos == nullptr) {
        return -1;
    }
    return static_cast<int>(pos - kCharset);
}

uint32_t Polymod(const std::vector<uint8_t>& values) {
    static const uint32_t kGenerator[5] = {
        0x3b6a57b2, 0x26508e6d, 0x1ea119fa, 0x3d4233dd, 0x2a1462b3
    };
    uint32_t chk = 1;
    for (uint8_t v : values) {
        uint32_t top = chk >> 25;
        chk = ((chk & 0x1ffffff) << 5) ^ v;
        for (int i = 0; i < 5; ++i) {
            if ((top >> i) & 1) {
                chk ^= kGenerator[i];
            }
        }
    }
    return chk;
}

std::vector<uint8_t> ExpandHrp(const std::string& hrp) {
    std::vector<uint8_t> out;
    out.reserve(hrp.size() * 2 + 1);
    for (char c : hrp) {
        out.push_back(static_cast<uint8_t>(c) >> 5);
    }
    out.push_back(0);
    for (char c : hrp) {
        out.push_back(static_cast<uint8_t>(c) & 31);
    }
    return out;
}

uint32_t TargetConstant(Encoding encoding) {
    return encoding == Encoding::Bech32m ? BECH32M_CONST : 1;
}

} // namespace

// ============================================================================
// Generic Encoding
// ============================================================================

std::string Encode(Encoding encoding, const std::string& hrp,
                   const std::vector<uint8_t>& values) {
    std::vector<uint8_t> enc = ExpandHrp(hrp);
    enc.insert(enc.end(), values.begin(), values.end());
    enc.resize(enc.size() + CHECKSUM_SIZE, 0);
    uint32_t mod = Polymod(enc) ^ TargetConstant(encoding);

    std::string result;
    result.reserve(hrp.size() + 1 + values.size() + CHECKSUM_SIZE);
    for (char c : hrp) {
        result += (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    }
    result += '1';
    for (uint8_t v : values) {
        result += kCharset[v & 31];
    }
    for (size_t i = 0; i < CHECKSUM_SIZE; ++i) {
        result += kCharset[(mod >> (5 * (5 - i))) & 31];
    }
    return result;
}

DecodeResult Decode(const std::string& str) {
    DecodeResult result;
    if (str.size() > MAX_LENGTH) {
        return result;
    }

    bool hasLower = false;
    bool hasUpper = false;
    for (char c : str) {
        if (c < 33 || c > 126) {
            return result;
        }
        if (c >= 'a' && c <= 'z') hasLower = true;
        if (c >= 'A' && c <= 'Z') hasUpper = true;
    }
    if (hasLower && hasUpper) {
        return result;
    }

    std::string lower(str);
    for (char& c : lower) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }

    size_t sep = lower.rfind('1');
    if (sep == std::string::npos || sep == 0 || sep + 1 + CHECKSUM_SIZE > lower.size()) {
        return result;
    }

    std::vector<uint8_t> values;
    values.reserve(lower.size() - sep - 1);
    for (size_t i = sep + 1; i < lower.size(); ++i) {
        int v = ValueOf(lower[i]);
        if (v < 0) {
            return result;
        }
        values.push_back(static_cast<uint8_t>(v));
    }

    std::string hrp = lower.substr(0, sep);
    std::vector<uint8_t> check = ExpandHrp(hrp);
    check.insert(check.end(), values.begin(), values.end());
    uint32_t mod = Polymod(check);

    if (mod == 1) {
        result.encoding = Encoding::Bech32;
    } else if (mod == BECH32M_CONST) {
        result.encoding = Encoding::Bech32m;
    } else {
        return result;
    }

    values.resize(values.size() - CHECKSUM_SIZE);
    result.hrp = std::move(hrp);
    result.values = std::move(values);
    return result;
}

bool ConvertBits(const std::vector<uint8_t>& in, int fromBits, int toBits,
                 bool pad, std::vector<uint8_t>& out) {
    uint32_t acc = 0;
    int bits = 0;
    const uint32_t maxv = (1u << toBits) - 1;
    const uint32_t maxAcc = (1u << (fromBits + toBits - 1)) - 1;
    for (uint8_t value : in) {
        if ((value >> fromBits) != 0) {
            return false;
        }
        acc = ((acc << fromBits) | value) & maxAcc;
        bits += fromBits;
        while (bits >= toBits) {
            bits -= toBits;
            out.push_back(static_cast<uint8_t>((acc >> bits) & maxv));
        }
    }
    if (pad) {
        if (bits > 0) {
            out.push_back(static_cast<uint8_t>((acc << (toBits - bits)) & maxv));
        }
    } else if (bits >= fromBits || ((acc << (toBits - bits)) & maxv) != 0) {
        return false;
    }
    return true;
}

// ============================================================================
// Segwit Addresses
// ============================================================================

namespace {

bool ValidProgram(int version, size_t len) {
    if (version < 0 || version > 16) return false;
    if (len < 2 || len > 40) return false;
    if (version == 0 && len != 20 && len != 32) return false;
    return true;
}

} // namespace

std::string EncodeSegwit(const std::string& hrp, int version,
                         const std::vector<Byte>& program) {
    if (!ValidProgram(version, program.size())) {
        return "";
    }
    std::vector<uint8_t> values{static_cast<uint8_t>(version)};
    ConvertBits(program, 8, 5, true, values);
    return Encode(version == 0 ? Encoding::Bech32 : Encoding::Bech32m, hrp, values);
}

std::optional<WitnessProgram> DecodeSegwit(const std::string& addr) {
    DecodeResult dec = Decode(addr);
    if (dec.encoding == Encoding::Invalid || dec.values.empty()) {
        return std::nullopt;
    }

    int version = dec.values[0];
    Encoding expected = version == 0 ? Encoding::Bech32 : Encoding::Bech32m;
    if (dec.encoding != expected) {
        return std::nullopt;
    }

    std::vector<uint8_t> data(dec.values.begin() + 1, dec.values.end());
    WitnessProgram wp;
    if (!ConvertBits(data, 5, 8, false, wp.program)) {
        return std::nullopt;
    }
    if (!ValidProgram(version, wp.program.size())) {
        return std::nullopt;
    }
    wp.hrp = std::move(dec.hrp);
    wp.version = version;
    return wp;
}

} // namespace bech32
} // namespace seedorder
