// SEEDORDER - BIP39 Mnemonic Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/wallet/mnemonic.h"
#include "seedorder/crypto/hmac.h"
#include "seedorder/crypto/sha256.h"

#include <cstring>
#include <sstream>
#include <stdexcept>

#include <openssl/crypto.h>

namespace seedorder {
namespace wallet {

const char* MnemonicStatusToString(MnemonicStatus status) {
    switch (status) {
        case MnemonicStatus::Valid:          return "Valid";
        case MnemonicStatus::WrongWordCount: return "WrongWordCount";
        case MnemonicStatus::UnknownWord:    return "UnknownWord";
        case MnemonicStatus::BadChecksum:    return "BadChecksum";
    }
    return "Unknown";
}

bool Mnemonic::IsValidWordCount(size_t count) {
    return count >= 12 && count <= 24 && count % 3 == 0;
}

namespace {

/// Pack 11-bit indices MSB first into ceil(n*11/8) bytes
std::vector<Byte> PackBits(const std::vector<uint16_t>& indices) {
    std::vector<Byte> result((indices.size() * 11 + 7) / 8, 0);
    size_t bitPos = 0;
    for (uint16_t idx : indices) {
        for (int j = 10; j >= 0; --j) {
            if (idx & (1 << j)) {
                result[bitPos / 8] |= static_cast<Byte>(1 << (7 - (bitPos % 8)));
            }
            ++bitPos;
        }
    }
    return result;
}

bool GetBit(const Byte* data, size_t bitPos) {
    return (data[bitPos / 8] >> (7 - (bitPos % 8))) & 1;
}

} // namespace

std::vector<Byte> Mnemonic::ToEntropy(const std::vector<uint16_t>& indices) {
    if (!IsValidWordCount(indices.size())) {
        throw std::invalid_argument("Invalid mnemonic word count: " +
                                    std::to_string(indices.size()));
    }
    size_t entropyBits = indices.size() * 11 - indices.size() / 3;
    std::vector<Byte> packed = PackBits(indices);
    packed.resize(entropyBits / 8);
    return packed;
}

MnemonicStatus Mnemonic::CheckIndices(const std::vector<uint16_t>& indices) {
    if (!IsValidWordCount(indices.size())) {
        return MnemonicStatus::WrongWordCount;
    }
    for (uint16_t idx : indices) {
        if (idx >= WORDLIST_SIZE) {
            return MnemonicStatus::UnknownWord;
        }
    }

    size_t checksumBits = indices.size() / 3;
    size_t entropyBits = indices.size() * 11 - checksumBits;

    std::vector<Byte> packed = PackBits(indices);
    Hash256 hash = SHA256Hash(packed.data(), entropyBits / 8);

    for (size_t i = 0; i < checksumBits; ++i) {
        if (GetBit(packed.data(), entropyBits + i) != GetBit(hash.data(), i)) {
            return MnemonicStatus::BadChecksum;
        }
    }
    return MnemonicStatus::Valid;
}

MnemonicStatus Mnemonic::Check(const std::vector<std::string>& words,
                               const Wordlist& wordlist,
                               std::vector<uint16_t>* indices) {
    if (!IsValidWordCount(words.size())) {
        return MnemonicStatus::WrongWordCount;
    }

    std::vector<uint16_t> found;
    found.reserve(words.size());
    for (const auto& w : words) {
        auto idx = wordlist.Find(w);
        if (!idx) {
            return MnemonicStatus::UnknownWord;
        }
        found.push_back(*idx);
    }

    MnemonicStatus status = CheckIndices(found);
    if (indices) {
        *indices = std::move(found);
    }
    return status;
}

MnemonicStatus Mnemonic::CheckPhrase(const std::string& phrase, const Wordlist& wordlist) {
    std::vector<std::string> words;
    std::istringstream stream(phrase);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return Check(words, wordlist);
}

std::string Mnemonic::JoinPhrase(const std::vector<uint16_t>& indices,
                                 const Wordlist& wordlist) {
    std::string result;
    for (size_t i = 0; i < indices.size(); ++i) {
        if (i > 0) result += ' ';
        result += wordlist.Word(indices[i]);
    }
    return result;
}

Mnemonic::Seed Mnemonic::ToSeed(const std::string& phrase) {
    // Salt is "mnemonic" + passphrase; the passphrase is always empty here
    std::vector<Byte> derived = PBKDF2_SHA512(phrase, "mnemonic",
                                              BIP39_PBKDF2_ROUNDS, BIP39_SEED_SIZE);
    Seed seed{};
    std::memcpy(seed.data(), derived.data(), BIP39_SEED_SIZE);
    OPENSSL_cleanse(derived.data(), derived.size());
    return seed;
}

} // namespace wallet
} // namespace seedorder
