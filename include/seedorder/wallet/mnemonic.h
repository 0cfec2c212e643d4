// SEEDORDER - BIP39 Mnemonic Validation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Checksum validation of BIP39 word sequences and derivation of the
// 64-byte seed. Only the empty passphrase is supported.

#ifndef SEEDORDER_WALLET_MNEMONIC_H
#define SEEDORDER_WALLET_MNEMONIC_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "seedorder/core/types.h"
#include "seedorder/wallet/wordlist.h"

namespace seedorder {
namespace wallet {

/// Seed size constants
constexpr size_t BIP39_SEED_SIZE = 64;
constexpr uint32_t BIP39_PBKDF2_ROUNDS = 2048;

/// Outcome of validating a word sequence
enum class MnemonicStatus {
    Valid,
    WrongWordCount,     ///< Not 12, 15, 18, 21 or 24 words
    UnknownWord,        ///< A word is not in the wordlist
    BadChecksum         ///< Checksum bits do not match SHA256(entropy)
};

const char* MnemonicStatusToString(MnemonicStatus status);

/**
 * BIP39 mnemonic utilities.
 *
 * Each word encodes 11 bits. For ENT bits of entropy the sequence carries
 * ENT/32 checksum bits taken from the front of SHA256(entropy).
 */
class Mnemonic {
public:
    using Seed = std::array<Byte, BIP39_SEED_SIZE>;

    /// 12, 15, 18, 21 or 24
    static bool IsValidWordCount(size_t count);

    /// Validate a sequence of word indices (each < 2048)
    static MnemonicStatus CheckIndices(const std::vector<uint16_t>& indices);

    /**
     * Validate words against a wordlist.
     *
     * @param words Words, matched ASCII case-insensitively
     * @param wordlist List to look the words up in
     * @param indices Receives the word indices when every word is known
     */
    static MnemonicStatus Check(const std::vector<std::string>& words,
                                const Wordlist& wordlist,
                                std::vector<uint16_t>* indices = nullptr);

    /// Split on whitespace and Check()
    static MnemonicStatus CheckPhrase(const std::string& phrase, const Wordlist& wordlist);

    /// Canonical phrase: wordlist spelling joined by single spaces
    static std::string JoinPhrase(const std::vector<uint16_t>& indices,
                                  const Wordlist& wordlist);

    /// Entropy bytes of a sequence with a valid word count (checksum not verified)
    static std::vector<Byte> ToEntropy(const std::vector<uint16_t>& indices);

    /// PBKDF2-HMAC-SHA512(phrase, "mnemonic", 2048) -> 64-byte seed
    static Seed ToSeed(const std::string& phrase);
};

} // namespace wallet
} // namespace seedorder

#endif // SEEDORDER_WALLET_MNEMONIC_H
