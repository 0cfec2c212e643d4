// SEEDORDER - Mnemonic-to-Address Pipeline
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Turns one candidate word ordering into the address it would control:
// checksum validation, BIP39 seed, BIP32 walk along the scheme path and
// address encoding. Invalid candidates are skipped, never fatal.

#ifndef SEEDORDER_RECOVERY_PIPELINE_H
#define SEEDORDER_RECOVERY_PIPELINE_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "seedorder/recovery/scheme.h"
#include "seedorder/wallet/hdkey.h"
#include "seedorder/wallet/wordlist.h"

namespace seedorder {
namespace recovery {

/// Why a candidate produced no address
enum class SkipReason {
    None,
    UnknownWord,        ///< A word is not in the wordlist
    BadChecksum,        ///< Valid words, wrong checksum
    KeyDerivation       ///< BIP32 produced an invalid key on the path
};

const char* SkipReasonToString(SkipReason reason);

/// Result of one pipeline run
struct PipelineOutcome {
    std::optional<std::string> address;
    SkipReason skip{SkipReason::None};

    bool Ok() const { return address.has_value(); }

    static PipelineOutcome Derived(std::string addr) {
        PipelineOutcome outcome;
        outcome.address = std::move(addr);
        return outcome;
    }

    static PipelineOutcome Skipped(SkipReason reason) {
        PipelineOutcome outcome;
        outcome.skip = reason;
        return outcome;
    }
};

/**
 * Derives the scheme's address for candidate phrases.
 *
 * Holds only immutable configuration; Derive() may be called from any
 * number of threads at once.
 */
class DerivationPipeline {
public:
    DerivationPipeline(const wallet::Wordlist& wordlist, AddressScheme scheme,
                       wallet::DerivationPath path);

    /// Derive from a whitespace-separated phrase
    PipelineOutcome Derive(const std::string& phrase) const;

    /// Derive from words
    PipelineOutcome Derive(const std::vector<std::string>& words) const;

    /**
     * Derive from wordlist indices (all < 2048).
     *
     * @param phrase Receives the canonical phrase when the checksum passes
     */
    PipelineOutcome DeriveIndices(const std::vector<uint16_t>& indices,
                                  std::string* phrase = nullptr) const;

    /// Address for an already-validated canonical phrase
    PipelineOutcome DerivePhrase(const std::string& canonicalPhrase) const;

    const wallet::Wordlist& GetWordlist() const { return wordlist_; }
    AddressScheme GetScheme() const { return scheme_; }
    const wallet::DerivationPath& GetPath() const { return path_; }

private:
    const wallet::Wordlist& wordlist_;
    AddressScheme scheme_;
    wallet::DerivationPath path_;
};

} // namespace recovery
} // namespace seedorder

#endif // SEEDORDER_RECOVERY_PIPELINE_H
