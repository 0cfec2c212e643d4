// SEEDORDER - Wordlist Language Resolution
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Picks the BIP-39 wordlist the candidate words belong to, either from an
// explicit language tag or by counting word matches per language.

#ifndef SEEDORDER_RECOVERY_LANGUAGE_H
#define SEEDORDER_RECOVERY_LANGUAGE_H

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "seedorder/wallet/wordlist.h"

namespace seedorder {
namespace recovery {

/// Tag that asks for detection besides the default "english"
constexpr const char* AUTO_LANGUAGE_TAG = "auto";

/// Outcome of language resolution
struct LanguageResolution {
    wallet::Language language{wallet::Language::English};

    /// Chosen by detection rather than given explicitly
    bool autoDetected{false};

    /// Detection found no language with enough matches and fell back to English
    bool inconclusive{false};

    /// Words that matched the chosen list (detection only)
    size_t matchCount{0};

    /// "japanese (auto-detected)", "english (default)" or the plain tag
    std::string Describe() const;
};

/**
 * Resolves the wordlist language for a run.
 *
 * Detection tries every available language in the fixed order of
 * wallet::AllLanguages(). A language whose list matches every word wins
 * at once; otherwise the best score wins if it covers at least half of
 * the words (integer division), and ties keep the earlier language.
 */
class LanguageResolver {
public:
    explicit LanguageResolver(const wallet::WordlistRegistry& registry)
        : registry_(registry) {}

    /// True for the tags that request detection ("english", "auto")
    static bool IsDetectionRequest(const std::string& tag);

    /**
     * Resolve from a command-line tag.
     *
     * @throws RecoveryError UnknownLanguage for an unrecognized tag
     */
    LanguageResolution Resolve(const std::vector<std::string>& words,
                               const std::string& tag) const;

    /// Resolve from an optional explicit language; English and nullopt detect
    LanguageResolution Resolve(const std::vector<std::string>& words,
                               const std::optional<wallet::Language>& explicitLanguage) const;

    /// Run detection unconditionally
    LanguageResolution Detect(const std::vector<std::string>& words) const;

    /// Number of words found in a list (ASCII case-insensitive)
    static size_t CountMatches(const std::vector<std::string>& words,
                               const wallet::Wordlist& wordlist);

private:
    const wallet::WordlistRegistry& registry_;
};

} // namespace recovery
} // namespace seedorder

#endif // SEEDORDER_RECOVERY_LANGUAGE_H
