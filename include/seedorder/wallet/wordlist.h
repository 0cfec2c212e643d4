// SEEDORDER - BIP-39 Wordlists
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// The ten BIP-39 languages, their 2048-word lists and a registry of the
// lists available to a run. English is always compiled in. The build
// embeds every other list found as wordlists/<file>.txt, and a run can
// load or replace lists from a directory in the same layout (the
// bitcoin/bips repository's bip-0039 directory).

#ifndef SEEDORDER_WALLET_WORDLIST_H
#define SEEDORDER_WALLET_WORDLIST_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace seedorder {
namespace wallet {

// ============================================================================
// Languages
// ============================================================================

/// Number of words in every BIP-39 list
constexpr size_t WORDLIST_SIZE = 2048;

/// Compiled-in English list
extern const char* const ENGLISH_WORDS[WORDLIST_SIZE];

enum class Language {
    English,
    Portuguese,
    Spanish,
    French,
    Italian,
    Czech,
    Korean,
    Japanese,
    ChineseSimplified,
    ChineseTraditional
};

constexpr size_t LANGUAGE_COUNT = 10;

/// All languages, in the order language detection tries them
const std::array<Language, LANGUAGE_COUNT>& AllLanguages();

/// Command-line tag ("english", "chinese-simplified", ...)
const char* LanguageTag(Language lang);

/// Upstream file stem ("english", "chinese_simplified", ...)
const char* LanguageFileName(Language lang);

/// Parse a tag; case-insensitive, '_' accepted in place of '-'
std::optional<Language> ParseLanguageTag(const std::string& tag);

/// "english, portuguese, ..." for error messages
std::string SupportedLanguageTags();

/// ASCII-only lowercase; other bytes are left alone
std::string ToLowerAscii(const std::string& str);

/// A list compiled in from wordlists/<file>.txt
struct EmbeddedWordlist {
    Language language;
    const char* const* words;  // WORDLIST_SIZE entries
};

/// Non-English lists embedded at build time, in detection order
std::vector<EmbeddedWordlist> EmbeddedWordlists();

// ============================================================================
// Wordlist
// ============================================================================

/**
 * An immutable list of exactly 2048 words.
 *
 * Lookups are ASCII case-insensitive. Words are kept in their canonical
 * spelling, which is what goes into the seed derivation.
 */
class Wordlist {
public:
    /**
     * @throws RecoveryError InvalidWordlist unless words holds exactly 2048
     *         non-empty entries that are unique after ASCII lowercasing
     */
    Wordlist(Language language, std::vector<std::string> words);

    /// The compiled-in English list
    static const Wordlist& English();

    /**
     * Read one word per line. Trailing CR and surrounding spaces/tabs are
     * stripped and blank lines ignored; nothing else is normalized.
     *
     * @throws RecoveryError WordlistUnavailable if the file cannot be read,
     *         InvalidWordlist if its contents are malformed
     */
    static Wordlist FromFile(Language language, const std::string& path);

    Language GetLanguage() const { return language_; }

    size_t size() const { return words_.size(); }

    /// Canonical spelling of word #index
    /// @throws std::out_of_range if index >= 2048
    const std::string& Word(uint16_t index) const;

    /// Index of a word, case-insensitively
    std::optional<uint16_t> Find(const std::string& word) const;

    bool Contains(const std::string& word) const { return Find(word).has_value(); }

private:
    Language language_;
    std::vector<std::string> words_;
    std::unordered_map<std::string, uint16_t> index_;
};

// ============================================================================
// Wordlist Registry
// ============================================================================

/**
 * The set of wordlists available to a run.
 *
 * Starts with English and every embedded list. LoadDirectory() adds or
 * replaces whatever languages a directory provides.
 */
class WordlistRegistry {
public:
    WordlistRegistry();

    /// Registry holding the English list alone
    static WordlistRegistry EnglishOnly();

    /// Add or replace a list
    void Add(Wordlist wordlist);

    /**
     * Load "<dir>/<file>.txt" for every language whose file exists.
     *
     * @return Number of lists loaded
     * @throws RecoveryError WordlistUnavailable if dir is not a directory,
     *         InvalidWordlist if a present file is malformed
     */
    size_t LoadDirectory(const std::string& dir);

    bool Has(Language lang) const { return lists_.count(lang) != 0; }

    /// @return nullptr if the language is not loaded
    const Wordlist* Find(Language lang) const;

    /// @throws RecoveryError WordlistUnavailable if the language is not loaded
    const Wordlist& Get(Language lang) const;

    /// Loaded languages, in detection order
    std::vector<Language> Available() const;

private:
    struct EnglishOnlyTag {};
    explicit WordlistRegistry(EnglishOnlyTag);

    std::map<Language, Wordlist> lists_;
};

} // namespace wallet
} // namespace seedorder

#endif // SEEDORDER_WALLET_WORDLIST_H
