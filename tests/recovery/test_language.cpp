// SEEDORDER - Language Resolution Tests
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include <gtest/gtest.h>

#include "seedorder/recovery/errors.h"
#include "seedorder/recovery/language.h"
#include "seedorder/wallet/wordlist.h"

#include <cstdio>
#include <optional>
#include <string>
#include <vector>

namespace seedorder {
namespace test {

using recovery::LanguageResolution;
using recovery::LanguageResolver;
using wallet::Language;

// ============================================================================
// Test Fixtures
// ============================================================================

/// English-only registry plus synthetic Spanish ("s0000"...) and Italian ("i0000"...) lists
class LanguageResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        registry_.Add(wallet::Wordlist(Language::Spanish, MakeWords("s")));
        registry_.Add(wallet::Wordlist(Language::Italian, MakeWords("i")));
    }

    static std::vector<std::string> MakeWords(const std::string& prefix) {
        std::vector<std::string> words;
        for (size_t i = 0; i < wallet::WORDLIST_SIZE; ++i) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04zu", i);
            words.push_back(prefix + buf);
        }
        return words;
    }

    /// count words from one list followed by fillers from another
    static std::vector<std::string> Phrase(const std::string& prefix, size_t count,
                                           const std::string& filler, size_t total = 12) {
        std::vector<std::string> words;
        for (size_t i = 0; i < total; ++i) {
            char buf[16];
            std::snprintf(buf, sizeof(buf), "%04zu", i);
            words.push_back((i < count ? prefix : filler) + buf);
        }
        return words;
    }

    wallet::WordlistRegistry registry_ = wallet::WordlistRegistry::EnglishOnly();
};

// ============================================================================
// Detection
// ============================================================================

TEST_F(LanguageResolverTest, EnglishPhraseDetectsEnglish) {
    LanguageResolver resolver(registry_);
    std::vector<std::string> words(11, "abandon");
    words.push_back("about");

    LanguageResolution result = resolver.Detect(words);
    EXPECT_EQ(result.language, Language::English);
    EXPECT_TRUE(result.autoDetected);
    EXPECT_FALSE(result.inconclusive);
    EXPECT_EQ(result.matchCount, 12u);
    EXPECT_EQ(result.Describe(), "english (auto-detected)");
}

TEST_F(LanguageResolverTest, FullMatchWins) {
    LanguageResolver resolver(registry_);
    LanguageResolution result = resolver.Detect(Phrase("s", 12, "x"));
    EXPECT_EQ(result.language, Language::Spanish);
    EXPECT_EQ(result.matchCount, 12u);
    EXPECT_EQ(result.Describe(), "spanish (auto-detected)");
}

TEST_F(LanguageResolverTest, HalfTheWordsIsEnough) {
    LanguageResolver resolver(registry_);
    LanguageResolution result = resolver.Detect(Phrase("i", 6, "x"));
    EXPECT_EQ(result.language, Language::Italian);
    EXPECT_FALSE(result.inconclusive);
    EXPECT_EQ(result.matchCount, 6u);
}

TEST_F(LanguageResolverTest, BelowHalfFallsBackToEnglish) {
    LanguageResolver resolver(registry_);
    LanguageResolution result = resolver.Detect(Phrase("i", 5, "x"));
    EXPECT_EQ(result.language, Language::English);
    EXPECT_TRUE(result.inconclusive);
    EXPECT_EQ(result.matchCount, 0u);
    EXPECT_EQ(result.Describe(), "english (default)");
}

TEST_F(LanguageResolverTest, TieKeepsEarlierLanguage) {
    LanguageResolver resolver(registry_);
    // Six Spanish then six Italian words; Spanish comes first in detection order
    LanguageResolution result = resolver.Detect(Phrase("s", 6, "i"));
    EXPECT_EQ(result.language, Language::Spanish);
    EXPECT_EQ(result.matchCount, 6u);
}

TEST_F(LanguageResolverTest, UnloadedLanguagesAreSkipped) {
    wallet::WordlistRegistry englishOnly = wallet::WordlistRegistry::EnglishOnly();
    LanguageResolver resolver(englishOnly);
    LanguageResolution result = resolver.Detect(Phrase("s", 12, "x"));
    EXPECT_EQ(result.language, Language::English);
    EXPECT_TRUE(result.inconclusive);
}

TEST(BuiltinLanguageTest, SpanishPhraseDetectsSpanish) {
    wallet::WordlistRegistry registry;
    if (!registry.Has(Language::Spanish)) {
        GTEST_SKIP() << "spanish wordlist not embedded in this build";
    }

    std::vector<std::string> words = {"abeja", "abierto", "abogado", "abono",
                                      "aborto", "abrazo", "abrir", "abuelo",
                                      "abuso", "acabar", "academia", "acceso"};
    LanguageResolver resolver(registry);
    LanguageResolution result = resolver.Resolve(words, std::string("auto"));
    EXPECT_EQ(result.language, Language::Spanish);
    EXPECT_TRUE(result.autoDetected);
    EXPECT_FALSE(result.inconclusive);
    EXPECT_EQ(result.matchCount, 12u);
    EXPECT_EQ(result.Describe(), "spanish (auto-detected)");
}

TEST(BuiltinLanguageTest, EmbeddedListsDetectThemselves) {
    wallet::WordlistRegistry registry;
    LanguageResolver resolver(registry);
    for (const auto& embedded : wallet::EmbeddedWordlists()) {
        // Words no other loaded list has, since some lists share entries
        std::vector<std::string> words;
        for (size_t i = 0; i < wallet::WORDLIST_SIZE && words.size() < 12; ++i) {
            bool shared = false;
            for (Language other : registry.Available()) {
                if (other != embedded.language &&
                    registry.Get(other).Contains(embedded.words[i])) {
                    shared = true;
                    break;
                }
            }
            if (!shared) {
                words.push_back(embedded.words[i]);
            }
        }
        ASSERT_EQ(words.size(), 12u);

        LanguageResolution result = resolver.Detect(words);
        EXPECT_EQ(result.language, embedded.language) << wallet::LanguageTag(embedded.language);
        EXPECT_EQ(result.matchCount, 12u);
    }
}

// ============================================================================
// Explicit Tags
// ============================================================================

TEST_F(LanguageResolverTest, DetectionTags) {
    EXPECT_TRUE(LanguageResolver::IsDetectionRequest("english"));
    EXPECT_TRUE(LanguageResolver::IsDetectionRequest("English"));
    EXPECT_TRUE(LanguageResolver::IsDetectionRequest("auto"));
    EXPECT_FALSE(LanguageResolver::IsDetectionRequest("spanish"));
}

TEST_F(LanguageResolverTest, EnglishTagStillDetects) {
    LanguageResolver resolver(registry_);
    LanguageResolution result = resolver.Resolve(Phrase("s", 12, "x"), std::string("english"));
    EXPECT_EQ(result.language, Language::Spanish);
    EXPECT_TRUE(result.autoDetected);
}

TEST_F(LanguageResolverTest, ExplicitLanguageIsNotDetected) {
    LanguageResolver resolver(registry_);
    LanguageResolution result = resolver.Resolve(Phrase("s", 12, "x"), std::string("Italian"));
    EXPECT_EQ(result.language, Language::Italian);
    EXPECT_FALSE(result.autoDetected);
    EXPECT_FALSE(result.inconclusive);
    EXPECT_EQ(result.matchCount, 0u);
    EXPECT_EQ(result.Describe(), "italian");
}

TEST_F(LanguageResolverTest, ExplicitUnloadedLanguageResolves) {
    LanguageResolver resolver(registry_);
    LanguageResolution result = resolver.Resolve(Phrase("s", 12, "x"),
                                                 std::optional<Language>(Language::Korean));
    EXPECT_EQ(result.language, Language::Korean);
    EXPECT_FALSE(registry_.Has(Language::Korean));
}

TEST_F(LanguageResolverTest, UnknownTagThrows) {
    LanguageResolver resolver(registry_);
    try {
        resolver.Resolve(Phrase("s", 12, "x"), std::string("klingon"));
        FAIL() << "expected UnknownLanguage";
    } catch (const RecoveryError& e) {
        EXPECT_EQ(e.Code(), ErrorCode::UnknownLanguage);
        std::string msg = e.what();
        EXPECT_EQ(msg.find("Unknown language: klingon. Supported: english"), 0u);
    }
}

TEST_F(LanguageResolverTest, CountMatchesIgnoresCase) {
    std::vector<std::string> words = {"ABANDON", "Zoo", "nope"};
    EXPECT_EQ(LanguageResolver::CountMatches(words, wallet::Wordlist::English()), 2u);
}

} // namespace test
} // namespace seedorder
