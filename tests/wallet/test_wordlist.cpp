// SEEDORDER - Wordlist Tests
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include <gtest/gtest.h>

#include "seedorder/recovery/errors.h"
#include "seedorder/wallet/wordlist.h"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace seedorder {
namespace test {

using wallet::Language;
using wallet::Wordlist;
using wallet::WordlistRegistry;

namespace {

/// 2048 distinct synthetic words "w0000".."w2047"
std::vector<std::string> SyntheticWords(const std::string& prefix = "w") {
    std::vector<std::string> words;
    for (size_t i = 0; i < wallet::WORDLIST_SIZE; ++i) {
        char buf[16];
        std::snprintf(buf, sizeof(buf), "%04zu", i);
        words.push_back(prefix + buf);
    }
    return words;
}

ErrorCode CodeOf(const std::function<void()>& fn) {
    try {
        fn();
    } catch (const RecoveryError& e) {
        return e.Code();
    }
    ADD_FAILURE() << "expected RecoveryError";
    return ErrorCode::InvalidOption;
}

} // namespace

// ============================================================================
// Language Tags
// ============================================================================

TEST(LanguageTagTest, ParseIsCaseInsensitive) {
    EXPECT_EQ(wallet::ParseLanguageTag("English").value(), Language::English);
    EXPECT_EQ(wallet::ParseLanguageTag("SPANISH").value(), Language::Spanish);
    EXPECT_EQ(wallet::ParseLanguageTag("chinese-simplified").value(), Language::ChineseSimplified);
    EXPECT_EQ(wallet::ParseLanguageTag("chinese_traditional").value(), Language::ChineseTraditional);
    EXPECT_FALSE(wallet::ParseLanguageTag("klingon").has_value());
    EXPECT_FALSE(wallet::ParseLanguageTag("").has_value());
}

TEST(LanguageTagTest, FileNamesUseUnderscores) {
    EXPECT_STREQ(wallet::LanguageFileName(Language::ChineseSimplified), "chinese_simplified");
    EXPECT_STREQ(wallet::LanguageFileName(Language::Czech), "czech");
    EXPECT_STREQ(wallet::LanguageTag(Language::ChineseTraditional), "chinese-traditional");
}

TEST(LanguageTagTest, DetectionOrderStartsWithEnglish) {
    const auto& all = wallet::AllLanguages();
    EXPECT_EQ(all.front(), Language::English);
    EXPECT_EQ(all.back(), Language::ChineseTraditional);
    EXPECT_EQ(wallet::SupportedLanguageTags().find("english, portuguese, spanish"), 0u);
}

// ============================================================================
// English List
// ============================================================================

TEST(WordlistTest, EnglishBoundaries) {
    const Wordlist& english = Wordlist::English();
    EXPECT_EQ(english.size(), wallet::WORDLIST_SIZE);
    EXPECT_EQ(english.Word(0), "abandon");
    EXPECT_EQ(english.Word(3), "about");
    EXPECT_EQ(english.Word(2047), "zoo");
    EXPECT_THROW(english.Word(2048), std::out_of_range);
}

TEST(WordlistTest, FindIsCaseInsensitive) {
    const Wordlist& english = Wordlist::English();
    EXPECT_EQ(english.Find("zoo").value(), 2047);
    EXPECT_EQ(english.Find("ZOO").value(), 2047);
    EXPECT_EQ(english.Find("Abandon").value(), 0);
    EXPECT_FALSE(english.Find("notaword").has_value());
    EXPECT_FALSE(english.Contains(""));
}

TEST(WordlistTest, RejectsWrongSize) {
    auto words = SyntheticWords();
    words.pop_back();
    EXPECT_EQ(CodeOf([&] { Wordlist(Language::Spanish, words); }),
              ErrorCode::InvalidWordlist);
}

TEST(WordlistTest, RejectsDuplicatesIgnoringCase) {
    auto words = SyntheticWords();
    words[10] = "W0003";
    EXPECT_EQ(CodeOf([&] { Wordlist(Language::Spanish, words); }),
              ErrorCode::InvalidWordlist);
}

TEST(WordlistTest, RejectsEmptyEntry) {
    auto words = SyntheticWords();
    words[5].clear();
    EXPECT_EQ(CodeOf([&] { Wordlist(Language::Spanish, words); }),
              ErrorCode::InvalidWordlist);
}

// ============================================================================
// Files and Registry
// ============================================================================

class WordlistFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        char dirname[] = "/tmp/seedorder_wordlist_test_XXXXXX";
        if (mkdtemp(dirname) == nullptr) {
            throw std::runtime_error("Failed to create temp directory");
        }
        dir_ = dirname;
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        rmdir(dir_.c_str());
    }

    std::string WriteFile(const std::string& name, const std::string& content) {
        std::string path = dir_ + "/" + name;
        std::ofstream file(path, std::ios::binary);
        file << content;
        file.close();
        tempFiles_.push_back(path);
        return path;
    }

    static std::string Join(const std::vector<std::string>& words, const char* eol) {
        std::string out;
        for (const auto& w : words) {
            out += w;
            out += eol;
        }
        return out;
    }

    std::string dir_;
    std::vector<std::string> tempFiles_;
};

TEST_F(WordlistFileTest, FromFileStripsCarriageReturnsAndBlankLines) {
    std::string content = "\n" + Join(SyntheticWords(), "\r\n") + "\n  \n";
    std::string path = WriteFile("spanish.txt", content);

    Wordlist list = Wordlist::FromFile(Language::Spanish, path);
    EXPECT_EQ(list.GetLanguage(), Language::Spanish);
    EXPECT_EQ(list.Word(0), "w0000");
    EXPECT_EQ(list.Find("w2047").value(), 2047);
}

TEST_F(WordlistFileTest, FromFileMissing) {
    EXPECT_EQ(CodeOf([&] { Wordlist::FromFile(Language::French, dir_ + "/none.txt"); }),
              ErrorCode::WordlistUnavailable);
}

TEST_F(WordlistFileTest, FromFileTooShort) {
    std::string path = WriteFile("french.txt", "un\ndeux\ntrois\n");
    EXPECT_EQ(CodeOf([&] { Wordlist::FromFile(Language::French, path); }),
              ErrorCode::InvalidWordlist);
}

TEST(WordlistRegistryTest, StartsWithEnglishAndEmbeddedLists) {
    WordlistRegistry registry;
    std::vector<Language> expected = {Language::English};
    for (const auto& embedded : wallet::EmbeddedWordlists()) {
        expected.push_back(embedded.language);
        EXPECT_EQ(registry.Get(embedded.language).Word(0), embedded.words[0]);
        EXPECT_EQ(registry.Get(embedded.language).Word(2047), embedded.words[2047]);
    }
    EXPECT_EQ(registry.Available(), expected);

    for (Language lang : wallet::AllLanguages()) {
        if (!registry.Has(lang)) {
            EXPECT_EQ(CodeOf([&] { registry.Get(lang); }), ErrorCode::WordlistUnavailable);
        }
    }
}

TEST(WordlistRegistryTest, EmbeddedListsFollowDetectionOrder) {
    const auto& order = wallet::AllLanguages();
    size_t previous = 0;
    for (const auto& embedded : wallet::EmbeddedWordlists()) {
        auto it = std::find(order.begin(), order.end(), embedded.language);
        ASSERT_NE(it, order.end());
        size_t position = static_cast<size_t>(it - order.begin());
        EXPECT_GT(position, previous);
        previous = position;
    }
}

TEST_F(WordlistFileTest, RegistryEnglishOnly) {
    WordlistRegistry registry = WordlistRegistry::EnglishOnly();
    EXPECT_TRUE(registry.Has(Language::English));
    EXPECT_FALSE(registry.Has(Language::Japanese));
    EXPECT_EQ(registry.Find(Language::Japanese), nullptr);
    EXPECT_EQ(registry.Available().size(), 1u);
    EXPECT_EQ(CodeOf([&] { registry.Get(Language::Japanese); }),
              ErrorCode::WordlistUnavailable);
}

TEST_F(WordlistFileTest, RegistryLoadsPresentFiles) {
    WriteFile("italian.txt", Join(SyntheticWords("i"), "\n"));
    WriteFile("chinese_simplified.txt", Join(SyntheticWords("c"), "\n"));

    WordlistRegistry registry = WordlistRegistry::EnglishOnly();
    EXPECT_EQ(registry.LoadDirectory(dir_), 2u);
    EXPECT_TRUE(registry.Has(Language::Italian));
    EXPECT_TRUE(registry.Has(Language::ChineseSimplified));
    EXPECT_FALSE(registry.Has(Language::Czech));
    EXPECT_EQ(registry.Get(Language::Italian).Word(1), "i0001");

    auto available = registry.Available();
    ASSERT_EQ(available.size(), 3u);
    EXPECT_EQ(available[0], Language::English);
    EXPECT_EQ(available[1], Language::Italian);
    EXPECT_EQ(available[2], Language::ChineseSimplified);
}

TEST_F(WordlistFileTest, DirectoryReplacesEmbeddedList) {
    WriteFile("spanish.txt", Join(SyntheticWords("s"), "\n"));

    WordlistRegistry registry;
    registry.LoadDirectory(dir_);
    EXPECT_EQ(registry.Get(Language::Spanish).Word(0), "s0000");
}

TEST_F(WordlistFileTest, RegistryRejectsMissingDirectory) {
    WordlistRegistry registry;
    EXPECT_EQ(CodeOf([&] { registry.LoadDirectory(dir_ + "/missing"); }),
              ErrorCode::WordlistUnavailable);
}

} // namespace test
} // namespace seedorder
