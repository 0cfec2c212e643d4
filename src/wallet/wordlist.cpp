// SEEDORDER - BIP-39 Wordlists Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/wallet/wordlist.h"
#include "seedorder/recovery/errors.h"
#include "seedorder/util/logging.h"

#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace seedorder {
namespace wallet {

namespace fs = std::filesystem;

// ============================================================================
// Languages
// ============================================================================

const std::array<Language, LANGUAGE_COUNT>& AllLanguages() {
    static const std::array<Language, LANGUAGE_COUNT> languages = {
        Language::English,
        Language::Portuguese,
        Language::Spanish,
        Language::French,
        Language::Italian,
        Language::Czech,
        Language::Korean,
        Language::Japanese,
        Language::ChineseSimplified,
        Language::ChineseTraditional
    };
    return languages;
}

const char* LanguageTag(Language lang) {
    switch (lang) {
        case Language::English:            return "english";
        case Language::Portuguese:         return "portuguese";
        case Language::Spanish:            return "spanish";
        case Language::French:             return "french";
        case Language::Italian:            return "italian";
        case Language::Czech:              return "czech";
        case Language::Korean:             return "korean";
        case Language::Japanese:           return "japanese";
        case Language::ChineseSimplified:  return "chinese-simplified";
        case Language::ChineseTraditional: return "chinese-traditional";
    }
    return "unknown";
}

const char* LanguageFileName(Language lang) {
    switch (lang) {
        case Language::ChineseSimplified:  return "chinese_simplified";
        case Language::ChineseTraditional: return "chinese_traditional";
        default:                           return LanguageTag(lang);
    }
}

std::string ToLowerAscii(const std::string& str) {
    std::string result = str;
    for (char& c : result) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return result;
}

std::optional<Language> ParseLanguageTag(const std::string& tag) {
    std::string key = ToLowerAscii(tag);
    for (char& c : key) {
        if (c == '_') c = '-';
    }
    for (Language lang : AllLanguages()) {
        if (key == LanguageTag(lang)) {
            return lang;
        }
    }
    return std::nullopt;
}

std::string SupportedLanguageTags() {
    std::string result;
    for (Language lang : AllLanguages()) {
        if (!result.empty()) result += ", ";
        result += LanguageTag(lang);
    }
    return result;
}

// ============================================================================
// Wordlist
// ============================================================================

Wordlist::Wordlist(Language language, std::vector<std::string> words)
    : language_(language), words_(std::move(words)) {
    const std::string name = LanguageTag(language_);

    if (words_.size() != WORDLIST_SIZE) {
        throw RecoveryError(ErrorCode::InvalidWordlist,
                            "Wordlist " + name + " has " + std::to_string(words_.size()) +
                            " words, expected " + std::to_string(WORDLIST_SIZE));
    }

    index_.reserve(WORDLIST_SIZE);
    for (size_t i = 0; i < words_.size(); ++i) {
        if (words_[i].empty()) {
            throw RecoveryError(ErrorCode::InvalidWordlist,
                                "Wordlist " + name + " has an empty entry at line " +
                                std::to_string(i + 1));
        }
        auto inserted = index_.emplace(ToLowerAscii(words_[i]), static_cast<uint16_t>(i));
        if (!inserted.second) {
            throw RecoveryError(ErrorCode::InvalidWordlist,
                                "Wordlist " + name + " contains duplicate word '" +
                                words_[i] + "'");
        }
    }
}

const Wordlist& Wordlist::English() {
    static const Wordlist english(Language::English,
                                  std::vector<std::string>(ENGLISH_WORDS,
                                                           ENGLISH_WORDS + WORDLIST_SIZE));
    return english;
}

namespace {

std::string TrimLine(const std::string& line) {
    size_t begin = 0;
    size_t end = line.size();
    while (begin < end && (line[begin] == ' ' || line[begin] == '\t')) ++begin;
    while (end > begin && (line[end - 1] == ' ' || line[end - 1] == '\t' ||
                           line[end - 1] == '\r')) {
        --end;
    }
    return line.substr(begin, end - begin);
}

} // namespace

Wordlist Wordlist::FromFile(Language language, const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw RecoveryError(ErrorCode::WordlistUnavailable,
                            "Cannot open wordlist file: " + path);
    }

    std::vector<std::string> words;
    words.reserve(WORDLIST_SIZE);
    std::string line;
    while (std::getline(file, line)) {
        std::string word = TrimLine(line);
        if (!word.empty()) {
            words.push_back(std::move(word));
        }
    }

    if (file.bad()) {
        throw RecoveryError(ErrorCode::WordlistUnavailable,
                            "Error reading wordlist file: " + path);
    }

    return Wordlist(language, std::move(words));
}

const std::string& Wordlist::Word(uint16_t index) const {
    if (index >= words_.size()) {
        throw std::out_of_range("Wordlist index out of range: " + std::to_string(index));
    }
    return words_[index];
}

std::optional<uint16_t> Wordlist::Find(const std::string& word) const {
    auto it = index_.find(ToLowerAscii(word));
    if (it == index_.end()) {
        return std::nullopt;
    }
    return it->second;
}

// ============================================================================
// Wordlist Registry
// ============================================================================

namespace {

/// Embedded lists, validated once
const std::vector<Wordlist>& BuiltinWordlists() {
    static const std::vector<Wordlist> lists = [] {
        std::vector<Wordlist> result;
        for (const EmbeddedWordlist& embedded : EmbeddedWordlists()) {
            result.emplace_back(embedded.language,
                                std::vector<std::string>(embedded.words,
                                                         embedded.words + WORDLIST_SIZE));
        }
        return result;
    }();
    return lists;
}

} // namespace

WordlistRegistry::WordlistRegistry() : WordlistRegistry(EnglishOnlyTag{}) {
    for (const Wordlist& list : BuiltinWordlists()) {
        lists_.emplace(list.GetLanguage(), list);
    }
}

WordlistRegistry::WordlistRegistry(EnglishOnlyTag) {
    lists_.emplace(Language::English, Wordlist::English());
}

WordlistRegistry WordlistRegistry::EnglishOnly() {
    return WordlistRegistry(EnglishOnlyTag{});
}

void WordlistRegistry::Add(Wordlist wordlist) {
    Language lang = wordlist.GetLanguage();
    lists_.erase(lang);
    lists_.emplace(lang, std::move(wordlist));
}

size_t WordlistRegistry::LoadDirectory(const std::string& dir) {
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        throw RecoveryError(ErrorCode::WordlistUnavailable,
                            "Wordlist directory not found: " + dir);
    }

    size_t loaded = 0;
    for (Language lang : AllLanguages()) {
        fs::path file = fs::path(dir) / (std::string(LanguageFileName(lang)) + ".txt");
        if (!fs::is_regular_file(file, ec)) {
            LOG_DEBUG(util::LogCategory::WALLET) << "No wordlist for " << LanguageTag(lang)
                                                 << " at " << file.string();
            continue;
        }
        Add(Wordlist::FromFile(lang, file.string()));
        ++loaded;
        LOG_DEBUG(util::LogCategory::WALLET) << "Loaded " << LanguageTag(lang)
                                             << " wordlist from " << file.string();
    }

    return loaded;
}

const Wordlist* WordlistRegistry::Find(Language lang) const {
    auto it = lists_.find(lang);
    return it == lists_.end() ? nullptr : &it->second;
}

const Wordlist& WordlistRegistry::Get(Language lang) const {
    const Wordlist* list = Find(lang);
    if (!list) {
        throw RecoveryError(ErrorCode::WordlistUnavailable,
                            std::string("Wordlist not available for language ") +
                            LanguageTag(lang) + "; it was not embedded at build time, "
                            "use --wordlistdir to load " + LanguageFileName(lang) + ".txt");
    }
    return *list;
}

std::vector<Language> WordlistRegistry::Available() const {
    std::vector<Language> result;
    for (Language lang : AllLanguages()) {
        if (Has(lang)) {
            result.push_back(lang);
        }
    }
    return result;
}

} // namespace wallet
} // namespace seedorder
