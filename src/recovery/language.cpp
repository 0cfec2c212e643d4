// SEEDORDER - Wordlist Language Resolution Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/recovery/language.h"
#include "seedorder/recovery/errors.h"
#include "seedorder/util/logging.h"

namespace seedorder {
namespace recovery {

using wallet::Language;

std::string LanguageResolution::Describe() const {
    std::string name = wallet::LanguageTag(language);
    if (inconclusive) {
        return name + " (default)";
    }
    if (autoDetected) {
        return name + " (auto-detected)";
    }
    return name;
}

bool LanguageResolver::IsDetectionRequest(const std::string& tag) {
    std::string key = wallet::ToLowerAscii(tag);
    return key == wallet::LanguageTag(Language::English) || key == AUTO_LANGUAGE_TAG;
}

size_t LanguageResolver::CountMatches(const std::vector<std::string>& words,
                                      const wallet::Wordlist& wordlist) {
    size_t count = 0;
    for (const auto& word : words) {
        if (wordlist.Contains(word)) {
            ++count;
        }
    }
    return count;
}

LanguageResolution LanguageResolver::Resolve(const std::vector<std::string>& words,
                                             const std::string& tag) const {
    if (IsDetectionRequest(tag)) {
        return Detect(words);
    }

    auto lang = wallet::ParseLanguageTag(tag);
    if (!lang) {
        throw RecoveryError(ErrorCode::UnknownLanguage,
                            "Unknown language: " + tag + ". Supported: " +
                            wallet::SupportedLanguageTags());
    }
    return Resolve(words, lang);
}

LanguageResolution LanguageResolver::Resolve(
        const std::vector<std::string>& words,
        const std::optional<Language>& explicitLanguage) const {
    if (!explicitLanguage || *explicitLanguage == Language::English) {
        return Detect(words);
    }

    LanguageResolution result;
    result.language = *explicitLanguage;
    if (const wallet::Wordlist* list = registry_.Find(result.language)) {
        result.matchCount = CountMatches(words, *list);
    }
    return result;
}

LanguageResolution LanguageResolver::Detect(const std::vector<std::string>& words) const {
    std::optional<Language> best;
    size_t bestCount = 0;

    for (Language lang : wallet::AllLanguages()) {
        const wallet::Wordlist* list = registry_.Find(lang);
        if (!list) {
            LOG_TRACE(util::LogCategory::RECOVERY) << "Skipping " << wallet::LanguageTag(lang)
                                                   << ": wordlist not loaded";
            continue;
        }

        size_t count = CountMatches(words, *list);
        LOG_TRACE(util::LogCategory::RECOVERY) << wallet::LanguageTag(lang) << ": "
                                               << count << "/" << words.size() << " words";

        if (count > bestCount) {
            bestCount = count;
            best = lang;
        }

        if (count == words.size()) {
            LanguageResolution result;
            result.language = lang;
            result.autoDetected = true;
            result.matchCount = count;
            return result;
        }
    }

    LanguageResolution result;
    result.autoDetected = true;
    if (best && bestCount >= words.size() / 2) {
        result.language = *best;
        result.matchCount = bestCount;
        return result;
    }

    // Fall back to English
    result.inconclusive = true;
    if (const wallet::Wordlist* english = registry_.Find(Language::English)) {
        result.matchCount = CountMatches(words, *english);
    }
    return result;
}

} // namespace recovery
} // namespace seedorder
