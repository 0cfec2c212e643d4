// SEEDORDER - Mnemonic-to-Address Pipeline Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/recovery/pipeline.h"
#include "seedorder/util/logging.h"
#include "seedorder/wallet/mnemonic.h"

#include <sstream>

#include <openssl/crypto.h>

namespace seedorder {
namespace recovery {

using wallet::Mnemonic;
using wallet::MnemonicStatus;

const char* SkipReasonToString(SkipReason reason) {
    switch (reason) {
        case SkipReason::None:          return "None";
        case SkipReason::UnknownWord:   return "UnknownWord";
        case SkipReason::BadChecksum:   return "BadChecksum";
        case SkipReason::KeyDerivation: return "KeyDerivation";
    }
    return "Unknown";
}

DerivationPipeline::DerivationPipeline(const wallet::Wordlist& wordlist,
                                       AddressScheme scheme,
                                       wallet::DerivationPath path)
    : wordlist_(wordlist), scheme_(scheme), path_(std::move(path)) {}

PipelineOutcome DerivationPipeline::Derive(const std::string& phrase) const {
    std::vector<std::string> words;
    std::istringstream stream(phrase);
    std::string word;
    while (stream >> word) {
        words.push_back(word);
    }
    return Derive(words);
}

PipelineOutcome DerivationPipeline::Derive(const std::vector<std::string>& words) const {
    std::vector<uint16_t> indices;
    indices.reserve(words.size());
    for (const auto& w : words) {
        auto idx = wordlist_.Find(w);
        if (!idx) {
            return PipelineOutcome::Skipped(SkipReason::UnknownWord);
        }
        indices.push_back(*idx);
    }
    return DeriveIndices(indices);
}

PipelineOutcome DerivationPipeline::DeriveIndices(const std::vector<uint16_t>& indices,
                                                  std::string* phrase) const {
    switch (Mnemonic::CheckIndices(indices)) {
        case MnemonicStatus::Valid:
            break;
        case MnemonicStatus::UnknownWord:
            return PipelineOutcome::Skipped(SkipReason::UnknownWord);
        case MnemonicStatus::WrongWordCount:
        case MnemonicStatus::BadChecksum:
            return PipelineOutcome::Skipped(SkipReason::BadChecksum);
    }

    std::string canonical = Mnemonic::JoinPhrase(indices, wordlist_);
    PipelineOutcome outcome = DerivePhrase(canonical);
    if (phrase) {
        *phrase = std::move(canonical);
    }
    return outcome;
}

PipelineOutcome DerivationPipeline::DerivePhrase(const std::string& canonicalPhrase) const {
    Mnemonic::Seed seed = Mnemonic::ToSeed(canonicalPhrase);
    auto master = wallet::ExtendedKey::FromSeed(seed.data(), seed.size());
    OPENSSL_cleanse(seed.data(), seed.size());
    if (!master) {
        LOG_TRACE(util::LogCategory::RECOVERY) << "Master key derivation failed";
        return PipelineOutcome::Skipped(SkipReason::KeyDerivation);
    }

    auto child = master->DerivePath(path_);
    if (!child) {
        LOG_TRACE(util::LogCategory::RECOVERY) << "Child key derivation failed at "
                                               << path_.ToString();
        return PipelineOutcome::Skipped(SkipReason::KeyDerivation);
    }

    return PipelineOutcome::Derived(EncodeSchemeAddress(scheme_, child->GetPublicKey()));
}

} // namespace recovery
} // namespace seedorder
