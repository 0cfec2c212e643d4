// SEEDORDER - Recovery Options Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/recovery/options.h"
#include "seedorder/recovery/errors.h"
#include "seedorder/util/logging.h"

#include <limits>

namespace seedorder {
namespace recovery {

namespace {

[[noreturn]] void InvalidOption(const std::string& message) {
    throw RecoveryError(ErrorCode::InvalidOption, message);
}

uint64_t GetUIntOption(const util::ConfigManager& config, const char* key, uint64_t defaultValue) {
    if (!config.HasKey(key)) {
        return defaultValue;
    }
    auto value = config.TryGetUInt(key);
    if (!value) {
        InvalidOption(std::string("Invalid value for --") + key + ": " +
                      config.GetString(key, ""));
    }
    return *value;
}

} // namespace

util::CommandLineSpec MakeCommandLineSpec() {
    util::CommandLineSpec spec;
    spec.valueKeys = {
        util::ConfigKeys::MAX_PERMUTATIONS,
        util::ConfigKeys::LANGUAGE,
        util::ConfigKeys::DERIVATION,
        util::ConfigKeys::START,
        util::ConfigKeys::THREADS,
        util::ConfigKeys::BATCHSIZE,
        util::ConfigKeys::PROGRESSINTERVAL,
        util::ConfigKeys::WORDLISTDIR,
        util::ConfigKeys::CONF,
        util::ConfigKeys::LOGLEVEL,
        util::ConfigKeys::LOGFILE,
    };
    spec.aliases = {
        {"l", util::ConfigKeys::LANGUAGE},
        {"h", util::ConfigKeys::HELP},
        {"V", util::ConfigKeys::VERSION},
    };
    return spec;
}

std::set<std::string> KnownKeys() {
    std::set<std::string> keys = MakeCommandLineSpec().valueKeys;
    keys.insert(util::ConfigKeys::BIP44);
    keys.insert(util::ConfigKeys::BIP49);
    keys.insert(util::ConfigKeys::BIP84);
    keys.insert(util::ConfigKeys::STRICTLANGUAGE);
    keys.insert(util::ConfigKeys::HELP);
    keys.insert(util::ConfigKeys::VERSION);
    return keys;
}

bool GetFlagOption(const util::ConfigManager& config, const char* key) {
    if (!config.HasKey(key)) {
        return false;
    }
    auto value = config.TryGetBool(key);
    if (!value) {
        InvalidOption(std::string("Invalid value for --") + key + ": " +
                      config.GetString(key, ""));
    }
    return *value;
}

RecoverConfig ReadRecoverConfig(const util::ConfigManager& config) {
    for (const auto& key : config.UnknownKeys(KnownKeys())) {
        std::string source = config.GetSource(key);
        if (source == "<command-line>") {
            InvalidOption("Unknown option: --" + key);
        }
        LOG_WARN(util::LogCategory::CONFIG) << "Ignoring unknown key '" << key
                                            << "' in " << source;
    }

    RecoverConfig rc;

    const auto& positional = config.GetPositional();
    if (positional.empty()) {
        InvalidOption("Missing target address. Usage: seedorder-recover "
                      "[options] <target-address> <word>...");
    }
    rc.target = positional.front();
    rc.words.assign(positional.begin() + 1, positional.end());

    rc.maxPermutations = GetUIntOption(config, util::ConfigKeys::MAX_PERMUTATIONS,
                                       rc.maxPermutations);
    rc.language = config.GetString(util::ConfigKeys::LANGUAGE, rc.language);

    uint64_t derivation = GetUIntOption(config, util::ConfigKeys::DERIVATION, 0);
    if (derivation > std::numeric_limits<uint32_t>::max()) {
        InvalidOption("Invalid value for --derivation: " + std::to_string(derivation));
    }
    rc.derivation = static_cast<uint32_t>(derivation);

    rc.schemeFlags.bip44 = GetFlagOption(config, util::ConfigKeys::BIP44);
    rc.schemeFlags.bip49 = GetFlagOption(config, util::ConfigKeys::BIP49);
    rc.schemeFlags.bip84 = GetFlagOption(config, util::ConfigKeys::BIP84);

    rc.start = GetUIntOption(config, util::ConfigKeys::START, rc.start);
    rc.threads = static_cast<size_t>(GetUIntOption(config, util::ConfigKeys::THREADS, rc.threads));
    rc.batchSize = GetUIntOption(config, util::ConfigKeys::BATCHSIZE, rc.batchSize);
    if (rc.batchSize == 0) {
        InvalidOption("Invalid value for --batchsize: 0");
    }
    rc.progressInterval = GetUIntOption(config, util::ConfigKeys::PROGRESSINTERVAL,
                                        rc.progressInterval);

    rc.wordlistDir = config.GetPath(util::ConfigKeys::WORDLISTDIR);
    rc.strictLanguage = GetFlagOption(config, util::ConfigKeys::STRICTLANGUAGE);

    rc.logLevel = config.GetString(util::ConfigKeys::LOGLEVEL, rc.logLevel);
    rc.logFile = config.GetPath(util::ConfigKeys::LOGFILE);
    return rc;
}

void CheckWordCount(const std::vector<std::string>& words) {
    if (words.size() != 12 && words.size() != 24) {
        throw RecoveryError(ErrorCode::WrongWordCount,
                            "Expected exactly 12 or 24 words, got " +
                            std::to_string(words.size()));
    }
}

} // namespace recovery
} // namespace seedorder
