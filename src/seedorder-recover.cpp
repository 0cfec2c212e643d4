// SEEDORDER - Word Order Recovery Tool
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Tries orderings of a known set of 12 or 24 BIP-39 words until one of
// them derives the given Bitcoin address.
//
// Usage: seedorder-recover [options] <target-address> <word>...

#include "seedorder/recovery/errors.h"
#include "seedorder/recovery/language.h"
#include "seedorder/recovery/options.h"
#include "seedorder/recovery/pipeline.h"
#include "seedorder/recovery/scheme.h"
#include "seedorder/recovery/search.h"
#include "seedorder/util/config.h"
#include "seedorder/util/logging.h"
#include "seedorder/util/threadpool.h"
#include "seedorder/util/time.h"
#include "seedorder/wallet/address.h"
#include "seedorder/wallet/wordlist.h"

#include <atomic>
#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace seedorder {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "seedorder-recover";

// ============================================================================
// Exit Codes
// ============================================================================

constexpr int EXIT_OK = 0;            // Found, or not found within the cap
constexpr int EXIT_FATAL = 1;         // Input or configuration error
constexpr int EXIT_INTERRUPTED = 130; // SIGINT/SIGTERM

// ============================================================================
// Signal Handling
// ============================================================================

static std::atomic<bool> g_cancel{false};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_cancel.store(true);
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
}

// ============================================================================
// Help and Version
// ============================================================================

void PrintHelp() {
    std::cout << "Try permutations of 12 or 24 BIP-39 words to match a BTC address\n\n";
    std::cout << "Usage: " << CLIENT_NAME << " [options] <target-address> <word>...\n\n";
    std::cout << "Search Options:\n";
    std::cout << "  --max-permutations=N       Maximum number of permutations to test (default: 1000000)\n";
    std::cout << "  -l, --language=TAG         BIP-39 wordlist language (default: english, detects)\n";
    std::cout << "                             english, portuguese, spanish, french, italian, czech,\n";
    std::cout << "                             korean, japanese, chinese-simplified, chinese-traditional, auto\n";
    std::cout << "  --derivation=N             Derivation index (default: 0)\n";
    std::cout << "  --bip44                    Use BIP44 (legacy addresses - starts with 1)\n";
    std::cout << "  --bip49                    Use BIP49 (P2SH-wrapped SegWit addresses - starts with 3)\n";
    std::cout << "  --bip84                    Use BIP84 (native SegWit addresses - starts with bc1)\n";
    std::cout << "  --start=N                  First permutation index to test (default: 0)\n";
    std::cout << "  --threads=N                Worker threads, 0 = all cores (default: 1)\n";
    std::cout << "  --batchsize=N              Permutations per worker batch (default: 4096)\n";
    std::cout << "  --progressinterval=N       Permutations between progress lines, 0 = off (default: 100000)\n";
    std::cout << "\nWordlist Options:\n";
    std::cout << "  --wordlistdir=DIR          Load <language>.txt wordlists, replacing built-in ones\n";
    std::cout << "  --strictlanguage           Fail if the language cannot be detected\n";
    std::cout << "\nGeneral Options:\n";
    std::cout << "  --conf=FILE                Config file (default: ~/.seedorder/seedorder.conf)\n";
    std::cout << "  --loglevel=LEVEL           trace, debug, info, warn, error, off (default: info)\n";
    std::cout << "  --logfile=FILE             Also write the log to FILE\n";
    std::cout << "  -h, --help                 Show this help message\n";
    std::cout << "  -V, --version              Show version information\n";
}

void PrintVersion() {
    std::cout << CLIENT_NAME << " " << VERSION << "\n";
}

// ============================================================================
// Command Line and Configuration
// ============================================================================

[[noreturn]] void InvalidOption(const std::string& message) {
    throw RecoveryError(ErrorCode::InvalidOption, message);
}

/// Load the config file named by --conf, or the default one if present
void LoadConfigFile(util::ConfigManager& config) {
    std::string path;
    bool required = false;
    if (config.HasKey(util::ConfigKeys::CONF)) {
        path = config.GetPath(util::ConfigKeys::CONF);
        required = true;
    } else {
        path = util::ConfigManager::GetDefaultConfigPath();
        std::error_code ec;
        if (path.empty() || !std::filesystem::exists(path, ec)) {
            return;
        }
    }

    util::ConfigParseResult result = config.ParseFile(path);
    if (!result.success) {
        InvalidOption(std::string(required ? "Config file error: "
                                           : "Default config file error: ") +
                      result.Describe());
    }
    for (const auto& warning : result.warnings) {
        LOG_WARN(util::LogCategory::CONFIG) << warning;
    }
    LOG_DEBUG(util::LogCategory::CONFIG) << "Loaded config file " << path;
}

// ============================================================================
// Logging Setup
// ============================================================================

void SetupLogging(const std::string& logLevel, const std::string& logFile) {
    auto level = util::ParseLogLevel(logLevel);
    if (!level) {
        InvalidOption("Invalid value for --loglevel: " + logLevel);
    }

    auto& logger = util::Logger::Instance();
    logger.SetLevel(*level);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<util::FileSink>(logFile);
        if (!fileSink->IsOpen()) {
            InvalidOption("Cannot open log file: " + logFile);
        }
        logger.AddSink(fileSink);
    }
}

// ============================================================================
// Recovery
// ============================================================================

void PrintFound(const recovery::SearchResult& result) {
    std::cout << "✓ FOUND MATCHING MNEMONIC!\n";
    std::cout << "\n";
    std::cout << "Mnemonic phrase:\n";
    std::cout << "  " << result.phrase << "\n";
    std::cout << "\n";
    std::cout << "Details:\n";
    std::cout << "  Permutation index: " << result.trialIndex << "\n";
    std::cout << "  Address type: " << recovery::SchemeName(result.scheme) << "\n";
    std::cout << "  Derivation path: " << result.path << "\n";
    std::cout << "  Derived address: " << result.address << "\n";
    std::cout << "\n";
}

int RunRecovery(const recovery::RecoverConfig& rc) {
    recovery::CheckWordCount(rc.words);

    wallet::Address target = wallet::ParseAndCheckAddress(rc.target);
    LOG_DEBUG(util::LogCategory::RECOVERY) << "Target " << target.canonical << " ("
                                           << wallet::AddressTypeToString(target.type) << ")";

    recovery::SchemeResolution scheme = recovery::ResolveScheme(rc.schemeFlags, rc.target);
    if (scheme.autoDetected) {
        std::cout << recovery::AutoDetectMessage(scheme.scheme) << "\n";
    } else if (!recovery::SchemeProducesType(scheme.scheme, target.type)) {
        LOG_WARN(util::LogCategory::RECOVERY)
            << recovery::SchemeName(scheme.scheme) << " never derives "
            << wallet::AddressTypeToString(target.type) << " addresses like "
            << target.canonical;
    }

    wallet::DerivationPath path = recovery::PathTemplate(scheme.scheme, rc.derivation);

    wallet::WordlistRegistry registry;
    if (!rc.wordlistDir.empty()) {
        util::ScopedLogTimer timer(util::LogCategory::WALLET, "loading wordlists");
        size_t loaded = registry.LoadDirectory(rc.wordlistDir);
        LOG_INFO(util::LogCategory::WALLET) << "Loaded " << loaded << " wordlists from "
                                            << rc.wordlistDir;
    }

    std::cout << "Configuration:\n";
    std::cout << "  Address type: " << recovery::SchemeName(scheme.scheme) << "\n";
    std::cout << "  Derivation index: " << rc.derivation << "\n";
    std::cout << "  Word count: " << rc.words.size() << "\n";

    recovery::LanguageResolver resolver(registry);
    recovery::LanguageResolution language = resolver.Resolve(rc.words, rc.language);
    if (language.inconclusive) {
        if (rc.strictLanguage) {
            throw RecoveryError(ErrorCode::InconclusiveLanguage,
                                "Cannot determine the wordlist language: no language "
                                "matches at least half of the words");
        }
        LOG_WARN(util::LogCategory::RECOVERY)
            << "Language detection inconclusive (" << language.matchCount << "/"
            << rc.words.size() << " english words); falling back to english";
    }
    if (language.autoDetected) {
        std::cout << "  Language: " << language.Describe() << "\n";
    } else {
        std::cout << "  Language: " << rc.language << "\n";
    }
    const wallet::Wordlist& wordlist = registry.Get(language.language);

    std::cout << "  Max permutations: " << util::FormatCount(rc.maxPermutations) << "\n";
    if (rc.start > 0) {
        std::cout << "  Start index: " << rc.start << "\n";
    }
    if (rc.threads != 1) {
        std::cout << "  Threads: " << util::ThreadPool::ResolveThreadCount(rc.threads) << "\n";
    }
    std::cout << "\n";

    std::cout << "Using derivation path: " << path.ToString() << "\n\n";

    recovery::DerivationPipeline pipeline(wordlist, scheme.scheme, path);
    recovery::MatchEvaluator evaluator(target.canonical, scheme.scheme, path);
    recovery::PermutationSearch search(rc.words, pipeline, evaluator);

    recovery::SearchOptions options;
    options.maxPermutations = rc.maxPermutations;
    options.startIndex = rc.start;
    options.progressInterval = rc.progressInterval;
    options.threads = rc.threads;
    options.batchSize = rc.batchSize;
    options.cancel = &g_cancel;
    options.progress = [](uint64_t rank) {
        std::cout << "Checked " << util::FormatCount(rank) << " permutations..." << std::endl;
    };

    recovery::SearchResult result = search.Run(options);

    if (result.found) {
        PrintFound(result);
        return EXIT_OK;
    }

    if (result.cancelled) {
        std::cout << "Interrupted after " << util::FormatCount(result.trialsExamined)
                  << " permutations (elapsed: " << util::FormatDurationMillis(result.elapsed)
                  << ")\n";
        return EXIT_INTERRUPTED;
    }

    std::cout << "No matching mnemonic found within the first "
              << util::FormatCount(rc.maxPermutations) << " permutations";
    if (rc.start > 0) {
        std::cout << " from index " << rc.start;
    }
    std::cout << " (elapsed: " << util::FormatDurationMillis(result.elapsed) << ")\n";
    return EXIT_OK;
}

int AppMain(int argc, char* argv[]) {
    util::Logger::Instance().Initialize();

    util::ConfigManager config;
    util::ConfigParseResult parsed = config.ParseCommandLine(argc, argv, recovery::MakeCommandLineSpec());
    if (!parsed.success) {
        InvalidOption(parsed.Describe());
    }

    if (recovery::GetFlagOption(config, util::ConfigKeys::HELP)) {
        PrintHelp();
        return EXIT_OK;
    }
    if (recovery::GetFlagOption(config, util::ConfigKeys::VERSION)) {
        PrintVersion();
        return EXIT_OK;
    }

    // Command-line log settings apply while the config file is read
    SetupLogging(config.GetString(util::ConfigKeys::LOGLEVEL, "info"), "");
    LoadConfigFile(config);

    recovery::RecoverConfig rc = recovery::ReadRecoverConfig(config);
    SetupLogging(rc.logLevel, rc.logFile);

    LOG_DEBUG(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting";

    SetupSignalHandlers();
    return RunRecovery(rc);
}

} // namespace seedorder

int main(int argc, char* argv[]) {
    int code = seedorder::EXIT_FATAL;
    try {
        code = seedorder::AppMain(argc, argv);
    } catch (const seedorder::RecoveryError& e) {
        LOG_DEBUG(seedorder::util::LogCategory::DEFAULT)
            << seedorder::ErrorCodeToString(e.Code()) << ": " << e.what();
        std::cerr << "Error: " << e.what() << std::endl;
        code = seedorder::EXIT_FATAL;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        code = seedorder::EXIT_FATAL;
    }
    seedorder::util::Logger::Instance().Shutdown();
    return code;
}
