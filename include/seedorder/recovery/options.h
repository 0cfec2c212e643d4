// SEEDORDER - Recovery Options
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Turns parsed command-line and config-file settings into the settings of
// one recovery run, and runs the input checks that must pass before any
// ordering is tried.

#ifndef SEEDORDER_RECOVERY_OPTIONS_H
#define SEEDORDER_RECOVERY_OPTIONS_H

#include <cstddef>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "seedorder/recovery/scheme.h"
#include "seedorder/recovery/search.h"
#include "seedorder/util/config.h"

namespace seedorder {
namespace recovery {

// ============================================================================
// Recovery Configuration
// ============================================================================

struct RecoverConfig {
    std::string target;
    std::vector<std::string> words;

    uint64_t maxPermutations{DEFAULT_MAX_PERMUTATIONS};
    std::string language{"english"};
    uint32_t derivation{0};
    SchemeFlags schemeFlags;

    uint64_t start{0};
    size_t threads{1};
    uint64_t batchSize{DEFAULT_BATCH_SIZE};
    uint64_t progressInterval{DEFAULT_PROGRESS_INTERVAL};

    std::string wordlistDir;
    bool strictLanguage{false};

    std::string logLevel{"info"};
    std::string logFile;
};

/// Value options, flags and short aliases of seedorder-recover
util::CommandLineSpec MakeCommandLineSpec();

/// Every key the tool understands, flags included
std::set<std::string> KnownKeys();

/// Boolean flag; false when absent
/// @throws RecoveryError InvalidOption for a value that is not a boolean
bool GetFlagOption(const util::ConfigManager& config, const char* key);

/**
 * Build a RecoverConfig from parsed options.
 *
 * Unknown keys from the command line are fatal; unknown keys from a config
 * file are logged and ignored.
 *
 * @throws RecoveryError InvalidOption for a missing target, unknown
 *         command-line options and malformed values
 */
RecoverConfig ReadRecoverConfig(const util::ConfigManager& config);

/// @throws RecoveryError WrongWordCount unless there are 12 or 24 words
void CheckWordCount(const std::vector<std::string>& words);

} // namespace recovery
} // namespace seedorder

#endif // SEEDORDER_RECOVERY_OPTIONS_H
