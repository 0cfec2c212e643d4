// SEEDORDER - Permutation Search
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Drives the derivation pipeline over word orderings in rank order and
// stops at the first ordering whose address equals the target. Orderings
// are over input positions, so repeated words still give distinct trials.
//
// Sequential by default. With more than one thread the rank range is cut
// into batches run on a ThreadPool; the lowest matching rank wins, which
// reproduces the sequential answer.

#ifndef SEEDORDER_RECOVERY_SEARCH_H
#define SEEDORDER_RECOVERY_SEARCH_H

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "seedorder/recovery/permutation.h"
#include "seedorder/recovery/pipeline.h"
#include "seedorder/recovery/scheme.h"
#include "seedorder/util/threadpool.h"
#include "seedorder/util/time.h"

namespace seedorder {
namespace recovery {

// ============================================================================
// Options and Results
// ============================================================================

constexpr uint64_t DEFAULT_MAX_PERMUTATIONS = 1000000;
constexpr uint64_t DEFAULT_PROGRESS_INTERVAL = 100000;
constexpr uint64_t DEFAULT_BATCH_SIZE = 4096;

/// Batches kept in flight per worker thread in a parallel run
constexpr size_t BATCHES_PER_THREAD = 4;

/// Pool settings for a parallel run; the queue holds every batch in flight
util::ThreadPool::Config ParallelPoolConfig(size_t threads);

/// Called with the rank about to be examined each progress interval
using ProgressCallback = std::function<void(uint64_t rank)>;

struct SearchOptions {
    /// Number of orderings to examine
    uint64_t maxPermutations{DEFAULT_MAX_PERMUTATIONS};

    /// Rank of the first ordering to examine
    uint64_t startIndex{0};

    /// Trials between progress reports, 0 disables them
    uint64_t progressInterval{DEFAULT_PROGRESS_INTERVAL};

    /// Worker threads; 1 runs inline, 0 means hardware concurrency
    size_t threads{1};

    /// Ranks per parallel batch
    uint64_t batchSize{DEFAULT_BATCH_SIZE};

    ProgressCallback progress;

    /// Checked before every trial; set it to stop the run
    const std::atomic<bool>* cancel{nullptr};
};

/// Per-reason skip counters
struct SkipCounters {
    uint64_t unknownWord{0};
    uint64_t badChecksum{0};
    uint64_t keyDerivation{0};

    void Count(SkipReason reason);
    uint64_t Total() const { return unknownWord + badChecksum + keyDerivation; }
    SkipCounters& operator+=(const SkipCounters& other);
};

struct SearchResult {
    bool found{false};

    /// Rank of the matching ordering (valid when found)
    uint64_t trialIndex{0};

    std::string phrase;
    std::string address;
    AddressScheme scheme{AddressScheme::NativeSegwit};
    std::string path;

    /// Orderings examined; on a match, those up to and including it
    uint64_t trialsExamined{0};
    bool cancelled{false};
    util::Milliseconds elapsed{0};
    SkipCounters skips;
};

// ============================================================================
// Match Evaluator
// ============================================================================

/**
 * Compares derived addresses with the target.
 *
 * The target must already be in canonical form (Base58 as given, Bech32
 * lowercase) as produced by wallet::ParseAndCheckAddress().
 */
class MatchEvaluator {
public:
    MatchEvaluator(std::string target, AddressScheme scheme, wallet::DerivationPath path);

    /// @return A found SearchResult when candidateAddress equals the target
    std::optional<SearchResult> Evaluate(const std::string& candidateAddress,
                                         uint64_t trialIndex,
                                         const std::string& phrase) const;

    const std::string& GetTarget() const { return target_; }

private:
    std::string target_;
    AddressScheme scheme_;
    std::string path_;
};

// ============================================================================
// Permutation Search
// ============================================================================

class PermutationSearch {
public:
    /**
     * @param words Candidate words, in the order given
     * @param pipeline Derivation pipeline for the chosen language and scheme
     * @param evaluator Target comparison
     */
    PermutationSearch(std::vector<std::string> words,
                      const DerivationPipeline& pipeline,
                      const MatchEvaluator& evaluator);

    /// Total number of orderings (saturating)
    uint64_t TotalOrderings() const { return Factorial(words_.size()); }

    /// Examine ranks [start, start + max) clipped to the total
    SearchResult Run(const SearchOptions& options) const;

private:
    struct BatchOutcome {
        uint64_t examined{0};
        bool cancelled{false};
        SkipCounters skips;
        std::optional<SearchResult> match;
    };

    /// Examine [begin, end); stops early on a match, cancellation, or when
    /// a lower match is already recorded in minMatch
    BatchOutcome RunRange(uint64_t begin, uint64_t end,
                          const SearchOptions& options,
                          std::atomic<uint64_t>* minMatch) const;

    /// Run the pipeline on one ordering
    std::optional<SearchResult> Trial(const std::vector<size_t>& order, uint64_t rank,
                                      SkipCounters& skips) const;

    SearchResult RunSequential(uint64_t begin, uint64_t end,
                               const SearchOptions& options) const;
    SearchResult RunParallel(uint64_t begin, uint64_t end,
                             const SearchOptions& options) const;

    SearchResult MakeResult() const;

    std::vector<std::string> words_;
    std::vector<std::optional<uint16_t>> indices_;
    bool allKnown_{true};
    const DerivationPipeline& pipeline_;
    const MatchEvaluator& evaluator_;
};

} // namespace recovery
} // namespace seedorder

#endif // SEEDORDER_RECOVERY_SEARCH_H
