// SEEDORDER - Permutation Search Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/recovery/search.h"
#include "seedorder/util/logging.h"
#include "seedorder/util/threadpool.h"

#include <algorithm>
#include <deque>
#include <future>
#include <limits>
#include <mutex>

namespace seedorder {
namespace recovery {

namespace {

constexpr uint64_t NO_MATCH = std::numeric_limits<uint64_t>::max();

bool IsCancelled(const SearchOptions& options) {
    return options.cancel && options.cancel->load(std::memory_order_relaxed);
}

} // namespace

util::ThreadPool::Config ParallelPoolConfig(size_t threads) {
    util::ThreadPool::Config config;
    config.numThreads = util::ThreadPool::ResolveThreadCount(threads);
    config.maxQueueSize = config.numThreads * BATCHES_PER_THREAD;
    config.name = "search";
    return config;
}

// ============================================================================
// Skip Counters
// ============================================================================

void SkipCounters::Count(SkipReason reason) {
    switch (reason) {
        case SkipReason::UnknownWord:   ++unknownWord; break;
        case SkipReason::BadChecksum:   ++badChecksum; break;
        case SkipReason::KeyDerivation: ++keyDerivation; break;
        case SkipReason::None:          break;
    }
}

SkipCounters& SkipCounters::operator+=(const SkipCounters& other) {
    unknownWord += other.unknownWord;
    badChecksum += other.badChecksum;
    keyDerivation += other.keyDerivation;
    return *this;
}

// ============================================================================
// Match Evaluator
// ============================================================================

MatchEvaluator::MatchEvaluator(std::string target, AddressScheme scheme,
                               wallet::DerivationPath path)
    : target_(std::move(target)), scheme_(scheme), path_(path.ToString()) {}

std::optional<SearchResult> MatchEvaluator::Evaluate(const std::string& candidateAddress,
                                                     uint64_t trialIndex,
                                                     const std::string& phrase) const {
    if (candidateAddress != target_) {
        return std::nullopt;
    }

    SearchResult result;
    result.found = true;
    result.trialIndex = trialIndex;
    result.phrase = phrase;
    result.address = candidateAddress;
    result.scheme = scheme_;
    result.path = path_;
    return result;
}

// ============================================================================
// Permutation Search
// ============================================================================

PermutationSearch::PermutationSearch(std::vector<std::string> words,
                                     const DerivationPipeline& pipeline,
                                     const MatchEvaluator& evaluator)
    : words_(std::move(words)), pipeline_(pipeline), evaluator_(evaluator) {
    indices_.reserve(words_.size());
    for (const auto& word : words_) {
        auto idx = pipeline_.GetWordlist().Find(word);
        if (!idx) {
            allKnown_ = false;
            LOG_DEBUG(util::LogCategory::SEARCH) << "Word '" << word << "' is not in the "
                << wallet::LanguageTag(pipeline_.GetWordlist().GetLanguage()) << " wordlist";
        }
        indices_.push_back(idx);
    }
}

SearchResult PermutationSearch::MakeResult() const {
    SearchResult result;
    result.scheme = pipeline_.GetScheme();
    result.path = pipeline_.GetPath().ToString();
    return result;
}

std::optional<SearchResult> PermutationSearch::Trial(const std::vector<size_t>& order,
                                                     uint64_t rank,
                                                     SkipCounters& skips) const {
    if (!allKnown_) {
        skips.Count(SkipReason::UnknownWord);
        return std::nullopt;
    }

    std::vector<uint16_t> candidate;
    candidate.reserve(order.size());
    for (size_t pos : order) {
        candidate.push_back(*indices_[pos]);
    }

    std::string phrase;
    PipelineOutcome outcome = pipeline_.DeriveIndices(candidate, &phrase);
    if (!outcome.Ok()) {
        skips.Count(outcome.skip);
        LOG_TRACE(util::LogCategory::SEARCH) << "Trial " << rank << " skipped: "
                                             << SkipReasonToString(outcome.skip);
        return std::nullopt;
    }

    return evaluator_.Evaluate(*outcome.address, rank, phrase);
}

PermutationSearch::BatchOutcome PermutationSearch::RunRange(
        uint64_t begin, uint64_t end, const SearchOptions& options,
        std::atomic<uint64_t>* minMatch) const {
    BatchOutcome out;
    auto cursor = PermutationCursor::AtRank(words_.size(), begin);
    if (!cursor) {
        return out;
    }

    for (uint64_t rank = begin; rank < end; ++rank) {
        if (IsCancelled(options)) {
            out.cancelled = true;
            break;
        }
        if (minMatch && minMatch->load(std::memory_order_relaxed) < rank) {
            break;
        }

        if (options.progressInterval > 0 && rank > 0 &&
            rank % options.progressInterval == 0) {
            LogDebugF(util::LogCategory::SEARCH, "Checked %s permutations",
                      util::FormatCount(rank).c_str());
            if (options.progress) {
                options.progress(rank);
            }
        }

        auto match = Trial(cursor->Current(), rank, out.skips);
        ++out.examined;
        if (match) {
            out.match = std::move(match);
            if (minMatch) {
                uint64_t current = minMatch->load();
                while (rank < current && !minMatch->compare_exchange_weak(current, rank)) {
                }
            }
            break;
        }

        if (rank + 1 < end && !cursor->Advance()) {
            break;
        }
    }

    return out;
}

SearchResult PermutationSearch::RunSequential(uint64_t begin, uint64_t end,
                                              const SearchOptions& options) const {
    BatchOutcome out = RunRange(begin, end, options, nullptr);

    SearchResult result = out.match ? std::move(*out.match) : MakeResult();
    result.trialsExamined = out.examined;
    result.cancelled = out.cancelled;
    result.skips = out.skips;
    return result;
}

SearchResult PermutationSearch::RunParallel(uint64_t begin, uint64_t end,
                                            const SearchOptions& options) const {
    const uint64_t batchSize = std::max<uint64_t>(1, options.batchSize);

    std::atomic<uint64_t> minMatch{NO_MATCH};
    std::mutex progressMutex;

    SearchOptions workerOptions = options;
    if (options.progress) {
        workerOptions.progress = [&options, &progressMutex](uint64_t rank) {
            std::lock_guard<std::mutex> lock(progressMutex);
            options.progress(rank);
        };
    }

    std::optional<SearchResult> best;
    SkipCounters skips;
    uint64_t examined = 0;
    bool cancelled = false;

    // Every batch in flight fits in the queue, so Submit never sees it full
    const util::ThreadPool::Config config = ParallelPoolConfig(options.threads);
    util::ThreadPool pool(config);

    LogDebugF(util::LogCategory::SEARCH, "Parallel search: %zu threads, batches of %llu",
              pool.ThreadCount(), static_cast<unsigned long long>(batchSize));

    std::deque<std::future<BatchOutcome>> inflight;
    auto collect = [&]() {
        BatchOutcome out = inflight.front().get();
        inflight.pop_front();
        examined += out.examined;
        skips += out.skips;
        cancelled = cancelled || out.cancelled;
        if (out.match && (!best || out.match->trialIndex < best->trialIndex)) {
            best = std::move(out.match);
        }
    };

    const size_t window = config.maxQueueSize;
    uint64_t next = begin;
    while (next < end) {
        if (IsCancelled(options)) {
            cancelled = true;
            break;
        }
        while (inflight.size() >= window) {
            collect();
        }
        // Batches are handed out in rank order, so nothing past a match is needed
        if (minMatch.load() < next) {
            break;
        }

        uint64_t stop = next + std::min(batchSize, end - next);
        inflight.push_back(pool.Submit([this, next, stop, &workerOptions, &minMatch]() {
            return RunRange(next, stop, workerOptions, &minMatch);
        }));
        next = stop;
    }
    while (!inflight.empty()) {
        collect();
    }

    SearchResult result = MakeResult();
    if (cancelled) {
        // Lower ranks may not have been examined, so a match cannot be trusted
        if (best) {
            LogWarnF(util::LogCategory::SEARCH,
                     "Run cancelled; discarding unconfirmed match at rank %llu",
                     static_cast<unsigned long long>(best->trialIndex));
        }
        result.cancelled = true;
        result.trialsExamined = examined;
    } else if (best) {
        result = std::move(*best);
        result.trialsExamined = result.trialIndex - begin + 1;
    } else {
        result.trialsExamined = examined;
    }
    result.skips = skips;
    return result;
}

SearchResult PermutationSearch::Run(const SearchOptions& options) const {
    util::Timer timer;

    const uint64_t total = TotalOrderings();
    const uint64_t begin = options.startIndex;
    const uint64_t end = std::min(total, SaturatingAdd(begin, options.maxPermutations));

    LogInfoF(util::LogCategory::SEARCH, "Searching %zu words, ranks %llu to %llu",
             words_.size(), static_cast<unsigned long long>(begin),
             static_cast<unsigned long long>(end));

    SearchResult result;
    if (begin >= end) {
        LogWarnF(util::LogCategory::SEARCH, "Start index %llu is past the last ordering",
                 static_cast<unsigned long long>(begin));
        result = MakeResult();
    } else if (util::ThreadPool::ResolveThreadCount(options.threads) > 1) {
        result = RunParallel(begin, end, options);
    } else {
        result = RunSequential(begin, end, options);
    }

    result.elapsed = util::Milliseconds(timer.ElapsedMillis());

    LogDebugF(util::LogCategory::SEARCH,
              "Examined %llu orderings in %s (%s); skipped %llu unknown word, "
              "%llu bad checksum, %llu key derivation",
              static_cast<unsigned long long>(result.trialsExamined),
              util::FormatDurationMillis(result.elapsed).c_str(),
              util::FormatRate(result.trialsExamined, timer.Elapsed()).c_str(),
              static_cast<unsigned long long>(result.skips.unknownWord),
              static_cast<unsigned long long>(result.skips.badChecksum),
              static_cast<unsigned long long>(result.skips.keyDerivation));

    return result;
}

} // namespace recovery
} // namespace seedorder
