// SEEDORDER - Time Utilities
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Elapsed-time measurement and human-readable formatting of durations and
// trial counts for progress output.

#ifndef SEEDORDER_UTIL_TIME_H
#define SEEDORDER_UTIL_TIME_H

#include <chrono>
#include <cstdint>
#include <string>

namespace seedorder {
namespace util {

// ============================================================================
// Type Aliases
// ============================================================================

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

using Nanoseconds = std::chrono::nanoseconds;
using Milliseconds = std::chrono::milliseconds;
using Seconds = std::chrono::seconds;

// ============================================================================
// Constants
// ============================================================================

constexpr int64_t MILLIS_PER_SECOND = 1000;
constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_DAY = 86400;

// ============================================================================
// Timer
// ============================================================================

/// Stopwatch; starts on construction
class Timer {
public:
    Timer();

    /// Start or resume
    void Start();

    /// Pause, keeping the accumulated time
    void Stop();

    /// Zero the timer and leave it stopped
    void Reset();

    bool IsRunning() const { return running_; }

    double ElapsedSeconds() const;
    int64_t ElapsedMillis() const;
    Nanoseconds Elapsed() const;

private:
    SteadyTimePoint start_;
    Nanoseconds accumulated_{0};
    bool running_{false};
};

// ============================================================================
// Formatting
// ============================================================================

/// Format a duration as e.g. "1h 2m 3.045s"; "0s" for zero
std::string FormatDurationMillis(Milliseconds duration);

/**
 * Abbreviate a count for progress output.
 *
 * Values of 1000 and above use one decimal and a K, M or G suffix
 * (1000 -> "1.0K", 2500000 -> "2.5M"); smaller values print as-is.
 */
std::string FormatCount(uint64_t n);

/// Trials per second, formatted with FormatCount ("12.3K/s")
std::string FormatRate(uint64_t count, Nanoseconds elapsed);

} // namespace util
} // namespace seedorder

#endif // SEEDORDER_UTIL_TIME_H
