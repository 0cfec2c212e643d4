// SEEDORDER - Time Utilities Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/util/time.h"

#include <cstdio>
#include <iomanip>
#include <sstream>

namespace seedorder {
namespace util {

// ============================================================================
// Timer Implementation
// ============================================================================

Timer::Timer() {
    Start();
}

void Timer::Start() {
    if (!running_) {
        start_ = SteadyClock::now();
        running_ = true;
    }
}

void Timer::Stop() {
    if (running_) {
        accumulated_ += std::chrono::duration_cast<Nanoseconds>(SteadyClock::now() - start_);
        running_ = false;
    }
}

void Timer::Reset() {
    accumulated_ = Nanoseconds{0};
    running_ = false;
}

double Timer::ElapsedSeconds() const {
    return std::chrono::duration<double>(Elapsed()).count();
}

int64_t Timer::ElapsedMillis() const {
    return std::chrono::duration_cast<Milliseconds>(Elapsed()).count();
}

Nanoseconds Timer::Elapsed() const {
    auto total = accumulated_;
    if (running_) {
        total += std::chrono::duration_cast<Nanoseconds>(SteadyClock::now() - start_);
    }
    return total;
}

// ============================================================================
// Formatting
// ============================================================================

std::string FormatDurationMillis(Milliseconds duration) {
    int64_t total = duration.count();
    if (total < 0) {
        return "-" + FormatDurationMillis(Milliseconds{-total});
    }
    if (total == 0) {
        return "0s";
    }

    int64_t totalSeconds = total / MILLIS_PER_SECOND;
    int64_t millis = total % MILLIS_PER_SECOND;

    int64_t days = totalSeconds / SECONDS_PER_DAY;
    totalSeconds %= SECONDS_PER_DAY;
    int64_t hours = totalSeconds / SECONDS_PER_HOUR;
    totalSeconds %= SECONDS_PER_HOUR;
    int64_t minutes = totalSeconds / SECONDS_PER_MINUTE;
    int64_t seconds = totalSeconds % SECONDS_PER_MINUTE;

    std::ostringstream oss;
    if (days > 0) oss << days << "d ";
    if (hours > 0) oss << hours << "h ";
    if (minutes > 0) oss << minutes << "m ";
    if (seconds > 0 || millis > 0) {
        oss << seconds;
        if (millis > 0) {
            oss << '.' << std::setfill('0') << std::setw(3) << millis;
        }
        oss << 's';
    }

    std::string result = oss.str();
    while (!result.empty() && result.back() == ' ') {
        result.pop_back();
    }
    return result;
}

std::string FormatCount(uint64_t n) {
    struct Unit { uint64_t scale; char suffix; };
    static const Unit kUnits[] = {
        {1000000000ULL, 'G'},
        {1000000ULL, 'M'},
        {1000ULL, 'K'},
    };

    for (const auto& unit : kUnits) {
        if (n >= unit.scale) {
            char buf[32];
            std::snprintf(buf, sizeof(buf), "%.1f%c",
                          static_cast<double>(n) / static_cast<double>(unit.scale),
                          unit.suffix);
            return buf;
        }
    }
    return std::to_string(n);
}

std::string FormatRate(uint64_t count, Nanoseconds elapsed) {
    double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds <= 0.0) {
        return "0/s";
    }
    auto perSecond = static_cast<uint64_t>(static_cast<double>(count) / seconds);
    return FormatCount(perSecond) + "/s";
}

} // namespace util
} // namespace seedorder
