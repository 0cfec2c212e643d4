// SEEDORDER - Logging Implementation
// Copyright (c) 2024 SEEDORDER Developers
// MIT License

#include "seedorder/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <utility>

#include <unistd.h>

namespace seedorder {
namespace util {

// ============================================================================
// Log Level Functions
// ============================================================================

namespace {

struct LevelName {
    LogLevel level;
    const char* name;
};

constexpr LevelName LEVEL_NAMES[] = {
    {LogLevel::Trace, "TRACE"},
    {LogLevel::Debug, "DEBUG"},
    {LogLevel::Info,  "INFO"},
    {LogLevel::Warn,  "WARN"},
    {LogLevel::Error, "ERROR"},
    {LogLevel::Fatal, "FATAL"},
    {LogLevel::Off,   "OFF"},
};

bool EqualsIgnoreCase(const std::string& a, const char* b) {
    size_t i = 0;
    for (; i < a.size() && b[i] != '\0'; ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return i == a.size() && b[i] == '\0';
}

} // namespace

const char* LogLevelToString(LogLevel level) {
    for (const auto& entry : LEVEL_NAMES) {
        if (entry.level == level) {
            return entry.name;
        }
    }
    return "UNKNOWN";
}

std::optional<LogLevel> ParseLogLevel(const std::string& str) {
    for (const auto& entry : LEVEL_NAMES) {
        if (EqualsIgnoreCase(str, entry.name)) {
            return entry.level;
        }
    }
    if (EqualsIgnoreCase(str, "warning")) return LogLevel::Warn;
    if (EqualsIgnoreCase(str, "none")) return LogLevel::Off;
    return std::nullopt;
}

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<Milliseconds>(tp.time_since_epoch()).count() %
                  MILLIS_PER_SECOND;

    std::tm local{};
    localtime_r(&seconds, &local);

    char buffer[32];
    size_t len = std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    std::ostringstream oss;
    oss << std::string(buffer, len) << '.' << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

std::string GetBasename(const std::string& path) {
    size_t pos = path.find_last_of('/');
    return pos == std::string::npos ? path : path.substr(pos + 1);
}

namespace {

/// Which optional parts of an entry a sink prints
struct EntryLayout {
    bool timestamp{false};
    bool level{true};
    bool category{false};
    bool thread{false};
    bool location{false};
};

/// "[time] [LEVEL] [category] [thread] file:line: message"
std::string FormatEntry(const LogEntry& entry, const EntryLayout& layout) {
    std::ostringstream oss;
    if (layout.timestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    if (layout.level) {
        oss << '[' << LogLevelToString(entry.level) << "] ";
    }
    if (layout.category && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (layout.thread) {
        oss << '[' << entry.threadId << "] ";
    }
    if (layout.location && !entry.file.empty()) {
        oss << GetBasename(entry.file) << ':' << entry.line << ": ";
    }
    oss << entry.message;
    return oss.str();
}

} // namespace

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink() = default;

ConsoleSink::ConsoleSink(const Config& config) : config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    const std::string line = Format(entry);
    FILE* out = config_.useStderr ? stderr : stdout;

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.useColors && isatty(fileno(out))) {
        std::fprintf(out, "%s%s\033[0m\n", GetColorCode(entry.level), line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(config_.useStderr ? stderr : stdout);
}

std::string ConsoleSink::Format(const LogEntry& entry) const {
    EntryLayout layout;
    layout.timestamp = config_.showTimestamp;
    layout.level = config_.showLevel;
    layout.category = config_.showCategory;
    layout.thread = config_.showThread;
    return FormatEntry(entry, layout);
}

const char* ConsoleSink::GetColorCode(LogLevel level) const {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[0m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error:
        case LogLevel::Fatal: return "\033[31;1m";
        case LogLevel::Off:   break;
    }
    return "\033[0m";
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const std::string& path, LogLevel level)
    : path_(path), file_(path, std::ios::out | std::ios::app), level_(level) {}

FileSink::~FileSink() {
    Flush();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < level_) {
        return;
    }

    // Files keep everything needed to untangle interleaved worker output
    EntryLayout layout;
    layout.timestamp = true;
    layout.category = true;
    layout.thread = true;
    layout.location = true;
    const std::string line = FormatEntry(entry, layout);

    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CallbackSink Implementation
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : callback_(std::move(callback)), level_(level) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_ && entry.level >= level_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Initialize(const ConsoleSink::Config& console) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    if (sinks_.empty()) {
        sinks_.push_back(std::make_shared<ConsoleSink>(console));
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    if (!sink) {
        return;
    }
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

size_t Logger::SinkCount() const {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    return sinks_.size();
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.insert(category);
    allCategoriesEnabled_ = false;
}

void Logger::DisableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.erase(category);
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategoriesEnabled_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.find(category) != enabledCategories_.end();
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    allCategoriesEnabled_ = true;
}

void Logger::Log(LogLevel level, const std::string& category,
                 const std::string& message, const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    if (file) {
        entry.file = file;
    }
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    // Sinks serialize their own output; workers only contend for the copy
    std::vector<std::shared_ptr<ILogSink>> sinks;
    {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks = sinks_;
    }
    for (const auto& sink : sinks) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    if (!WillLog(level, category)) {
        return;
    }

    va_list args;
    va_start(args, format);
    va_list measure;
    va_copy(measure, args);
    int needed = std::vsnprintf(nullptr, 0, format, measure);
    va_end(measure);

    std::string message;
    if (needed > 0) {
        message.resize(static_cast<size_t>(needed) + 1);
        std::vsnprintf(&message[0], message.size(), format, args);
        message.resize(static_cast<size_t>(needed));
    }
    va_end(args);

    Log(level, category, message, file, line);
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level, const std::string& category,
                     const char* file, int line)
    : level_(level), category_(category), file_(file), line_(line) {}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

// ============================================================================
// ScopedLogTimer Implementation
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const std::string& category,
                               const std::string& operation)
    : category_(category), operation_(operation) {
    Logger::Instance().Log(LogLevel::Debug, category_, "Starting: " + operation_);
}

ScopedLogTimer::~ScopedLogTimer() {
    timer_.Stop();
    Logger::Instance().Log(LogLevel::Debug, category_,
                           "Completed: " + operation_ + " in " +
                           FormatDurationMillis(Milliseconds(timer_.ElapsedMillis())));
}

} // namespace util
} // namespace seedorder
