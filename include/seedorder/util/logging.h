// SEEDORDER - Logging System
// Copyright (c) 2024 SEEDORDER Developers
// MIT License
//
// Diagnostic logging for the recovery tool:
// - Log levels (TRACE .. FATAL, OFF) and named categories
// - Console (stderr by default, so reports on stdout stay clean),
//   file and callback sinks
// - Thread-safe; search workers log through the same singleton
// - Printf-style and stream-style interfaces

#ifndef SEEDORDER_UTIL_LOGGING_H
#define SEEDORDER_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

#include "seedorder/util/time.h"

namespace seedorder {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,   // Per-trial detail
    Debug = 1,   // Run statistics, timings
    Info = 2,    // Progress and decisions
    Warn = 3,    // Suspicious input that does not stop the run
    Error = 4,   // Fatal input errors
    Fatal = 5,
    Off = 6
};

/// Convert log level to string
const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, "warning" accepted)
std::optional<LogLevel> ParseLogLevel(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* RECOVERY = "recovery";
    constexpr const char* SEARCH = "search";
    constexpr const char* WALLET = "wallet";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::string category;
    std::string message;
    std::string file;
    int line;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sink Interface
// ============================================================================

/// Abstract base class for log output destinations
class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

// ============================================================================
// Console Sink
// ============================================================================

/// Log sink that writes to stderr (or stdout on request)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};           // ANSI colors when attached to a tty
        bool useStderr{true};           // All entries go to stderr
        bool showTimestamp{false};
        bool showLevel{true};
        bool showCategory{false};
        bool showThread{false};
        LogLevel level{LogLevel::Trace};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

    /// Render an entry the way Write prints it (without color)
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

// ============================================================================
// File Sink
// ============================================================================

/// Log sink that appends to a file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, LogLevel level = LogLevel::Trace);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }
    const std::string& GetPath() const { return path_; }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    std::string path_;
    std::ofstream file_;
    std::mutex mutex_;
    LogLevel level_;
};

// ============================================================================
// Callback Sink
// ============================================================================

/// Log sink that forwards entries to a callback (used by tests)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install a console sink if no sink is present yet
    void Initialize(const ConsoleSink::Config& console = ConsoleSink::Config());

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given category (and others enabled before)
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...)
#if defined(__GNUC__)
        __attribute__((format(printf, 6, 7)))
#endif
        ;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        stream_ << value;
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define SEEDORDER_LOGGER ::seedorder::util::Logger::Instance()

#define SEEDORDER_LOG_ENABLED(level, category) \
    SEEDORDER_LOGGER.WillLog(::seedorder::util::LogLevel::level, category)

#define SEEDORDER_LOG(level, category) \
    if (SEEDORDER_LOG_ENABLED(level, category)) \
        ::seedorder::util::LogStream(::seedorder::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category)   SEEDORDER_LOG(Trace, category)
#define LOG_DEBUG(category)   SEEDORDER_LOG(Debug, category)
#define LOG_INFO(category)    SEEDORDER_LOG(Info, category)
#define LOG_WARN(category)    SEEDORDER_LOG(Warn, category)
#define LOG_ERROR(category)   SEEDORDER_LOG(Error, category)

#define SEEDORDER_LOGF(level, category, ...) \
    do { \
        if (SEEDORDER_LOG_ENABLED(level, category)) { \
            SEEDORDER_LOGGER.LogF(::seedorder::util::LogLevel::level, category, \
                                  __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  SEEDORDER_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   SEEDORDER_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   SEEDORDER_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  SEEDORDER_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs "Starting: op" on construction and "Completed: op in 1.234s" on
/// destruction, both at debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

    ScopedLogTimer(const ScopedLogTimer&) = delete;
    ScopedLogTimer& operator=(const ScopedLogTimer&) = delete;

private:
    std::string category_;
    std::string operation_;
    Timer timer_;
};

// ============================================================================
// Utility Functions
// ============================================================================

/// "YYYY-MM-DD HH:MM:SS.mmm" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Basename of a source path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace seedorder

#endif // SEEDORDER_UTIL_LOGGING_H
