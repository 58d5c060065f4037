// ZKANCHOR - Logging System
// Copyright (c) 2024 ZKANCHOR Developers
// MIT License
//
// Leveled, categorized, thread-safe logging with pluggable sinks.
// Nothing is written until a sink is attached (Logger::Initialize attaches
// a console sink), so library code can log freely.

#ifndef ZKANCHOR_UTIL_LOGGING_H
#define ZKANCHOR_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace zkanchor {
namespace util {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Fatal = 5,
    Off = 6
};

const char* LogLevelToString(LogLevel level);

/// Parse log level from string (case-insensitive, Info on unknown input)
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* FIELD = "field";
    constexpr const char* POSEIDON = "poseidon";
    constexpr const char* MERKLE = "merkle";
    constexpr const char* ANCHOR = "anchor";
    constexpr const char* RANGE = "range";
    constexpr const char* WITNESS = "witness";
    constexpr const char* PROVER = "prover";
    constexpr const char* VERIFY = "verify";
    constexpr const char* CIRCUIT = "circuit";
    constexpr const char* BACKEND = "backend";
    constexpr const char* CONFIG = "config";
    constexpr const char* POOL = "pool";
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
    std::string function;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;

    LogEntry() : level(LogLevel::Info), line(0) {}
};

// ============================================================================
// Log Sinks
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

/// Writes formatted entries to stdout (errors optionally to stderr)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool useStderr{true};
        bool showTimestamp{true};
        bool showLevel{true};
        bool showCategory{true};
        bool showThread{false};
        bool showLocation{false};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    const Config& GetConfig() const { return config_; }

    /// Render an entry without writing it
    std::string Format(const LogEntry& entry) const;

private:
    Config config_;
    std::mutex mutex_;

    const char* GetColorCode(LogLevel level) const;
};

/// Forwards entries to a callback (used by tests and embedding hosts)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    CallbackSink() = default;
    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;
    void Flush() override {}
    void SetLevel(LogLevel level) override { level_ = level; }
    LogLevel GetLevel() const override { return level_; }

private:
    Callback callback_;
    LogLevel level_{LogLevel::Info};
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Attach a default console sink (idempotent)
    void Initialize();

    /// Flush and detach all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level);
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the enabled categories
    void EnableCategory(const std::string& category);
    void DisableCategory(const std::string& category);
    bool IsCategoryEnabled(const std::string& category) const;
    void EnableAllCategories();

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0,
             const char* function = nullptr);

    /// Log with printf-style formatting
    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* function,
              const char* format, ...);

    /// True if a message at this level and category reaches any sink
    bool WillLog(LogLevel level, const std::string& category) const;

    void Flush();

private:
    Logger();
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> enabledCategories_;
    mutable std::mutex categoriesMutex_;
    std::atomic<bool> allCategoriesEnabled_{true};
    std::atomic<bool> hasSinks_{false};
    std::atomic<bool> initialized_{false};
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects a message with operator<< and emits it on destruction
class LogStream {
public:
    LogStream(LogLevel level, const std::string& category,
              const char* file, int line, const char* function);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (active_) {
            stream_ << value;
        }
        return *this;
    }

private:
    std::ostringstream stream_;
    LogLevel level_;
    std::string category_;
    const char* file_;
    int line_;
    const char* function_;
    bool active_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define ZKANCHOR_LOGGER ::zkanchor::util::Logger::Instance()

#define ZKANCHOR_LOG_ENABLED(level, category) \
    ZKANCHOR_LOGGER.WillLog(::zkanchor::util::LogLevel::level, category)

#define ZKANCHOR_LOG(level, category) \
    if (ZKANCHOR_LOG_ENABLED(level, category)) \
        ::zkanchor::util::LogStream(::zkanchor::util::LogLevel::level, category, \
                                    __FILE__, __LINE__, __func__)

#define LOG_TRACE(category)   ZKANCHOR_LOG(Trace, category)
#define LOG_DEBUG(category)   ZKANCHOR_LOG(Debug, category)
#define LOG_INFO(category)    ZKANCHOR_LOG(Info, category)
#define LOG_WARN(category)    ZKANCHOR_LOG(Warn, category)
#define LOG_ERROR(category)   ZKANCHOR_LOG(Error, category)

#define ZKANCHOR_LOGF(level, category, ...) \
    do { \
        if (ZKANCHOR_LOG_ENABLED(level, category)) { \
            ZKANCHOR_LOGGER.LogF(::zkanchor::util::LogLevel::level, category, \
                                 __FILE__, __LINE__, __func__, __VA_ARGS__); \
        } \
    } while(0)

#define LogDebugF(category, ...)  ZKANCHOR_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   ZKANCHOR_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   ZKANCHOR_LOGF(Warn, category, __VA_ARGS__)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// RAII timer that logs the elapsed time of a scope at Debug level
class ScopedLogTimer {
public:
    ScopedLogTimer(const std::string& category, const std::string& operation);
    ~ScopedLogTimer();

    void Checkpoint(const std::string& name);

private:
    std::string category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::steady_clock::time_point lastCheckpoint_;
};

#define ZKANCHOR_CONCAT_INNER(a, b) a##b
#define ZKANCHOR_CONCAT(a, b) ZKANCHOR_CONCAT_INNER(a, b)

#define ZKANCHOR_LOG_TIMER(category, operation) \
    ::zkanchor::util::ScopedLogTimer ZKANCHOR_CONCAT(zkanchor_timer_, __LINE__)( \
        category, operation)

// ============================================================================
// Utility Functions
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

/// Truncate or pad string to fixed width
std::string FixedWidth(const std::string& str, size_t width, char pad = ' ');

/// Get basename from file path
std::string GetBasename(const std::string& path);

} // namespace util
} // namespace zkanchor

#endif // ZKANCHOR_UTIL_LOGGING_H
