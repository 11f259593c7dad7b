// CONCORD - Logging System
// Copyright (c) 2024 CONCORD Developers
// MIT License
//
// Leveled, categorised logging with pluggable sinks:
// - Levels TRACE..FATAL (and OFF)
// - Category filtering (knowledge, voting, facts, cascade, ...)
// - Console, rotating file and callback sinks
// - Stream-style (LOG_WARN(cat) << ...) and printf-style (LogWarnF) macros

#ifndef CONCORD_UTIL_LOGGING_H
#define CONCORD_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace concord {
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

/// Parse log level (case-insensitive); unknown strings map to Info
LogLevel LogLevelFromString(const std::string& str);

// ============================================================================
// Log Categories
// ============================================================================

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* KNOWLEDGE = "knowledge";
    constexpr const char* VOTING = "voting";
    constexpr const char* FACTS = "facts";
    constexpr const char* ENVELOPE = "envelope";
    constexpr const char* CASCADE = "cascade";
    constexpr const char* STORE = "store";
    constexpr const char* TRANSPORT = "transport";
    constexpr const char* CONFIG = "config";
    constexpr const char* CLI = "cli";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    std::thread::id threadId;
};

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
    virtual void SetLevel(LogLevel level) = 0;
    virtual LogLevel GetLevel() const = 0;
};

/// Writes to stderr (so stdout stays clean for CLI output)
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};
        bool showTimestamp{true};
        bool showCategory{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink() = default;
    explicit ConsoleSink(const Config& config) : config_(config) {}

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    Config config_;
    std::mutex mutex_;
};

/// Appends to a file, rotating to <path>.1 .. <path>.N past maxSize
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};
        bool autoFlush{false};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

private:
    void Rotate();

    Config config_;
    std::ofstream file_;
    std::mutex mutex_;
    size_t currentSize_{0};
};

/// Forwards entries to a callback (used by tests to capture warnings)
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace)
        : callback_(std::move(callback)), level_(level) {}

    void Write(const LogEntry& entry) override {
        if (entry.level >= level_ && callback_) callback_(entry);
    }
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

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Restrict output to the given category (may be called repeatedly)
    void EnableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category,
             const std::string& message,
             const char* file = nullptr, int line = 0);

    void LogF(LogLevel level, const std::string& category,
              const char* file, int line, const char* format, ...);

    void Flush();

private:
    Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};

    std::unordered_set<std::string> enabledCategories_;
    std::atomic<bool> allCategoriesEnabled_{true};
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Log Stream
// ============================================================================

/// Collects one message and hands it to the Logger on destruction
class LogStream {
public:
    LogStream(LogLevel level, const char* category, const char* file, int line)
        : level_(level), category_(category), file_(file), line_(line) {}
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
    const char* category_;
    const char* file_;
    int line_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define CONCORD_LOGGER ::concord::util::Logger::Instance()

#define CONCORD_LOG_ENABLED(level, category) \
    CONCORD_LOGGER.WillLog(::concord::util::LogLevel::level, category)

#define CONCORD_LOG(level, category) \
    if (CONCORD_LOG_ENABLED(level, category)) \
        ::concord::util::LogStream(::concord::util::LogLevel::level, category, \
                                   __FILE__, __LINE__)

#define LOG_TRACE(category)   CONCORD_LOG(Trace, category)
#define LOG_DEBUG(category)   CONCORD_LOG(Debug, category)
#define LOG_INFO(category)    CONCORD_LOG(Info, category)
#define LOG_WARN(category)    CONCORD_LOG(Warn, category)
#define LOG_ERROR(category)   CONCORD_LOG(Error, category)

#define CONCORD_LOGF(level, category, ...) \
    do { \
        if (CONCORD_LOG_ENABLED(level, category)) { \
            CONCORD_LOGGER.LogF(::concord::util::LogLevel::level, category, \
                                __FILE__, __LINE__, __VA_ARGS__); \
        } \
    } while (0)

#define LogDebugF(category, ...)  CONCORD_LOGF(Debug, category, __VA_ARGS__)
#define LogInfoF(category, ...)   CONCORD_LOGF(Info, category, __VA_ARGS__)
#define LogWarnF(category, ...)   CONCORD_LOGF(Warn, category, __VA_ARGS__)
#define LogErrorF(category, ...)  CONCORD_LOGF(Error, category, __VA_ARGS__)

// ============================================================================
// Utility Functions
// ============================================================================

/// "2024-01-15 10:30:00.123" in local time
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

} // namespace util
} // namespace concord

#endif // CONCORD_UTIL_LOGGING_H
