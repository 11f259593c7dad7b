// CONCORD - Logging Implementation
// Copyright (c) 2024 CONCORD Developers
// MIT License

#include <concord/util/logging.h>

#include <algorithm>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace concord {
namespace util {

// ============================================================================
// Helpers
// ============================================================================

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(), ::toupper);

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "FATAL") return LogLevel::Fatal;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;
    return LogLevel::Info;
}

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    auto time = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

namespace {

std::string FormatEntry(const LogEntry& entry, bool timestamp, bool category,
                        bool location) {
    std::ostringstream oss;
    if (timestamp) {
        oss << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (category && !entry.category.empty() &&
        entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (location && !entry.file.empty()) {
        auto slash = entry.file.find_last_of('/');
        oss << (slash == std::string::npos ? entry.file : entry.file.substr(slash + 1))
            << ':' << entry.line << ' ';
    }
    oss << entry.message;
    return oss.str();
}

const char* ColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "";
    }
}

} // namespace

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    std::string line = FormatEntry(entry, config_.showTimestamp,
                                   config_.showCategory, false);

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.useColors && isatty(fileno(stderr))) {
        std::fprintf(stderr, "%s%s\033[0m\n", ColorCode(entry.level), line.c_str());
    } else {
        std::fprintf(stderr, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    file_.open(config_.path, std::ios::out | std::ios::app);
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        currentSize_ = static_cast<size_t>(file_.tellp());
    }
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }
    std::string line = FormatEntry(entry, true, true, true);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (config_.maxSize > 0 && currentSize_ + line.size() > config_.maxSize) {
        Rotate();
    }
    file_ << line;
    currentSize_ += line.size();
    if (config_.autoFlush) {
        file_.flush();
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::Rotate() {
    file_.close();

    // <path>.N-1 -> <path>.N, ..., <path> -> <path>.1
    for (size_t i = config_.maxFiles; i > 1; --i) {
        std::string from = config_.path + "." + std::to_string(i - 1);
        std::string to = config_.path + "." + std::to_string(i);
        std::rename(from.c_str(), to.c_str());
    }
    std::string first = config_.path + ".1";
    std::rename(config_.path.c_str(), first.c_str());

    file_.open(config_.path, std::ios::out | std::ios::trunc);
    currentSize_ = 0;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
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

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    enabledCategories_.clear();
    allCategoriesEnabled_ = true;
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    if (allCategoriesEnabled_) {
        return true;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return enabledCategories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level < level_.load() || level == LogLevel::Off) {
        return false;
    }
    return IsCategoryEnabled(category);
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
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.threadId = std::this_thread::get_id();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::LogF(LogLevel level, const std::string& category,
                  const char* file, int line, const char* format, ...) {
    char buffer[4096];
    va_list args;
    va_start(args, format);
    std::vsnprintf(buffer, sizeof(buffer), format, args);
    va_end(args);

    Log(level, category, buffer, file, line);
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogStream
// ============================================================================

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace concord
