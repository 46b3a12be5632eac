// AMOCA - Logging System
// Copyright (c) 2024 AMOCA Developers
// MIT License
//
// Leveled, categorized logging for the ledger engines. Messages are built
// with LOG_<LEVEL>(category) << ... and fanned out to sinks (console,
// rotating file, callback). A LogScope tags everything logged on a thread
// while a transaction runs, so engine messages can be traced back to it.

#ifndef AMOCA_UTIL_LOGGING_H
#define AMOCA_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

namespace amoca {
namespace util {

// ============================================================================
// Levels and Categories
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

/// Parse a level name, case-insensitive; unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* LEDGER = "ledger";
    constexpr const char* STAKING = "staking";
    constexpr const char* GOVERNANCE = "governance";
    constexpr const char* ACCESS = "access";
    constexpr const char* AUTH = "auth";
    constexpr const char* TX = "tx";
    constexpr const char* DB = "db";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    /// Active LogScope tag when the entry was made, empty outside any scope
    std::string scope;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
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

/// Short lines on stderr: "[WARN] tx: (tx 1a2b3c) message"
class ConsoleSink : public ILogSink {
public:
    struct Config {
        bool useColors{true};       // only when the stream is a terminal
        bool showTimestamp{false};
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

/// Full lines with timestamp and source location, rotated by size
class FileSink : public ILogSink {
public:
    struct Config {
        std::string path;
        size_t maxSize{10 * 1024 * 1024};
        size_t maxFiles{5};             // debug.log.1 .. debug.log.<maxFiles>
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);
    ~FileSink() override;

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;
    void SetLevel(LogLevel level) override { config_.level = level; }
    LogLevel GetLevel() const override { return config_.level; }

    size_t GetCurrentSize() const { return currentSize_; }

private:
    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t currentSize_{0};

    void RotateLocked();
};

/// Forwards entries to a function; used by tests
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Trace)
        : callback_(std::move(callback)), level_(level) {}

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

    /// Flush and drop all sinks
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();
    size_t SinkCount() const;

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Once any category is enabled, only enabled categories are logged
    void EnableCategory(const std::string& category);
    void EnableAllCategories();
    bool IsCategoryEnabled(const std::string& category) const;

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::unordered_set<std::string> categories_;
    mutable std::mutex categoriesMutex_;
};

// ============================================================================
// Scopes
// ============================================================================

/**
 * Tags entries logged on the current thread for its lifetime. Scopes nest:
 * an inner tag is appended to the outer one ("tx 1a2b3c mint_tokens").
 */
class LogScope {
public:
    explicit LogScope(const std::string& tag);
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

    /// Tag of the innermost live scope on this thread
    static const std::string& Current();

private:
    std::string saved_;
};

// ============================================================================
// Setup
// ============================================================================

struct LogOptions {
    LogLevel level{LogLevel::Warn};
    /// Categories to log at Debug; "1", "all" or "true" selects every one
    std::vector<std::string> debugCategories;
    bool printToConsole{false};
    /// Empty disables the file sink
    std::string filePath;
};

/// Replace sinks and filters; false if the log file could not be opened
bool ConfigureLogging(const LogOptions& options);

// ============================================================================
// Log Stream and Macros
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

#define AMOCA_LOG(level, category) \
    if (!::amoca::util::Logger::Instance().WillLog(::amoca::util::LogLevel::level, category)) {} \
    else ::amoca::util::LogStream(::amoca::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category)   AMOCA_LOG(Trace, category)
#define LOG_DEBUG(category)   AMOCA_LOG(Debug, category)
#define LOG_INFO(category)    AMOCA_LOG(Info, category)
#define LOG_WARN(category)    AMOCA_LOG(Warn, category)
#define LOG_ERROR(category)   AMOCA_LOG(Error, category)

// ============================================================================
// Helpers
// ============================================================================

/// Local time with milliseconds: "2024-01-15 10:30:00.123"
std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp);

std::string GetBasename(const std::string& path);

} // namespace util
} // namespace amoca

#endif // AMOCA_UTIL_LOGGING_H
