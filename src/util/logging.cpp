// AMOCA - Logging Implementation
// Copyright (c) 2024 AMOCA Developers
// MIT License

#include <amoca/util/logging.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace amoca {
namespace util {

namespace {

thread_local std::string g_scope;

const char* ColorFor(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35;1m";
        default:              return "";
    }
}

bool SelectsAll(const std::string& category) {
    return category == "1" || category == "all" || category == "true";
}

} // namespace

// ============================================================================
// Levels
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
    std::string name = str;
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (name == "trace") return LogLevel::Trace;
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    if (name == "fatal") return LogLevel::Fatal;
    if (name == "off" || name == "none") return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Helpers
// ============================================================================

std::string FormatLogTimestamp(std::chrono::system_clock::time_point tp) {
    std::time_t secs = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                      tp.time_since_epoch()).count() % 1000;

    std::tm local;
    localtime_r(&secs, &local);

    std::ostringstream os;
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
       << std::setfill('0') << std::setw(3) << millis;
    return os.str();
}

std::string GetBasename(const std::string& path) {
    size_t slash = path.find_last_of("/\\");
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

// ============================================================================
// ConsoleSink
// ============================================================================

void ConsoleSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::ostringstream line;
    if (config_.showTimestamp) {
        line << FormatLogTimestamp(entry.timestamp) << ' ';
    }
    line << '[' << LogLevelToString(entry.level) << "] ";
    if (entry.category != LogCategory::DEFAULT) {
        line << entry.category << ": ";
    }
    if (!entry.scope.empty()) {
        line << '(' << entry.scope << ") ";
    }
    line << entry.message;

    std::lock_guard<std::mutex> lock(mutex_);
    const char* color = ColorFor(entry.level);
    if (config_.useColors && *color != '\0' && isatty(fileno(stderr))) {
        fprintf(stderr, "%s%s\033[0m\n", color, line.str().c_str());
    } else {
        fprintf(stderr, "%s\n", line.str().c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config) : config_(config) {
    if (config_.path.empty()) {
        return;
    }
    file_.open(config_.path, std::ios::out | std::ios::app);
    if (file_.is_open()) {
        file_.seekp(0, std::ios::end);
        currentSize_ = static_cast<size_t>(file_.tellp());
    }
}

FileSink::~FileSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    if (entry.level < config_.level) {
        return;
    }

    std::ostringstream line;
    line << FormatLogTimestamp(entry.timestamp) << " [" << LogLevelToString(entry.level) << "] ["
         << entry.category << "] ";
    if (!entry.file.empty()) {
        line << GetBasename(entry.file) << ':' << entry.line << ' ';
    }
    if (!entry.scope.empty()) {
        line << '(' << entry.scope << ") ";
    }
    line << entry.message << '\n';
    std::string text = line.str();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open()) {
        return;
    }
    if (config_.maxFiles > 0 && currentSize_ >= config_.maxSize) {
        RotateLocked();
    }
    file_ << text;
    file_.flush();
    currentSize_ += text.size();
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::RotateLocked() {
    file_.close();

    auto numbered = [this](size_t n) { return config_.path + "." + std::to_string(n); };
    std::remove(numbered(config_.maxFiles).c_str());
    for (size_t n = config_.maxFiles; n > 1; --n) {
        std::rename(numbered(n - 1).c_str(), numbered(n).c_str());
    }
    std::rename(config_.path.c_str(), numbered(1).c_str());

    file_.open(config_.path, std::ios::out | std::ios::trunc);
    currentSize_ = 0;
}

// ============================================================================
// CallbackSink
// ============================================================================

void CallbackSink::Write(const LogEntry& entry) {
    if (entry.level >= level_ && callback_) {
        callback_(entry);
    }
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

Logger::~Logger() {
    Shutdown();
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
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
    categories_.insert(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.clear();
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.empty() || categories_.count(category) > 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.scope = g_scope;
    entry.message = message;
    entry.file = file ? file : "";
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

// ============================================================================
// LogScope / LogStream
// ============================================================================

LogScope::LogScope(const std::string& tag) : saved_(g_scope) {
    g_scope = saved_.empty() ? tag : saved_ + " " + tag;
}

LogScope::~LogScope() {
    g_scope = std::move(saved_);
}

const std::string& LogScope::Current() {
    return g_scope;
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

// ============================================================================
// Setup
// ============================================================================

bool ConfigureLogging(const LogOptions& options) {
    Logger& logger = Logger::Instance();
    logger.Flush();
    logger.ClearSinks();
    logger.EnableAllCategories();

    LogLevel level = options.level;
    if (!options.debugCategories.empty()) {
        level = std::min(level, LogLevel::Debug);
        bool all = std::any_of(options.debugCategories.begin(), options.debugCategories.end(),
                               SelectsAll);
        if (!all) {
            for (const auto& category : options.debugCategories) {
                logger.EnableCategory(category);
            }
        }
    }
    logger.SetLevel(level);

    if (options.printToConsole) {
        ConsoleSink::Config console;
        console.level = level;
        logger.AddSink(std::make_shared<ConsoleSink>(console));
    }

    if (options.filePath.empty()) {
        return true;
    }
    FileSink::Config file;
    file.path = options.filePath;
    file.level = level;
    auto sink = std::make_shared<FileSink>(file);
    if (!sink->IsOpen()) {
        return false;
    }
    logger.AddSink(sink);
    return true;
}

} // namespace util
} // namespace amoca
