// ZPROOF - Logging Implementation
// Copyright (c) 2024 ZPROOF Developers
// MIT License

#include "zproof/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace zproof {
namespace util {

namespace {

thread_local uint64_t t_requestId = 0;

std::string Timestamp(std::chrono::system_clock::time_point tp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << '.'
        << std::setfill('0') << std::setw(3) << millis;
    return oss.str();
}

/// "<time> [LEVEL] [category] [req N] message (file:line)"
std::string FormatLine(const LogEntry& entry, bool timestamp, bool source) {
    std::ostringstream oss;
    if (timestamp) {
        oss << Timestamp(entry.timestamp) << ' ';
    }
    oss << '[' << std::left << std::setw(5) << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << '[' << entry.category << "] ";
    }
    if (entry.requestId != 0) {
        oss << "[req " << entry.requestId << "] ";
    }
    oss << entry.message;
    if (source && entry.file) {
        std::string file(entry.file);
        size_t slash = file.find_last_of('/');
        oss << " (" << (slash == std::string::npos ? file : file.substr(slash + 1))
            << ':' << entry.line << ')';
    }
    return oss.str();
}

const char* Color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[1;31m";
        default:              return "";
    }
}

} // namespace

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
    std::string name(str);
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
// ScopedRequestTag
// ============================================================================

ScopedRequestTag::ScopedRequestTag(uint64_t requestId) : previous_(t_requestId) {
    t_requestId = requestId;
}

ScopedRequestTag::~ScopedRequestTag() {
    t_requestId = previous_;
}

uint64_t ScopedRequestTag::Current() {
    return t_requestId;
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink() : ConsoleSink(Config{}) {}

ConsoleSink::ConsoleSink(const Config& config)
    : LogSink(config.level), config_(config) {}

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = FormatLine(entry, config_.showTimestamp, false);
    FILE* out = entry.level >= LogLevel::Warn ? stderr : stdout;
    const char* color = Color(entry.level);

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.useColors && *color && isatty(fileno(out))) {
        std::fprintf(out, "%s%s\033[0m\n", color, line.c_str());
    } else {
        std::fprintf(out, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const Config& config)
    : LogSink(config.level), config_(config) {
    if (config_.path.empty()) {
        return;
    }
    file_.open(config_.path, std::ios::out | std::ios::app);
    if (file_.is_open()) {
        std::streampos end = file_.tellp();
        written_ = end > 0 ? static_cast<size_t>(end) : 0;
    }
}

bool FileSink::IsOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void FileSink::Write(const LogEntry& entry) {
    std::string line = FormatLine(entry, config_.showTimestamp, true) + "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.maxSize > 0 && written_ + line.size() > config_.maxSize) {
        RotateLocked();
    }
    if (!file_.is_open()) {
        return;
    }
    file_ << line;
    file_.flush();
    written_ += line.size();
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::RotateLocked() {
    file_.close();
    std::string backup = config_.path + ".1";
    if (std::rename(config_.path.c_str(), backup.c_str()) != 0) {
        // Keep appending to the same file rather than losing output
        std::fprintf(stderr, "Cannot rotate log file %s\n", config_.path.c_str());
        file_.open(config_.path, std::ios::out | std::ios::app);
    } else {
        file_.open(config_.path, std::ios::out | std::ios::trunc);
    }
    written_ = 0;
}

// ============================================================================
// CallbackSink
// ============================================================================

CallbackSink::CallbackSink(Callback callback, LogLevel level)
    : LogSink(level), callback_(std::move(callback)) {}

void CallbackSink::Write(const LogEntry& entry) {
    if (callback_) {
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

void Logger::Initialize() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    if (sinks_.empty()) {
        sinks_.push_back(std::make_shared<ConsoleSink>());
    }
}

void Logger::Shutdown() {
    Flush();
    ClearSinks();
}

void Logger::AddSink(std::shared_ptr<LogSink> sink) {
    if (sink) {
        std::lock_guard<std::mutex> lock(sinksMutex_);
        sinks_.push_back(std::move(sink));
    }
}

void Logger::RemoveSink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.clear();
}

void Logger::SetCategories(const std::vector<std::string>& categories) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.clear();
    for (const auto& category : categories) {
        if (category == "all" || category == "1") {
            categories_.clear();
            return;
        }
        if (!category.empty()) {
            categories_.insert(category);
        }
    }
}

bool Logger::IsCategoryEnabled(const std::string& category) const {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.empty() || categories_.count(category) != 0;
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    return level >= LogLevel::Warn || IsCategoryEnabled(category);
}

void Logger::Log(LogLevel level, const std::string& category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level, category)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category;
    entry.message = message;
    entry.file = file;
    entry.line = line;
    entry.timestamp = std::chrono::system_clock::now();
    entry.requestId = ScopedRequestTag::Current();

    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        if (sink->Accepts(level)) {
            sink->Write(entry);
        }
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

// ============================================================================
// ScopedLogTimer
// ============================================================================

ScopedLogTimer::ScopedLogTimer(const char* category, std::string operation)
    : category_(category)
    , operation_(std::move(operation))
    , start_(std::chrono::steady_clock::now()) {}

ScopedLogTimer::~ScopedLogTimer() {
    LOG_DEBUG(category_) << operation_ << " took " << ElapsedMs() << "ms";
}

int64_t ScopedLogTimer::ElapsedMs() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_).count();
}

} // namespace util
} // namespace zproof
