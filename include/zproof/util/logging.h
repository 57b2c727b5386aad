// ZPROOF - Logging System
// Copyright (c) 2024 ZPROOF Developers
// MIT License
//
// Leveled, categorized logging for the proof daemon. Entries written while
// an HTTP connection is being served carry that connection's request tag,
// so lines from concurrent workers can be told apart.

#ifndef ZPROOF_UTIL_LOGGING_H
#define ZPROOF_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace zproof {
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

/// Case-insensitive; "warning" and "none" are accepted. Unknown names give Info.
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* HTTP = "http";
    constexpr const char* PARAMS = "params";
    constexpr const char* PROVER = "prover";
    constexpr const char* SERVICE = "service";
    constexpr const char* CONFIG = "config";
    constexpr const char* BENCH = "bench";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
    /// Tag of the request being served on this thread, 0 outside requests
    uint64_t requestId{0};
};

// ============================================================================
// Request Tagging
// ============================================================================

/**
 * Tags every entry logged on the current thread with a request id for the
 * lifetime of the object. Tags nest; the previous tag is restored on exit.
 */
class ScopedRequestTag {
public:
    explicit ScopedRequestTag(uint64_t requestId);
    ~ScopedRequestTag();

    ScopedRequestTag(const ScopedRequestTag&) = delete;
    ScopedRequestTag& operator=(const ScopedRequestTag&) = delete;

    /// Tag active on the calling thread, 0 if none
    static uint64_t Current();

private:
    uint64_t previous_;
};

// ============================================================================
// Sinks
// ============================================================================

/// Destination for log entries, with its own minimum level
class LogSink {
public:
    explicit LogSink(LogLevel level) : level_(level) {}
    virtual ~LogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }
    bool Accepts(LogLevel level) const { return level >= level_.load(); }

private:
    std::atomic<LogLevel> level_;
};

/// stdout for Info and below, stderr for warnings and errors
class ConsoleSink : public LogSink {
public:
    struct Config {
        bool useColors{true};
        bool showTimestamp{true};
        LogLevel level{LogLevel::Info};
    };

    ConsoleSink();
    explicit ConsoleSink(const Config& config);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    Config config_;
    std::mutex mutex_;
};

/**
 * Appends to a file. Once the file passes maxSize bytes it is renamed to
 * "<path>.1" (replacing any earlier backup) and a fresh file is started.
 */
class FileSink : public LogSink {
public:
    struct Config {
        std::string path;
        size_t maxSize{10 * 1024 * 1024};
        bool showTimestamp{true};
        LogLevel level{LogLevel::Debug};
    };

    explicit FileSink(const Config& config);

    bool IsOpen() const;

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    void RotateLocked();

    Config config_;
    std::ofstream file_;
    mutable std::mutex mutex_;
    size_t written_{0};
};

/// Hands entries to a function; tests use it to capture output
class CallbackSink : public LogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback, LogLevel level = LogLevel::Info);

    void Write(const LogEntry& entry) override;

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Add a console sink if none has been configured
    void Initialize();

    /// Flush and detach every sink
    void Shutdown();

    void AddSink(std::shared_ptr<LogSink> sink);
    void RemoveSink(const std::shared_ptr<LogSink>& sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /**
     * Limit Trace/Debug/Info output to these categories. An empty list,
     * "all" or "1" enables everything. Warnings and errors always pass.
     */
    void SetCategories(const std::vector<std::string>& categories);
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

    std::atomic<LogLevel> level_{LogLevel::Info};

    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex sinksMutex_;

    std::set<std::string> categories_;
    mutable std::mutex categoriesMutex_;
};

/// Accumulates a message through operator<< and logs it when destroyed
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
// Macros
// ============================================================================

#define ZPROOF_LOG(level, category) \
    if (!::zproof::util::Logger::Instance().WillLog(::zproof::util::LogLevel::level, category)) {} \
    else ::zproof::util::LogStream(::zproof::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category)   ZPROOF_LOG(Trace, category)
#define LOG_DEBUG(category)   ZPROOF_LOG(Debug, category)
#define LOG_INFO(category)    ZPROOF_LOG(Info, category)
#define LOG_WARN(category)    ZPROOF_LOG(Warn, category)
#define LOG_ERROR(category)   ZPROOF_LOG(Error, category)
#define LOG_FATAL(category)   ZPROOF_LOG(Fatal, category)

// ============================================================================
// Scoped Log Timer
// ============================================================================

/// Logs "<operation> took <N>ms" at Debug level when the scope ends
class ScopedLogTimer {
public:
    ScopedLogTimer(const char* category, std::string operation);
    ~ScopedLogTimer();

    int64_t ElapsedMs() const;

private:
    const char* category_;
    std::string operation_;
    std::chrono::steady_clock::time_point start_;
};

} // namespace util
} // namespace zproof

#endif // ZPROOF_UTIL_LOGGING_H
