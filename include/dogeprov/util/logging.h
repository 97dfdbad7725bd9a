// DOGEPROV - Logging System
// Copyright (c) 2024 DOGEPROV Developers
// MIT License
//
// Leveled, categorized logging with pluggable sinks:
//
//   LOG_INFO(LogCategory::APPROVAL) << "Request #" << id << " approved";

#ifndef DOGEPROV_UTIL_LOGGING_H
#define DOGEPROV_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <vector>

namespace dogeprov {
namespace util {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Unknown names map to Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* PROVIDER = "provider";
    constexpr const char* PERMISSION = "permission";
    constexpr const char* ACCOUNT = "account";
    constexpr const char* SELECTION = "selection";
    constexpr const char* APPROVAL = "approval";
    constexpr const char* TXBUILDER = "txbuilder";
    constexpr const char* EVENTS = "events";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
}

// ============================================================================
// Log Entry / Sinks
// ============================================================================

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// "2024-01-15 10:30:00.123 [WARN] [approval] message"
std::string FormatLogEntry(const LogEntry& entry, bool withLocation);

class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() = 0;
};

/// stdout, with Error and above on stderr
class ConsoleSink : public ILogSink {
public:
    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::mutex mutex_;
};

/// Appends to a log file
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path);

    bool IsOpen() const { return file_.is_open(); }

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::ofstream file_;
    std::mutex mutex_;
};

/// Forwards entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

    void Write(const LogEntry& entry) override { callback_(entry); }
    void Flush() override {}

private:
    Callback callback_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    bool WillLog(LogLevel level) const {
        return level != LogLevel::Off && level >= level_.load();
    }

    void Log(LogLevel level, const char* category, const std::string& message,
             const char* file, int line);

    void Flush();

private:
    friend bool ConfigureLogging(LogLevel level, const std::string& logFile);

    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::vector<std::shared_ptr<ILogSink>> sinks_;
    mutable std::mutex sinksMutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};

    std::shared_ptr<ILogSink> console_;
    std::shared_ptr<ILogSink> file_;
};

/// Set the global level, install the console sink and, when a path is
/// given, replace the file sink. False if the file cannot be opened.
bool ConfigureLogging(LogLevel level, const std::string& logFile);

// ============================================================================
// Log Stream
// ============================================================================

/// Accumulates a message and emits it on destruction
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

#define DOGEPROV_LOG(level, category) \
    if (!::dogeprov::util::Logger::Instance().WillLog(::dogeprov::util::LogLevel::level)) {} \
    else ::dogeprov::util::LogStream(::dogeprov::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category)   DOGEPROV_LOG(Trace, category)
#define LOG_DEBUG(category)   DOGEPROV_LOG(Debug, category)
#define LOG_INFO(category)    DOGEPROV_LOG(Info, category)
#define LOG_WARN(category)    DOGEPROV_LOG(Warn, category)
#define LOG_ERROR(category)   DOGEPROV_LOG(Error, category)

} // namespace util
} // namespace dogeprov

#endif // DOGEPROV_UTIL_LOGGING_H
