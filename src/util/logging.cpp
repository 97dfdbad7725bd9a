// DOGEPROV - Logging Implementation
// Copyright (c) 2024 DOGEPROV Developers
// MIT License

#include "dogeprov/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

namespace dogeprov {
namespace util {

const char* LogLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

LogLevel LogLevelFromString(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info")  return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return LogLevel::Info;
}

std::string FormatLogEntry(const LogEntry& entry, bool withLocation) {
    auto time = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;
    std::tm tm_buf;
    localtime_r(&time, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << ' '
        << '[' << LogLevelToString(entry.level) << "] ";
    if (!entry.category.empty()) {
        oss << '[' << entry.category << "] ";
    }
    if (withLocation && !entry.file.empty()) {
        size_t slash = entry.file.find_last_of('/');
        oss << (slash == std::string::npos ? entry.file : entry.file.substr(slash + 1))
            << ':' << entry.line << ' ';
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::Write(const LogEntry& entry) {
    std::string formatted = FormatLogEntry(entry, false);
    std::lock_guard<std::mutex> lock(mutex_);
    std::fprintf(entry.level >= LogLevel::Error ? stderr : stdout, "%s\n", formatted.c_str());
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

FileSink::FileSink(const std::string& path) : file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogEntry& entry) {
    std::string formatted = FormatLogEntry(entry, true);
    std::lock_guard<std::mutex> lock(mutex_);
    file_ << formatted << '\n';
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    file_.flush();
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

void Logger::Log(LogLevel level, const char* category, const std::string& message,
                 const char* file, int line) {
    if (!WillLog(level)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.category = category ? category : "";
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

bool ConfigureLogging(LogLevel level, const std::string& logFile) {
    Logger& logger = Logger::Instance();
    logger.SetLevel(level);

    std::shared_ptr<FileSink> file;
    if (!logFile.empty()) {
        file = std::make_shared<FileSink>(logFile);
        if (!file->IsOpen()) {
            return false;
        }
    }

    std::lock_guard<std::mutex> lock(logger.sinksMutex_);
    if (!logger.console_) {
        logger.console_ = std::make_shared<ConsoleSink>();
        logger.sinks_.push_back(logger.console_);
    }
    if (file) {
        auto& sinks = logger.sinks_;
        sinks.erase(std::remove(sinks.begin(), sinks.end(), logger.file_), sinks.end());
        logger.file_ = file;
        sinks.push_back(file);
    }
    return true;
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace dogeprov
