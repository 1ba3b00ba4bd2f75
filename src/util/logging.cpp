// POLYMINT - Logging Implementation
// Copyright (c) 2024 POLYMINT Developers
// MIT License

#include "polymint/util/logging.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace polymint {
namespace util {

// ============================================================================
// Levels and Formatting
// ============================================================================

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

std::optional<LogLevel> ParseLogLevel(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (LogLevel level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                           LogLevel::Warn, LogLevel::Error, LogLevel::Off}) {
        std::string candidate = LogLevelToString(level);
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (lower == candidate) {
            return level;
        }
    }
    return std::nullopt;
}

std::string FormatLogEntry(const LogEntry& entry) {
    auto sinceEpoch = entry.timestamp.time_since_epoch();
    std::time_t seconds = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch) % 1000;

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis.count() << "Z [" << LogLevelToString(entry.level) << "] ["
        << entry.category << "] ";
    if (entry.file) {
        std::string path = entry.file;
        oss << path.substr(path.find_last_of("/\\") + 1) << ':' << entry.line << ' ';
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

StreamSink::StreamSink() : out_(std::clog) {}

StreamSink::StreamSink(std::ostream& out) : out_(out) {}

void StreamSink::Write(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
}

void StreamSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

FileSink::FileSink(const std::string& path) : file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_ << line << '\n';
    }
}

void FileSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.flush();
    }
}

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

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::RemoveSink(const std::shared_ptr<ILogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::ClearSinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::Mute(const std::string& category) {
    std::lock_guard<std::mutex> lock(mutex_);
    muted_.insert(category);
}

void Logger::UnmuteAll() {
    std::lock_guard<std::mutex> lock(mutex_);
    muted_.clear();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return !sinks_.empty() && muted_.count(category) == 0;
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

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Write(entry);
    }
}

void Logger::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
}

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace polymint
