// POLYMINT - Logging System
// Copyright (c) 2024 POLYMINT Developers
// MIT License
//
// Leveled logging for committed calls, rejections and collaborator faults.
// Entries carry one of the LogCategory names and fan out to the sinks
// registered on the Logger:
//
//   LOG_INFO(LogCategory::TREASURY) << "bought " << amount;

#ifndef POLYMINT_UTIL_LOGGING_H
#define POLYMINT_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace polymint {
namespace util {

// ============================================================================
// Levels and Categories
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,   // Rejected calls, swallowed oracle refreshes
    Info = 2,    // Committed state changes
    Warn = 3,    // Collaborator faults
    Error = 4,
    Off = 5
};

const char* LogLevelToString(LogLevel level);

/// Case-insensitive; nullopt for an unknown name
std::optional<LogLevel> ParseLogLevel(const std::string& name);

namespace LogCategory {
    constexpr const char* TREASURY = "treasury";
    constexpr const char* BOND = "bond";
    constexpr const char* EPOCH = "epoch";
    constexpr const char* ORACLE = "oracle";
    constexpr const char* REWARDS = "rewards";
    constexpr const char* ASSET = "asset";
    constexpr const char* CONFIG = "config";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    const char* file{nullptr};
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// "2024-05-01T12:00:00.250Z [INFO] [treasury] treasury.cpp:88 message"
std::string FormatLogEntry(const LogEntry& entry);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}
};

/// Formatted lines to a borrowed stream (std::clog by default)
class StreamSink : public ILogSink {
public:
    StreamSink();
    explicit StreamSink(std::ostream& out);

    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::ostream& out_;
    std::mutex mutex_;
};

/// Formatted lines appended to a file
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

/// Hands raw entries to a callback
class CallbackSink : public ILogSink {
public:
    using Callback = std::function<void(const LogEntry&)>;

    explicit CallbackSink(Callback callback) : callback_(std::move(callback)) {}

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

    void AddSink(std::shared_ptr<ILogSink> sink);
    void RemoveSink(const std::shared_ptr<ILogSink>& sink);
    void ClearSinks();

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// Muted categories are dropped at any level
    void Mute(const std::string& category);
    void UnmuteAll();

    bool WillLog(LogLevel level, const std::string& category) const;

    void Log(LogLevel level, const std::string& category, const std::string& message,
             const char* file = nullptr, int line = 0);

    void Flush();

private:
    Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_{LogLevel::Info};

    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<ILogSink>> sinks_;
    std::set<std::string> muted_;
};

// ============================================================================
// Stream Macros
// ============================================================================

/// Collects a message and hands it to the logger on destruction
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

// The operands after << are evaluated only when the entry will be written
#define POLYMINT_LOG(level, category) \
    if (!::polymint::util::Logger::Instance().WillLog( \
            ::polymint::util::LogLevel::level, category)) {} \
    else ::polymint::util::LogStream(::polymint::util::LogLevel::level, category, \
                                     __FILE__, __LINE__)

#define LOG_TRACE(category)   POLYMINT_LOG(Trace, category)
#define LOG_DEBUG(category)   POLYMINT_LOG(Debug, category)
#define LOG_INFO(category)    POLYMINT_LOG(Info, category)
#define LOG_WARN(category)    POLYMINT_LOG(Warn, category)
#define LOG_ERROR(category)   POLYMINT_LOG(Error, category)

} // namespace util
} // namespace polymint

#endif // POLYMINT_UTIL_LOGGING_H
