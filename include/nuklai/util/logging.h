// NUKLAI - Logging System
// Copyright (c) 2024 NUKLAI Developers
// MIT License
//
// Process-wide leveled logger. Messages carry a category ("emission", "db",
// ...) so a node can narrow output to the subsystems it cares about, and are
// fanned out to every registered sink.
//
//   LOG_INFO(util::LogCategory::EMISSION) << "minted " << FormatAmount(total);
//
// Arguments after << are not evaluated when the message would be filtered.

#ifndef NUKLAI_UTIL_LOGGING_H
#define NUKLAI_UTIL_LOGGING_H

#include <atomic>
#include <chrono>
#include <fstream>
#include <memory>
#include <mutex>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace nuklai {
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

/// Case-insensitive; "warning" and "none" are accepted, anything unknown is Info
LogLevel LogLevelFromString(const std::string& str);

namespace LogCategory {
    constexpr const char* DEFAULT = "default";
    constexpr const char* EMISSION = "emission";
    constexpr const char* DB = "db";
    constexpr const char* CONFIG = "config";
    constexpr const char* NODE = "node";
}

struct LogEntry {
    LogLevel level{LogLevel::Info};
    std::string category;
    std::string message;
    std::string file;
    int line{0};
    std::chrono::system_clock::time_point timestamp;
};

/// "[LEVEL] [category] file.cpp:line message"; location only when requested
std::string FormatLogEntry(const LogEntry& entry, bool withLocation);

// ============================================================================
// Sinks
// ============================================================================

class ILogSink {
public:
    virtual ~ILogSink() = default;

    virtual void Write(const LogEntry& entry) = 0;
    virtual void Flush() {}
};

/// stdout, colored by level when attached to a terminal
class ConsoleSink : public ILogSink {
public:
    void Write(const LogEntry& entry) override;
    void Flush() override;

private:
    std::mutex mutex_;
};

/// Appends timestamped lines with source locations
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

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& Instance();

    /// Install the console sink once; later calls do nothing until Shutdown
    void Initialize();

    /// Flush and drop every sink
    void Shutdown();

    void AddSink(std::shared_ptr<ILogSink> sink);

    void SetLevel(LogLevel level) { level_.store(level); }
    LogLevel GetLevel() const { return level_.load(); }

    /// The first call narrows output to the enabled categories
    void EnableCategory(const std::string& category);
    void EnableAllCategories();

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
    std::mutex sinksMutex_;

    std::atomic<LogLevel> level_{LogLevel::Info};
    std::atomic<bool> initialized_{false};

    /// Empty means every category
    std::set<std::string> categories_;
    mutable std::mutex categoriesMutex_;
};

/// Builds one message and hands it to the logger when destroyed
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

} // namespace util
} // namespace nuklai

#define NUKLAI_LOG(level, category) \
    if (!::nuklai::util::Logger::Instance().WillLog(::nuklai::util::LogLevel::level, category)) {} \
    else ::nuklai::util::LogStream(::nuklai::util::LogLevel::level, category, __FILE__, __LINE__)

#define LOG_TRACE(category) NUKLAI_LOG(Trace, category)
#define LOG_DEBUG(category) NUKLAI_LOG(Debug, category)
#define LOG_INFO(category)  NUKLAI_LOG(Info, category)
#define LOG_WARN(category)  NUKLAI_LOG(Warn, category)
#define LOG_ERROR(category) NUKLAI_LOG(Error, category)

#endif // NUKLAI_UTIL_LOGGING_H
