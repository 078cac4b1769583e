// NUKLAI - Logging Implementation
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#include "nuklai/util/logging.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>

#include <unistd.h>

namespace nuklai {
namespace util {

namespace {

std::string Timestamp(std::chrono::system_clock::time_point tp) {
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

const char* ColorCode(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default:              return "\033[0m";
    }
}

} // namespace

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

LogLevel LogLevelFromString(const std::string& str) {
    std::string upper = str;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "TRACE") return LogLevel::Trace;
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    if (upper == "OFF" || upper == "NONE") return LogLevel::Off;
    return LogLevel::Info;
}

std::string FormatLogEntry(const LogEntry& entry, bool withLocation) {
    std::string level = LogLevelToString(entry.level);
    level.resize(5, ' ');

    std::ostringstream oss;
    oss << "[" << level << "] ";
    if (!entry.category.empty() && entry.category != LogCategory::DEFAULT) {
        oss << "[" << entry.category << "] ";
    }
    if (withLocation && !entry.file.empty()) {
        size_t slash = entry.file.find_last_of('/');
        oss << (slash == std::string::npos ? entry.file : entry.file.substr(slash + 1))
            << ":" << entry.line << " ";
    }
    oss << entry.message;
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::Write(const LogEntry& entry) {
    std::string line = FormatLogEntry(entry, false);

    std::lock_guard<std::mutex> lock(mutex_);
    if (isatty(fileno(stdout))) {
        fprintf(stdout, "%s%s\033[0m\n", ColorCode(entry.level), line.c_str());
    } else {
        fprintf(stdout, "%s\n", line.c_str());
    }
}

void ConsoleSink::Flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    fflush(stdout);
}

FileSink::FileSink(const std::string& path)
    : file_(path, std::ios::out | std::ios::app) {}

void FileSink::Write(const LogEntry& entry) {
    std::string line = Timestamp(entry.timestamp) + " " + FormatLogEntry(entry, true);

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
    if (initialized_.exchange(true)) {
        return;
    }
    AddSink(std::make_shared<ConsoleSink>());
}

void Logger::Shutdown() {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    for (const auto& sink : sinks_) {
        sink->Flush();
    }
    sinks_.clear();
    initialized_.store(false);
}

void Logger::AddSink(std::shared_ptr<ILogSink> sink) {
    std::lock_guard<std::mutex> lock(sinksMutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::EnableCategory(const std::string& category) {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.insert(category);
}

void Logger::EnableAllCategories() {
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    categories_.clear();
}

bool Logger::WillLog(LogLevel level, const std::string& category) const {
    if (level == LogLevel::Off || level < level_.load()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(categoriesMutex_);
    return categories_.empty() || categories_.count(category) > 0;
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

LogStream::~LogStream() {
    Logger::Instance().Log(level_, category_, stream_.str(), file_, line_);
}

} // namespace util
} // namespace nuklai
