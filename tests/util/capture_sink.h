// NUKLAI - Log Capture For Tests
// Copyright (c) 2024 NUKLAI Developers
// MIT License

#ifndef NUKLAI_TESTS_UTIL_CAPTURE_SINK_H
#define NUKLAI_TESTS_UTIL_CAPTURE_SINK_H

#include "nuklai/util/logging.h"

#include <mutex>
#include <vector>

namespace nuklai {
namespace test {

/// Keeps every entry the logger delivers
class CaptureSink : public util::ILogSink {
public:
    void Write(const util::LogEntry& entry) override {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.push_back(entry);
    }

    std::vector<util::LogEntry> Entries() {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_;
    }

private:
    std::mutex mutex_;
    std::vector<util::LogEntry> entries_;
};

} // namespace test
} // namespace nuklai

#endif // NUKLAI_TESTS_UTIL_CAPTURE_SINK_H
