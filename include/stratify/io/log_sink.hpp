#pragma once

#include "stratify/interfaces.hpp"
#include <iosfwd>
#include <mutex>
#include <string>
#include <vector>

namespace stratify {

// Writes informational lines to one stream and warnings/errors to another.
// Safe to share between concurrently running fixers.
class StreamLogSink : public ILogSink {
public:
    StreamLogSink(std::ostream& out, std::ostream& err, bool quiet = false);

    auto info(std::string_view message) -> void override;
    auto warn(std::string_view message) -> void override;
    auto error(std::string_view message) -> void override;

private:
    std::ostream& out_;
    std::ostream& err_;
    bool quiet_;
    std::mutex mutex_;
};

enum class LogLevel {
    INFO,
    WARN,
    ERROR
};

struct LogEntry {
    LogLevel level = LogLevel::INFO;
    std::string message;
};

// Keeps every message in memory
class RecordingLogSink : public ILogSink {
public:
    auto info(std::string_view message) -> void override;
    auto warn(std::string_view message) -> void override;
    auto error(std::string_view message) -> void override;

    auto entries() const -> std::vector<LogEntry>;
    auto contains(std::string_view fragment) const -> bool;

private:
    auto record(LogLevel level, std::string_view message) -> void;

    mutable std::mutex mutex_;
    std::vector<LogEntry> entries_;
};

} // namespace stratify
