#include "stratify/io/log_sink.hpp"
#include <algorithm>
#include <ostream>

namespace stratify {

StreamLogSink::StreamLogSink(std::ostream& out, std::ostream& err, bool quiet)
    : out_(out), err_(err), quiet_(quiet) {}

auto StreamLogSink::info(std::string_view message) -> void {
    if (quiet_) {
        return;
    }
    std::lock_guard lock(mutex_);
    out_ << message << '\n';
}

auto StreamLogSink::warn(std::string_view message) -> void {
    std::lock_guard lock(mutex_);
    err_ << "warning: " << message << '\n';
}

auto StreamLogSink::error(std::string_view message) -> void {
    std::lock_guard lock(mutex_);
    err_ << "error: " << message << '\n';
}

auto RecordingLogSink::info(std::string_view message) -> void {
    record(LogLevel::INFO, message);
}

auto RecordingLogSink::warn(std::string_view message) -> void {
    record(LogLevel::WARN, message);
}

auto RecordingLogSink::error(std::string_view message) -> void {
    record(LogLevel::ERROR, message);
}

auto RecordingLogSink::entries() const -> std::vector<LogEntry> {
    std::lock_guard lock(mutex_);
    return entries_;
}

auto RecordingLogSink::contains(std::string_view fragment) const -> bool {
    std::lock_guard lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [&](const LogEntry& entry) {
        return entry.message.find(fragment) != std::string::npos;
    });
}

auto RecordingLogSink::record(LogLevel level, std::string_view message) -> void {
    std::lock_guard lock(mutex_);
    entries_.push_back({.level = level, .message = std::string(message)});
}

} // namespace stratify
