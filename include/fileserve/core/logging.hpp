#pragma once

#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace fileserve {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 5
};

std::string_view log_level_name(LogLevel level) noexcept;

// Case-insensitive; unknown names give Info
LogLevel parse_log_level(std::string_view name) noexcept;

// ============================================================================
// Log Entry
// ============================================================================
//
// One event plus key/value context. The serving path attaches the resource
// path, byte counts and decisions as fields so sinks can render them
// without parsing the message.

struct LogField {
    std::string key;
    std::string value;
};

struct LogEntry {
    LogLevel level = LogLevel::Info;
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    std::string logger_name;
    std::vector<LogField> fields;

    LogEntry& field(std::string key, std::string value) {
        fields.push_back({std::move(key), std::move(value)});
        return *this;
    }

    LogEntry& field(std::string key, std::string_view value) {
        return field(std::move(key), std::string(value));
    }

    LogEntry& field(std::string key, const char* value) {
        return field(std::move(key), std::string(value));
    }

    LogEntry& field(std::string key, bool value) {
        return field(std::move(key), std::string(value ? "true" : "false"));
    }

    template<typename T>
        requires std::is_integral_v<T>
    LogEntry& field(std::string key, T value) {
        return field(std::move(key), std::to_string(value));
    }

    // Value of the first field named key, empty if absent
    std::string_view find_field(std::string_view key) const noexcept;
};

// ============================================================================
// Log Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
};

// Human-readable lines: "<time> [LEVEL] [name] message key=value ..."
class StreamSink : public LogSink {
    std::ostream& out_;
    bool colored_;
    std::mutex mutex_;

public:
    explicit StreamSink(std::ostream& out = std::cerr, bool colored = false)
        : out_(out), colored_(colored) {}

    void write(const LogEntry& entry) override;
};

// One JSON object per line
class JsonSink : public LogSink {
    std::ostream& out_;
    std::mutex mutex_;

public:
    explicit JsonSink(std::ostream& out = std::cout) : out_(out) {}
    void write(const LogEntry& entry) override;
};

// Keeps entries in memory; used by tests to assert on what was logged
class MemorySink : public LogSink {
    mutable std::mutex mutex_;
    std::vector<LogEntry> entries_;

public:
    void write(const LogEntry& entry) override;

    std::vector<LogEntry> entries() const;
    bool contains(LogLevel level, std::string_view needle) const;
    void clear();
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
    std::string name_;
    LogLevel level_ = LogLevel::Info;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;

public:
    Logger() = default;
    explicit Logger(std::string name, LogLevel level = LogLevel::Info)
        : name_(std::move(name)), level_(level) {}

    Logger& set_level(LogLevel level) { level_ = level; return *this; }
    Logger& add_sink(std::shared_ptr<LogSink> sink);

    bool is_enabled(LogLevel level) const noexcept {
        return level_ != LogLevel::Off && level >= level_;
    }

    // Entry stamped with this logger's name and the current time
    LogEntry entry(LogLevel level, std::string message) const;

    void log(const LogEntry& entry) const;
    void log(LogLevel level, std::string message) const;

    void trace(std::string message) const { log(LogLevel::Trace, std::move(message)); }
    void debug(std::string message) const { log(LogLevel::Debug, std::move(message)); }
    void info(std::string message) const { log(LogLevel::Info, std::move(message)); }
    void warn(std::string message) const { log(LogLevel::Warn, std::move(message)); }
    void error(std::string message) const { log(LogLevel::Error, std::move(message)); }

    const std::string& name() const noexcept { return name_; }
    LogLevel level() const noexcept { return level_; }
};

// ============================================================================
// Global Logger
// ============================================================================
//
// Writes to stderr through a StreamSink. The initial level comes from the
// FILESERVE_LOG_LEVEL environment variable (trace, debug, info, warn, error,
// off), Warn when unset.

Logger& default_logger();

inline void log_debug(std::string msg) { default_logger().debug(std::move(msg)); }
inline void log_info(std::string msg) { default_logger().info(std::move(msg)); }
inline void log_warn(std::string msg) { default_logger().warn(std::move(msg)); }
inline void log_error(std::string msg) { default_logger().error(std::move(msg)); }

} // namespace fileserve
