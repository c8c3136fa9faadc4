#include "fileserve/core/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace fileserve {

std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Off:   return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lower(name.size(), '\0');
    std::transform(name.begin(), name.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off" || lower == "none") return LogLevel::Off;
    return LogLevel::Info;
}

std::string_view LogEntry::find_field(std::string_view key) const noexcept {
    for (const auto& f : fields) {
        if (f.key == key) return f.value;
    }
    return {};
}

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        default: return "\033[0m";
    }
}

// UTC with milliseconds: 2024-01-31T12:00:00.123Z
std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm tm_val{};
    gmtime_r(&secs, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z';
    return oss.str();
}

void write_json_string(std::ostream& out, std::string_view s) {
    out << '"';
    for (char c : s) {
        switch (c) {
            case '"': out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n"; break;
            case '\r': out << "\\r"; break;
            case '\t': out << "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                        << static_cast<int>(c) << std::dec;
                } else {
                    out << c;
                }
        }
    }
    out << '"';
}

// Values with spaces are quoted so key=value pairs stay splittable
void write_text_value(std::ostream& out, std::string_view v) {
    if (v.find_first_of(" \t\"") == std::string_view::npos && !v.empty()) {
        out << v;
        return;
    }
    out << std::quoted(v);
}

} // anonymous namespace

void StreamSink::write(const LogEntry& entry) {
    // Format outside the lock; only the write is serialized
    std::ostringstream line;
    line << format_timestamp(entry.timestamp) << ' ';
    if (colored_) line << level_color(entry.level);
    line << '[' << log_level_name(entry.level) << ']';
    if (colored_) line << "\033[0m";

    if (!entry.logger_name.empty()) {
        line << " [" << entry.logger_name << ']';
    }
    line << ' ' << entry.message;

    for (const auto& f : entry.fields) {
        line << ' ' << f.key << '=';
        write_text_value(line, f.value);
    }
    line << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.str();
}

void JsonSink::write(const LogEntry& entry) {
    std::ostringstream obj;
    obj << "{\"timestamp\":\"" << format_timestamp(entry.timestamp) << '"'
        << ",\"level\":\"" << log_level_name(entry.level) << '"';

    if (!entry.logger_name.empty()) {
        obj << ",\"logger\":";
        write_json_string(obj, entry.logger_name);
    }

    obj << ",\"message\":";
    write_json_string(obj, entry.message);

    for (const auto& f : entry.fields) {
        obj << ',';
        write_json_string(obj, f.key);
        obj << ':';
        write_json_string(obj, f.value);
    }
    obj << "}\n";

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << obj.str();
}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool MemorySink::contains(LogLevel level, std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [&](const LogEntry& e) {
        return e.level == level && e.message.find(needle) != std::string::npos;
    });
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    return *this;
}

LogEntry Logger::entry(LogLevel level, std::string message) const {
    LogEntry e;
    e.level = level;
    e.timestamp = std::chrono::system_clock::now();
    e.message = std::move(message);
    e.logger_name = name_;
    return e;
}

void Logger::log(const LogEntry& entry) const {
    if (!is_enabled(entry.level)) return;

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::log(LogLevel level, std::string message) const {
    if (!is_enabled(level)) return;
    log(entry(level, std::move(message)));
}

Logger& default_logger() {
    static Logger logger("fileserve");
    static const bool initialized = [] {
        const char* env = std::getenv("FILESERVE_LOG_LEVEL");
        logger.set_level(env ? parse_log_level(env) : LogLevel::Warn);
        logger.add_sink(std::make_shared<StreamSink>(std::cerr, ::isatty(STDERR_FILENO) != 0));
        return true;
    }();
    (void)initialized;
    return logger;
}

} // namespace fileserve
