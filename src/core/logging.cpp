#include "paramroute/core/logging.hpp"

#include <ctime>
#include <iomanip>

#include <nlohmann/json.hpp>

namespace paramroute {

// ============================================================================
// Log Level Utilities
// ============================================================================

std::string_view log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
        default: return "UNKNOWN";
    }
}

LogLevel parse_log_level(std::string_view name) noexcept {
    if (name == "trace" || name == "TRACE") return LogLevel::Trace;
    if (name == "debug" || name == "DEBUG") return LogLevel::Debug;
    if (name == "info" || name == "INFO") return LogLevel::Info;
    if (name == "warn" || name == "WARN" || name == "warning" || name == "WARNING") return LogLevel::Warn;
    if (name == "error" || name == "ERROR") return LogLevel::Error;
    if (name == "fatal" || name == "FATAL") return LogLevel::Fatal;
    if (name == "off" || name == "OFF") return LogLevel::Off;
    return LogLevel::Info;
}

namespace {

const char* level_color(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        default: return "\033[0m";
    }
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
    auto time_t_val = std::chrono::system_clock::to_time_t(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()) % 1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &time_t_val);
#else
    localtime_r(&time_t_val, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count();
    return oss.str();
}

} // anonymous namespace

// ============================================================================
// Console Sink
// ============================================================================

void ConsoleSink::write(const LogEntry& entry) {
    std::ostringstream oss;
    oss << format_timestamp(entry.timestamp) << " ";

    if (colored_) oss << level_color(entry.level);
    oss << "[" << log_level_name(entry.level) << "]";
    if (colored_) oss << "\033[0m";

    if (!entry.logger_name.empty()) {
        oss << " [" << entry.logger_name << "]";
    }

    oss << " " << entry.message;

    for (const auto& [key, value] : entry.fields) {
        oss << " " << key << "=" << value;
    }
    oss << "\n";

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << oss.str();
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// ============================================================================
// JSON Sink
// ============================================================================

void JsonSink::write(const LogEntry& entry) {
    nlohmann::json line = {
        {"timestamp", format_timestamp(entry.timestamp)},
        {"level", std::string(log_level_name(entry.level))},
        {"message", entry.message},
    };
    if (!entry.logger_name.empty()) {
        line["logger"] = entry.logger_name;
    }
    for (const auto& [key, value] : entry.fields) {
        line[key] = value;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
}

void JsonSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    return *this;
}

Logger& Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
    return *this;
}

Logger& Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    return *this;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
}

bool Logger::is_enabled(LogLevel level) const {
    return level != LogLevel::Off && level >= this->level();
}

void Logger::log(LogLevel level, std::string message) const {
    if (!is_enabled(level)) return;
    log(entry(level, std::move(message)));
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
    std::lock_guard<std::mutex> lock(mutex_);
    if (entry.level == LogLevel::Off || entry.level < level_) return;
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

// ============================================================================
// Global Logger
// ============================================================================

Logger& default_logger() {
    static Logger logger("paramroute");
    static std::once_flag initialized;
    std::call_once(initialized, [] {
        logger.add_sink(std::make_shared<ConsoleSink>());
    });
    return logger;
}

} // namespace paramroute
