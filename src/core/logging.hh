#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <deque>
#include <sstream>
#include <source_location>
#include <thread>
#include <unordered_map>
#include <vector>

namespace aether {

// ============================================================================
// Log Levels
// ============================================================================

enum class LogLevel : std::uint8_t {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6,
};

[[nodiscard]] constexpr std::string_view log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr std::string_view log_level_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35;1m";
        case LogLevel::OFF:   return "";
    }
    return "";
}

// ============================================================================
// Log Entry
// ============================================================================

struct LogEntry {
    LogLevel level;
    std::chrono::system_clock::time_point timestamp;
    std::thread::id thread_id;
    std::string component;
    std::string message;
    std::string file;
    std::uint32_t line;
};

// ============================================================================
// Log Sink Interface
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

// ============================================================================
// Console Log Sink (stderr)
// ============================================================================

class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogEntry& entry) override;
    void flush() override;

    void set_show_thread_id(bool show) { show_thread_id_ = show; }
    void set_show_source_location(bool show) { show_source_location_ = show; }

private:
    bool use_colors_;
    bool show_thread_id_ = false;
    bool show_source_location_ = false;
    std::mutex mutex_;

    std::string format_entry(const LogEntry& entry) const;
};

// ============================================================================
// Memory Log Sink
// ============================================================================

// Keeps the most recent entries in memory. Used by tests and by embedders
// that forward records into their own logging.
class MemorySink : public LogSink {
public:
    explicit MemorySink(std::size_t capacity = 4096);

    void write(const LogEntry& entry) override;
    void flush() override {}

    [[nodiscard]] std::vector<LogEntry> entries() const;
    [[nodiscard]] bool contains(std::string_view needle) const;
    [[nodiscard]] std::size_t size() const;
    void clear();

private:
    std::size_t capacity_;
    std::deque<LogEntry> entries_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel level);
    void set_component_level(const std::string& component, LogLevel level);
    void clear_component_levels();
    void add_sink(std::shared_ptr<LogSink> sink);
    void remove_sink(const std::shared_ptr<LogSink>& sink);
    void clear_sinks();

    [[nodiscard]] bool is_enabled(LogLevel level, std::string_view component = {}) const;

    void log(LogLevel level,
             std::string_view component,
             std::string_view message,
             const std::source_location& loc = std::source_location::current());

    void flush();

    [[nodiscard]] LogLevel level() const { return level_.load(); }

private:
    Logger();
    ~Logger();

    std::atomic<LogLevel> level_{LogLevel::INFO};
    std::unordered_map<std::string, LogLevel> component_levels_;
    std::vector<std::shared_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Log Stream Helper
// ============================================================================

class LogStream {
public:
    LogStream(LogLevel level,
              std::string_view component,
              const std::source_location& loc);
    ~LogStream();

    LogStream(const LogStream&) = delete;
    LogStream& operator=(const LogStream&) = delete;

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            stream_ << value;
        }
        return *this;
    }

private:
    LogLevel level_;
    std::string component_;
    std::source_location loc_;
    std::ostringstream stream_;
    bool enabled_;
};

// ============================================================================
// Component Logger
// ============================================================================

class ComponentLogger {
public:
    explicit ComponentLogger(std::string component);

    [[nodiscard]] const std::string& component() const { return component_; }

    [[nodiscard]] bool is_trace_enabled() const;
    [[nodiscard]] bool is_debug_enabled() const;
    [[nodiscard]] bool is_info_enabled() const;

    LogStream trace(const std::source_location& loc = std::source_location::current()) const;
    LogStream debug(const std::source_location& loc = std::source_location::current()) const;
    LogStream info(const std::source_location& loc = std::source_location::current()) const;
    LogStream warn(const std::source_location& loc = std::source_location::current()) const;
    LogStream error(const std::source_location& loc = std::source_location::current()) const;

    void trace(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void debug(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void info(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void warn(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;
    void error(std::string_view msg, const std::source_location& loc = std::source_location::current()) const;

private:
    std::string component_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define AETHER_LOG_TRACE(logger) \
    if ((logger).is_trace_enabled()) (logger).trace()

#define AETHER_LOG_DEBUG(logger) \
    if ((logger).is_debug_enabled()) (logger).debug()

#define AETHER_LOG_INFO(logger) \
    if ((logger).is_info_enabled()) (logger).info()

#define AETHER_LOG_WARN(logger) (logger).warn()

#define AETHER_LOG_ERROR(logger) (logger).error()

// ============================================================================
// Component Loggers
// ============================================================================

namespace log {

inline ComponentLogger core("core");
inline ComponentLogger crypto("crypto");
inline ComponentLogger codec("codec");
inline ComponentLogger tx("tx");
inline ComponentLogger tracker("tracker");
inline ComponentLogger tx_wait("tracker.tx");
inline ComponentLogger job_wait("tracker.job");
inline ComponentLogger ai("ai");
inline ComponentLogger vcr("ai.vcr");
inline ComponentLogger rpc("rpc");

}  // namespace log

// ============================================================================
// Initialization Helper
// ============================================================================

struct LogConfig {
    LogLevel default_level = LogLevel::INFO;
    bool console_enabled = true;
    bool console_colors = true;
    bool console_thread_id = false;
    bool console_source_location = false;
    std::unordered_map<std::string, LogLevel> component_levels;
};

void init_logging(const LogConfig& config = LogConfig{});
void shutdown_logging();

}  // namespace aether
