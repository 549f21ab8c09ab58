#include "logging.hh"
#include <algorithm>
#include <iostream>
#include <iomanip>
#include <ctime>

namespace aether {

namespace {

void append_timestamp(std::ostringstream& oss, std::chrono::system_clock::time_point ts) {
    auto time_t = std::chrono::system_clock::to_time_t(ts);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');
}

}  // namespace

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : use_colors_(use_colors) {}

void ConsoleSink::write(const LogEntry& entry) {
    auto line = format_entry(entry);
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

std::string ConsoleSink::format_entry(const LogEntry& entry) const {
    std::ostringstream oss;
    append_timestamp(oss, entry.timestamp);

    if (show_thread_id_) {
        oss << " [" << entry.thread_id << "]";
    }

    if (use_colors_) {
        oss << " " << log_level_color(entry.level);
    }
    oss << " [" << std::setw(5) << log_level_name(entry.level) << "]";
    if (use_colors_) {
        oss << "\033[0m";
    }

    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }

    oss << " " << entry.message;

    if (show_source_location_ && !entry.file.empty()) {
        oss << " (" << entry.file << ":" << entry.line << ")";
    }

    return oss.str();
}

// ============================================================================
// MemorySink Implementation
// ============================================================================

MemorySink::MemorySink(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() >= capacity_) {
        entries_.pop_front();
    }
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {entries_.begin(), entries_.end()};
}

bool MemorySink::contains(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [needle](const LogEntry& e) {
        return e.message.find(needle) != std::string::npos;
    });
}

std::size_t MemorySink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() {
    add_sink(std::make_shared<ConsoleSink>(true));
}

Logger::~Logger() {
    flush();
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_component_level(const std::string& component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_[component] = level;
}

void Logger::clear_component_levels() {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_.clear();
}

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::remove_sink(const std::shared_ptr<LogSink>& sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.erase(std::remove(sinks_.begin(), sinks_.end(), sink), sinks_.end());
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level, std::string_view component) const {
    if (level == LogLevel::OFF) {
        return false;
    }

    if (!component.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!component_levels_.empty()) {
            // Walk "tracker.job" -> "tracker"
            std::string name(component);
            while (true) {
                auto it = component_levels_.find(name);
                if (it != component_levels_.end()) {
                    return level >= it->second;
                }
                auto pos = name.rfind('.');
                if (pos == std::string::npos) {
                    break;
                }
                name.resize(pos);
            }
        }
    }

    return level >= level_.load();
}

void Logger::log(LogLevel level,
                 std::string_view component,
                 std::string_view message,
                 const std::source_location& loc) {

    if (!is_enabled(level, component)) {
        return;
    }

    LogEntry entry;
    entry.level = level;
    entry.timestamp = std::chrono::system_clock::now();
    entry.thread_id = std::this_thread::get_id();
    entry.component = std::string(component);
    entry.message = std::string(message);
    entry.file = loc.file_name();
    entry.line = loc.line();

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& sink : sinks_) {
        sink->flush();
    }
}

// ============================================================================
// LogStream Implementation
// ============================================================================

LogStream::LogStream(LogLevel level,
                     std::string_view component,
                     const std::source_location& loc)
    : level_(level)
    , component_(component)
    , loc_(loc)
    , enabled_(Logger::instance().is_enabled(level, component)) {}

LogStream::~LogStream() {
    if (enabled_) {
        auto text = stream_.str();
        if (!text.empty()) {
            Logger::instance().log(level_, component_, text, loc_);
        }
    }
}

// ============================================================================
// ComponentLogger Implementation
// ============================================================================

ComponentLogger::ComponentLogger(std::string component)
    : component_(std::move(component)) {}

bool ComponentLogger::is_trace_enabled() const {
    return Logger::instance().is_enabled(LogLevel::TRACE, component_);
}

bool ComponentLogger::is_debug_enabled() const {
    return Logger::instance().is_enabled(LogLevel::DEBUG, component_);
}

bool ComponentLogger::is_info_enabled() const {
    return Logger::instance().is_enabled(LogLevel::INFO, component_);
}

LogStream ComponentLogger::trace(const std::source_location& loc) const {
    return LogStream(LogLevel::TRACE, component_, loc);
}

LogStream ComponentLogger::debug(const std::source_location& loc) const {
    return LogStream(LogLevel::DEBUG, component_, loc);
}

LogStream ComponentLogger::info(const std::source_location& loc) const {
    return LogStream(LogLevel::INFO, component_, loc);
}

LogStream ComponentLogger::warn(const std::source_location& loc) const {
    return LogStream(LogLevel::WARN, component_, loc);
}

LogStream ComponentLogger::error(const std::source_location& loc) const {
    return LogStream(LogLevel::ERROR, component_, loc);
}

void ComponentLogger::trace(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::TRACE, component_, msg, loc);
}

void ComponentLogger::debug(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::DEBUG, component_, msg, loc);
}

void ComponentLogger::info(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::INFO, component_, msg, loc);
}

void ComponentLogger::warn(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::WARN, component_, msg, loc);
}

void ComponentLogger::error(std::string_view msg, const std::source_location& loc) const {
    Logger::instance().log(LogLevel::ERROR, component_, msg, loc);
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(const LogConfig& config) {
    Logger& logger = Logger::instance();
    logger.clear_sinks();
    logger.clear_component_levels();
    logger.set_level(config.default_level);

    for (const auto& [component, level] : config.component_levels) {
        logger.set_component_level(component, level);
    }

    if (config.console_enabled) {
        auto console = std::make_shared<ConsoleSink>(config.console_colors);
        console->set_show_thread_id(config.console_thread_id);
        console->set_show_source_location(config.console_source_location);
        logger.add_sink(std::move(console));
    }

    AETHER_LOG_DEBUG(log::core) << "Logging initialized at level "
                                << log_level_name(config.default_level);
}

void shutdown_logging() {
    AETHER_LOG_DEBUG(log::core) << "Logging shutting down";
    Logger::instance().flush();
}

}  // namespace aether
