#pragma once

#include <cstdint>
#include <cstdio>
#include <string>
#include <string_view>
#include <memory>
#include <mutex>
#include <atomic>
#include <chrono>
#include <sstream>
#include <source_location>
#include <vector>
#include <thread>
#include <condition_variable>
#include <queue>
#include <optional>
#include <unordered_map>

namespace slp {

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
        case LogLevel::TRACE: return "\033[90m";    // Gray
        case LogLevel::DEBUG: return "\033[36m";    // Cyan
        case LogLevel::INFO:  return "\033[32m";    // Green
        case LogLevel::WARN:  return "\033[33m";    // Yellow
        case LogLevel::ERROR: return "\033[31m";    // Red
        case LogLevel::FATAL: return "\033[35;1m";  // Bright Magenta
        case LogLevel::OFF:   return "";
    }
    return "";
}

// "debug", "WARN", ... -> level; nullopt for unknown names
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view name);

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
    std::string function;
};

// ============================================================================
// Line Formatting
// ============================================================================

struct LineFormat {
    bool colors = false;
    bool thread_id = true;
    bool source_location = false;
};

// "2024-01-01 12:00:00.123 [tid] [ INFO] [component] message (file:line)"
[[nodiscard]] std::string format_log_line(const LogEntry& entry, const LineFormat& format);

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
// Console Log Sink
// ============================================================================

// Writes to stderr so stdout stays free for reports
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(LineFormat format = LineFormat{});

    void write(const LogEntry& entry) override;
    void flush() override;

private:
    LineFormat format_;
    std::mutex mutex_;
};

// ============================================================================
// File Log Sink
// ============================================================================

// Appends to a run log; throws std::runtime_error if the file cannot be opened
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& filename);
    ~FileSink() override;

    FileSink(const FileSink&) = delete;
    FileSink& operator=(const FileSink&) = delete;

    void write(const LogEntry& entry) override;
    void flush() override;

    [[nodiscard]] std::size_t bytes_written() const { return bytes_written_; }

private:
    std::FILE* file_ = nullptr;
    std::size_t bytes_written_ = 0;
    std::mutex mutex_;
};

// ============================================================================
// Async Log Sink Wrapper
// ============================================================================

class AsyncSink : public LogSink {
public:
    explicit AsyncSink(std::shared_ptr<LogSink> inner_sink, std::size_t queue_size = 10000);
    ~AsyncSink() override;

    void write(const LogEntry& entry) override;
    void flush() override;

    void start();
    void stop();

private:
    std::shared_ptr<LogSink> inner_sink_;
    std::queue<LogEntry> queue_;
    std::size_t max_queue_size_;
    std::mutex mutex_;
    std::condition_variable cv_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    bool writing_ = false;  // guarded by mutex_

    void worker_loop();
};

// ============================================================================
// Memory Log Sink (captures entries for inspection)
// ============================================================================

class MemorySink : public LogSink {
public:
    explicit MemorySink(std::size_t capacity = 1000);

    void write(const LogEntry& entry) override;
    void flush() override {}

    [[nodiscard]] std::vector<LogEntry> entries() const;
    [[nodiscard]] std::size_t count(LogLevel min_level) const;
    [[nodiscard]] bool contains(std::string_view needle) const;
    void clear();

private:
    std::size_t capacity_;
    std::vector<LogEntry> entries_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Logger
// ============================================================================

class Logger {
public:
    static Logger& instance();

    // Configure logger
    void set_level(LogLevel level);
    void set_component_level(const std::string& component, LogLevel level);
    void add_sink(std::shared_ptr<LogSink> sink);
    void clear_sinks();

    // Check if level is enabled
    [[nodiscard]] bool is_enabled(LogLevel level, const std::string& component = "") const;

    // Log a message
    void log(LogLevel level,
             std::string_view component,
             std::string_view message,
             const std::source_location& loc = std::source_location::current());

    // Flush all sinks
    void flush();

    // Get current level
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
    LogStream(LogStream&&) = default;
    LogStream& operator=(LogStream&&) = default;

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

    [[nodiscard]] bool is_trace_enabled() const;
    [[nodiscard]] bool is_debug_enabled() const;
    [[nodiscard]] bool is_info_enabled() const;

    LogStream trace(const std::source_location& loc = std::source_location::current()) const;
    LogStream debug(const std::source_location& loc = std::source_location::current()) const;
    LogStream info(const std::source_location& loc = std::source_location::current()) const;
    LogStream warn(const std::source_location& loc = std::source_location::current()) const;
    LogStream error(const std::source_location& loc = std::source_location::current()) const;
    LogStream fatal(const std::source_location& loc = std::source_location::current()) const;

    [[nodiscard]] const std::string& component() const { return component_; }

private:
    std::string component_;
};

// ============================================================================
// Logging Macros
// ============================================================================

#define SLP_LOG_TRACE(logger) \
    if ((logger).is_trace_enabled()) (logger).trace()

#define SLP_LOG_DEBUG(logger) \
    if ((logger).is_debug_enabled()) (logger).debug()

#define SLP_LOG_INFO(logger) \
    if ((logger).is_info_enabled()) (logger).info()

#define SLP_LOG_WARN(logger) (logger).warn()

#define SLP_LOG_ERROR(logger) (logger).error()

// ============================================================================
// Default Loggers for Core Components
// ============================================================================

namespace log {

inline ComponentLogger core("core");
inline ComponentLogger crypto("crypto");
inline ComponentLogger amm("amm");
inline ComponentLogger stake("stake");
inline ComponentLogger mempool("mempool");
inline ComponentLogger simulation("simulation");

// Subsystems; levels set on "protocol", "mev" or "analytics" apply to these
inline ComponentLogger commit("protocol.commit");
inline ComponentLogger reveal("protocol.reveal");
inline ComponentLogger sandwich("mev.sandwich");
inline ComponentLogger attacker("mev.attacker");
inline ComponentLogger results("analytics.results");

}  // namespace log

// ============================================================================
// Initialization Helper
// ============================================================================

struct LogConfig {
    LogLevel default_level = LogLevel::INFO;
    bool console_enabled = true;
    bool console_colors = true;
    bool console_thread_id = true;
    bool file_enabled = false;
    std::string file_path = "securelp.log";
    bool async_logging = true;

    // Per-component overrides, e.g. {"mev.sandwich", LogLevel::DEBUG}
    std::vector<std::pair<std::string, LogLevel>> component_levels;
};

// Replaces every sink; throws std::runtime_error if the log file cannot be opened
void init_logging(const LogConfig& config = LogConfig{});
void shutdown_logging();

}  // namespace slp
