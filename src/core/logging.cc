#include "logging.hh"
#include <iostream>
#include <iomanip>
#include <ctime>
#include <filesystem>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace slp {

// ============================================================================
// Level Parsing
// ============================================================================

std::optional<LogLevel> parse_log_level(std::string_view name) {
    std::string upper(name);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    for (auto level : {LogLevel::TRACE, LogLevel::DEBUG, LogLevel::INFO, LogLevel::WARN,
                       LogLevel::ERROR, LogLevel::FATAL, LogLevel::OFF}) {
        if (log_level_name(level) == upper) {
            return level;
        }
    }
    if (upper == "WARNING") {
        return LogLevel::WARN;
    }
    return std::nullopt;
}

// ============================================================================
// Line Formatting
// ============================================================================

std::string format_log_line(const LogEntry& entry, const LineFormat& format) {
    std::ostringstream oss;

    auto time_t = std::chrono::system_clock::to_time_t(entry.timestamp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        entry.timestamp.time_since_epoch()) % 1000;

    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &time_t);
#else
    localtime_r(&time_t, &tm_buf);
#endif

    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');

    if (format.thread_id) {
        oss << " [" << entry.thread_id << "]";
    }

    oss << " ";
    if (format.colors) {
        oss << log_level_color(entry.level);
    }
    oss << "[" << std::setw(5) << log_level_name(entry.level) << "]";
    if (format.colors) {
        oss << "\033[0m";
    }

    if (!entry.component.empty()) {
        oss << " [" << entry.component << "]";
    }

    oss << " " << entry.message;

    if (format.source_location && !entry.file.empty()) {
        oss << " (" << std::filesystem::path(entry.file).filename().string() << ":" << entry.line << ")";
    }

    return oss.str();
}

// ============================================================================
// ConsoleSink Implementation
// ============================================================================

ConsoleSink::ConsoleSink(LineFormat format)
    : format_(format) {}

void ConsoleSink::write(const LogEntry& entry) {
    std::string line = format_log_line(entry, format_);
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr << line << '\n';
}

void ConsoleSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cerr.flush();
}

// ============================================================================
// FileSink Implementation
// ============================================================================

FileSink::FileSink(const std::string& filename)
    : file_(std::fopen(filename.c_str(), "a")) {
    if (!file_) {
        throw std::runtime_error("cannot open log file '" + filename + "'");
    }
}

FileSink::~FileSink() {
    std::fclose(file_);
}

void FileSink::write(const LogEntry& entry) {
    LineFormat format;
    format.source_location = true;
    std::string line = format_log_line(entry, format);
    line.push_back('\n');

    std::lock_guard<std::mutex> lock(mutex_);
    bytes_written_ += std::fwrite(line.data(), 1, line.size(), file_);
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(file_);
}

// ============================================================================
// AsyncSink Implementation
// ============================================================================

AsyncSink::AsyncSink(std::shared_ptr<LogSink> inner_sink, std::size_t queue_size)
    : inner_sink_(std::move(inner_sink))
    , max_queue_size_(queue_size) {}

AsyncSink::~AsyncSink() {
    stop();
}

void AsyncSink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (queue_.size() >= max_queue_size_) {
        // Drop oldest entry
        queue_.pop();
    }

    queue_.push(entry);
    cv_.notify_all();
}

void AsyncSink::flush() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return (queue_.empty() && !writing_) || !running_.load(); });
    }
    inner_sink_->flush();
}

void AsyncSink::start() {
    if (running_.exchange(true)) {
        return;  // Already running
    }
    worker_thread_ = std::thread(&AsyncSink::worker_loop, this);
}

void AsyncSink::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_.store(false);
    }
    cv_.notify_all();

    if (worker_thread_.joinable()) {
        worker_thread_.join();
    }

    // Drain whatever the worker left behind
    std::lock_guard<std::mutex> lock(mutex_);
    while (!queue_.empty()) {
        inner_sink_->write(queue_.front());
        queue_.pop();
    }
    inner_sink_->flush();
}

void AsyncSink::worker_loop() {
    while (running_.load()) {
        std::unique_lock<std::mutex> lock(mutex_);

        cv_.wait(lock, [this]() {
            return !queue_.empty() || !running_.load();
        });

        while (!queue_.empty()) {
            LogEntry entry = std::move(queue_.front());
            queue_.pop();
            writing_ = true;
            lock.unlock();

            inner_sink_->write(entry);

            lock.lock();
            writing_ = false;
        }
        // flush() waits on the same condition for an empty queue
        cv_.notify_all();
    }
}

// ============================================================================
// MemorySink Implementation
// ============================================================================

MemorySink::MemorySink(std::size_t capacity)
    : capacity_(capacity) {}

void MemorySink::write(const LogEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (capacity_ == 0) {
        return;
    }
    if (entries_.size() >= capacity_) {
        entries_.erase(entries_.begin());
    }
    entries_.push_back(entry);
}

std::vector<LogEntry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

std::size_t MemorySink::count(LogLevel min_level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(entries_.begin(), entries_.end(),
        [min_level](const LogEntry& e) { return e.level >= min_level; }));
}

bool MemorySink::contains(std::string_view needle) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
        [needle](const LogEntry& e) { return e.message.find(needle) != std::string::npos; });
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
    // Default: console sink
    add_sink(std::make_shared<ConsoleSink>());
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

void Logger::add_sink(std::shared_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::is_enabled(LogLevel level, const std::string& component) const {
    // Check component-specific level first
    if (!component.empty()) {
        std::lock_guard<std::mutex> lock(mutex_);

        // Check exact match
        auto it = component_levels_.find(component);
        if (it != component_levels_.end()) {
            return level >= it->second;
        }

        // Check parent components (e.g., "mev" for "mev.sandwich")
        std::string parent = component;
        while (true) {
            auto pos = parent.rfind('.');
            if (pos == std::string::npos) {
                break;
            }
            parent = parent.substr(0, pos);
            it = component_levels_.find(parent);
            if (it != component_levels_.end()) {
                return level >= it->second;
            }
        }
    }

    return level >= level_.load();
}

void Logger::log(LogLevel level,
                 std::string_view component,
                 std::string_view message,
                 const std::source_location& loc) {

    if (!is_enabled(level, std::string(component))) {
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
    entry.function = loc.function_name();

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
    , enabled_(Logger::instance().is_enabled(level, std::string(component))) {}

LogStream::~LogStream() {
    if (enabled_ && !stream_.str().empty()) {
        Logger::instance().log(level_, component_, stream_.str(), loc_);
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

LogStream ComponentLogger::fatal(const std::source_location& loc) const {
    return LogStream(LogLevel::FATAL, component_, loc);
}

// ============================================================================
// Initialization
// ============================================================================

void init_logging(const LogConfig& config) {
    // Open the file first so a bad path leaves the current sinks in place
    std::shared_ptr<LogSink> file;
    if (config.file_enabled) {
        file = std::make_shared<FileSink>(config.file_path);
    }

    Logger& logger = Logger::instance();
    logger.clear_sinks();
    logger.set_level(config.default_level);
    for (const auto& [component, level] : config.component_levels) {
        logger.set_component_level(component, level);
    }

    auto attach = [&](std::shared_ptr<LogSink> sink) {
        if (config.async_logging) {
            auto async = std::make_shared<AsyncSink>(std::move(sink));
            async->start();
            logger.add_sink(std::move(async));
        } else {
            logger.add_sink(std::move(sink));
        }
    };

    if (file) {
        attach(std::move(file));
    }
    if (config.console_enabled) {
        LineFormat format;
        format.colors = config.console_colors;
        format.thread_id = config.console_thread_id;
        attach(std::make_shared<ConsoleSink>(format));
    }

    SLP_LOG_DEBUG(log::core) << "Logging initialized (level " << log_level_name(config.default_level)
                             << ", " << config.component_levels.size() << " component overrides)";
}

void shutdown_logging() {
    SLP_LOG_DEBUG(log::core) << "Logging shutting down";
    Logger::instance().flush();
}

}  // namespace slp
