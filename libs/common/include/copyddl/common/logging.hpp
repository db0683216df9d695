// =============================================================================
// Copybook DDL - Logging
// Version: 1.0.0
// =============================================================================
// Named loggers share the sinks installed by LogManager::configure. Until a
// program configures logging, INFO and above go to stderr so that library
// callers keep stdout for their own output.
// =============================================================================
#pragma once

#include "copyddl/common/types.hpp"
#include <fstream>
#include <mutex>
#include <ostream>
#include <source_location>

namespace copyddl::logging {

// DBG/ERR instead of DEBUG/ERROR to stay clear of platform macros
enum class LogLevel : UInt8 {
    TRACE = 0,
    DBG = 1,
    INFO = 2,
    WARN = 3,
    ERR = 4,
    OFF = 5
};

[[nodiscard]] constexpr StringView to_string(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DBG:   return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERR:   return "ERROR";
        case LogLevel::OFF:   return "OFF";
    }
    return "UNKNOWN";
}

// Accepts trace, debug, info, warn(ing), error, off/none in any case
[[nodiscard]] Optional<LogLevel> parse_log_level(StringView name);

struct LogEntry {
    LogLevel level = LogLevel::INFO;
    SystemTimePoint timestamp = SystemClock::now();
    String logger_name;
    String message;
    std::source_location location;

    // "2024-01-31 12:00:00.123 [ WARN] [ddl] message"
    [[nodiscard]] String format(bool colored = false, bool include_location = false) const;
};

// =============================================================================
// Sinks
// =============================================================================

class LogSink {
private:
    LogLevel min_level_;

public:
    explicit LogSink(LogLevel min_level) : min_level_(min_level) {}
    virtual ~LogSink() = default;

    [[nodiscard]] bool accepts(LogLevel level) const { return level >= min_level_; }

    virtual void write(const LogEntry& entry) = 0;
    virtual void flush() = 0;
};

// Writes to a stream the caller keeps alive (std::cerr by default)
class StreamSink : public LogSink {
private:
    std::ostream& out_;
    bool colored_;
    std::mutex mutex_;

public:
    StreamSink(std::ostream& out, LogLevel min_level, bool colored = false);

    void write(const LogEntry& entry) override;
    void flush() override;
};

// Appends to a file, rolling it over to <file>.1 ... <file>.N at max_size
class FileSink : public LogSink {
private:
    Path path_;
    std::ofstream file_;
    Size max_size_;
    UInt32 max_backups_;
    Size written_ = 0;
    std::mutex mutex_;

    void roll_over();

public:
    FileSink(Path path, LogLevel min_level,
             Size max_size = 10 * 1024 * 1024, UInt32 max_backups = 5);

    [[nodiscard]] bool is_open() const { return file_.is_open(); }

    void write(const LogEntry& entry) override;
    void flush() override;
};

// =============================================================================
// Logger
// =============================================================================

class Logger {
private:
    String name_;
    LogLevel level_;
    std::vector<SharedPtr<LogSink>> sinks_;
    mutable std::mutex mutex_;

public:
    Logger(String name, LogLevel level, std::vector<SharedPtr<LogSink>> sinks);

    void reconfigure(LogLevel level, std::vector<SharedPtr<LogSink>> sinks);

    void log(LogLevel level, StringView message,
             std::source_location loc = std::source_location::current());

    template<typename... Args>
    void debug(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::DBG)) {
            log(LogLevel::DBG, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void info(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::INFO)) {
            log(LogLevel::INFO, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    template<typename... Args>
    void warn(std::format_string<Args...> fmt, Args&&... args) {
        if (should_log(LogLevel::WARN)) {
            log(LogLevel::WARN, std::format(fmt, std::forward<Args>(args)...));
        }
    }

    void flush();

    [[nodiscard]] bool should_log(LogLevel level) const;
};

// =============================================================================
// LogManager
// =============================================================================

struct LogSettings {
    LogLevel console_level = LogLevel::INFO;
    std::ostream* console = nullptr;       // nullptr means std::cerr
    bool colored = false;
    Optional<Path> file;
    LogLevel file_level = LogLevel::DBG;
};

class LogManager {
private:
    LogLevel level_ = LogLevel::INFO;
    std::vector<SharedPtr<LogSink>> sinks_;
    std::unordered_map<String, SharedPtr<Logger>> loggers_;
    std::mutex mutex_;

    LogManager();

public:
    static LogManager& instance();

    [[nodiscard]] SharedPtr<Logger> get_logger(const String& name);

    // Replaces the sinks of every logger, existing and future
    void configure(const LogSettings& settings);

    // Flushes and closes the configured sinks and goes back to stderr at INFO
    void shutdown();
};

// Logs "<operation> completed in <n>us" when it goes out of scope
class ScopedTimer {
private:
    SharedPtr<Logger> logger_;
    String operation_;
    TimePoint start_;
    LogLevel level_;
    std::source_location location_;

public:
    ScopedTimer(SharedPtr<Logger> logger, String operation,
                LogLevel level = LogLevel::DBG,
                std::source_location loc = std::source_location::current());
    ~ScopedTimer();

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;
};

} // namespace copyddl::logging
