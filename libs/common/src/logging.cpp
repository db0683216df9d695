// =============================================================================
// Copybook DDL - Logging Implementation
// Version: 1.0.0
// =============================================================================

#include "copyddl/common/logging.hpp"
#include <algorithm>
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace copyddl::logging {

namespace {

StringView level_color(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "\033[90m";
        case LogLevel::DBG:   return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERR:   return "\033[31m";
        case LogLevel::OFF:   return "";
    }
    return "";
}

constexpr StringView COLOR_RESET = "\033[0m";

} // anonymous namespace

Optional<LogLevel> parse_log_level(StringView name) {
    String upper = to_upper(trim(name));
    if (upper == "TRACE") return LogLevel::TRACE;
    if (upper == "DEBUG" || upper == "DBG") return LogLevel::DBG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR" || upper == "ERR") return LogLevel::ERR;
    if (upper == "OFF" || upper == "NONE") return LogLevel::OFF;
    return nullopt;
}

// =============================================================================
// LogEntry
// =============================================================================

String LogEntry::format(bool colored, bool include_location) const {
    std::ostringstream oss;

    auto seconds = SystemClock::to_time_t(timestamp);
    auto ms = std::chrono::duration_cast<Milliseconds>(timestamp.time_since_epoch()) % 1000;
    std::tm local{};
    localtime_r(&seconds, &local);
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << std::setfill(' ');

    oss << " [";
    if (colored) oss << level_color(level);
    oss << std::setw(5) << to_string(level);
    if (colored) oss << COLOR_RESET;
    oss << "] ";

    if (!logger_name.empty()) {
        oss << '[' << logger_name << "] ";
    }
    oss << message;

    if (include_location && location.file_name() != nullptr && *location.file_name() != '\0') {
        Path file(location.file_name());
        oss << " (" << file.filename().string() << ':' << location.line() << ')';
    }
    return oss.str();
}

// =============================================================================
// StreamSink
// =============================================================================

StreamSink::StreamSink(std::ostream& out, LogLevel min_level, bool colored)
    : LogSink(min_level), out_(out), colored_(colored) {}

void StreamSink::write(const LogEntry& entry) {
    if (!accepts(entry.level)) return;
    String line = entry.format(colored_, false);
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << line << '\n';
}

void StreamSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    out_.flush();
}

// =============================================================================
// FileSink
// =============================================================================

FileSink::FileSink(Path path, LogLevel min_level, Size max_size, UInt32 max_backups)
    : LogSink(min_level), path_(std::move(path)), max_size_(max_size), max_backups_(max_backups) {
    std::error_code ec;
    if (path_.has_parent_path()) {
        std::filesystem::create_directories(path_.parent_path(), ec);
    }
    auto existing = std::filesystem::file_size(path_, ec);
    written_ = ec ? 0 : static_cast<Size>(existing);
    file_.open(path_, std::ios::app);
}

void FileSink::roll_over() {
    file_.close();
    std::error_code ec;
    auto backup = [this](UInt32 n) { return Path(path_.string() + "." + std::to_string(n)); };

    if (max_backups_ > 0) {
        std::filesystem::remove(backup(max_backups_), ec);
        for (UInt32 n = max_backups_ - 1; n >= 1; --n) {
            std::filesystem::rename(backup(n), backup(n + 1), ec);
        }
        std::filesystem::rename(path_, backup(1), ec);
    }

    file_.open(path_, std::ios::trunc);
    written_ = 0;
}

void FileSink::write(const LogEntry& entry) {
    if (!accepts(entry.level)) return;
    String line = entry.format(false, true);
    line += '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    if (written_ > 0 && written_ + line.size() > max_size_) {
        roll_over();
    }
    if (!file_.is_open()) return;
    file_ << line;
    written_ += line.size();
}

void FileSink::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) file_.flush();
}

// =============================================================================
// Logger
// =============================================================================

Logger::Logger(String name, LogLevel level, std::vector<SharedPtr<LogSink>> sinks)
    : name_(std::move(name)), level_(level), sinks_(std::move(sinks)) {}

void Logger::reconfigure(LogLevel level, std::vector<SharedPtr<LogSink>> sinks) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    sinks_ = std::move(sinks);
}

bool Logger::should_log(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_ != LogLevel::OFF && level >= level_;
}

void Logger::log(LogLevel level, StringView message, std::source_location loc) {
    if (!should_log(level)) return;

    LogEntry entry;
    entry.level = level;
    entry.logger_name = name_;
    entry.message = String(message);
    entry.location = loc;

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(entry);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

// =============================================================================
// LogManager
// =============================================================================

LogManager::LogManager() {
    sinks_.push_back(std::make_shared<StreamSink>(std::cerr, LogLevel::INFO));
}

LogManager& LogManager::instance() {
    static LogManager manager;
    return manager;
}

SharedPtr<Logger> LogManager::get_logger(const String& name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = loggers_.find(name);
    if (it != loggers_.end()) {
        return it->second;
    }
    auto logger = std::make_shared<Logger>(name, level_, sinks_);
    loggers_.emplace(name, logger);
    return logger;
}

void LogManager::configure(const LogSettings& settings) {
    std::vector<SharedPtr<LogSink>> sinks;
    std::ostream& console = settings.console ? *settings.console : std::cerr;
    sinks.push_back(std::make_shared<StreamSink>(console, settings.console_level, settings.colored));

    // Loggers filter at the most verbose level any sink wants
    LogLevel level = settings.console_level;
    if (settings.file) {
        sinks.push_back(std::make_shared<FileSink>(*settings.file, settings.file_level));
        level = std::min(level, settings.file_level);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
    level_ = level;
    sinks_ = std::move(sinks);
    for (auto& [_, logger] : loggers_) {
        logger->reconfigure(level_, sinks_);
    }
}

void LogManager::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
    level_ = LogLevel::INFO;
    sinks_ = {std::make_shared<StreamSink>(std::cerr, LogLevel::INFO)};
    for (auto& [_, logger] : loggers_) {
        logger->reconfigure(level_, sinks_);
    }
}

// =============================================================================
// ScopedTimer
// =============================================================================

ScopedTimer::ScopedTimer(SharedPtr<Logger> logger, String operation,
                         LogLevel level, std::source_location loc)
    : logger_(std::move(logger)), operation_(std::move(operation)),
      start_(Clock::now()), level_(level), location_(loc) {}

ScopedTimer::~ScopedTimer() {
    if (!logger_ || !logger_->should_log(level_)) return;
    auto elapsed = std::chrono::duration_cast<Microseconds>(Clock::now() - start_);
    logger_->log(level_, std::format("{} completed in {}us", operation_, elapsed.count()), location_);
}

} // namespace copyddl::logging
