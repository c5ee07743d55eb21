/**
 * @file logger.cpp
 * @brief Thread-safe logging with rate limiting
 *
 * Features:
 * - Singleton pattern for global access
 * - Rate limiting to prevent log flooding (disabled by default)
 * - Structured logging (JSON format)
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR, FATAL)
 * - Timestamp with millisecond precision
 */

#include "wager/logger.hpp"
#include <iostream>
#include <iomanip>
#include <sstream>

namespace wager {

bool parse_log_level(std::string_view name, LogLevel& out) {
    if (name == "DEBUG") out = LogLevel::DEBUG;
    else if (name == "INFO") out = LogLevel::INFO;
    else if (name == "WARN") out = LogLevel::WARN;
    else if (name == "ERROR") out = LogLevel::ERROR;
    else if (name == "FATAL") out = LogLevel::FATAL;
    else return false;
    return true;
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::set_level(LogLevel level) {
    level_.store(level);
}

void Logger::set_rate_limit(std::chrono::milliseconds limit) {
    rate_limit_ = limit;
}

void Logger::enable_structured(bool enabled) {
    structured_.store(enabled);
}

void Logger::set_output(std::ostream* out) {
    std::lock_guard<std::mutex> lock(out_mutex_);
    out_ = out;
}

/**
 * @brief Log message at specified level
 * @param level Log level
 * @param message Message to log (already sanitized)
 *
 * Ledger output goes to stdout by default; logs go to stderr unless
 * redirected with set_output().
 */
void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_.load()) return;

    if (should_rate_limit()) return;

    auto line = format_message(level, message);
    std::lock_guard<std::mutex> lock(out_mutex_);
    std::ostream& out = out_ ? *out_ : std::clog;
    out << line << std::endl;
}

/**
 * @brief Format log message with timestamp and level
 *
 * Formats:
 * - Structured (JSON): {"timestamp":"...","level":"...","message":"..."}
 * - Plain: [2024-01-01 12:00:00.123] INFO  message
 */
std::string Logger::format_message(LogLevel level, const std::string& message) {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm utc{};
    gmtime_r(&time_t, &utc);

    std::stringstream ss;

    if (structured_.load()) {
        ss << "{\"timestamp\":\"" << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "Z\""
           << ",\"level\":\"";

        switch (level) {
            case LogLevel::DEBUG: ss << "DEBUG"; break;
            case LogLevel::INFO:  ss << "INFO"; break;
            case LogLevel::WARN:  ss << "WARN"; break;
            case LogLevel::ERROR: ss << "ERROR"; break;
            case LogLevel::FATAL: ss << "FATAL"; break;
        }

        ss << "\",\"message\":\"" << message << "\"}";
    } else {
        ss << "[" << std::put_time(&utc, "%Y-%m-%d %H:%M:%S")
           << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: ss << "DEBUG"; break;
            case LogLevel::INFO:  ss << "INFO "; break;
            case LogLevel::WARN:  ss << "WARN "; break;
            case LogLevel::ERROR: ss << "ERROR"; break;
            case LogLevel::FATAL: ss << "FATAL"; break;
        }

        ss << " " << message;
    }

    return ss.str();
}

bool Logger::should_rate_limit() {
    if (rate_limit_.count() == 0) return false;

    auto now = std::chrono::steady_clock::now();
    auto last = last_log_.load();

    if (now - last < rate_limit_) {
        return true;
    }

    last_log_.store(now);
    return false;
}

} // namespace wager
