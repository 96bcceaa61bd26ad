/**
 * @file logger.hpp
 * @brief Thread-safe native logging framework for Courier.
 *
 * Structured single-line logging with configurable levels, component tags,
 * timestamps and a replaceable output sink.
 *
 * @copyright Copyright (c) 2024 Courier Contributors
 * @license MIT License
 */

#pragma once

#include "courier/utils/export.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace courier {
namespace utils {

/**
 * @enum LogLevel
 * @brief Logging severity levels.
 */
enum class LogLevel : int {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    FATAL = 5,
    OFF = 6
};

/**
 * @brief Fixed-width level label used in the log line.
 */
inline const char* logLevelToString(LogLevel level) {
    switch (level) {
        case LogLevel::TRACE: return "TRACE";
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
        case LogLevel::OFF:   return "OFF  ";
        default:              return "?????";
    }
}

/**
 * @brief Parse a level name ("TRACE" .. "OFF", case-sensitive).
 * @return The parsed level, or @p fallback when the name is unknown.
 */
inline LogLevel parseLogLevel(const std::string& name, LogLevel fallback = LogLevel::INFO) {
    if (name == "TRACE") return LogLevel::TRACE;
    if (name == "DEBUG") return LogLevel::DEBUG;
    if (name == "INFO")  return LogLevel::INFO;
    if (name == "WARN")  return LogLevel::WARN;
    if (name == "ERROR") return LogLevel::ERROR;
    if (name == "FATAL") return LogLevel::FATAL;
    if (name == "OFF")   return LogLevel::OFF;
    return fallback;
}

/**
 * @class Logger
 * @brief Thread-safe singleton logger.
 *
 * Usage:
 * @code
 * Logger::instance().setLevel(LogLevel::DEBUG);
 * LOG_INFO("Engine", "Queued envelope {} for {}", envelopeId, principal);
 * @endcode
 *
 * By default lines go to stderr. Tests can install a sink to capture them.
 */
class COURIER_UTILS_API Logger {
public:
    /// Receives the level and the fully formatted line (without newline).
    using Sink = std::function<void(LogLevel, const std::string&)>;

    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void setLevel(LogLevel level) {
        level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel getLevel() const {
        return static_cast<LogLevel>(level_.load(std::memory_order_relaxed));
    }

    bool isEnabled(LogLevel level) const {
        return level != LogLevel::OFF &&
               static_cast<int>(level) >= level_.load(std::memory_order_relaxed);
    }

    /**
     * @brief Enable or disable ANSI colours (stderr output only).
     */
    void setColorEnabled(bool enabled) {
        colorEnabled_.store(enabled, std::memory_order_relaxed);
    }

    /**
     * @brief Replace the output sink. Pass nullptr to restore stderr.
     */
    void setSink(Sink sink) {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = std::move(sink);
    }

    /**
     * @brief Trimmed level name ("INFO", not "INFO ").
     */
    static std::string levelName(LogLevel level) {
        std::string name = logLevelToString(level);
        while (!name.empty() && name.back() == ' ') {
            name.pop_back();
        }
        return name;
    }

    template<typename... Args>
    void log(LogLevel level, const char* component, const char* format, Args&&... args) {
        if (!isEnabled(level)) {
            return;
        }

        std::string message = formatMessage(format, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#ifdef _WIN32
        localtime_s(&tm_buf, &time_t_now);
#else
        localtime_r(&time_t_now, &tm_buf);
#endif

        std::ostringstream prefix;
        prefix << "["
               << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
               << "." << std::setfill('0') << std::setw(3) << ms.count()
               << "] ";

        std::ostringstream body;
        body << " [" << component << "] " << message;

        std::lock_guard<std::mutex> lock(mutex_);
        if (sink_) {
            sink_(level, prefix.str() + "[" + logLevelToString(level) + "]" + body.str());
            return;
        }

        const bool color = colorEnabled_.load(std::memory_order_relaxed);
        std::cerr << prefix.str();
        if (color) {
            std::cerr << getColorCode(level);
        }
        std::cerr << "[" << logLevelToString(level) << "]";
        if (color) {
            std::cerr << "\033[0m";
        }
        std::cerr << body.str() << std::endl;
    }

private:
    Logger() : level_(static_cast<int>(LogLevel::INFO)), colorEnabled_(true) {}
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::string formatMessage(const char* format) {
        return std::string(format);
    }

    // Substitutes each "{}" with the next argument, left to right.
    template<typename T, typename... Args>
    std::string formatMessage(const char* format, T&& value, Args&&... args) {
        std::ostringstream oss;

        while (*format) {
            if (*format == '{' && *(format + 1) == '}') {
                oss << value;
                return oss.str() + formatMessage(format + 2, std::forward<Args>(args)...);
            }
            oss << *format++;
        }

        return oss.str();
    }

    const char* getColorCode(LogLevel level) const {
        switch (level) {
            case LogLevel::TRACE: return "\033[90m";
            case LogLevel::DEBUG: return "\033[36m";
            case LogLevel::INFO:  return "\033[32m";
            case LogLevel::WARN:  return "\033[33m";
            case LogLevel::ERROR: return "\033[31m";
            case LogLevel::FATAL: return "\033[35;1m";
            default:              return "";
        }
    }

    std::atomic<int> level_;
    std::atomic<bool> colorEnabled_;
    std::mutex mutex_;
    Sink sink_;
};

}  // namespace utils
}  // namespace courier

// =============================================================================
// Convenience Macros
// =============================================================================

#define LOG_TRACE(component, ...) \
    ::courier::utils::Logger::instance().log(::courier::utils::LogLevel::TRACE, component, __VA_ARGS__)

#define LOG_DEBUG(component, ...) \
    ::courier::utils::Logger::instance().log(::courier::utils::LogLevel::DEBUG, component, __VA_ARGS__)

#define LOG_INFO(component, ...) \
    ::courier::utils::Logger::instance().log(::courier::utils::LogLevel::INFO, component, __VA_ARGS__)

#define LOG_WARN(component, ...) \
    ::courier::utils::Logger::instance().log(::courier::utils::LogLevel::WARN, component, __VA_ARGS__)

#define LOG_ERROR(component, ...) \
    ::courier::utils::Logger::instance().log(::courier::utils::LogLevel::ERROR, component, __VA_ARGS__)

#define LOG_FATAL(component, ...) \
    ::courier::utils::Logger::instance().log(::courier::utils::LogLevel::FATAL, component, __VA_ARGS__)

// Conditional logging (avoid evaluation if level disabled)
#define LOG_IF(level, component, condition, ...) \
    do { \
        if ((condition) && ::courier::utils::Logger::instance().isEnabled(level)) { \
            ::courier::utils::Logger::instance().log(level, component, __VA_ARGS__); \
        } \
    } while(0)
