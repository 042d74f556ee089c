#pragma once

#include <atomic>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>

namespace gestify {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Thread-safe Logger utility.
 * The pipeline tick logs sparingly (transitions, drops); per-frame data
 * only goes out at DEBUG level.
 */
class Logger {
public:
    static void setLevel(LogLevel level) { level_ = level; }
    static LogLevel getLevel() { return level_; }

    static bool enabled(LogLevel level) {
        return static_cast<int>(level) >= static_cast<int>(level_.load());
    }

    static void log(LogLevel level, const std::string& message) {
        if (!enabled(level)) return;

        std::lock_guard<std::mutex> lock(mutex_);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

        std::cout << "[" << std::put_time(std::localtime(&time), "%H:%M:%S")
                  << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";

        switch (level) {
            case LogLevel::DEBUG: std::cout << "\033[36m[DEBUG]\033[0m "; break; // Cyan
            case LogLevel::INFO:  std::cout << "\033[32m[INFO] \033[0m "; break; // Green
            case LogLevel::WARN:  std::cout << "\033[33m[WARN] \033[0m "; break; // Yellow
            case LogLevel::ERROR: std::cout << "\033[31m[ERROR]\033[0m "; break; // Red
        }

        std::cout << message << std::endl;
    }

    template<typename... Args>
    static void debug(Args... args) {
        if (!enabled(LogLevel::DEBUG)) return;
        log(LogLevel::DEBUG, format(args...));
    }

    template<typename... Args>
    static void info(Args... args) {
        if (!enabled(LogLevel::INFO)) return;
        log(LogLevel::INFO, format(args...));
    }

    template<typename... Args>
    static void warn(Args... args) {
        if (!enabled(LogLevel::WARN)) return;
        log(LogLevel::WARN, format(args...));
    }

    template<typename... Args>
    static void error(Args... args) {
        log(LogLevel::ERROR, format(args...));
    }

    /**
     * Parse "debug" / "info" / "warn" / "error" (case-sensitive).
     * Unknown names fall back to INFO.
     */
    static LogLevel parseLevel(const std::string& name) {
        if (name == "debug") return LogLevel::DEBUG;
        if (name == "warn") return LogLevel::WARN;
        if (name == "error") return LogLevel::ERROR;
        return LogLevel::INFO;
    }

private:
    template<typename... Args>
    static std::string format(Args... args) {
        std::stringstream ss;
        (ss << ... << args);
        return ss.str();
    }

    static inline std::mutex mutex_;
    static inline std::atomic<LogLevel> level_{LogLevel::INFO};
};

} // namespace gestify
