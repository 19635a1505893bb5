#pragma once
#include <iostream>
#include <string>
#include <mutex>
#include "core/errors/budget_errors.hpp"

namespace budget::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    // Writes to stderr: stdout is reserved for protocol frames.
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_session_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            session_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        LogLevel min_level() {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (session_id_.empty() ? "" : "[" + session_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;

        std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    inline errors::Result<LogLevel> parse_log_level(const std::string& text) {
        if (text == "debug") return LogLevel::DEBUG;
        if (text == "info") return LogLevel::INFO;
        if (text == "warn") return LogLevel::WARN;
        if (text == "error") return LogLevel::ERROR;
        return errors::BudgetError{errors::ErrorCategory::Input,
                                   "Unknown log level: " + text,
                                   "invalid_log_level",
                                   "Use one of: debug, info, warn, error."};
    }

    // 3. Helper macros for clean syntax everywhere else in the code
    #define LOG_DEBUG(msg) budget::core::logging::Logger::get().log(budget::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  budget::core::logging::Logger::get().log(budget::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  budget::core::logging::Logger::get().log(budget::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) budget::core::logging::Logger::get().log(budget::core::logging::LogLevel::ERROR, msg)

} // namespace budget::core::logging
