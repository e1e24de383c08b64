#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace forge::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole app shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_task_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            task_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // The stream must outlive every later log call.
        void set_output(std::ostream& out) {
            std::lock_guard<std::mutex> lock(mutex_);
            out_ = &out;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            *out_ << "[" << level_to_string(level) << "] "
                  << (task_id_.empty() ? "" : "[" + task_id_ + "] ")
                  << message << std::endl;
        }

        static bool parse_level(const std::string& text, LogLevel& level) {
            if (text == "debug") { level = LogLevel::DEBUG; return true; }
            if (text == "info")  { level = LogLevel::INFO;  return true; }
            if (text == "warn")  { level = LogLevel::WARN;  return true; }
            if (text == "error") { level = LogLevel::ERROR; return true; }
            return false;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string task_id_;
        LogLevel min_level_ = LogLevel::INFO;
        std::ostream* out_ = &std::clog;

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

    // 3. Helper macros for clean syntax everywhere else in the code
    #define FORGE_LOG_DEBUG(msg) \
        do { \
            if (forge::core::logging::Logger::get().enabled(forge::core::logging::LogLevel::DEBUG)) \
                forge::core::logging::Logger::get().log(forge::core::logging::LogLevel::DEBUG, msg); \
        } while (0)
    #define FORGE_LOG_INFO(msg)  forge::core::logging::Logger::get().log(forge::core::logging::LogLevel::INFO, msg)
    #define FORGE_LOG_WARN(msg)  forge::core::logging::Logger::get().log(forge::core::logging::LogLevel::WARN, msg)
    #define FORGE_LOG_ERROR(msg) forge::core::logging::Logger::get().log(forge::core::logging::LogLevel::ERROR, msg)

} // namespace forge::core::logging
