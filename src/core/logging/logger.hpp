#pragma once
#include <chrono>
#include <cstdint>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>

namespace relay::core::logging {

    // 1. Log Levels, ordered by severity
    enum class LogLevel {
        DEBUG = 0,
        INFO = 1,
        WARN = 2,
        ERROR = 3
    };

    inline std::optional<LogLevel> parse_level(const std::string& text) {
        if (text == "debug" || text == "DEBUG") return LogLevel::DEBUG;
        if (text == "info" || text == "INFO") return LogLevel::INFO;
        if (text == "warn" || text == "WARN") return LogLevel::WARN;
        if (text == "error" || text == "ERROR") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Global Logger shared by every module
    class Logger {
    public:
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_instance_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            instance_id_ = id;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& module, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::cout << "[" << now_unix_ms() << "] "
                      << "[" << level_to_string(level) << "] "
                      << (instance_id_.empty() ? "" : "[" + instance_id_ + "] ")
                      << "[" << module << "] "
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string instance_id_;
        LogLevel min_level_ = LogLevel::DEBUG;

        static std::int64_t now_unix_ms() {
            const auto now = std::chrono::system_clock::now();
            return static_cast<std::int64_t>(
                std::chrono::duration_cast<std::chrono::milliseconds>(
                    now.time_since_epoch())
                    .count());
        }

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

    // Truncates payloads (commands, responses) before they reach a log line.
    inline std::string preview(const std::string& text, std::size_t max_chars) {
        if (text.size() <= max_chars) {
            return text;
        }
        return text.substr(0, max_chars) + "...";
    }

    // 3. Helper macros; the module tag names the subsystem emitting the line
    #define LOG_DEBUG(module, msg) relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::DEBUG, module, msg)
    #define LOG_INFO(module, msg)  relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::INFO, module, msg)
    #define LOG_WARN(module, msg)  relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::WARN, module, msg)
    #define LOG_ERROR(module, msg) relay::core::logging::Logger::get().log(relay::core::logging::LogLevel::ERROR, module, msg)

} // namespace relay::core::logging
