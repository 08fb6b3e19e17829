#pragma once
#include <iostream>
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

namespace nexus::core::logging {

    // 1. Define Log Levels
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // Plain text lines or one JSON object per line.
    enum class LogFormat {
        Plain,
        Json
    };

    // 2. Global Logger Setup
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        void set_context_id(const std::string& id) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_id_ = id;
        }

        void set_format(LogFormat format) {
            std::lock_guard<std::mutex> lock(mutex_);
            format_ = format;
        }

        void set_min_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Restores defaults so state does not leak between test cases.
        void reset() {
            std::lock_guard<std::mutex> lock(mutex_);
            context_id_.clear();
            format_ = LogFormat::Plain;
            min_level_ = LogLevel::INFO;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_); // Thread safety!
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            // stdout stays reserved for command output.
            if (format_ == LogFormat::Json) {
                nlohmann::json line;
                line["level"] = level_name(level);
                line["context"] = context_id_;
                line["message"] = message;
                std::cerr << line.dump() << std::endl;
                return;
            }

            std::cerr << "[" << level_to_string(level) << "] "
                      << (context_id_.empty() ? "" : "[" + context_id_ + "] ")
                      << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_id_;
        LogFormat format_ = LogFormat::Plain;
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

        std::string level_name(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "debug";
                case LogLevel::INFO:  return "info";
                case LogLevel::WARN:  return "warn";
                case LogLevel::ERROR: return "error";
                default: return "unknown";
            }
        }
    };

    // 3. Helper macros for clean syntax everywhere else in the code
    #define NEXUS_LOG_DEBUG(msg) nexus::core::logging::Logger::get().log(nexus::core::logging::LogLevel::DEBUG, msg)
    #define NEXUS_LOG_INFO(msg)  nexus::core::logging::Logger::get().log(nexus::core::logging::LogLevel::INFO, msg)
    #define NEXUS_LOG_WARN(msg)  nexus::core::logging::Logger::get().log(nexus::core::logging::LogLevel::WARN, msg)
    #define NEXUS_LOG_ERROR(msg) nexus::core::logging::Logger::get().log(nexus::core::logging::LogLevel::ERROR, msg)

} // namespace nexus::core::logging
