#pragma once
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>
#include <string>

namespace gatehouse::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Process-wide logger.
    // stdout carries the tool protocol, so console output goes to stderr.
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

        LogLevel min_level() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return min_level_;
        }

        // Mirrors every line into `path` (appending). Returns false when the
        // file cannot be opened; console logging continues either way.
        bool set_log_file(const std::filesystem::path& path) {
            std::lock_guard<std::mutex> lock(mutex_);
            std::error_code ec;
            std::filesystem::create_directories(path.parent_path(), ec);
            file_.close();
            file_.clear();
            file_.open(path, std::ios::app);
            return file_.is_open();
        }

        void set_console_enabled(bool enabled) {
            std::lock_guard<std::mutex> lock(mutex_);
            console_enabled_ = enabled;
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (level < min_level_) {
                return;
            }

            const std::string line =
                "[" + level_to_string(level) + "] " +
                (session_id_.empty() ? "" : "[" + session_id_ + "] ") + message;
            if (console_enabled_) {
                std::cerr << line << std::endl;
            }
            if (file_.is_open()) {
                file_ << line << std::endl;
            }
        }

    private:
        Logger() = default;
        mutable std::mutex mutex_;
        std::string session_id_;
        LogLevel min_level_ = LogLevel::INFO;
        bool console_enabled_ = true;
        std::ofstream file_;

        static std::string level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
                default: return "UNKNOWN";
            }
        }
    };

    #define GATEHOUSE_LOG_DEBUG(msg) gatehouse::core::logging::Logger::get().log(gatehouse::core::logging::LogLevel::DEBUG, msg)
    #define GATEHOUSE_LOG_INFO(msg)  gatehouse::core::logging::Logger::get().log(gatehouse::core::logging::LogLevel::INFO, msg)
    #define GATEHOUSE_LOG_WARN(msg)  gatehouse::core::logging::Logger::get().log(gatehouse::core::logging::LogLevel::WARN, msg)
    #define GATEHOUSE_LOG_ERROR(msg) gatehouse::core::logging::Logger::get().log(gatehouse::core::logging::LogLevel::ERROR, msg)

} // namespace gatehouse::core::logging
