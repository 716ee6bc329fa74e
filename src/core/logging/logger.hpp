#pragma once
#include <iostream>
#include <mutex>
#include <string>

namespace stride::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    // 2. Global logger
    class Logger {
    public:
        // Singleton access so the whole process shares one logger
        static Logger& get() {
            static Logger instance;
            return instance;
        }

        // Tag prepended to every line, e.g. the agent or run id
        void set_context(const std::string& tag) {
            std::lock_guard<std::mutex> lock(mutex_);
            context_ = tag;
        }

        void set_level(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            min_level_ = level;
        }

        // Lets callers skip building expensive messages
        bool enabled(LogLevel level) {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<int>(level) >= static_cast<int>(min_level_);
        }

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            // Warnings and errors go to stderr so stdout stays readable when piped
            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << "[" << level_to_string(level) << "] "
                << (context_.empty() ? "" : "[" + context_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string context_;
        LogLevel min_level_ = LogLevel::INFO;

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

    // 3. Helper macros
    #define STRIDE_LOG_DEBUG(msg) ::stride::core::logging::Logger::get().log(::stride::core::logging::LogLevel::DEBUG, msg)
    #define STRIDE_LOG_INFO(msg)  ::stride::core::logging::Logger::get().log(::stride::core::logging::LogLevel::INFO, msg)
    #define STRIDE_LOG_WARN(msg)  ::stride::core::logging::Logger::get().log(::stride::core::logging::LogLevel::WARN, msg)
    #define STRIDE_LOG_ERROR(msg) ::stride::core::logging::Logger::get().log(::stride::core::logging::LogLevel::ERROR, msg)

} // namespace stride::core::logging
