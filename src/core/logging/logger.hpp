#pragma once
#include <chrono>
#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include <mutex>

namespace turnstile::core::logging {

    // 1. Log levels, ordered by severity
    enum class LogLevel {
        DEBUG,
        INFO,
        WARN,
        ERROR
    };

    inline std::optional<LogLevel> parse_log_level(const std::string& value) {
        if (value == "debug") return LogLevel::DEBUG;
        if (value == "info")  return LogLevel::INFO;
        if (value == "warn")  return LogLevel::WARN;
        if (value == "error") return LogLevel::ERROR;
        return std::nullopt;
    }

    // 2. Process-wide logger. Lines look like
    //    2026-01-02T03:04:05Z [INFO ] [instance] message
    //    WARN and ERROR go to stderr, the rest to stdout.
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

        void log(LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            if (static_cast<int>(level) < static_cast<int>(min_level_)) {
                return;
            }

            std::ostream& out = level >= LogLevel::WARN ? std::cerr : std::cout;
            out << timestamp() << " [" << level_to_string(level) << "] "
                << (instance_id_.empty() ? "" : "[" + instance_id_ + "] ")
                << message << std::endl;
        }

    private:
        Logger() = default;
        std::mutex mutex_;
        std::string instance_id_;
        LogLevel min_level_ = LogLevel::INFO;

        static std::string timestamp() {
            const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc{};
            gmtime_r(&now, &utc);
            char buffer[32];
            const auto written = std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%SZ", &utc);
            return std::string(buffer, written);
        }

        static const char* level_to_string(LogLevel level) {
            switch (level) {
                case LogLevel::DEBUG: return "DEBUG";
                case LogLevel::INFO:  return "INFO ";
                case LogLevel::WARN:  return "WARN ";
                case LogLevel::ERROR: return "ERROR";
            }
            return "UNKNOWN";
        }
    };

    // 3. Call-site macros
    #define LOG_DEBUG(msg) turnstile::core::logging::Logger::get().log(turnstile::core::logging::LogLevel::DEBUG, msg)
    #define LOG_INFO(msg)  turnstile::core::logging::Logger::get().log(turnstile::core::logging::LogLevel::INFO, msg)
    #define LOG_WARN(msg)  turnstile::core::logging::Logger::get().log(turnstile::core::logging::LogLevel::WARN, msg)
    #define LOG_ERROR(msg) turnstile::core::logging::Logger::get().log(turnstile::core::logging::LogLevel::ERROR, msg)

} // namespace turnstile::core::logging
