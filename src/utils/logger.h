#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>

enum class LogLevel {
    Debug = 0,
    Info,
    Warn,
    Error
};

class Logger {
public:
    static Logger& instance();

    void set_level(LogLevel p_level) { level_ = p_level; }
    LogLevel level() const { return level_; }
    bool enabled(LogLevel p_level) const { return p_level >= level_; }

    void write(LogLevel p_level, const std::string& p_message);

    // Accepts debug|info|warn|error, throws std::invalid_argument otherwise
    static LogLevel parse_level(std::string_view p_name);

private:
    Logger() = default;

    std::mutex mutex_;
    std::atomic<LogLevel> level_{LogLevel::Info};
};

std::string format_utc_timestamp();

#define LOG_AT(level, msg)                                   \
    do {                                                     \
        if (Logger::instance().enabled(level)) {             \
            std::ostringstream log_stream_;                  \
            log_stream_ << msg;                              \
            Logger::instance().write(level, log_stream_.str()); \
        }                                                    \
    } while (0)

#define LOG_DEBUG(msg) LOG_AT(LogLevel::Debug, msg)
#define LOG_INFO(msg) LOG_AT(LogLevel::Info, msg)
#define LOG_WARN(msg) LOG_AT(LogLevel::Warn, msg)
#define LOG_ERROR(msg) LOG_AT(LogLevel::Error, msg)
