#include "logger.h"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <stdexcept>

namespace {

const char* level_name(LogLevel p_level) {
    switch (p_level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "?";
}

}

Logger& Logger::instance() {
    static Logger instance_;
    return instance_;
}

void Logger::write(LogLevel p_level, const std::string& p_message) {
    std::string line = "[" + format_utc_timestamp() + "] [" + level_name(p_level) + "] " + p_message;

    std::lock_guard<std::mutex> lock(mutex_);
    if (p_level >= LogLevel::Warn) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
}

LogLevel Logger::parse_level(std::string_view p_name) {
    if (p_name == "debug") return LogLevel::Debug;
    if (p_name == "info") return LogLevel::Info;
    if (p_name == "warn") return LogLevel::Warn;
    if (p_name == "error") return LogLevel::Error;
    throw std::invalid_argument("Unknown log level: " + std::string(p_name));
}

std::string format_utc_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
    gmtime_r(&seconds, &utc);

    std::ostringstream out;
    out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
    return out.str();
}
