#include "logger.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <cstdlib>
#include <iomanip>

LogLevel Logger::current_level = LogLevel::INFO;
std::mutex Logger::log_mutex;

void Logger::init(LogLevel level) {
    std::lock_guard<std::mutex> lock(log_mutex);
    current_level = level;
}

void Logger::init_from_env() {
    const char* value = std::getenv("LANSHARE_LOG");
    if (!value) return;

    std::string name(value);
    if (name == "debug") init(LogLevel::DEBUG);
    else if (name == "info") init(LogLevel::INFO);
    else if (name == "warn") init(LogLevel::WARN);
    else if (name == "error") init(LogLevel::ERROR);
}

void Logger::log(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(log_mutex);
    if (level < current_level) return;

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    std::tm tm_buf{};
    localtime_r(&time, &tm_buf);

    std::string level_str;
    switch (level) {
        case LogLevel::DEBUG: level_str = "[DEBUG]"; break;
        case LogLevel::INFO:  level_str = "[INFO] "; break;
        case LogLevel::WARN:  level_str = "[WARN] "; break;
        case LogLevel::ERROR: level_str = "[ERROR]"; break;
    }

    std::cout << std::put_time(&tm_buf, "%H:%M:%S")
              << '.' << std::setfill('0') << std::setw(3) << ms.count()
              << " " << level_str << " " << message << std::endl;
}
