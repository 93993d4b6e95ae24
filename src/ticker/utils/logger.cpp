#include <ticker/utils/logger.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace ticker::utils {

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;

std::optional<LogLevel> parse_log_level(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::DEBUG;
    }
    if (lower == "info") {
        return LogLevel::INFO;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::WARN;
    }
    if (lower == "error") {
        return LogLevel::LOG_ERROR;
    }
    return std::nullopt;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "DEBUG";
        case LogLevel::INFO:
            return "INFO";
        case LogLevel::WARN:
            return "WARN";
        case LogLevel::LOG_ERROR:
            return "ERROR";
    }
    return "UNKNOWN";
}

Logger::Logger(LogLevel level) : level_(level) {}

Logger& Logger::debug() {
    static thread_local Logger instance(LogLevel::DEBUG);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::info() {
    static thread_local Logger instance(LogLevel::INFO);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::warn() {
    static thread_local Logger instance(LogLevel::WARN);
    instance.stream_.str("");
    return instance;
}

Logger& Logger::error() {
    static thread_local Logger instance(LogLevel::LOG_ERROR);
    instance.stream_.str("");
    return instance;
}

bool Logger::enabled() const {
    return level_ >= current_level_;
}

Logger& Logger::operator<<(const EndlType&) {
    if (!enabled()) {
        return *this;
    }

    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ).count() % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::stringstream time_str;
    time_str << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S");
    time_str << '.' << std::setfill('0') << std::setw(3) << ms;

    std::lock_guard<std::mutex> lock(console_mutex_);
    std::cout << "[" << time_str.str() << "] "
              << "[" << log_level_name(level_) << "] "
              << stream_.str() << std::endl;

    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::level() {
    return current_level_;
}

} // namespace ticker::utils
