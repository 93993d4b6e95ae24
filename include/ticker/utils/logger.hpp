#pragma once
#include <mutex>
#include <optional>
#include <sstream>
#include <string>

namespace ticker::utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};

// Parses "debug", "info", "warn"/"warning" or "error", case insensitive
std::optional<LogLevel> parse_log_level(const std::string& name);

const char* log_level_name(LogLevel level);

class Logger {
public:
    struct EndlType {};
    inline static constexpr EndlType endl{};

    static Logger& debug();
    static Logger& info();
    static Logger& warn();
    static Logger& error();

    template<typename T>
    Logger& operator<<(const T& value) {
        if (enabled()) {
            stream_ << value;
        }
        return *this;
    }

    // Flushes the buffered line to stdout if the level passes the filter
    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

private:
    explicit Logger(LogLevel level);

    bool enabled() const;

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
};

} // namespace ticker::utils
