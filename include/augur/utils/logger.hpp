#pragma once
#include <string>
#include <sstream>
#include <mutex>

namespace augur::utils {

class Config;

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    LOG_ERROR  // ERROR collides with a Windows macro
};


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
        stream_ << value;
        return *this;
    }

    Logger& operator<<(const EndlType&);

    static void set_level(LogLevel level);
    static LogLevel level();

    // log_level (default info) and log_timestamps (default on)
    static void configure(const Config& config);

    // Maps "debug", "info", "warn"/"warning", "error" (any case) to a level.
    // Unknown text falls back to INFO.
    static LogLevel parse_level(const std::string& text);

private:
    explicit Logger(LogLevel level);

    static Logger& thread_instance(LogLevel level);

    LogLevel level_;
    std::stringstream stream_;

    static std::mutex console_mutex_;
    static LogLevel current_level_;
    static bool timestamps_;
};

} // namespace augur::utils
