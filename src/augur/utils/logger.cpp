#include <augur/utils/logger.hpp>
#include <augur/utils/config.hpp>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace augur::utils {

namespace {

const char* tag(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:
            return "[DEBUG] ";
        case LogLevel::INFO:
            return "[INFO] ";
        case LogLevel::WARN:
            return "[WARN] ";
        case LogLevel::LOG_ERROR:
            break;
    }
    return "[ERROR] ";
}

// Local wall time with milliseconds
std::string timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto time = std::chrono::system_clock::to_time_t(now);
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;

    std::tm local_tm{};
    localtime_r(&time, &local_tm);

    std::ostringstream out;
    out << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms;
    return out.str();
}

} // namespace

std::mutex Logger::console_mutex_;
LogLevel Logger::current_level_ = LogLevel::INFO;
bool Logger::timestamps_ = true;

Logger::Logger(LogLevel level) : level_(level) {}

// One buffer per thread and level, cleared for each message
Logger& Logger::thread_instance(LogLevel level) {
    static thread_local Logger debug_logger(LogLevel::DEBUG);
    static thread_local Logger info_logger(LogLevel::INFO);
    static thread_local Logger warn_logger(LogLevel::WARN);
    static thread_local Logger error_logger(LogLevel::LOG_ERROR);

    Logger* logger = &error_logger;
    switch (level) {
        case LogLevel::DEBUG:
            logger = &debug_logger;
            break;
        case LogLevel::INFO:
            logger = &info_logger;
            break;
        case LogLevel::WARN:
            logger = &warn_logger;
            break;
        case LogLevel::LOG_ERROR:
            break;
    }
    logger->stream_.str("");
    return *logger;
}

Logger& Logger::debug() { return thread_instance(LogLevel::DEBUG); }
Logger& Logger::info() { return thread_instance(LogLevel::INFO); }
Logger& Logger::warn() { return thread_instance(LogLevel::WARN); }
Logger& Logger::error() { return thread_instance(LogLevel::LOG_ERROR); }

Logger& Logger::operator<<(const EndlType&) {
    if (level_ < current_level_) {
        return *this;
    }

    const std::string prefix = timestamps_ ? "[" + timestamp() + "] " : std::string();
    std::lock_guard<std::mutex> lock(console_mutex_);
    std::cout << prefix << tag(level_) << stream_.str() << std::endl;
    return *this;
}

void Logger::set_level(LogLevel level) {
    current_level_ = level;
}

LogLevel Logger::level() {
    return current_level_;
}

void Logger::configure(const Config& config) {
    set_level(parse_level(config.get("log_level", std::string("info"))));
    timestamps_ = config.get_bool("log_timestamps", true);
}

LogLevel Logger::parse_level(const std::string& text) {
    std::string lowered = text;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lowered == "debug") {
        return LogLevel::DEBUG;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::WARN;
    }
    if (lowered == "error") {
        return LogLevel::LOG_ERROR;
    }
    return LogLevel::INFO;
}

} // namespace augur::utils
