#ifndef MASQUEPLUS_LOGGER_H
#define MASQUEPLUS_LOGGER_H

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

// Log level enumeration for conditional logging
enum class LogLevel {
    DEBUG = 0,     // Every message (most verbose)
    INFO = 1,      // Important events
    WARNING = 2,   // Problems only
    ERROR = 3,     // Errors only
    NONE = 4,      // Disable all logging
};

namespace masqueplus {

// Ordered key=value pairs appended after msg="...".
using LogFields = std::vector<std::pair<std::string, std::string>>;

void nativeLog(LogLevel level, const std::string& message, const LogFields& fields = {});

// Set a callback for log lines (replaces stdout while set; pass nullptr to restore)
void setLogCallback(std::function<void(const std::string&)> callback);

// Set global log level. Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses debug|info|warn|warning|error|none (case-insensitive).
bool parse_log_level(const std::string& value, LogLevel* out);

const char* log_level_name(LogLevel level);

// time=... level=... msg="..." key=value ...
std::string format_log_line(LogLevel level,
                            const std::string& message,
                            const LogFields& fields,
                            std::chrono::system_clock::time_point when);

// Removes a leading "2006/01/02 15:04:05" style timestamp that child processes
// prefix their own log lines with.
std::string strip_embedded_timestamp(const std::string& line);

} // namespace masqueplus

// Logging macros for conditional formatting
#define LOG_DEBUG(...) if (masqueplus::get_log_level() <= LogLevel::DEBUG) masqueplus::nativeLog(LogLevel::DEBUG, __VA_ARGS__)
#define LOG_INFO(...)  if (masqueplus::get_log_level() <= LogLevel::INFO) masqueplus::nativeLog(LogLevel::INFO, __VA_ARGS__)
#define LOG_WARN(...)  if (masqueplus::get_log_level() <= LogLevel::WARNING) masqueplus::nativeLog(LogLevel::WARNING, __VA_ARGS__)
#define LOG_ERROR(...) if (masqueplus::get_log_level() <= LogLevel::ERROR) masqueplus::nativeLog(LogLevel::ERROR, __VA_ARGS__)

#endif // MASQUEPLUS_LOGGER_H
