#include "logger.h"

#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>
#include <regex>
#include <sstream>
#include <iomanip>

namespace masqueplus {

/**
 * @brief Mutex for protecting the logger.
 */
static std::mutex g_logMutex;

/**
 * @brief Global log level (for conditional logging)
 * Default: INFO (skips DEBUG messages)
 */
static LogLevel g_log_level = LogLevel::INFO;

/**
 * @brief Optional sink replacing stdout.
 */
static std::function<void(const std::string&)> g_log_callback;

namespace {

bool needs_quoting(const std::string& value) {
    if (value.empty()) return true;
    for (char c : value) {
        if (std::isspace(static_cast<unsigned char>(c)) || c == '"' || c == '=' || c == '\\') {
            return true;
        }
    }
    return false;
}

std::string quote(const std::string& value) {
    std::string out;
    out.reserve(value.size() + 2);
    out.push_back('"');
    for (char c : value) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default: out.push_back(c); break;
        }
    }
    out.push_back('"');
    return out;
}

std::string format_rfc3339(std::chrono::system_clock::time_point when) {
    const std::time_t secs = std::chrono::system_clock::to_time_t(when);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        when.time_since_epoch()).count() % 1000;

    std::tm local{};
    localtime_r(&secs, &local);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &local);

    // %z yields +hhmm; RFC 3339 wants +hh:mm
    char zone[8];
    std::strftime(zone, sizeof(zone), "%z", &local);
    std::string tz(zone);
    if (tz.size() == 5) {
        tz.insert(3, ":");
    }
    if (tz == "+00:00") {
        tz = "Z";
    }

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << millis << tz;
    return oss.str();
}

} // namespace

void setLogCallback(std::function<void(const std::string&)> callback) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_callback = std::move(callback);
}

/**
 * @brief Sets the global log level (for conditional logging)
 * @param level The log level to set.
 */
void set_log_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(g_logMutex);
    g_log_level = level;
}

/**
 * @brief Gets the current global log level
 * @return The current log level.
 */
LogLevel get_log_level() {
    std::lock_guard<std::mutex> lock(g_logMutex);
    return g_log_level;
}

bool parse_log_level(const std::string& value, LogLevel* out) {
    std::string v = value;
    for (auto& c : v) c = static_cast<char>(::tolower(c));
    LogLevel level;
    if (v == "debug") level = LogLevel::DEBUG;
    else if (v == "info") level = LogLevel::INFO;
    else if (v == "warn" || v == "warning") level = LogLevel::WARNING;
    else if (v == "error") level = LogLevel::ERROR;
    else if (v == "none") level = LogLevel::NONE;
    else return false;
    if (out) *out = level;
    return true;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
    case LogLevel::DEBUG: return "DEBUG";
    case LogLevel::INFO: return "INFO";
    case LogLevel::WARNING: return "WARN";
    case LogLevel::ERROR: return "ERROR";
    case LogLevel::NONE: return "NONE";
    }
    return "INFO";
}

std::string format_log_line(LogLevel level,
                            const std::string& message,
                            const LogFields& fields,
                            std::chrono::system_clock::time_point when) {
    std::ostringstream oss;
    oss << "time=" << format_rfc3339(when)
        << " level=" << log_level_name(level)
        << " msg=" << quote(message);

    for (const auto& field : fields) {
        if (field.first.empty() || field.second.empty()) {
            continue;
        }
        oss << ' ' << field.first << '=';
        if (needs_quoting(field.second)) {
            oss << quote(field.second);
        } else {
            oss << field.second;
        }
    }
    return oss.str();
}

std::string strip_embedded_timestamp(const std::string& line) {
    static const std::regex kPrefix(
        R"(^\s*\d{4}[/-]\d{2}[/-]\d{2}[ T]\d{2}:\d{2}:\d{2}(\.\d+)?\s*)");
    return std::regex_replace(line, kPrefix, "", std::regex_constants::format_first_only);
}

/**
 * @brief Writes one formatted line to the active sink.
 */
void nativeLog(LogLevel level, const std::string& message, const LogFields& fields) {
    const std::string line = format_log_line(level, message, fields, std::chrono::system_clock::now());

    std::lock_guard<std::mutex> lock(g_logMutex);
    if (g_log_callback) {
        g_log_callback(line);
        return;
    }
    std::cout << line << std::endl;
}

} // namespace masqueplus
