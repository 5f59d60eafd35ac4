#ifndef LOGGER_H
#define LOGGER_H

#include <string>
#include <functional>

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARNING = 2,
    ERROR = 3,
    NONE = 4,      // Disable all logging
};

// Tag prepended to every line, usually the local device id.
void setNodeTag(const std::string& tag);

// Formats "[tag] L message" and hands it to the active sink.
void log_line(LogLevel level, const std::string& message);
inline void nativeLog(const std::string& message) { log_line(LogLevel::INFO, message); }

// Receives every formatted line instead of stderr (the simulator routes
// lines through it). Passing nullptr restores stderr output.
void setLogCallback(std::function<void(const std::string&)> callback);

// Default: INFO (skips debug messages)
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses "debug", "info", "warn"/"warning", "error", "none". Unknown strings yield INFO.
LogLevel parse_log_level(const std::string& level);
const char* log_level_to_string(LogLevel level);

// Lines are queued and written by a background thread until disabled.
// Disabling drains the queue before returning.
void enable_async_logging();
void disable_async_logging();
bool is_async_logging_enabled();

#define LOG_DEBUG(msg) if (get_log_level() <= LogLevel::DEBUG) log_line(LogLevel::DEBUG, msg)
#define LOG_INFO(msg)  if (get_log_level() <= LogLevel::INFO) log_line(LogLevel::INFO, msg)
#define LOG_WARN(msg)  if (get_log_level() <= LogLevel::WARNING) log_line(LogLevel::WARNING, msg)
#define LOG_ERROR(msg) if (get_log_level() <= LogLevel::ERROR) log_line(LogLevel::ERROR, msg)

#endif // LOGGER_H
