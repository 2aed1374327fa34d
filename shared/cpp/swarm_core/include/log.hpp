#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Initial level comes from SWARM_LOG_LEVEL (debug|info|warn|error), default info.
LogLevel log_level();
void set_log_level(LogLevel level);
LogLevel log_level_from_string(const std::string& name);

// Writes "[component] message" as one line. Info and debug go to stdout,
// warnings and errors to stderr.
void log_line(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& component, const std::string& message) {
    log_line(LogLevel::Debug, component, message);
}
inline void log_info(const std::string& component, const std::string& message) {
    log_line(LogLevel::Info, component, message);
}
inline void log_warn(const std::string& component, const std::string& message) {
    log_line(LogLevel::Warn, component, message);
}
inline void log_error(const std::string& component, const std::string& message) {
    log_line(LogLevel::Error, component, message);
}
