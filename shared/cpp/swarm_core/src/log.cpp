#include "../include/log.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_log_mtx;

std::atomic<int>& level_slot() {
    static std::atomic<int> level{static_cast<int>(log_level_from_string(getenv_or("SWARM_LOG_LEVEL", "info")))};
    return level;
}
}

LogLevel log_level() {
    return static_cast<LogLevel>(level_slot().load());
}

void set_log_level(LogLevel level) {
    level_slot().store(static_cast<int>(level));
}

LogLevel log_level_from_string(const std::string& name) {
    std::string n = name;
    std::transform(n.begin(), n.end(), n.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (n == "debug") return LogLevel::Debug;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void log_line(LogLevel level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) < level_slot().load()) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    switch (level) {
    case LogLevel::Debug:
        std::cout << "[" << component << "] (debug) " << message << std::endl;
        break;
    case LogLevel::Info:
        std::cout << "[" << component << "] " << message << std::endl;
        break;
    case LogLevel::Warn:
        std::cerr << "[" << component << "] Warning: " << message << std::endl;
        break;
    case LogLevel::Error:
        std::cerr << "[" << component << "] Error: " << message << std::endl;
        break;
    }
}
