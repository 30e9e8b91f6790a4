#include "../include/log.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace ragcore {

static std::atomic<int> g_level{static_cast<int>(LogLevel::info)};
static std::mutex g_write_mtx;

static const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info: return "INFO";
        case LogLevel::warn: return "WARN";
        case LogLevel::error: return "ERROR";
        default: return "";
    }
}

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

LogLevel parse_log_level(const std::string& name) {
    std::string s = name;
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c){ return (char)std::tolower(c); });
    if (s == "debug") return LogLevel::debug;
    if (s == "info") return LogLevel::info;
    if (s == "warn" || s == "warning") return LogLevel::warn;
    if (s == "error") return LogLevel::error;
    if (s == "off" || s == "none") return LogLevel::off;
    throw ConfigError("unknown log level: " + name);
}

void log_write(LogLevel level, const std::string& message) {
    if (level == LogLevel::off || static_cast<int>(level) < g_level.load()) return;
    std::lock_guard<std::mutex> lock(g_write_mtx);
    std::cerr << "[ragcore] [" << level_tag(level) << "] " << message << "\n";
}

} // namespace ragcore
