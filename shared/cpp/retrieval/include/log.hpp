#pragma once
#include <string>

namespace ragcore {

enum class LogLevel { debug, info, warn, error, off };

void set_log_level(LogLevel level);
LogLevel log_level();
LogLevel parse_log_level(const std::string& name);

void log_write(LogLevel level, const std::string& message);

inline void log_debug(const std::string& message) { log_write(LogLevel::debug, message); }
inline void log_info(const std::string& message) { log_write(LogLevel::info, message); }
inline void log_warn(const std::string& message) { log_write(LogLevel::warn, message); }
inline void log_error(const std::string& message) { log_write(LogLevel::error, message); }

} // namespace ragcore
