#pragma once

#include <string>

namespace wrpzmq {

enum class LogLevel {
    debug = 0,
    info,
    warn,
    error,
    off
};

void set_log_level(LogLevel level);

LogLevel log_level();

// Accepts "debug", "info", "warn", "error" and "off". Returns false and
// leaves `level` untouched for anything else.
bool parse_log_level(const std::string& text, LogLevel& level);

/**
 * Writes one timestamped line to stderr if `level` is enabled.
 * Safe to call from any thread.
 */
void log(LogLevel level, const std::string& line);

inline void log_debug(const std::string& line) { log(LogLevel::debug, line); }
inline void log_info(const std::string& line) { log(LogLevel::info, line); }
inline void log_warn(const std::string& line) { log(LogLevel::warn, line); }
inline void log_error(const std::string& line) { log(LogLevel::error, line); }

} // namespace wrpzmq
