#include "logging.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace wrpzmq {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::warn)};
std::mutex g_output_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::debug: return "DEBUG";
    case LogLevel::info:  return "INFO";
    case LogLevel::warn:  return "WARN";
    case LogLevel::error: return "ERROR";
    case LogLevel::off:   break;
    }
    return "";
}

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

bool parse_log_level(const std::string& text, LogLevel& level) {
    if (text == "debug") {
        level = LogLevel::debug;
    } else if (text == "info") {
        level = LogLevel::info;
    } else if (text == "warn") {
        level = LogLevel::warn;
    } else if (text == "error") {
        level = LogLevel::error;
    } else if (text == "off") {
        level = LogLevel::off;
    } else {
        return false;
    }
    return true;
}

void log(LogLevel level, const std::string& line) {
    if (level == LogLevel::off || static_cast<int>(level) < g_level.load()) {
        return;
    }

    auto now = std::chrono::system_clock::now();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    std::time_t t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count() << 'Z'
        << " [" << level_tag(level) << "] " << line << '\n';

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << oss.str();
}

} // namespace wrpzmq
