#pragma once
#include <string>
#include <iostream>
#include <mutex>
#include <atomic>
#include <cstdlib>

namespace polygate {

enum class LogLevel { debug = 0, info = 1, warn = 2, error = 3, off = 4 };

inline LogLevel parse_log_level(const std::string& s) {
    if (s == "debug") return LogLevel::debug;
    if (s == "warn" || s == "warning") return LogLevel::warn;
    if (s == "error") return LogLevel::error;
    if (s == "off" || s == "none") return LogLevel::off;
    return LogLevel::info;
}

inline std::atomic<int>& log_threshold() {
    static std::atomic<int> level{[] {
        const char* env = std::getenv("POLYGATE_LOG");
        return static_cast<int>(env ? parse_log_level(env) : LogLevel::info);
    }()};
    return level;
}

inline void set_log_level(LogLevel level) {
    log_threshold() = static_cast<int>(level);
}

inline bool log_enabled(LogLevel level) {
    return static_cast<int>(level) >= log_threshold().load();
}

// Writes one "[tag] message" line to stderr; whole lines never interleave.
inline void log_line(LogLevel level, const std::string& tag, const std::string& msg) {
    if (!log_enabled(level)) return;
    static std::mutex mu;
    std::string line = "[" + tag + "] ";
    if (level == LogLevel::warn) line += "warning: ";
    else if (level == LogLevel::error) line += "error: ";
    line += msg;
    line += "\n";
    std::lock_guard<std::mutex> lock(mu);
    std::cerr << line;
}

inline void log_debug(const std::string& tag, const std::string& msg) { log_line(LogLevel::debug, tag, msg); }
inline void log_info(const std::string& tag, const std::string& msg)  { log_line(LogLevel::info, tag, msg); }
inline void log_warn(const std::string& tag, const std::string& msg)  { log_line(LogLevel::warn, tag, msg); }
inline void log_error(const std::string& tag, const std::string& msg) { log_line(LogLevel::error, tag, msg); }

} // namespace polygate
