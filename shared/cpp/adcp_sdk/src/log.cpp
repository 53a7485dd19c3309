#include "../include/log.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace {
std::mutex g_log_mtx;
std::atomic<int> g_min_level{static_cast<int>(LogLevel::Info)};

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO";
}
}

LogLevel parse_log_level(const std::string& s) {
    if (s == "debug" || s == "DEBUG") return LogLevel::Debug;
    if (s == "warn" || s == "WARN" || s == "warning") return LogLevel::Warn;
    if (s == "error" || s == "ERROR") return LogLevel::Error;
    return LogLevel::Info;
}

void set_log_level(LogLevel level) { g_min_level = static_cast<int>(level); }

LogLevel log_level() { return static_cast<LogLevel>(g_min_level.load()); }

void log_line(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < g_min_level.load()) return;
    std::lock_guard<std::mutex> lock(g_log_mtx);
    std::cerr << "[" << tag << "] " << level_name(level) << " " << message << std::endl;
}

void log_line(LogLevel level, const std::string& tag, const std::string& message, const std::string& context_id) {
    log_line(level, tag, message + " ctx=" + context_id);
}
