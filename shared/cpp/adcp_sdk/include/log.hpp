#pragma once
#include <string>

enum class LogLevel { Debug, Info, Warn, Error };

LogLevel parse_log_level(const std::string& s);
void set_log_level(LogLevel level);
LogLevel log_level();

// Writes "[tag] LEVEL message" to stderr. Lines from concurrent threads never interleave.
void log_line(LogLevel level, const std::string& tag, const std::string& message);
// Same, with " ctx=<context_id>" appended.
void log_line(LogLevel level, const std::string& tag, const std::string& message, const std::string& context_id);
