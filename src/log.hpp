#pragma once
#include <string>

namespace rconbridge {

// Diagnostics go to stderr as "[tag] message" lines. The threshold is
// process-wide and defaults to Info.
enum class LogLevel { Debug, Info, Warn, Error };

void set_log_level(LogLevel level);
LogLevel log_level();

// "debug" | "info" | "warn" | "error" (case-insensitive). Unknown -> Info.
LogLevel parse_log_level(const std::string& name);

void log_debug(const char* tag, const std::string& message);
void log_info(const char* tag, const std::string& message);
void log_warn(const char* tag, const std::string& message);
void log_error(const char* tag, const std::string& message);

} // namespace rconbridge
