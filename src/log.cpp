#include "log.hpp"
#include "util.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace rconbridge {

static std::atomic<int> g_log_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
    g_log_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_log_level.load());
}

LogLevel parse_log_level(const std::string& name) {
    std::string n = to_lower(trim(name));
    if (n == "debug" || n == "trace") return LogLevel::Debug;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    return LogLevel::Info;
}

static void emit(LogLevel level, const char* tag, const std::string& message) {
    if (static_cast<int>(level) < g_log_level.load(std::memory_order_relaxed)) return;
    const char* prefix = "";
    if (level == LogLevel::Warn)       prefix = "Warning: ";
    else if (level == LogLevel::Error) prefix = "Error: ";
    // One line per call; pipelines log from several threads
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << tag << "] " << prefix << message << "\n";
}

void log_debug(const char* tag, const std::string& message) { emit(LogLevel::Debug, tag, message); }
void log_info(const char* tag, const std::string& message)  { emit(LogLevel::Info, tag, message); }
void log_warn(const char* tag, const std::string& message)  { emit(LogLevel::Warn, tag, message); }
void log_error(const char* tag, const std::string& message) { emit(LogLevel::Error, tag, message); }

} // namespace rconbridge
