#include "log.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>

namespace gitmcp {

static std::atomic<LogLevel> g_level{LogLevel::Info};
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
    g_level.store(level);
}

LogLevel log_level() {
    return g_level.load();
}

bool parse_log_level(const std::string& name, LogLevel& out) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") {
        out = LogLevel::Debug;
    } else if (lower == "info") {
        out = LogLevel::Info;
    } else if (lower == "warn" || lower == "warning") {
        out = LogLevel::Warn;
    } else if (lower == "error") {
        out = LogLevel::Error;
    } else {
        return false;
    }
    return true;
}

void log_message(LogLevel level, const std::string& tag, const std::string& message) {
    if (static_cast<int>(level) < static_cast<int>(g_level.load())) return;

    const char* prefix = "";
    if (level == LogLevel::Warn) prefix = "warning: ";
    else if (level == LogLevel::Error) prefix = "error: ";

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "[" << tag << "] " << prefix << message << "\n";
}

} // namespace gitmcp
