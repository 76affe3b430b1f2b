#pragma once
#include <string>

namespace gitmcp {

// Diagnostics go to stderr as "[tag] message" lines; stdout belongs to
// the protocol stream.
enum class LogLevel { Debug, Info, Warn, Error };

void set_log_level(LogLevel level);
LogLevel log_level();

// Parse "debug", "info", "warn"/"warning" or "error" (case-insensitive).
bool parse_log_level(const std::string& name, LogLevel& out);

void log_message(LogLevel level, const std::string& tag, const std::string& message);

inline void log_debug(const std::string& tag, const std::string& message) {
    log_message(LogLevel::Debug, tag, message);
}
inline void log_info(const std::string& tag, const std::string& message) {
    log_message(LogLevel::Info, tag, message);
}
inline void log_warn(const std::string& tag, const std::string& message) {
    log_message(LogLevel::Warn, tag, message);
}
inline void log_error(const std::string& tag, const std::string& message) {
    log_message(LogLevel::Error, tag, message);
}

} // namespace gitmcp
