#pragma once

#include <string>

namespace speedtest {

enum class LogLevel { Debug, Info, Warn, Error };

void set_log_level(LogLevel level);

LogLevel log_level();

// Writes one "[tag] message" line; Debug/Info go to stdout, Warn/Error to stderr.
void log_line(LogLevel level, const std::string &tag, const std::string &message);

inline void log_debug(const std::string &tag, const std::string &message) {
    log_line(LogLevel::Debug, tag, message);
}

inline void log_info(const std::string &tag, const std::string &message) {
    log_line(LogLevel::Info, tag, message);
}

inline void log_warn(const std::string &tag, const std::string &message) {
    log_line(LogLevel::Warn, tag, message);
}

inline void log_error(const std::string &tag, const std::string &message) {
    log_line(LogLevel::Error, tag, message);
}

// Serializes raw console writes (progress bars) with log lines.
void write_console(const std::string &text);

} // namespace speedtest
