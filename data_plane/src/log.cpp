#include "speedtest/log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace speedtest {

namespace {

std::atomic<LogLevel> &threshold() {
    static std::atomic<LogLevel> level{LogLevel::Info};
    return level;
}

std::mutex &console_mutex() {
    static std::mutex mutex;
    return mutex;
}

} // namespace

void set_log_level(LogLevel level) { threshold().store(level); }

LogLevel log_level() { return threshold().load(); }

void log_line(LogLevel level, const std::string &tag, const std::string &message) {
    if (level < log_level()) {
        return;
    }
    std::lock_guard<std::mutex> lock(console_mutex());
    std::ostream &out = (level >= LogLevel::Warn) ? std::cerr : std::cout;
    out << '[' << tag << "] " << message << std::endl;
}

void write_console(const std::string &text) {
    std::lock_guard<std::mutex> lock(console_mutex());
    std::cout << text << std::flush;
}

} // namespace speedtest
