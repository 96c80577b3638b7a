#include "logging.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace volley {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Quiet)};
std::mutex g_log_mutex;

} // namespace

void set_log_level(LogLevel level) {
    g_level.store(static_cast<int>(level));
}

LogLevel log_level() {
    return static_cast<LogLevel>(g_level.load());
}

void log(LogLevel level, const std::string& message) {
    if (!log_enabled(level)) {
        return;
    }
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << "* " << message << "\n";
}

} // namespace volley
