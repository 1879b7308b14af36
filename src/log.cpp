#include "log.hpp"

#include <atomic>
#include <iostream>
#include <mutex>

namespace smap {

namespace {
std::atomic<int> g_level{static_cast<int>(LogLevel::Error)};
std::mutex g_log_mtx;

void emit(LogLevel level, const char* tag, const std::string& msg) {
    if (static_cast<int>(level) > g_level.load()) return;
    std::lock_guard<std::mutex> lk(g_log_mtx);
    std::cerr << tag << msg << std::endl;
}
} // namespace

void set_log_level(LogLevel level) {
    g_level = static_cast<int>(level);
}

void log_error(const std::string& msg) { emit(LogLevel::Error, "ERROR: ", msg); }
void log_warning(const std::string& msg) { emit(LogLevel::Warning, "WARNING: ", msg); }
void log_info(const std::string& msg) { emit(LogLevel::Info, "INFO: ", msg); }
void log_debug(const std::string& msg) { emit(LogLevel::Debug, "DEBUG: ", msg); }

} // namespace smap
