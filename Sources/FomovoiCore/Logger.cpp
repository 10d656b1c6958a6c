#include "Logger.hpp"

#include <atomic>
#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace fv {

namespace {

std::mutex            g_log_mutex;
std::ofstream         g_log_file;
std::atomic<LogLevel> g_min_level{LogLevel::info};

std::string now_timestamp() {
    auto t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
#if defined(_WIN32)
    localtime_s(&tm, &t);
#else
    localtime_r(&t, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

const char* level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "DEBUG";
        case LogLevel::info:  return "INFO";
        case LogLevel::warn:  return "WARN";
        case LogLevel::error: return "ERROR";
    }
    return "UNKNOWN";
}

} // namespace

LogLevel log_level_from_string(const std::string& s) {
    if (s == "debug") return LogLevel::debug;
    if (s == "warn")  return LogLevel::warn;
    if (s == "error") return LogLevel::error;
    return LogLevel::info;
}

void log_init(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) g_log_file.close();
    if (path.empty()) return;

    g_log_file.open(path, std::ios::out | std::ios::app);
    if (!g_log_file.is_open()) {
        std::cerr << "[Logger] Could not open log file: " << path << std::endl;
        return;
    }
    g_log_file << "==== fomovoi log started " << now_timestamp() << " ====" << std::endl;
}

void log_shutdown() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) {
        g_log_file << "==== fomovoi log ended ====" << std::endl;
        g_log_file.close();
    }
}

void set_log_level(LogLevel level) {
    g_min_level.store(level);
}

LogLevel log_level() {
    return g_min_level.load();
}

void log_message(LogLevel level, const std::string& tag, const std::string& msg) {
    if (static_cast<int>(level) < static_cast<int>(g_min_level.load())) return;

    std::string line = "[" + now_timestamp() + "][" + level_to_string(level)
                       + "][" + tag + "] " + msg;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::cerr << line << std::endl;
    if (g_log_file.is_open()) {
        g_log_file << line << std::endl;
    }
}

} // namespace fv
