#include <pipali/utils/logging.h>
#include <iostream>
#include <fstream>
#include <mutex>
#include <atomic>

namespace pipali {
namespace utils {

namespace {

std::atomic<LogLevel> g_log_level{LogLevel::INFO};
std::mutex g_log_mutex;
std::ofstream g_log_file;

} // namespace

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug" || name == "trace") return LogLevel::DEBUG;
    if (name == "warning") return LogLevel::WARNING;
    if (name == "error" || name == "critical") return LogLevel::ERROR;
    return LogLevel::INFO;
}

std::string log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "debug";
        case LogLevel::INFO: return "info";
        case LogLevel::WARNING: return "warning";
        case LogLevel::ERROR: return "error";
    }
    return "info";
}

void set_log_level(LogLevel level) {
    g_log_level = level;
}

LogLevel get_log_level() {
    return g_log_level;
}

bool is_log_enabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(g_log_level.load());
}

bool set_log_file(const std::string& path) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (g_log_file.is_open()) {
        g_log_file.close();
    }
    if (path.empty()) {
        return true;
    }
    g_log_file.open(path, std::ios::out | std::ios::app);
    if (!g_log_file.is_open()) {
        std::cerr << "[Log] Warning: Failed to open log file: " << path << std::endl;
        return false;
    }
    return true;
}

void log_message(LogLevel level, const std::string& tag, const std::string& message) {
    std::string line;
    if (level == LogLevel::DEBUG) {
        line = "DEBUG: ";
    }
    line += "[" + tag + "] " + message;

    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level == LogLevel::WARNING || level == LogLevel::ERROR) {
        std::cerr << line << std::endl;
    } else {
        std::cout << line << std::endl;
    }
    if (g_log_file.is_open()) {
        g_log_file << "[" << log_level_name(level) << "] " << line << "\n";
        g_log_file.flush();
    }
}

} // namespace utils
} // namespace pipali
