#pragma once

#include <string>
#include <sstream>

#ifdef _WIN32
// Undefine Windows macros that conflict with our enums
#ifdef ERROR
#undef ERROR
#endif
#endif

namespace pipali {
namespace utils {

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR
};

// Parse "debug", "info", "warning", "error" (case-sensitive).
// Unknown names fall back to INFO.
LogLevel parse_log_level(const std::string& name);
std::string log_level_name(LogLevel level);

void set_log_level(LogLevel level);
LogLevel get_log_level();
bool is_log_enabled(LogLevel level);

// Mirror every line into this file (appended). Empty path disables the file.
// Returns false if the file could not be opened.
bool set_log_file(const std::string& path);

// Thread-safe. INFO/DEBUG go to stdout, WARNING/ERROR to stderr.
// Output format: "[Tag] message" (DEBUG lines are prefixed with "DEBUG: ").
void log_message(LogLevel level, const std::string& tag, const std::string& message);

} // namespace utils
} // namespace pipali

// Stream-style logging helpers, e.g.
//   PIPALI_LOG_INFO("Sidecar", "Starting on port " << port);
#define PIPALI_LOG(level, tag, msg) \
    do { \
        if (::pipali::utils::is_log_enabled(level)) { \
            std::ostringstream pipali_log_stream_; \
            pipali_log_stream_ << msg; \
            ::pipali::utils::log_message(level, tag, pipali_log_stream_.str()); \
        } \
    } while (0)

#define PIPALI_LOG_DEBUG(tag, msg) PIPALI_LOG(::pipali::utils::LogLevel::DEBUG, tag, msg)
#define PIPALI_LOG_INFO(tag, msg) PIPALI_LOG(::pipali::utils::LogLevel::INFO, tag, msg)
#define PIPALI_LOG_WARNING(tag, msg) PIPALI_LOG(::pipali::utils::LogLevel::WARNING, tag, msg)
#define PIPALI_LOG_ERROR(tag, msg) PIPALI_LOG(::pipali::utils::LogLevel::ERROR, tag, msg)
