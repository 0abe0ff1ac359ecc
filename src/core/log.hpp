#pragma once

#include <string>
#include <filesystem>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
};

// Configure the run log. DEBUG lines are dropped unless debug is set.
// An empty file path disables the file sink (stderr only). The log file's
// directory is created if missing, so first-run lines are not lost.
void log_init(const std::filesystem::path& log_file, bool debug);

// Silence the stderr sink (tests).
void log_set_quiet(bool quiet);

// "2025-01-15T10:00:00 - INFO - message"
void forager_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { forager_log(LogLevel::DEBUG, msg); }
inline void log_info(const std::string& msg) { forager_log(LogLevel::INFO, msg); }
inline void log_warn(const std::string& msg) { forager_log(LogLevel::WARNING, msg); }
inline void log_error(const std::string& msg) { forager_log(LogLevel::ERROR, msg); }
