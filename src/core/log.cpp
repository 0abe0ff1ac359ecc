#include "log.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <fstream>
#include <iostream>

namespace {

struct LogState {
    std::string file_path;
    bool debug = false;
    bool quiet = false;
};

LogState& state() {
    static LogState s;
    return s;
}

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
    }
    return "INFO";
}

} // namespace

void log_init(const std::filesystem::path& log_file, bool debug) {
    state().file_path = log_file.string();
    state().debug = debug;

    if (log_file.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(log_file.parent_path(), ec);
        if (ec) {
            forager_log(LogLevel::WARNING, fmt::format("Cannot create log directory {}: {}",
                                                       log_file.parent_path().string(), ec.message()));
        }
    }
}

void log_set_quiet(bool quiet) {
    state().quiet = quiet;
}

void forager_log(LogLevel level, const std::string& msg) {
    const auto& s = state();
    if (level == LogLevel::DEBUG && !s.debug) return;

    std::string line = fmt::format("{} - {} - {}\n", now_iso(), level_name(level), msg);

    if (!s.quiet) {
        std::cerr << line;
    }

    if (!s.file_path.empty()) {
        std::ofstream out(s.file_path, std::ios::app);
        if (out) out << line;
    }
}
