#pragma once

#include <string>
#include <unistd.h>
#include <fmt/format.h>

namespace theme {

namespace color {
    const std::string GREEN     = "\033[92m";
    const std::string RED       = "\033[91m";
    const std::string YELLOW    = "\033[93m";
    const std::string CYAN      = "\033[36m";
    const std::string OLIVE     = "\033[38;2;128;128;64m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Colors only when stdout is a terminal; cron output stays plain
inline bool enabled() {
    static const bool tty = isatty(STDOUT_FILENO) != 0;
    return tty;
}

inline std::string paint(const std::string& c, const std::string& s) {
    return enabled() ? c + s + color::RESET : s;
}

inline std::string bold(const std::string& s)    { return paint(color::BOLD, s); }
inline std::string dim(const std::string& s)     { return paint(color::DIM, s); }
inline std::string green(const std::string& s)   { return paint(color::GREEN, s); }
inline std::string red(const std::string& s)     { return paint(color::RED, s); }
inline std::string yellow(const std::string& s)  { return paint(color::YELLOW, s); }

// ── Layout ──────────────────────────────────────────────

inline std::string banner(const std::string& version) {
    return "\n" + paint(color::OLIVE + color::BOLD, "  forager") + " "
         + dim("v" + version) + "\n"
         + dim("  incremental file upload") + "\n";
}

inline std::string section(const std::string& title) {
    return "\n" + paint(color::OLIVE + color::BOLD, "  " + title) + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return paint(color::GREEN, "    + ") + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "    x ") + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return paint(color::YELLOW, "    ! ") + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return paint(color::CYAN, "    ~ ") + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return paint(color::OLIVE, "    > ") + msg + "\n";
}

// Key-value row for the run summary
inline std::string kv(const std::string& key, const std::string& value) {
    return paint(color::DIM, fmt::format("    {:<22}", key)) + value + "\n";
}

} // namespace theme
