#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <ctime>
#include <cctype>
#include <cmath>
#include <algorithm>
#include <filesystem>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int64_t parse_size_bytes(const std::string& size_str) {
    std::string s = size_str;
    trim(s);
    if (s.empty()) return -1;

    // Find where the numeric part ends
    size_t i = 0;
    while (i < s.size() && (std::isdigit(static_cast<unsigned char>(s[i])) || s[i] == '.')) {
        i++;
    }
    if (i == 0) return -1;

    double value;
    try {
        value = std::stod(s.substr(0, i));
    } catch (const std::exception&) {
        return -1;
    }

    std::string suffix = s.substr(i);
    trim(suffix);
    std::transform(suffix.begin(), suffix.end(), suffix.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    double multiplier;
    if (suffix.empty() || suffix == "B") {
        multiplier = 1.0;
    } else if (suffix == "K" || suffix == "KB" || suffix == "KIB") {
        multiplier = 1024.0;
    } else if (suffix == "M" || suffix == "MB" || suffix == "MIB") {
        multiplier = 1024.0 * 1024;
    } else if (suffix == "G" || suffix == "GB" || suffix == "GIB") {
        multiplier = 1024.0 * 1024 * 1024;
    } else if (suffix == "T" || suffix == "TB" || suffix == "TIB") {
        multiplier = 1024.0 * 1024 * 1024 * 1024;
    } else {
        return -1;
    }

    return static_cast<int64_t>(std::llround(value * multiplier));
}

std::string format_bytes(int64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    if (bytes < 1024) return fmt::format("{} B", bytes);

    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        unit++;
    }
    return fmt::format("{:.1f} {}", value, units[unit]);
}

std::string apply_filename_modifiers(const std::string& filename,
                                     const std::string& prefix,
                                     const std::string& suffix) {
    std::filesystem::path p(filename);
    // stem()/extension() treat a leading dot as part of the stem (".bashrc" has no extension)
    return prefix + p.stem().string() + suffix + p.extension().string();
}
