#include "time_utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cmath>
#include <ctime>

std::string iso_utc(double epoch_secs) {
    double whole = std::floor(epoch_secs);
    auto t = static_cast<std::time_t>(whole);
    long micros = std::lround((epoch_secs - whole) * 1e6);
    if (micros >= 1000000) {
        t += 1;
        micros -= 1000000;
    }

    struct tm tm_buf = {};
    gmtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);

    if (micros == 0) {
        return fmt::format("{}+00:00", buf);
    }
    return fmt::format("{}.{:06d}+00:00", buf, micros);
}

double now_epoch_secs() {
    auto now = std::chrono::system_clock::now();
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count();
    return static_cast<double>(us) / 1e6;
}

std::string now_iso_utc() {
    return iso_utc(now_epoch_secs());
}

int64_t epoch_to_ns(double epoch_secs) {
    return static_cast<int64_t>(std::llround(epoch_secs * 1e9));
}

std::string format_elapsed(double seconds) {
    if (seconds < 0) return "-";

    int total = static_cast<int>(seconds);
    int hours = total / 3600;
    int mins = (total % 3600) / 60;
    int secs = total % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
