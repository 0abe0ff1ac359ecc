#pragma once

#include <string>
#include <cstdint>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Parse a byte size like "1048576", "512K", "100M", "1G", "1.5GB".
// Suffixes are binary (K = 1024). Returns -1 on parse failure.
int64_t parse_size_bytes(const std::string& size_str);

// Human-readable size: "512 B", "1.5 KiB", "3.2 GiB".
std::string format_bytes(int64_t bytes);

// Apply upload filename modifiers: "data.txt" + ("pre_", "_suf") -> "pre_data_suf.txt".
std::string apply_filename_modifiers(const std::string& filename,
                                     const std::string& prefix,
                                     const std::string& suffix);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
