#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME, falling back to the temp dir).
std::filesystem::path home_dir();

// Returns the system temporary directory.
std::filesystem::path temp_dir();

// Sleep for the given number of milliseconds.
void sleep_ms(int ms);

// Result of a stat() call, with mtime at nanosecond resolution.
struct FileStat {
    int64_t size = 0;
    double mtime = 0.0;         // seconds since epoch
    bool is_regular = false;
    bool is_directory = false;
    bool is_symlink = false;    // only meaningful for lstat
};

// stat (follow=true) or lstat (follow=false). On failure returns nullopt and
// fills err with strerror(errno).
std::optional<FileStat> stat_path(const std::filesystem::path& p, bool follow, std::string& err);

// Append bytes to a file and force them to stable storage (write + fsync).
// Returns false with err filled on any failure.
bool durable_append(const std::filesystem::path& p, const std::string& data, std::string& err);

// Cut a file back to `length` bytes and fsync it. Returns false with err
// filled on any failure.
bool durable_truncate(const std::filesystem::path& p, uint64_t length, std::string& err);

// Install SIGINT/SIGTERM handlers that only raise a flag.
void install_interrupt_handlers();

// True once SIGINT/SIGTERM has been received.
bool interrupted();

// Test hook: set or clear the interrupt flag.
void set_interrupted(bool value);

} // namespace platform
