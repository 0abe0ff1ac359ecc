#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>
#include <core/constants.hpp>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

// A file found by the scanner. Built fresh on every scan, never persisted.
struct FileRecord {
    std::string path;               // absolute path, identity key
    std::string name;               // base name
    int64_t size_bytes = 0;
    double mtime = 0.0;             // seconds since epoch
    bool is_symlink = false;
};

enum class SortKey {
    MTIME,
    NAME,
};

// Configuration structures
struct UploaderConfig {
    std::string type = "directory";              // "directory" or "sftp"

    // sftp
    std::string host;
    int port = SFTP_DEFAULT_PORT;
    std::string user;
    std::optional<std::string> password;
    std::optional<std::string> ssh_key_path;
    std::optional<std::string> ssh_public_key_path;
    std::string remote_dir;
    int timeout = SSH_CONNECT_TIMEOUT_SECS;

    // directory
    std::string spool_dir;                       // default: <state_dir>/outbox
};

struct RunConfig {
    std::string source = DEFAULT_SOURCE;
    std::string glob;                            // empty = every file
    bool recursive = false;
    bool follow_symlinks = false;
    int64_t max_file_size = DEFAULT_MAX_FILE_SIZE;  // 0 = unlimited
    int skip_last_n = DEFAULT_SKIP_LAST_N;
    SortKey sort_key = SortKey::MTIME;
    int num_files = DEFAULT_NUM_FILES;           // 0 = no batch limit
    double sleep_secs = DEFAULT_SLEEP_SECS;
    bool delete_files = false;
    bool dry_run = false;
    bool debug = false;
    std::string prefix;
    std::string suffix;
    std::string state_dir;                       // default: <source>/.forager
    UploaderConfig uploader;
};

// Static upload metadata (metadata.yaml). Keys are ordered for stable output.
using Metadata = std::map<std::string, std::string>;

// Counters for one invocation
struct RunStats {
    int64_t files_scanned = 0;
    std::map<std::string, int64_t> skipped;      // reason -> count
    int64_t files_uploaded = 0;
    int64_t bytes_uploaded = 0;
    int64_t errors = 0;
    int64_t scan_errors = 0;
    int64_t dry_run_files = 0;
    bool interrupted = false;
    double elapsed_secs = 0.0;

    int64_t total_skipped() const {
        int64_t n = 0;
        for (const auto& [reason, count] : skipped) n += count;
        return n;
    }
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;

// Telemetry sink: topic is "status", "error" or "upload.stats"
using PublishCallback = std::function<void(const std::string& topic, const std::string& message)>;
