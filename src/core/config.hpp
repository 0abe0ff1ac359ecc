#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Values given on the command line. Anything set here wins over the
// config file, which wins over the built-in defaults.
struct ConfigOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> source;
    std::optional<std::string> glob;
    std::optional<bool> recursive;
    std::optional<int> skip_last_n;
    std::optional<std::string> sort_key;
    std::optional<std::string> max_file_size;
    std::optional<int> num_files;
    std::optional<double> sleep_secs;
    std::optional<std::string> prefix;
    std::optional<std::string> suffix;
    std::optional<bool> dry_run;
    std::optional<bool> delete_files;
    std::optional<bool> follow_symlinks;
    std::optional<bool> debug;
    std::optional<std::string> state_dir;
};

class Config {
public:
    // defaults -> config file -> overrides, then validate and load
    // <state_dir>/metadata.yaml. Any problem is returned as Err before the
    // filesystem is scanned.
    static Result<Config> load(const ConfigOverrides& overrides = {});

    // Parse a config file on top of base. Exposed for tests.
    static Result<RunConfig> apply_file(const fs::path& path, RunConfig base);

    // Fill derived paths (state_dir, spool_dir), expand "~" and check every
    // value. Exposed for tests.
    static Result<RunConfig> finalize(RunConfig config);

    // Accessors
    const RunConfig& run() const { return run_; }
    const Metadata& metadata() const { return metadata_; }
    const fs::path& config_file() const { return config_file_; }

    fs::path state_dir() const { return fs::path(run_.state_dir); }

public:
    Config() = default;

private:
    RunConfig run_;
    Metadata metadata_;
    fs::path config_file_;     // empty when no file was read
};

// Metadata fields that must be present as strings in metadata.yaml.
const std::vector<std::string>& required_metadata_fields();

// Load metadata.yaml: a flat map of scalar values. Every required field must
// be present and non-empty.
Result<Metadata> load_metadata(const fs::path& path);

// "mtime" / "name" (case-insensitive)
std::optional<SortKey> parse_sort_key(const std::string& s);
const char* sort_key_name(SortKey key);

// Path helpers
fs::path expand_user(const std::string& path);
fs::path default_state_dir(const std::string& source);
fs::path default_config_path(const std::string& source);
