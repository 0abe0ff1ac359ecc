#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <managers/glob_matcher.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

const std::vector<std::string>& required_metadata_fields() {
    static const std::vector<std::string> fields = {
        "upload_name", "site", "sensor", "project", "creator"
    };
    return fields;
}

std::optional<SortKey> parse_sort_key(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "mtime") return SortKey::MTIME;
    if (lower == "name") return SortKey::NAME;
    return std::nullopt;
}

const char* sort_key_name(SortKey key) {
    return key == SortKey::NAME ? "name" : "mtime";
}

fs::path expand_user(const std::string& path) {
    if (path == "~") return platform::home_dir();
    if (path.rfind("~/", 0) == 0) return platform::home_dir() / path.substr(2);
    return fs::path(path);
}

fs::path default_state_dir(const std::string& source) {
    return expand_user(source) / STATE_DIR_NAME;
}

fs::path default_config_path(const std::string& source) {
    return default_state_dir(source) / CONFIG_FILE;
}

// ── Config file ─────────────────────────────────────────────

// max_file_size accepts a plain integer or a "512M" style string
static Result<int64_t> parse_max_size(const std::string& value) {
    int64_t n = parse_size_bytes(value);
    if (n < 0) {
        return Result<int64_t>::Err("Invalid max_file_size: '" + value + "'");
    }
    return Result<int64_t>::Ok(n);
}

static UploaderConfig parse_uploader_config(const YAML::Node& node, UploaderConfig u) {
    u.type = node["type"].as<std::string>(u.type);
    u.host = node["host"].as<std::string>(u.host);
    u.port = node["port"].as<int>(u.port);
    u.user = node["user"].as<std::string>(u.user);
    u.remote_dir = node["remote_dir"].as<std::string>(u.remote_dir);
    u.timeout = node["timeout"].as<int>(u.timeout);
    u.spool_dir = node["spool_dir"].as<std::string>(u.spool_dir);

    if (node["password"]) {
        u.password = node["password"].as<std::string>();
    }
    if (node["ssh_key_path"]) {
        u.ssh_key_path = node["ssh_key_path"].as<std::string>();
    }
    if (node["ssh_public_key_path"]) {
        u.ssh_public_key_path = node["ssh_public_key_path"].as<std::string>();
    }
    return u;
}

Result<RunConfig> Config::apply_file(const fs::path& path, RunConfig c) {
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<RunConfig>::Ok(c);
        }
        if (!root.IsMap()) {
            return Result<RunConfig>::Err(path.string() + ": top level must be a mapping");
        }

        c.source = root["source"].as<std::string>(c.source);
        c.glob = root["glob"].as<std::string>(c.glob);
        c.recursive = root["recursive"].as<bool>(c.recursive);
        c.follow_symlinks = root["follow_symlinks"].as<bool>(c.follow_symlinks);
        c.skip_last_n = root["skip_last_n"].as<int>(c.skip_last_n);
        c.num_files = root["num_files"].as<int>(c.num_files);
        c.sleep_secs = root["sleep"].as<double>(c.sleep_secs);
        c.delete_files = root["delete_files"].as<bool>(c.delete_files);
        c.dry_run = root["dry_run"].as<bool>(c.dry_run);
        c.debug = root["debug"].as<bool>(c.debug);
        c.prefix = root["prefix"].as<std::string>(c.prefix);
        c.suffix = root["suffix"].as<std::string>(c.suffix);
        c.state_dir = root["state_dir"].as<std::string>(c.state_dir);

        if (root["sort_key"]) {
            std::string key = root["sort_key"].as<std::string>();
            auto parsed = parse_sort_key(key);
            if (!parsed) {
                return Result<RunConfig>::Err("Invalid sort_key '" + key + "' (expected mtime or name)");
            }
            c.sort_key = *parsed;
        }

        if (root["max_file_size"]) {
            auto size = parse_max_size(root["max_file_size"].as<std::string>());
            if (size.is_err()) return Result<RunConfig>::Err(size.error);
            c.max_file_size = size.value;
        }

        if (root["uploader"]) {
            if (!root["uploader"].IsMap()) {
                return Result<RunConfig>::Err(path.string() + ": 'uploader' must be a mapping");
            }
            c.uploader = parse_uploader_config(root["uploader"], c.uploader);
        }

        return Result<RunConfig>::Ok(c);
    } catch (const YAML::Exception& e) {
        return Result<RunConfig>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

static void apply_overrides(const ConfigOverrides& o, RunConfig& c, std::string& error) {
    if (o.source) c.source = *o.source;
    if (o.glob) c.glob = *o.glob;
    if (o.recursive) c.recursive = *o.recursive;
    if (o.skip_last_n) c.skip_last_n = *o.skip_last_n;
    if (o.num_files) c.num_files = *o.num_files;
    if (o.sleep_secs) c.sleep_secs = *o.sleep_secs;
    if (o.prefix) c.prefix = *o.prefix;
    if (o.suffix) c.suffix = *o.suffix;
    if (o.dry_run) c.dry_run = *o.dry_run;
    if (o.delete_files) c.delete_files = *o.delete_files;
    if (o.follow_symlinks) c.follow_symlinks = *o.follow_symlinks;
    if (o.debug) c.debug = *o.debug;
    if (o.state_dir) c.state_dir = *o.state_dir;

    if (o.sort_key) {
        auto parsed = parse_sort_key(*o.sort_key);
        if (!parsed) {
            error = "Invalid --sort-key '" + *o.sort_key + "' (expected mtime or name)";
            return;
        }
        c.sort_key = *parsed;
    }
    if (o.max_file_size) {
        auto size = parse_max_size(*o.max_file_size);
        if (size.is_err()) {
            error = size.error;
            return;
        }
        c.max_file_size = size.value;
    }
}

// ── Validation ──────────────────────────────────────────────

Result<RunConfig> Config::finalize(RunConfig c) {
    if (c.source.empty()) {
        return Result<RunConfig>::Err("source directory is not set");
    }
    c.source = fs::absolute(expand_user(c.source)).lexically_normal().string();

    if (c.state_dir.empty()) {
        c.state_dir = (fs::path(c.source) / STATE_DIR_NAME).string();
    } else {
        c.state_dir = fs::absolute(expand_user(c.state_dir)).lexically_normal().string();
    }

    if (c.skip_last_n < 0) {
        return Result<RunConfig>::Err(fmt::format("skip_last_n must be >= 0 (got {})", c.skip_last_n));
    }
    if (c.num_files < 0) {
        return Result<RunConfig>::Err(fmt::format("num_files must be >= 0 (got {})", c.num_files));
    }
    if (c.sleep_secs < 0) {
        return Result<RunConfig>::Err(fmt::format("sleep must be >= 0 (got {})", c.sleep_secs));
    }
    if (c.max_file_size < 0) {
        return Result<RunConfig>::Err("max_file_size must be >= 0");
    }

    try {
        GlobMatcher check(c.glob);
    } catch (const std::invalid_argument& e) {
        return Result<RunConfig>::Err(fmt::format("Invalid glob '{}': {}", c.glob, e.what()));
    }

    auto& u = c.uploader;
    if (u.type == "directory") {
        if (u.spool_dir.empty()) {
            u.spool_dir = (fs::path(c.state_dir) / OUTBOX_DIR).string();
        } else {
            u.spool_dir = fs::absolute(expand_user(u.spool_dir)).lexically_normal().string();
        }
    } else if (u.type == "sftp") {
        if (u.port <= 0 || u.port > 65535) {
            return Result<RunConfig>::Err(fmt::format("uploader.port out of range: {}", u.port));
        }
        if (u.ssh_key_path) u.ssh_key_path = expand_user(*u.ssh_key_path).string();
        if (u.ssh_public_key_path) u.ssh_public_key_path = expand_user(*u.ssh_public_key_path).string();
    } else {
        return Result<RunConfig>::Err("Unknown uploader type '" + u.type + "' (expected directory or sftp)");
    }

    return Result<RunConfig>::Ok(c);
}

// ── Metadata ────────────────────────────────────────────────

Result<Metadata> load_metadata(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Metadata>::Err("Metadata file not found: " + path.string());
    }

    Metadata meta;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (!root.IsMap()) {
            return Result<Metadata>::Err(path.string() + ": expected a mapping of metadata fields");
        }
        for (const auto& kv : root) {
            std::string key = kv.first.as<std::string>();
            if (!kv.second.IsScalar()) {
                return Result<Metadata>::Err(fmt::format("{}: field '{}' must be a string", path.string(), key));
            }
            meta[key] = kv.second.as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        return Result<Metadata>::Err(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }

    for (const auto& field : required_metadata_fields()) {
        auto it = meta.find(field);
        if (it == meta.end() || it->second.empty()) {
            return Result<Metadata>::Err(fmt::format("{}: required field '{}' is missing", path.string(), field));
        }
    }
    return Result<Metadata>::Ok(meta);
}

// ── Load ────────────────────────────────────────────────────

Result<Config> Config::load(const ConfigOverrides& overrides) {
    Config config;
    RunConfig run;

    // The default config file lives under the source, so resolve it first
    std::string source = overrides.source.value_or(run.source);
    fs::path file;
    if (overrides.config_path) {
        file = expand_user(*overrides.config_path);
        if (!fs::exists(file)) {
            return Result<Config>::Err("Config file not found: " + file.string());
        }
    } else if (overrides.state_dir && fs::exists(expand_user(*overrides.state_dir) / CONFIG_FILE)) {
        file = expand_user(*overrides.state_dir) / CONFIG_FILE;
    } else if (fs::exists(default_config_path(source))) {
        file = default_config_path(source);
    }

    if (!file.empty()) {
        auto applied = apply_file(file, run);
        if (applied.is_err()) return Result<Config>::Err(applied.error);
        run = applied.value;
        config.config_file_ = file;
    }

    std::string override_error;
    apply_overrides(overrides, run, override_error);
    if (!override_error.empty()) {
        return Result<Config>::Err(override_error);
    }

    auto finalized = finalize(run);
    if (finalized.is_err()) return Result<Config>::Err(finalized.error);
    config.run_ = finalized.value;

    auto meta = load_metadata(config.state_dir() / METADATA_FILE);
    if (meta.is_err()) return Result<Config>::Err(meta.error);
    config.metadata_ = meta.value;

    return Result<Config>::Ok(config);
}
