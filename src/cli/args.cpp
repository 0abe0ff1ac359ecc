#include "args.hpp"
#include "theme.hpp"
#include <iostream>

namespace {

// Numeric values must parse completely ("10x" is an error)
bool parse_int(const std::string& flag, const std::string& value, int& out, std::string& error) {
    try {
        size_t used = 0;
        int n = std::stoi(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        out = n;
        return true;
    } catch (const std::exception&) {
        error = flag + " expects an integer, got '" + value + "'";
        return false;
    }
}

bool parse_double(const std::string& flag, const std::string& value, double& out, std::string& error) {
    try {
        size_t used = 0;
        double d = std::stod(value, &used);
        if (used != value.size()) throw std::invalid_argument(value);
        out = d;
        return true;
    } catch (const std::exception&) {
        error = flag + " expects a number, got '" + value + "'";
        return false;
    }
}

} // namespace

ParsedArgs parse_args(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) args.emplace_back(argv[i]);
    return parse_args(args);
}

ParsedArgs parse_args(const std::vector<std::string>& args) {
    ParsedArgs out;
    auto& o = out.overrides;

    for (size_t i = 0; i < args.size(); ++i) {
        std::string flag = args[i];
        std::string value;
        bool has_inline = false;

        auto eq = flag.find('=');
        if (flag.rfind("--", 0) == 0 && eq != std::string::npos) {
            value = flag.substr(eq + 1);
            flag = flag.substr(0, eq);
            has_inline = true;
        }

        // Fetch the value for a flag that needs one
        auto take = [&](std::string& dst) -> bool {
            if (has_inline) {
                dst = value;
                return true;
            }
            if (i + 1 >= args.size()) {
                out.error = flag + " requires a value";
                return false;
            }
            dst = args[++i];
            return true;
        };

        std::string v;
        if (flag == "-h" || flag == "--help") {
            out.help = true;
        } else if (flag == "--version") {
            out.version = true;
        } else if (flag == "-r" || flag == "--recursive") {
            o.recursive = true;
        } else if (flag == "--dry-run") {
            o.dry_run = true;
        } else if (flag == "--delete-files") {
            o.delete_files = true;
        } else if (flag == "--transfer-symlinks") {
            o.follow_symlinks = true;
        } else if (flag == "--DEBUG" || flag == "--debug") {
            o.debug = true;
        } else if (flag == "--source") {
            if (!take(v)) break;
            o.source = v;
        } else if (flag == "--glob") {
            if (!take(v)) break;
            o.glob = v;
        } else if (flag == "--sort-key") {
            if (!take(v)) break;
            o.sort_key = v;
        } else if (flag == "--max-file-size") {
            if (!take(v)) break;
            o.max_file_size = v;
        } else if (flag == "--prefix") {
            if (!take(v)) break;
            o.prefix = v;
        } else if (flag == "--suffix") {
            if (!take(v)) break;
            o.suffix = v;
        } else if (flag == "--config") {
            if (!take(v)) break;
            o.config_path = v;
        } else if (flag == "--state-dir") {
            if (!take(v)) break;
            o.state_dir = v;
        } else if (flag == "--skip-last-file") {
            int n = 0;
            if (!take(v) || !parse_int(flag, v, n, out.error)) break;
            o.skip_last_n = n;
        } else if (flag == "--num-files") {
            int n = 0;
            if (!take(v) || !parse_int(flag, v, n, out.error)) break;
            o.num_files = n;
        } else if (flag == "--sleep") {
            double d = 0;
            if (!take(v) || !parse_double(flag, v, d, out.error)) break;
            o.sleep_secs = d;
        } else {
            out.error = "Unknown option: " + args[i];
            break;
        }
    }

    return out;
}

void print_usage() {
    std::cout << theme::section("Usage");
    std::cout << "    forager [options]\n";
    std::cout << theme::section("Selection");
    std::cout << theme::kv("--source DIR", "Directory to watch (default /data/)");
    std::cout << theme::kv("--glob PATTERN", "File name pattern, e.g. '*.{csv,json}'");
    std::cout << theme::kv("-r, --recursive", "Descend into subdirectories");
    std::cout << theme::kv("--skip-last-file N", "Hold back the N newest files (default 1)");
    std::cout << theme::kv("--sort-key KEY", "mtime (default) or name");
    std::cout << theme::kv("--max-file-size SZ", "Reject larger files, e.g. 512M (default 1G)");
    std::cout << theme::kv("--num-files N", "Batch size, 0 for no limit (default 10)");
    std::cout << theme::kv("--transfer-symlinks", "Follow symbolic links");
    std::cout << theme::section("Upload");
    std::cout << theme::kv("--sleep SECS", "Pause between uploads (default 3)");
    std::cout << theme::kv("--prefix STR", "Prepend to uploaded file names");
    std::cout << theme::kv("--suffix STR", "Append to uploaded file stems");
    std::cout << theme::kv("--delete-files", "Delete sources after a recorded upload");
    std::cout << theme::kv("--dry-run", "Show what would be uploaded, change nothing");
    std::cout << theme::section("General");
    std::cout << theme::kv("--config FILE", "YAML config (default <source>/.forager/config.yaml)");
    std::cout << theme::kv("--state-dir DIR", "Ledger and metadata location");
    std::cout << theme::kv("--DEBUG", "Verbose logging");
    std::cout << theme::kv("--version", "Show version");
    std::cout << theme::kv("--help", "Show this help");
    std::cout << "\n";
}
