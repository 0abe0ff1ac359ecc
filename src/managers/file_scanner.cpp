#include "file_scanner.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <system_error>

FileScanner::FileScanner(const fs::path& root, const std::string& glob,
                         bool recursive, bool follow_symlinks)
    : root_(normalize(root)), glob_(glob),
      recursive_(recursive), follow_symlinks_(follow_symlinks) {
}

fs::path FileScanner::normalize(const fs::path& p) {
    std::error_code ec;
    fs::path abs = fs::absolute(p, ec);
    if (ec) abs = p;
    abs = abs.lexically_normal();
    // "/data/" -> "/data" so joined children have a single separator
    if (!abs.has_filename() && abs.has_parent_path() && abs != abs.root_path()) {
        abs = abs.parent_path();
    }
    return abs;
}

void FileScanner::exclude_dir(const fs::path& dir) {
    excluded_.push_back(normalize(dir));
}

bool FileScanner::is_excluded(const fs::path& dir) const {
    fs::path norm = normalize(dir);
    for (const auto& ex : excluded_) {
        if (norm == ex) return true;
    }
    return false;
}

void FileScanner::scan(const FileVisitor& on_file, const ErrorVisitor& on_error) const {
    auto report = [&](const fs::path& p, const std::string& msg) {
        log_warn(fmt::format("Scan error at {}: {}", p.string(), msg));
        if (on_error) on_error(ScanError{p.string(), msg});
    };

    std::string err;
    auto root_stat = platform::stat_path(root_, true, err);
    if (!root_stat) {
        report(root_, err);
        return;
    }
    if (!root_stat->is_directory) {
        report(root_, "not a directory");
        return;
    }

    // Real directories already entered, keyed by canonical path (cycle guard
    // for followed directory symlinks)
    std::set<std::string> visited;
    std::error_code ec;
    auto root_canon = fs::canonical(root_, ec);
    visited.insert(ec ? root_.string() : root_canon.string());

    std::vector<fs::path> pending{root_};

    while (!pending.empty()) {
        fs::path dir = pending.back();
        pending.pop_back();

        fs::directory_iterator it(dir, ec);
        if (ec) {
            report(dir, ec.message());
            continue;
        }

        for (; it != fs::directory_iterator(); it.increment(ec)) {
            if (ec) break;
            const fs::path entry_path = it->path();

            auto lst = platform::stat_path(entry_path, false, err);
            if (!lst) {
                // Vanished between listing and stat
                report(entry_path, err);
                continue;
            }

            platform::FileStat st = *lst;
            if (lst->is_symlink) {
                if (!follow_symlinks_) {
                    log_debug(fmt::format("Skipping symlink: {}", entry_path.string()));
                    continue;
                }
                auto target = platform::stat_path(entry_path, true, err);
                if (!target) {
                    report(entry_path, "broken symlink: " + err);
                    continue;
                }
                st = *target;
                st.is_symlink = true;
            }

            if (st.is_directory) {
                if (!recursive_ || is_excluded(entry_path)) continue;

                std::error_code canon_ec;
                auto canon = fs::canonical(entry_path, canon_ec);
                std::string key = canon_ec ? entry_path.string() : canon.string();
                if (!visited.insert(key).second) {
                    log_debug(fmt::format("Already visited {}, not descending again", entry_path.string()));
                    continue;
                }
                pending.push_back(entry_path);
                continue;
            }

            if (!st.is_regular) continue;

            if (!glob_.matches_relative(entry_path.lexically_relative(root_))) continue;

            FileRecord rec;
            rec.path = entry_path.string();
            rec.name = entry_path.filename().string();
            rec.size_bytes = st.size;
            rec.mtime = st.mtime;
            rec.is_symlink = st.is_symlink;
            on_file(rec);
        }

        if (ec) {
            report(dir, ec.message());
            ec.clear();
        }
    }
}

std::vector<FileRecord> FileScanner::collect(std::vector<ScanError>* errors) const {
    std::vector<FileRecord> files;
    scan([&](const FileRecord& rec) { files.push_back(rec); },
         [&](const ScanError& e) { if (errors) errors->push_back(e); });
    return files;
}
