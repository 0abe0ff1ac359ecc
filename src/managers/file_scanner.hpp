#pragma once

#include <string>
#include <vector>
#include <set>
#include <functional>
#include <filesystem>
#include <core/types.hpp>
#include "glob_matcher.hpp"

namespace fs = std::filesystem;

// A directory (or file) the scanner could not read. Its subtree is simply
// absent from the results; the scan carries on with siblings.
struct ScanError {
    std::string path;
    std::string message;
};

class FileScanner {
public:
    using FileVisitor = std::function<void(const FileRecord&)>;
    using ErrorVisitor = std::function<void(const ScanError&)>;

    // Throws std::invalid_argument if glob does not compile.
    FileScanner(const fs::path& root, const std::string& glob,
                bool recursive, bool follow_symlinks);

    // Never descend into (or yield files from) this directory.
    void exclude_dir(const fs::path& dir);

    // Walk the tree, calling on_file for every matching regular file as it is
    // found. Every call re-reads the filesystem; nothing is cached.
    void scan(const FileVisitor& on_file, const ErrorVisitor& on_error = nullptr) const;

    // Convenience: run scan() and gather the results.
    std::vector<FileRecord> collect(std::vector<ScanError>* errors = nullptr) const;

    const fs::path& root() const { return root_; }

private:
    fs::path root_;
    GlobMatcher glob_;
    bool recursive_;
    bool follow_symlinks_;
    std::vector<fs::path> excluded_;

    bool is_excluded(const fs::path& dir) const;
    static fs::path normalize(const fs::path& p);
};
