#pragma once

#include <string>
#include <regex>
#include <filesystem>

namespace fs = std::filesystem;

// Shell-style glob compiled to an anchored regex.
//
// Supported syntax:
//   *        any run of characters except '/'
//   **       any run of characters including '/' ("**/" also matches zero dirs)
//   ?        one character except '/'
//   [abc]    character class, [!abc] or [^abc] negated
//   {a,b}    brace alternation, may nest and may contain other wildcards
//   \x       literal x
//
// A pattern without '/' is matched against a file's base name; a pattern
// with '/' is matched against the path relative to the scan root.
// An empty pattern matches everything.
class GlobMatcher {
public:
    GlobMatcher() = default;

    // Throws std::invalid_argument if the pattern cannot be compiled.
    explicit GlobMatcher(const std::string& pattern);

    // Match a single string (base name or relative path, caller decides).
    bool matches(const std::string& text) const;

    // Match a file given its path relative to the scan root.
    bool matches_relative(const fs::path& rel_path) const;

    bool empty() const { return pattern_.empty(); }
    bool is_path_pattern() const { return path_pattern_; }
    const std::string& pattern() const { return pattern_; }

    static std::string glob_to_regex(const std::string& glob);

private:
    std::string pattern_;
    bool path_pattern_ = false;
    std::regex re_;
};
