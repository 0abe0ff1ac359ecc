#include "glob_matcher.hpp"
#include <stdexcept>
#include <vector>

GlobMatcher::GlobMatcher(const std::string& pattern)
    : pattern_(pattern) {
    if (pattern_.empty()) return;

    std::string p = pattern_;
    // Leading "/" anchors at the root, which relative matching already does
    while (!p.empty() && p.front() == '/') p.erase(0, 1);
    path_pattern_ = p.find('/') != std::string::npos;

    try {
        re_ = std::regex(glob_to_regex(p));
    } catch (const std::regex_error& e) {
        throw std::invalid_argument("Invalid glob pattern '" + pattern_ + "': " + e.what());
    }
}

bool GlobMatcher::matches(const std::string& text) const {
    if (pattern_.empty()) return true;
    return std::regex_match(text, re_);
}

bool GlobMatcher::matches_relative(const fs::path& rel_path) const {
    if (pattern_.empty()) return true;

    if (path_pattern_) {
        std::string rel = rel_path.generic_string();
        return matches(rel);
    }
    return matches(rel_path.filename().string());
}

// Find the '}' closing the '{' at open, honouring nesting and escapes.
static size_t find_closing_brace(const std::string& glob, size_t open) {
    int depth = 0;
    for (size_t i = open; i < glob.length(); ++i) {
        char c = glob[i];
        if (c == '\\') {
            ++i;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            if (--depth == 0) return i;
        }
    }
    return std::string::npos;
}

// Split the body of a brace group on top-level commas.
static std::vector<std::string> split_alternatives(const std::string& body) {
    std::vector<std::string> parts;
    std::string current;
    int depth = 0;
    for (size_t i = 0; i < body.length(); ++i) {
        char c = body[i];
        if (c == '\\' && i + 1 < body.length()) {
            current += c;
            current += body[++i];
            continue;
        }
        if (c == '{') depth++;
        if (c == '}') depth--;
        if (c == ',' && depth == 0) {
            parts.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    parts.push_back(current);
    return parts;
}

static std::string translate(const std::string& glob) {
    std::string regex;

    for (size_t i = 0; i < glob.length(); ++i) {
        char c = glob[i];

        if (c == '\\') {
            if (i + 1 < glob.length()) {
                char next = glob[++i];
                if (std::string("\\^$.|?*+()[]{}/").find(next) != std::string::npos) regex += '\\';
                regex += next;
            } else {
                regex += "\\\\";
            }
        } else if (c == '*') {
            // Check for **
            if (i + 1 < glob.length() && glob[i + 1] == '*') {
                i++; // Skip next *
                if (i + 1 < glob.length() && glob[i + 1] == '/') {
                    regex += "(?:.*/)?";
                    i++; // Skip the slash
                } else {
                    regex += ".*";
                }
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '[') {
            size_t close = glob.find(']', i + 2);
            if (close == std::string::npos) {
                regex += "\\[";
                continue;
            }
            std::string body = glob.substr(i + 1, close - i - 1);
            regex += '[';
            size_t start = 0;
            if (!body.empty() && (body[0] == '!' || body[0] == '^')) {
                regex += '^';
                start = 1;
            }
            for (size_t k = start; k < body.size(); ++k) {
                if (body[k] == '\\' || body[k] == '[' || body[k] == ']') regex += '\\';
                regex += body[k];
            }
            regex += ']';
            i = close;
        } else if (c == '{') {
            size_t close = find_closing_brace(glob, i);
            if (close == std::string::npos) {
                regex += "\\{";
                continue;
            }
            auto alternatives = split_alternatives(glob.substr(i + 1, close - i - 1));
            regex += "(?:";
            for (size_t k = 0; k < alternatives.size(); ++k) {
                if (k > 0) regex += '|';
                regex += translate(alternatives[k]);
            }
            regex += ')';
            i = close;
        } else if (std::string("^$.|+()]}").find(c) != std::string::npos) {
            regex += '\\';
            regex += c;
        } else {
            regex += c;
        }
    }

    return regex;
}

std::string GlobMatcher::glob_to_regex(const std::string& glob) {
    return translate(glob);
}
