#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct ParsedArgs {
    ConfigOverrides overrides;
    bool help = false;
    bool version = false;
    std::string error;          // non-empty: usage error, exit 2
};

// Hand-rolled long-option parser. Accepts "--flag value" and "--flag=value".
ParsedArgs parse_args(const std::vector<std::string>& args);
ParsedArgs parse_args(int argc, char** argv);

void print_usage();
