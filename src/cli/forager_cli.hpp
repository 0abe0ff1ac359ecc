#pragma once

#include <string>
#include "args.hpp"

constexpr const char* FORAGER_VERSION = "0.4.0";

// Front end for one invocation: load config, run a batch, print a summary.
class ForagerCLI {
public:
    // Returns the process exit code.
    int run(const ParsedArgs& args);

private:
    void print_summary(const RunStats& stats, bool dry_run) const;
};
