#include <iostream>
#include <string>
#include <core/constants.hpp>
#include "cli/args.hpp"
#include "cli/forager_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        ParsedArgs args = parse_args(argc, argv);

        if (!args.error.empty()) {
            std::cout << theme::fail(args.error);
            std::cout << theme::step("Run 'forager --help' for the option list");
            return EXIT_USAGE;
        }
        if (args.version) {
            std::cout << theme::bold("forager") << theme::dim(std::string(" version ") + FORAGER_VERSION) << "\n";
            return EXIT_OK;
        }
        if (args.help) {
            std::cout << theme::banner(FORAGER_VERSION);
            print_usage();
            return EXIT_OK;
        }

        ForagerCLI cli;
        return cli.run(args);
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return EXIT_FAILURE_RUN;
    }
}
