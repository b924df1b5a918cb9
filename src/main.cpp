#include <iostream>
#include <vector>
#include <string>
#include "cli/termhop_cli.hpp"
#include "cli/theme.hpp"

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        auto options = parse_cli_args(args);
        if (options.is_err()) {
            std::cerr << theme::fail(options.error.message);
            TermhopCLI::print_usage();
            return 1;
        }
        if (args.empty()) {
            TermhopCLI::print_usage();
            return 1;
        }

        TermhopCLI cli(options.value);
        return cli.run();
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
