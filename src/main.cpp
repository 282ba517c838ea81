#include <iostream>
#include <vector>
#include <string>
#include "cli/nexcli_cli.hpp"
#include "cli/theme.hpp"
#include <platform/platform.hpp>

int main(int argc, char** argv) {
    theme::colors_enabled() = platform::stdout_is_tty();

    try {
        NexcliCLI cli;
        std::vector<std::string> args(argv + 1, argv + argc);

        if (args.size() == 1 && args[0] == "--version") {
            cli.print_version();
            return 0;
        }
        if (args.empty() || (args.size() == 1 && args[0] == "--help")) {
            cli.print_help();
            return args.empty() ? 1 : 0;
        }

        return cli.run(args);
    } catch (const std::exception& e) {
        std::cerr << theme::fail(std::string(e.what()));
        return 1;
    }
}
