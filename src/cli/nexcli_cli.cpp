#include "nexcli_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <iostream>

NexcliCLI::NexcliCLI() {
    register_all_commands();
}

void NexcliCLI::register_all_commands() {
    register_transfer_commands(*this);
    register_deps_commands(*this);

    add_command("version", [](BaseCLI& cli, const std::vector<std::string>&) {
        static_cast<NexcliCLI&>(cli).print_version();
        return 0;
    }, "version", "Show version");

    add_command("help", [](BaseCLI& cli, const std::vector<std::string>&) {
        cli.print_help();
        return 0;
    }, "help", "Show this help");
}

void NexcliCLI::print_version() const {
    std::cout << theme::paint(theme::color::TEAL + theme::color::BOLD, "nexcli")
              << theme::dim(std::string(" version ") + NEXCLI_VERSION) << "\n";
}
