#pragma once

#include "base_cli.hpp"

// Forward declarations for command registration
void register_transfer_commands(BaseCLI& cli);
void register_deps_commands(BaseCLI& cli);

class NexcliCLI : public BaseCLI {
public:
    NexcliCLI();

    void print_version() const;

private:
    void register_all_commands();
};
