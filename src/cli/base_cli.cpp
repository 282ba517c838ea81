#include "base_cli.hpp"
#include "theme.hpp"
#include <nexus/nexus_client.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <iostream>
#include <fmt/format.h>

BaseCLI::BaseCLI() = default;

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& usage,
                         const std::string& help) {
    commands_[name] = {handler, usage, help};
}

const std::vector<FlagSpec>& BaseCLI::global_flags() {
    static const std::vector<FlagSpec> flags = {
        {"url", 0, true},
        {"username", 0, true},
        {"password", 0, true},
        {"quiet", 'q', false},
        {"verbose", 'v', false},
        {"parallel", 0, true},
    };
    return flags;
}

void BaseCLI::apply_global_flags(const Arguments& args) {
    if (args.has("url")) overrides.url = args.value("url");
    if (args.has("username")) overrides.username = args.value("username");
    if (args.has("password")) overrides.password = args.value("password");
    if (args.has("parallel")) overrides.parallelism = args.int_value("parallel", DEFAULT_PARALLELISM);
    if (args.has("quiet")) verbosity = Verbosity::Quiet;
    if (args.has("verbose")) verbosity = Verbosity::Verbose;
}

int BaseCLI::run(const std::vector<std::string>& args) {
    try {
        Arguments globals(args, global_flags(), true);
        apply_global_flags(globals);

        const auto& rest = globals.remaining();
        if (rest.empty()) {
            print_help();
            return 1;
        }
        std::vector<std::string> command_args(rest.begin() + 1, rest.end());
        return execute_command(rest.front(), command_args);
    } catch (const NexcliError& e) {
        nexcli_log(fmt::format("fatal: {}", e.what()));
        std::cerr << theme::fail(e.what());
        return static_cast<int>(TransferStatus::Error);
    }
}

int BaseCLI::execute_command(const std::string& command, const std::vector<std::string>& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cerr << theme::fail("Unknown command: " + command);
        std::cerr << theme::step("Run 'nexcli help' for available commands.");
        return static_cast<int>(TransferStatus::Error);
    }

    nexcli_log(fmt::format("command: {} ({} args)", command, args.size()));
    try {
        return it->second.handler(*this, args);
    } catch (const NexcliError& e) {
        nexcli_log(fmt::format("{} failed: {}", command, e.what()));
        std::cerr << theme::fail(e.what());
        return static_cast<int>(TransferStatus::Error);
    }
}

void BaseCLI::print_help() const {
    std::cout << theme::section("Usage");
    for (const auto& [name, cmd] : commands_) {
        std::cout << "    " << theme::teal(fmt::format("nexcli {:<34}", cmd.usage))
                  << theme::dim(cmd.help) << "\n";
    }

    std::cout << theme::section("Global flags");
    std::cout << theme::kv("--url", "Nexus base URL (env NEXUS_URL)");
    std::cout << theme::kv("--username", "Nexus user (env NEXUS_USER)");
    std::cout << theme::kv("--password", "Nexus password (env NEXUS_PASS)");
    std::cout << theme::kv("--parallel", "Concurrent transfers (default 8)");
    std::cout << theme::kv("-q, --quiet", "Only errors and the final result");
    std::cout << theme::kv("-v, --verbose", "Per-file detail");
    std::cout << "\n";
}

const Config& BaseCLI::config() {
    if (!config_) {
        auto result = Config::load(overrides);
        if (result.is_err()) {
            throw ConfigurationError(result.error);
        }
        config_ = std::make_unique<Config>(result.value);
    }
    return *config_;
}

Console& BaseCLI::console() {
    if (!console_) {
        console_ = std::make_unique<Console>(verbosity);
    }
    return *console_;
}

ClientFactory& BaseCLI::clients() {
    if (!clients_) {
        const Config& cfg = config();
        clients_ = std::make_shared<NexusClientFactory>(cfg.url(), cfg.username(), cfg.password());
    }
    return *clients_;
}

void BaseCLI::set_client_factory(std::shared_ptr<ClientFactory> factory) {
    clients_ = std::move(factory);
}
