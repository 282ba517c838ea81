#pragma once

#include <string>
#include <map>
#include <memory>
#include <vector>
#include <functional>
#include <core/config.hpp>
#include "arguments.hpp"
#include "console.hpp"

class ClientFactory;

class BaseCLI {
public:
    BaseCLI();
    virtual ~BaseCLI() = default;

    // Handlers get the tokens after the command name and return an exit code.
    using CommandHandler = std::function<int(BaseCLI&, const std::vector<std::string>&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& usage,
                    const std::string& help);

    // Parse global flags, then dispatch. Errors are printed, not thrown.
    int run(const std::vector<std::string>& args);

    int execute_command(const std::string& command, const std::vector<std::string>& args);
    void print_help() const;

    // Global flags accepted before or after the command name
    static const std::vector<FlagSpec>& global_flags();

    // Fold global flags found in a command's own argument list into the
    // current overrides and verbosity.
    void apply_global_flags(const Arguments& args);

    // Resolved configuration; ConfigurationError when it cannot be loaded.
    const Config& config();
    Console& console();
    ClientFactory& clients();

    // Replace the HTTP client factory (tests).
    void set_client_factory(std::shared_ptr<ClientFactory> factory);

    ConfigOverrides overrides;
    Verbosity verbosity = Verbosity::Normal;

protected:
    struct Command {
        CommandHandler handler;
        std::string usage;
        std::string help;
    };
    std::map<std::string, Command> commands_;

private:
    std::unique_ptr<Config> config_;
    std::unique_ptr<Console> console_;
    std::shared_ptr<ClientFactory> clients_;
};
