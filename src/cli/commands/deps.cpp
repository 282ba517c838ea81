#include "../base_cli.hpp"
#include <deps/deps_manager.hpp>
#include <core/errors.hpp>
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;

static int cmd_deps(BaseCLI& cli, const std::vector<std::string>& tokens) {
    std::vector<FlagSpec> flags = BaseCLI::global_flags();
    flags.push_back({"no-cleanup", 0, false});

    Arguments args(tokens, flags);
    cli.apply_global_flags(args);

    const auto& pos = args.positionals();
    if (pos.size() != 1) {
        throw ConfigurationError("usage: nexcli deps init|lock|sync|env");
    }
    const std::string& sub = pos[0];
    if (args.has("no-cleanup") && sub != "sync") {
        throw ConfigurationError("--no-cleanup only applies to 'deps sync'");
    }

    DepsManager deps(cli.console(), fs::current_path());
    if (sub == "init") {
        deps.init();
    } else if (sub == "env") {
        deps.env();
    } else if (sub == "lock") {
        deps.lock(cli.clients());
    } else if (sub == "sync") {
        deps.sync(cli.clients(), !args.has("no-cleanup"), cli.config().parallelism());
    } else {
        throw ConfigurationError(fmt::format(
            "unknown deps command '{}' (expected init, lock, sync or env)", sub));
    }
    return 0;
}

void register_deps_commands(BaseCLI& cli) {
    cli.add_command("deps", cmd_deps, "deps init|lock|sync|env",
                    "Manage dependencies from deps.ini");
}
