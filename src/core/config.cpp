#include "config.hpp"
#include "constants.hpp"
#include "errors.hpp"
#include <transfer/checksum.hpp>
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_global_config_path() {
    return platform::home_dir() / ".nexcli" / "config.yaml";
}

Config::Config()
    : url_(DEFAULT_NEXUS_URL),
      username_(DEFAULT_NEXUS_USER),
      password_(DEFAULT_NEXUS_PASS),
      parallelism_(DEFAULT_PARALLELISM),
      checksum_(parse_checksum_algorithm(DEFAULT_CHECKSUM)) {}

Result<Config> Config::load_global(const fs::path& path) {
    Config config;
    if (!fs::exists(path)) {
        return Result<Config>::Ok(config);
    }

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(path.string() + ": expected a mapping at top level");
        }

        config.url_ = root["url"].as<std::string>(config.url_);
        config.username_ = root["username"].as<std::string>(config.username_);
        config.password_ = root["password"].as<std::string>(config.password_);
        config.parallelism_ = root["parallelism"].as<int>(config.parallelism_);
        if (root["checksum"]) {
            config.checksum_ = parse_checksum_algorithm(root["checksum"].as<std::string>());
        }
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), e.what()));
    } catch (const ConfigurationError& e) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), e.what()));
    }

    if (config.parallelism_ < 1) {
        return Result<Config>::Err(fmt::format("{}: parallelism must be at least 1", path.string()));
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const ConfigOverrides& overrides, const fs::path& path) {
    auto loaded = load_global(path);
    if (loaded.is_err()) return loaded;
    Config config = loaded.value;

    // Environment
    std::string env_url = platform::env_or_empty(ENV_NEXUS_URL);
    std::string env_user = platform::env_or_empty(ENV_NEXUS_USER);
    std::string env_pass = platform::env_or_empty(ENV_NEXUS_PASS);
    if (!env_url.empty()) config.url_ = env_url;
    if (!env_user.empty()) config.username_ = env_user;
    if (!env_pass.empty()) config.password_ = env_pass;

    // Flags
    if (overrides.url) config.url_ = *overrides.url;
    if (overrides.username) config.username_ = *overrides.username;
    if (overrides.password) config.password_ = *overrides.password;
    if (overrides.parallelism) {
        if (*overrides.parallelism < 1) {
            return Result<Config>::Err("--parallel must be at least 1");
        }
        config.parallelism_ = *overrides.parallelism;
    }
    if (overrides.checksum) {
        try {
            config.checksum_ = parse_checksum_algorithm(*overrides.checksum);
        } catch (const ConfigurationError& e) {
            return Result<Config>::Err(e.what());
        }
    }

    while (!config.url_.empty() && config.url_.back() == '/') config.url_.pop_back();
    if (config.url_.empty()) {
        return Result<Config>::Err("repository URL is empty");
    }
    return Result<Config>::Ok(config);
}

Result<Config> Config::load(const ConfigOverrides& overrides) {
    return load(overrides, get_global_config_path());
}
