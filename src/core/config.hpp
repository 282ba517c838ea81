#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Values given on the command line. Unset fields fall through to the
// environment, then ~/.nexcli/config.yaml, then built-in defaults.
struct ConfigOverrides {
    std::optional<std::string> url;
    std::optional<std::string> username;
    std::optional<std::string> password;
    std::optional<std::string> checksum;
    std::optional<int> parallelism;
};

class Config {
public:
    // Load ~/.nexcli/config.yaml (or `path`) on top of the built-in defaults.
    // A missing file is not an error.
    static Result<Config> load_global(const fs::path& path);

    // Full resolution: overrides > NEXUS_* environment > config file > defaults.
    static Result<Config> load(const ConfigOverrides& overrides,
                               const fs::path& path);
    static Result<Config> load(const ConfigOverrides& overrides);

    const std::string& url() const { return url_; }
    const std::string& username() const { return username_; }
    const std::string& password() const { return password_; }
    int parallelism() const { return parallelism_; }
    ChecksumAlgorithm checksum() const { return checksum_; }

    Config();

private:
    std::string url_;
    std::string username_;
    std::string password_;
    int parallelism_;
    ChecksumAlgorithm checksum_;
};

// ~/.nexcli/config.yaml
fs::path get_global_config_path();
