#include "key_template.hpp"
#include "checksum.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

std::string apply_key_template(const std::string& path, const std::filesystem::path& key_file) {
    if (key_file.empty()) return path;

    if (path.find("{key}") == std::string::npos) {
        throw ConfigurationError(
            "when --key-from is specified, the path must contain the {key} template placeholder");
    }

    std::string key;
    try {
        key = digest_file(key_file, ChecksumAlgorithm::SHA256);
    } catch (const FilesystemError& e) {
        throw ConfigurationError(fmt::format("failed to compute key from file {}: {}",
                                             key_file.string(), e.what()));
    }

    std::string result = replace_all(path, "{key}", key);
    nexcli_log(fmt::format("key template: {} -> {}", path, result));
    return result;
}
