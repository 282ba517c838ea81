#pragma once

#include <string>
#include <filesystem>

// Replace every "{key}" in `path` with the sha256 hex digest of key_file.
// An empty key_file returns `path` unchanged. Throws ConfigurationError when
// key_file is given but `path` has no "{key}".
std::string apply_key_template(const std::string& path, const std::filesystem::path& key_file);
