#pragma once

#include <string>
#include <filesystem>
#include "manifest.hpp"

namespace fs = std::filesystem;

// "my-lib" -> "MY_LIB"
std::string env_var_stem(const std::string& dependency_name);

// DEPS_<NAME>_NAME / _VERSION / _PATH lines, sorted by dependency name.
std::string render_env_file(const Manifest& manifest);
void write_env_file(const fs::path& path, const Manifest& manifest);
