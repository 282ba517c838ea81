#include "env_file.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <fstream>

std::string env_var_stem(const std::string& dependency_name) {
    std::string stem = replace_all(dependency_name, "-", "_");
    std::transform(stem.begin(), stem.end(), stem.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return stem;
}

std::string render_env_file(const Manifest& manifest) {
    std::string out;
    for (const auto& [name, dep] : manifest.dependencies) {
        std::string stem = env_var_stem(name);
        out += fmt::format("DEPS_{}_NAME=\"{}\"\n", stem, name);
        out += fmt::format("DEPS_{}_VERSION=\"{}\"\n", stem, dep.version);
        out += fmt::format("DEPS_{}_PATH=\"{}\"\n", stem, dep.local_path().generic_string());
        out += "\n";
    }
    return out;
}

void write_env_file(const fs::path& path, const Manifest& manifest) {
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        throw FilesystemError(fmt::format("failed to create {}", path.string()));
    }
    out << render_env_file(manifest);
}
