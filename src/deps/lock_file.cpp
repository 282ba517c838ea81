#include "lock_file.hpp"
#include <core/errors.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

const LockedFiles& LockFile::files_for(const std::string& name) const {
    auto it = dependencies.find(name);
    if (it == dependencies.end()) {
        throw ConfigurationError(fmt::format(
            "dependency {} not found in lock file (out of sync, run 'nexcli deps lock')", name));
    }
    return it->second;
}

void split_lock_checksum(const std::string& entry, std::string& algorithm, std::string& digest) {
    auto colon = entry.find(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == entry.size()) {
        throw ConfigurationError(fmt::format("invalid checksum format in lock file: {}", entry));
    }
    algorithm = entry.substr(0, colon);
    digest = entry.substr(colon + 1);
}

std::string emit_lock_file(const LockFile& lock) {
    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "dependencies" << YAML::Value << YAML::BeginMap;
    for (const auto& [name, files] : lock.dependencies) {
        out << YAML::Key << YAML::DoubleQuoted << name << YAML::Value << YAML::BeginMap;
        for (const auto& [path, checksum] : files) {
            out << YAML::Key << YAML::DoubleQuoted << path
                << YAML::Value << YAML::DoubleQuoted << checksum;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::EndMap;
    return std::string(out.c_str()) + "\n";
}

LockFile parse_lock_file(const std::string& text) {
    LockFile lock;
    try {
        YAML::Node root = YAML::Load(text);
        if (root.IsNull()) return lock;
        YAML::Node deps = root["dependencies"];
        if (!deps) return lock;
        if (!deps.IsMap()) {
            throw ConfigurationError("lock file: 'dependencies' must be a mapping");
        }
        for (const auto& dep : deps) {
            auto name = dep.first.as<std::string>();
            LockedFiles& files = lock.dependencies[name];
            if (dep.second.IsNull()) continue;
            if (!dep.second.IsMap()) {
                throw ConfigurationError(fmt::format("lock file: entry '{}' must be a mapping", name));
            }
            for (const auto& f : dep.second) {
                files[f.first.as<std::string>()] = f.second.as<std::string>();
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigurationError(fmt::format("lock file: {}", e.what()));
    }
    return lock;
}

void write_lock_file(const fs::path& path, const LockFile& lock) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw FilesystemError(fmt::format("failed to create {}", path.string()));
    }
    out << emit_lock_file(lock);
    if (!out) {
        throw FilesystemError(fmt::format("failed to write {}", path.string()));
    }
}

LockFile load_lock_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError(fmt::format(
            "failed to open {} (run 'nexcli deps lock' first)", path.string()));
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return parse_lock_file(text);
}
