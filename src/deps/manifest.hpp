#pragma once

#include <map>
#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// ── [defaults] ──────────────────────────────────────────────

struct ManifestDefaults {
    std::string url;
    std::string repository;
    std::string checksum = "sha256";
    std::string output_dir = "./local";
};

// ── One [name] section ──────────────────────────────────────

struct Dependency {
    std::string name;
    std::string repository;
    std::string path_template;
    std::string version;
    ChecksumAlgorithm checksum_algorithm = ChecksumAlgorithm::SHA256;
    std::string output_dir;
    std::string dest_override;
    bool recursive = false;
    std::string source_url;     // empty = defaults url, then the configured one

    // path_template with ${version} substituted
    std::string expanded_path() const;

    // dest_override when set, else output_dir/expanded_path (normalized)
    fs::path local_path() const;

    // Where a locked remote path lands on disk
    fs::path local_path_for(const std::string& remote_path) const;
};

struct Manifest {
    ManifestDefaults defaults;
    std::map<std::string, Dependency> dependencies;   // ordered by name
};

// Strict INI parser. Every problem is a ConfigurationError naming the
// section and key (or line) at fault.
Manifest parse_manifest(const std::string& text, const std::string& source_name = "deps.ini");
Manifest load_manifest(const fs::path& path);

// Template written by `deps init`.
std::string manifest_template();
void write_manifest_template(const fs::path& path);
