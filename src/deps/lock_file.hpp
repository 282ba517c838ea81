#pragma once

#include <map>
#include <string>
#include <filesystem>

namespace fs = std::filesystem;

// dependency name -> (remote path -> "algorithm:digest")
using LockedFiles = std::map<std::string, std::string>;

struct LockFile {
    std::map<std::string, LockedFiles> dependencies;

    // Entries for `name`; throws ConfigurationError when the dependency is
    // missing ("out of sync").
    const LockedFiles& files_for(const std::string& name) const;
};

// Split "sha256:abcd" into its parts; ConfigurationError when malformed.
void split_lock_checksum(const std::string& entry, std::string& algorithm, std::string& digest);

// Serialized form. Names and paths are sorted and every scalar is
// double-quoted, so equal input gives byte-identical output.
std::string emit_lock_file(const LockFile& lock);
LockFile parse_lock_file(const std::string& text);

void write_lock_file(const fs::path& path, const LockFile& lock);
LockFile load_lock_file(const fs::path& path);
