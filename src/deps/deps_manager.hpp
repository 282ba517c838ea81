#pragma once

#include <string>
#include <filesystem>
#include <core/constants.hpp>
#include "lock_file.hpp"
#include "manifest.hpp"

namespace fs = std::filesystem;

class ClientFactory;
class Console;

// deps init | lock | sync | env, rooted at one project directory.
class DepsManager {
public:
    DepsManager(Console& console, const fs::path& project_dir);

    fs::path manifest_path() const { return project_dir_ / DEPS_MANIFEST_FILE; }
    fs::path lock_path() const { return project_dir_ / DEPS_LOCK_FILE; }
    fs::path env_path() const { return project_dir_ / DEPS_ENV_FILE; }

    void init();
    LockFile lock(ClientFactory& clients);

    // Download every locked file, verify it against the lock and, with
    // cleanup, delete untracked files under each output directory.
    // Returns the number of verified files.
    int sync(ClientFactory& clients, bool cleanup, int parallelism);

    void env();

private:
    Manifest load() const;
    fs::path resolve_local(const fs::path& p) const;

    void sync_one(ClientFactory& clients, const Dependency& dep, const LockedFiles& locked,
                  int parallelism);
    void verify_one(const Dependency& dep, const LockedFiles& locked);

    Console& console_;
    fs::path project_dir_;
};
