#include "deps_manager.hpp"
#include "env_file.hpp"
#include "resolver.hpp"
#include <transfer/checksum.hpp>
#include <transfer/downloader.hpp>
#include <transfer/prune.hpp>
#include <nexus/repository_client.hpp>
#include <cli/console.hpp>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <map>
#include <set>

DepsManager::DepsManager(Console& console, const fs::path& project_dir)
    : console_(console), project_dir_(project_dir) {}

Manifest DepsManager::load() const {
    return load_manifest(manifest_path());
}

fs::path DepsManager::resolve_local(const fs::path& p) const {
    if (p.is_absolute()) return p.lexically_normal();
    return (project_dir_ / p).lexically_normal();
}

// ── init ────────────────────────────────────────────────────

void DepsManager::init() {
    write_manifest_template(manifest_path());
    console_.ok(fmt::format("Created {}", manifest_path().filename().string()));
}

// ── lock ────────────────────────────────────────────────────

LockFile DepsManager::lock(ClientFactory& clients) {
    Manifest manifest = load();
    Resolver resolver(clients);

    console_.step("Resolving dependencies");
    LockFile lock;
    size_t total = 0;
    for (const auto& [name, dep] : manifest.dependencies) {
        console_.info(fmt::format("[{}] {}/{} ({})", name, dep.repository, dep.expanded_path(),
                                  algorithm_name(dep.checksum_algorithm)));
        LockedFiles files = resolver.resolve(dep);
        console_.ok(fmt::format("Resolved {} file(s)", files.size()));
        total += files.size();
        lock.dependencies[name] = std::move(files);
    }

    write_lock_file(lock_path(), lock);
    console_.result(fmt::format("Dependencies resolved: {}, total files: {}, lock file: {}",
                                manifest.dependencies.size(), total,
                                lock_path().filename().string()));
    return lock;
}

// ── sync ────────────────────────────────────────────────────

void DepsManager::sync_one(ClientFactory& clients, const Dependency& dep, const LockedFiles& locked,
                           int parallelism) {
    auto client = clients.client_for(dep.source_url);

    // Current download URLs for the locked paths
    std::map<std::string, RemoteAsset> remote;
    if (dep.recursive) {
        std::string prefix = dep.expanded_path();
        while (!prefix.empty() && prefix.back() == '/') prefix.pop_back();
        for (auto& a : client->search_assets(dep.repository, prefix)) {
            remote[a.path] = std::move(a);
        }
    } else {
        for (const auto& [path, entry] : locked) {
            remote[path] = client->get_asset_by_path(dep.repository, path);
        }
    }

    std::vector<PlannedDownload> plan;
    for (const auto& [path, entry] : locked) {
        auto it = remote.find(path);
        if (it == remote.end()) {
            throw NexcliError(fmt::format(
                "locked file {} of {} is no longer in repository '{}' (run 'nexcli deps lock')",
                path, dep.name, dep.repository));
        }
        PlannedDownload p;
        p.asset = it->second;
        p.local_path = resolve_local(dep.local_path_for(path));
        p.display_path = path;
        plan.push_back(std::move(p));
    }

    TransferOptions options;
    options.checksum = dep.checksum_algorithm;
    options.parallelism = parallelism;

    Downloader downloader(*client, options, console_);
    TransferReport report = downloader.download_planned(plan, dep.repository + "/" + dep.expanded_path());
    if (!report.summary.ok()) {
        throw NexcliError(fmt::format("{} file(s) of {} failed to download",
                                      report.summary.failed, dep.name));
    }
}

void DepsManager::verify_one(const Dependency& dep, const LockedFiles& locked) {
    for (const auto& [path, entry] : locked) {
        std::string alg_name, expected;
        split_lock_checksum(entry, alg_name, expected);
        ChecksumAlgorithm alg = parse_checksum_algorithm(alg_name);

        fs::path local = resolve_local(dep.local_path_for(path));
        std::string actual = digest_file(local, alg);
        if (to_lower(actual) != to_lower(expected)) {
            throw IntegrityError(fmt::format("checksum mismatch for {}: expected {}, got {}",
                                             local.string(), expected, actual));
        }
        console_.detail(fmt::format("verified {}", path));
    }
}

int DepsManager::sync(ClientFactory& clients, bool cleanup, int parallelism) {
    Manifest manifest = load();
    LockFile lock = load_lock_file(lock_path());

    // Every dependency must be locked before anything is downloaded
    for (const auto& [name, dep] : manifest.dependencies) {
        lock.files_for(name);
    }

    std::map<std::string, std::set<std::string>> tracked;   // output dir -> keep set
    int verified = 0;

    console_.step("Syncing dependencies");
    for (const auto& [name, dep] : manifest.dependencies) {
        const LockedFiles& locked = lock.files_for(name);
        console_.info(fmt::format("[{}] {} file(s) into {}", name, locked.size(), dep.output_dir));

        sync_one(clients, dep, locked, parallelism);
        verify_one(dep, locked);
        verified += static_cast<int>(locked.size());

        auto& keep = tracked[prune_key(resolve_local(dep.output_dir))];
        for (const auto& [path, entry] : locked) {
            keep.insert(prune_key(resolve_local(dep.local_path_for(path))));
        }
    }

    if (cleanup) {
        int deleted = 0;
        for (const auto& [dir, keep] : tracked) {
            if (!fs::exists(dir)) continue;
            deleted += prune_extra_files(dir, keep, [&](const fs::path& p) {
                console_.detail(fmt::format("Deleted untracked file: {}", p.string()));
            });
        }
        if (deleted > 0) {
            console_.info(fmt::format("Cleaned up {} untracked file(s)", deleted));
        }
    }

    console_.result(fmt::format("Dependencies synced: {}, files verified: {}, all checksums valid",
                                manifest.dependencies.size(), verified));
    return verified;
}

// ── env ─────────────────────────────────────────────────────

void DepsManager::env() {
    Manifest manifest = load();
    write_env_file(env_path(), manifest);
    console_.ok(fmt::format("Generated {}", env_path().filename().string()));
}
