#include "prune.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>

std::string prune_key(const fs::path& p) {
    return fs::absolute(p).lexically_normal().generic_string();
}

int prune_extra_files(const fs::path& root, const std::set<std::string>& keep,
                      const std::function<void(const fs::path&)>& on_deleted) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) return 0;

    std::vector<fs::path> doomed;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (!it->is_regular_file()) continue;
        if (keep.count(prune_key(it->path())) == 0) doomed.push_back(it->path());
    }
    if (ec) {
        throw FilesystemError(fmt::format("cannot walk {}: {}", root.string(), ec.message()));
    }

    int deleted = 0;
    for (const auto& path : doomed) {
        if (!fs::remove(path, ec) || ec) {
            throw FilesystemError(fmt::format("cannot delete {}: {}", path.string(), ec.message()));
        }
        nexcli_log(fmt::format("prune: deleted {}", path.string()));
        deleted++;
        if (on_deleted) on_deleted(path);
    }

    remove_empty_directories(root);
    return deleted;
}

int remove_empty_directories(const fs::path& root) {
    std::error_code ec;
    std::vector<fs::path> dirs;
    for (auto it = fs::recursive_directory_iterator(root, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) break;
        if (it->is_directory() && !it->is_symlink()) dirs.push_back(it->path());
    }

    // Deepest first so a parent empties after its children go
    std::sort(dirs.begin(), dirs.end(), [](const fs::path& a, const fs::path& b) {
        auto depth = [](const fs::path& p) { return std::distance(p.begin(), p.end()); };
        return depth(a) > depth(b);
    });

    int removed = 0;
    for (const auto& dir : dirs) {
        if (fs::is_empty(dir, ec) && !ec) {
            if (fs::remove(dir, ec)) {
                nexcli_log(fmt::format("prune: removed empty directory {}", dir.string()));
                removed++;
            }
        }
    }
    return removed;
}
