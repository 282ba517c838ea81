#pragma once

#include <set>
#include <string>
#include <vector>
#include <functional>
#include <filesystem>

namespace fs = std::filesystem;

// Normalized absolute form used as the key of a keep-set.
std::string prune_key(const fs::path& p);

// Delete every regular file under root whose prune_key() is not in `keep`,
// then remove directories left empty, deepest first. The root itself is
// never removed. `on_deleted` sees each deleted file. Returns the number of
// files deleted.
int prune_extra_files(const fs::path& root, const std::set<std::string>& keep,
                      const std::function<void(const fs::path&)>& on_deleted = nullptr);

// Remove empty directories below root, deepest first. Returns how many.
int remove_empty_directories(const fs::path& root);
