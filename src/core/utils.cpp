#include "utils.hpp"
#include "errors.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace fs = std::filesystem;

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t pos = 0;
        int v = std::stoi(s, &pos);
        return pos == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string replace_all(std::string s, const std::string& from, const std::string& to) {
    if (from.empty()) return s;
    size_t pos = 0;
    while ((pos = s.find(from, pos)) != std::string::npos) {
        s.replace(pos, from.size(), to);
        pos += to.size();
    }
    return s;
}

std::string trim_leading_slashes(std::string s) {
    auto start = s.find_first_not_of('/');
    if (start == std::string::npos) return "";
    return s.substr(start);
}

std::string relative_slash_path(const fs::path& path, const fs::path& base) {
    return path.lexically_relative(base).generic_string();
}

bool parse_repository_path(const std::string& arg, std::string& repository, std::string& path) {
    auto slash = arg.find('/');
    if (slash == std::string::npos) return false;
    repository = arg.substr(0, slash);
    path = arg.substr(slash + 1);
    while (!path.empty() && path.back() == '/') path.pop_back();
    return !repository.empty();
}

std::string remote_relative_path(const std::string& asset_path, const std::string& base_path) {
    std::string p = trim_leading_slashes(asset_path);
    std::string base = trim_leading_slashes(base_path);
    while (!base.empty() && base.back() == '/') base.pop_back();
    if (!base.empty() && starts_with(p, base + "/")) {
        return p.substr(base.size() + 1);
    }
    return p;
}

fs::path contained_path(const fs::path& root, const std::string& relative, const char* what) {
    fs::path base = root.lexically_normal();
    if (!base.has_filename() && base.has_relative_path()) base = base.parent_path();

    fs::path target = (base / relative).lexically_normal();
    fs::path rel = target.lexically_relative(base);
    std::string first = rel.empty() ? std::string("..") : rel.begin()->string();
    if (first == "..") {
        throw PathTraversalError(fmt::format("{} '{}' escapes {}", what, relative, root.string()));
    }
    return target;
}

bool has_archive_suffix(const std::string& name) {
    return ends_with(name, ".tar.gz") || ends_with(name, ".tar.zst") || ends_with(name, ".zip");
}

std::string format_bytes(int64_t bytes) {
    const int64_t unit = 1024;
    if (bytes < unit) return fmt::format("{} B", bytes);
    int64_t div = unit;
    int exp = 0;
    for (int64_t n = bytes / unit; n >= unit; n /= unit) {
        div *= unit;
        exp++;
    }
    return fmt::format("{:.1f} {}iB", static_cast<double>(bytes) / static_cast<double>(div),
                       "KMGTPE"[exp]);
}

std::string format_duration(double seconds) {
    if (seconds < 1.0) return fmt::format("{:.0f}ms", seconds * 1000.0);
    if (seconds < 60.0) return fmt::format("{:.1f}s", seconds);
    if (seconds < 3600.0) return fmt::format("{:.1f}m", seconds / 60.0);
    return fmt::format("{:.1f}h", seconds / 3600.0);
}
