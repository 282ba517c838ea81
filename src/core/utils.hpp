#pragma once

#include <string>
#include <cstdint>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);
bool starts_with(const std::string& s, const std::string& prefix);
bool ends_with(const std::string& s, const std::string& suffix);

// Replace every occurrence of `from` in `s`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

// Strip leading slashes from a repository path.
std::string trim_leading_slashes(std::string s);

// Path relative to base, slash separated ("sub/file.txt").
std::string relative_slash_path(const std::filesystem::path& path,
                                const std::filesystem::path& base);

// Split "repository/folder/sub/" into {"repository", "folder/sub"}.
// Returns false if there is no '/' separator.
bool parse_repository_path(const std::string& arg, std::string& repository, std::string& path);

// Remote asset path relative to base_path; the asset path itself when base_path
// is empty or not a prefix. Leading slashes are dropped.
std::string remote_relative_path(const std::string& asset_path, const std::string& base_path);

// root/relative, normalized. Throws PathTraversalError when the result does
// not stay below root; `what` names the offending item in the message.
std::filesystem::path contained_path(const std::filesystem::path& root,
                                     const std::string& relative, const char* what);

// True when `name` carries one of the archive suffixes nexcli understands.
bool has_archive_suffix(const std::string& name);

// "1.5 MiB", "812 B"
std::string format_bytes(int64_t bytes);

// "320ms", "4.2s", "1.5m", "2.0h"
std::string format_duration(double seconds);
