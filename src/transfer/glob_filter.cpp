#include "glob_filter.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <algorithm>
#include <fmt/format.h>

// Split on commas that are not inside a {a,b} group.
static std::vector<std::string> split_patterns(const std::string& s) {
    std::vector<std::string> out;
    std::string cur;
    int depth = 0;
    bool escape = false;
    for (char c : s) {
        if (escape) {
            cur += c;
            escape = false;
            continue;
        }
        if (c == '\\') escape = true;
        else if (c == '{') depth++;
        else if (c == '}' && depth > 0) depth--;
        else if (c == ',' && depth == 0) {
            out.push_back(cur);
            cur.clear();
            continue;
        }
        cur += c;
    }
    out.push_back(cur);
    return out;
}

static void append_literal(std::string& regex, char c) {
    static const std::string special = "\\^$.|?*+()[]{}";
    if (special.find(c) != std::string::npos) regex += '\\';
    regex += c;
}

GlobFilter::GlobFilter(const std::string& patterns) : source_(patterns) {
    for (auto pattern : split_patterns(patterns)) {
        trim(pattern);
        if (pattern.empty()) continue;

        bool negated = pattern[0] == '!';
        if (negated) pattern = pattern.substr(1);
        if (pattern.empty()) continue;

        std::string rx = glob_to_regex(pattern);
        Pattern p;
        p.text = pattern;
        try {
            p.re = std::regex(rx, std::regex::ECMAScript | std::regex::optimize);
        } catch (const std::regex_error& e) {
            throw ConfigurationError(fmt::format("invalid glob pattern '{}': {}", pattern, e.what()));
        }
        (negated ? exclude_ : include_).push_back(std::move(p));
    }
}

std::string GlobFilter::glob_to_regex(const std::string& glob) {
    std::string regex;
    int brace_depth = 0;
    const size_t n = glob.size();

    for (size_t i = 0; i < n; ++i) {
        char c = glob[i];

        if (c == '\\') {
            if (i + 1 >= n) {
                throw ConfigurationError(fmt::format("invalid glob pattern '{}': dangling escape", glob));
            }
            append_literal(regex, glob[++i]);
        } else if (c == '*') {
            if (i + 1 < n && glob[i + 1] == '*') {
                i++;
                if (i + 1 < n && glob[i + 1] == '/') {
                    // "**/" also matches zero directories
                    i++;
                    regex += "(?:.*/)?";
                } else {
                    regex += ".*";
                }
            } else {
                regex += "[^/]*";
            }
        } else if (c == '?') {
            regex += "[^/]";
        } else if (c == '/' && i + 3 == n && glob[i + 1] == '*' && glob[i + 2] == '*') {
            // trailing "/**" matches the directory itself too
            regex += "(?:/.*)?";
            i += 2;
        } else if (c == '[') {
            size_t j = i + 1;
            bool negate = false;
            if (j < n && (glob[j] == '!' || glob[j] == '^')) {
                negate = true;
                j++;
            }
            std::string cls;
            if (j < n && glob[j] == ']') {
                cls += "\\]";
                j++;
            }
            while (j < n && glob[j] != ']') {
                char k = glob[j];
                if (k == '\\') {
                    if (j + 1 >= n) break;
                    k = glob[++j];
                    cls += '\\';
                    cls += k;
                } else if (k == '[' || k == '^') {
                    cls += '\\';
                    cls += k;
                } else {
                    cls += k;
                }
                j++;
            }
            if (j >= n) {
                throw ConfigurationError(fmt::format("invalid glob pattern '{}': unclosed '['", glob));
            }
            regex += negate ? "[^/" + cls + "]" : "[" + cls + "]";
            i = j;
        } else if (c == '{') {
            brace_depth++;
            regex += "(?:";
        } else if (c == ',' && brace_depth > 0) {
            regex += "|";
        } else if (c == '}' && brace_depth > 0) {
            brace_depth--;
            regex += ")";
        } else {
            append_literal(regex, c);
        }
    }

    if (brace_depth > 0) {
        throw ConfigurationError(fmt::format("invalid glob pattern '{}': unclosed '{{'", glob));
    }
    return regex;
}

bool GlobFilter::matches(const std::string& relative_path) const {
    std::string path = relative_path;
    std::replace(path.begin(), path.end(), '\\', '/');

    bool included = include_.empty();
    for (const auto& p : include_) {
        if (std::regex_match(path, p.re)) {
            included = true;
            break;
        }
    }
    if (!included) return false;

    for (const auto& p : exclude_) {
        if (std::regex_match(path, p.re)) return false;
    }
    return true;
}

std::vector<FileTransferUnit> GlobFilter::collect_files(const fs::path& base) const {
    std::vector<FileTransferUnit> files;
    std::error_code ec;

    if (fs::is_regular_file(base, ec)) {
        if (!matches(base.filename().string())) return files;
        FileTransferUnit unit;
        unit.absolute_path = fs::absolute(base).string();
        unit.relative_path = base.filename().string();
        unit.size_bytes = static_cast<int64_t>(fs::file_size(base, ec));
        files.push_back(unit);
        return files;
    }

    if (!fs::is_directory(base, ec)) {
        throw FilesystemError(fmt::format("{}: no such file or directory", base.string()));
    }

    for (auto it = fs::recursive_directory_iterator(base, ec);
         it != fs::recursive_directory_iterator(); it.increment(ec)) {
        if (ec) {
            throw FilesystemError(fmt::format("{}: {}", base.string(), ec.message()));
        }
        if (!it->is_regular_file()) continue;

        std::string rel = relative_slash_path(it->path(), base);
        if (!matches(rel)) continue;

        FileTransferUnit unit;
        unit.absolute_path = fs::absolute(it->path()).string();
        unit.relative_path = rel;
        unit.size_bytes = static_cast<int64_t>(it->file_size());
        files.push_back(unit);
    }
    if (ec) {
        throw FilesystemError(fmt::format("{}: {}", base.string(), ec.message()));
    }

    // Sort for consistent ordering
    std::sort(files.begin(), files.end(),
              [](const FileTransferUnit& a, const FileTransferUnit& b) {
                  return a.relative_path < b.relative_path;
              });
    return files;
}
