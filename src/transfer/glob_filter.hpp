#pragma once

#include <string>
#include <vector>
#include <regex>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Comma-separated include/exclude glob list ("**/*.go,!**/vendor/**").
// Patterns are matched against slash-separated paths relative to a base
// directory or remote folder.
class GlobFilter {
public:
    // Matches everything.
    GlobFilter() = default;

    // Throws ConfigurationError naming the pattern on malformed syntax.
    explicit GlobFilter(const std::string& patterns);

    bool matches(const std::string& relative_path) const;
    bool empty() const { return include_.empty() && exclude_.empty(); }
    const std::string& source() const { return source_; }

    // Walk base (a directory or a single regular file) and return every
    // matching regular file, sorted by relative path.
    std::vector<FileTransferUnit> collect_files(const fs::path& base) const;

    // Translate one glob into an anchored ECMAScript regex.
    static std::string glob_to_regex(const std::string& glob);

private:
    struct Pattern {
        std::string text;
        std::regex re;
    };

    std::string source_;
    std::vector<Pattern> include_;
    std::vector<Pattern> exclude_;
};
