#include "manifest.hpp"
#include <transfer/checksum.hpp>
#include <core/constants.hpp>
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <set>
#include <sstream>
#include <vector>

std::string Dependency::expanded_path() const {
    return replace_all(path_template, "${version}", version);
}

fs::path Dependency::local_path() const {
    if (!dest_override.empty()) return fs::path(dest_override).lexically_normal();
    return (fs::path(output_dir) / trim_leading_slashes(expanded_path())).lexically_normal();
}

fs::path Dependency::local_path_for(const std::string& remote_path) const {
    if (!dest_override.empty() && !recursive) return fs::path(dest_override).lexically_normal();
    if (!dest_override.empty()) {
        std::string base = trim_leading_slashes(expanded_path());
        while (!base.empty() && base.back() == '/') base.pop_back();
        return contained_path(dest_override, remote_relative_path(remote_path, base), "locked file");
    }
    return contained_path(output_dir, trim_leading_slashes(remote_path), "locked file");
}

namespace {

const std::set<std::string> DEFAULTS_KEYS = {"url", "repository", "checksum", "output_dir"};
const std::set<std::string> DEPENDENCY_KEYS = {
    "repository", "path", "version", "checksum", "output_dir", "dest", "recursive", "url"};

void validate_output_dir(const std::string& value, const std::string& section) {
    if (value.empty()) {
        throw ConfigurationError(fmt::format("[{}] output_dir cannot be empty", section));
    }
    std::string clean = fs::path(value).lexically_normal().generic_string();
    while (clean.size() > 1 && clean.back() == '/') clean.pop_back();
    if (clean == "." || clean.empty()) {
        throw ConfigurationError(fmt::format(
            "[{}] output_dir cannot be '.' (current directory) for safety reasons", section));
    }
    if (clean == "/") {
        throw ConfigurationError(fmt::format(
            "[{}] output_dir cannot be '/' (root directory) for safety reasons", section));
    }
}

// Raw key/value pairs of one section, in file order
struct RawSection {
    std::string name;
    int line = 0;
    std::map<std::string, std::string> values;
};

ChecksumAlgorithm checksum_for(const std::string& value, const std::string& section) {
    try {
        return parse_checksum_algorithm(value);
    } catch (const ConfigurationError&) {
        throw ConfigurationError(fmt::format(
            "[{}] unknown checksum algorithm '{}' (expected sha1, sha256, sha512 or md5)",
            section, value));
    }
}

}  // namespace

Manifest parse_manifest(const std::string& text, const std::string& source_name) {
    std::vector<RawSection> sections;
    std::set<std::string> seen;

    std::istringstream in(text);
    std::string raw;
    int line_no = 0;
    while (std::getline(in, raw)) {
        line_no++;
        std::string line = raw;
        trim(line);
        if (line.empty() || line[0] == ';' || line[0] == '#') continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                throw ConfigurationError(fmt::format(
                    "{}:{}: malformed section header '{}'", source_name, line_no, line));
            }
            std::string name = line.substr(1, line.size() - 2);
            trim(name);
            if (name.empty()) {
                throw ConfigurationError(fmt::format("{}:{}: empty section name", source_name, line_no));
            }
            if (!seen.insert(name).second) {
                throw ConfigurationError(fmt::format(
                    "{}:{}: duplicate section [{}]", source_name, line_no, name));
            }
            sections.push_back(RawSection{name, line_no, {}});
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigurationError(fmt::format(
                "{}:{}: expected 'key = value', got '{}'", source_name, line_no, line));
        }
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);
        if (key.empty()) {
            throw ConfigurationError(fmt::format("{}:{}: missing key before '='", source_name, line_no));
        }
        if (sections.empty()) {
            throw ConfigurationError(fmt::format(
                "{}:{}: key '{}' appears outside any section", source_name, line_no, key));
        }

        RawSection& current = sections.back();
        const auto& allowed = current.name == "defaults" ? DEFAULTS_KEYS : DEPENDENCY_KEYS;
        if (!allowed.count(key)) {
            throw ConfigurationError(fmt::format(
                "{}:{}: unknown key '{}' in section [{}]", source_name, line_no, key, current.name));
        }
        current.values[key] = value;
    }

    Manifest manifest;
    manifest.defaults.checksum = DEPS_DEFAULT_CHECKSUM;
    manifest.defaults.output_dir = DEPS_DEFAULT_OUTPUT;

    // Defaults first, wherever the section sits in the file
    for (const auto& s : sections) {
        if (s.name != "defaults") continue;
        auto get = [&](const char* key, std::string& target) {
            auto it = s.values.find(key);
            if (it != s.values.end()) target = it->second;
        };
        get("url", manifest.defaults.url);
        get("repository", manifest.defaults.repository);
        get("checksum", manifest.defaults.checksum);
        if (s.values.count("output_dir")) {
            validate_output_dir(s.values.at("output_dir"), "defaults");
            manifest.defaults.output_dir = s.values.at("output_dir");
        }
        checksum_for(manifest.defaults.checksum, "defaults");
    }

    for (const auto& s : sections) {
        if (s.name == "defaults") continue;
        const auto& v = s.values;
        auto value_or = [&](const char* key, const std::string& fallback) {
            auto it = v.find(key);
            return it != v.end() ? it->second : fallback;
        };

        Dependency dep;
        dep.name = s.name;
        dep.repository = value_or("repository", manifest.defaults.repository);
        dep.path_template = value_or("path", "");
        dep.version = value_or("version", "");
        dep.checksum_algorithm = checksum_for(value_or("checksum", manifest.defaults.checksum), s.name);
        dep.output_dir = value_or("output_dir", manifest.defaults.output_dir);
        dep.dest_override = value_or("dest", "");
        dep.source_url = value_or("url", manifest.defaults.url);

        std::string recursive = to_lower(value_or("recursive", "false"));
        if (recursive != "true" && recursive != "false") {
            throw ConfigurationError(fmt::format(
                "[{}] recursive must be 'true' or 'false', got '{}'", s.name, v.at("recursive")));
        }
        dep.recursive = recursive == "true";

        if (dep.path_template.empty()) {
            throw ConfigurationError(fmt::format(
                "dependency [{}] is missing required 'path' field", s.name));
        }
        if (dep.repository.empty()) {
            throw ConfigurationError(fmt::format(
                "dependency [{}] is missing 'repository' (not set in defaults or dependency)", s.name));
        }
        validate_output_dir(dep.output_dir, s.name);

        manifest.dependencies.emplace(dep.name, std::move(dep));
    }

    return manifest;
}

Manifest load_manifest(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError(fmt::format("failed to open {}", path.string()));
    }
    std::stringstream buf;
    buf << in.rdbuf();
    return parse_manifest(buf.str(), path.filename().string());
}

std::string manifest_template() {
    return R"([defaults]
url = http://localhost:8081
repository = libs
checksum = sha256
output_dir = ./local

[docs_folder]
path = docs/${version}/
version = 2025-10-15
recursive = true

[example_txt]
path = docs/example-${version}.txt
version = 1.0.0

[libfoo_tar]
path = thirdparty/libfoo-${version}.tar.gz
version = 1.2.3
checksum = sha512
)";
}

void write_manifest_template(const fs::path& path) {
    if (fs::exists(path)) {
        throw ConfigurationError(fmt::format("{} already exists", path.string()));
    }
    std::ofstream out(path);
    if (!out) {
        throw FilesystemError(fmt::format("failed to create {}", path.string()));
    }
    out << manifest_template();
}
