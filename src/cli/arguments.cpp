#include "arguments.hpp"
#include <core/errors.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

Arguments::Arguments(const std::vector<std::string>& tokens, const std::vector<FlagSpec>& specs,
                     bool stop_at_positional)
    : specs_(specs) {
    bool flags_done = false;
    for (size_t i = 0; i < tokens.size(); i++) {
        const std::string& tok = tokens[i];

        if (flags_done || tok.size() < 2 || tok[0] != '-') {
            if (stop_at_positional) {
                remaining_.assign(tokens.begin() + static_cast<long>(i), tokens.end());
                return;
            }
            positionals_.push_back(tok);
            continue;
        }
        if (tok == "--") {
            flags_done = true;
            continue;
        }

        const FlagSpec* spec = nullptr;
        std::string inline_value;
        bool has_inline = false;

        if (starts_with(tok, "--")) {
            std::string name = tok.substr(2);
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
                has_inline = true;
            }
            spec = find_long(name);
        } else if (tok.size() == 2) {
            spec = find_short(tok[1]);
        }

        if (!spec) {
            throw ConfigurationError(fmt::format("unknown flag '{}'", tok));
        }

        if (!spec->takes_value) {
            if (has_inline) {
                throw ConfigurationError(fmt::format("flag --{} does not take a value", spec->long_name));
            }
            values_[spec->long_name] = "true";
            continue;
        }

        if (has_inline) {
            values_[spec->long_name] = inline_value;
        } else if (i + 1 < tokens.size()) {
            values_[spec->long_name] = tokens[++i];
        } else {
            throw ConfigurationError(fmt::format("flag --{} requires a value", spec->long_name));
        }
    }
}

std::string Arguments::value(const std::string& long_name, const std::string& fallback) const {
    auto it = values_.find(long_name);
    return it != values_.end() ? it->second : fallback;
}

int Arguments::int_value(const std::string& long_name, int fallback) const {
    auto it = values_.find(long_name);
    if (it == values_.end()) return fallback;
    int v = safe_stoi(it->second, -1);
    if (v < 1) {
        throw ConfigurationError(fmt::format("--{} expects a positive integer, got '{}'",
                                             long_name, it->second));
    }
    return v;
}

const FlagSpec* Arguments::find_long(const std::string& name) const {
    for (const auto& s : specs_) {
        if (s.long_name == name) return &s;
    }
    return nullptr;
}

const FlagSpec* Arguments::find_short(char c) const {
    for (const auto& s : specs_) {
        if (s.short_name != 0 && s.short_name == c) return &s;
    }
    return nullptr;
}
