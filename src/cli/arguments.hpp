#pragma once

#include <map>
#include <string>
#include <vector>

// One accepted flag. `short_name` is 0 when there is no single-dash form.
struct FlagSpec {
    std::string long_name;
    char short_name;
    bool takes_value;
};

// Small getopt-style parser: "--name value", "--name=value", "-x value",
// "-x", and "--" to end flag parsing. Unknown flags and missing values are
// ConfigurationErrors.
class Arguments {
public:
    // With stop_at_positional, parsing ends at the first positional token and
    // everything from there on is left in remaining().
    Arguments(const std::vector<std::string>& tokens, const std::vector<FlagSpec>& specs,
              bool stop_at_positional = false);

    bool has(const std::string& long_name) const { return values_.count(long_name) > 0; }
    std::string value(const std::string& long_name, const std::string& fallback = "") const;

    // Parsed as a positive integer; ConfigurationError otherwise.
    int int_value(const std::string& long_name, int fallback) const;

    const std::vector<std::string>& positionals() const { return positionals_; }
    const std::vector<std::string>& remaining() const { return remaining_; }

private:
    const FlagSpec* find_long(const std::string& name) const;
    const FlagSpec* find_short(char c) const;

    std::vector<FlagSpec> specs_;
    std::map<std::string, std::string> values_;
    std::vector<std::string> positionals_;
    std::vector<std::string> remaining_;
};
