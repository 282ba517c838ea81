#pragma once

#include <string>
#include <filesystem>

namespace platform {

// Returns the user's home directory (HOME on Unix, USERPROFILE on Windows).
std::filesystem::path home_dir();

// Returns the system temporary directory (/tmp on Unix, GetTempPath on Windows).
std::filesystem::path temp_dir();

// True when stdout is attached to a terminal.
bool stdout_is_tty();

// Terminal width in columns (80 when unknown).
int term_width();

// Value of an environment variable, or "" when unset.
std::string env_or_empty(const char* name);

} // namespace platform
