#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

namespace color {
    const std::string TEAL      = "\033[38;2;0;150;136m";
    const std::string SLATE     = "\033[38;2;96;125;139m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Off when stdout is not a terminal; main() decides once at startup.
inline bool& colors_enabled() {
    static bool enabled = true;
    return enabled;
}

inline std::string paint(const std::string& code, const std::string& s) {
    return colors_enabled() ? code + s + color::RESET : s;
}

// Shorthand wrappers
inline std::string teal(const std::string& s)    { return paint(color::TEAL, s); }
inline std::string dim(const std::string& s)     { return paint(color::DIM, s); }

// ── Layout ──────────────────────────────────────────────

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + paint(color::TEAL + color::BOLD, "  " + title) + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return paint(color::GREEN, "    + ") + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return paint(color::RED, "    x ") + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return paint(color::YELLOW, "    ! ") + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return paint(color::TEAL, "    ~ ") + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return paint(color::SLATE, "    > ") + msg + "\n";
}

// Subtle log line for internal status (dimmer than program output)
inline std::string log(const std::string& msg) {
    if (!colors_enabled()) return "    \xc2\xb7 " + msg + "\n";
    return "\033[38;2;80;80;80m    \xc2\xb7 " + msg + "\033[0m\n";
}

// Key-value row
inline std::string kv(const std::string& key, const std::string& value) {
    return paint(color::DIM, fmt::format("    {:<12}", key)) + value + "\n";
}

} // namespace theme
