#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences for plain (non-dashboard) output
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

// Section header with a blank line on each side
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Usage row: command in blue, description dimmed
inline std::string usage(const std::string& cmd, const std::string& desc) {
    return color::BLUE + fmt::format("    {:<24}", cmd) + color::RESET
         + color::DIM + desc + color::RESET + "\n";
}

} // namespace theme
