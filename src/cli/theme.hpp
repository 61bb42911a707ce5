#pragma once

#include <string>
#include <fmt/format.h>

namespace theme {

// ANSI escape sequences
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s)     { return color::DIM + s + color::RESET; }
inline std::string red(const std::string& s)     { return color::RED + s + color::RESET; }

// ── Layout ──────────────────────────────────────────────

inline std::string rule() {
    std::string line;
    for (int i = 0; i < 44; i++) line += "\xe2\x94\x80";
    return color::DIM + "  " + line + color::RESET + "\n";
}

inline std::string banner(const std::string& version) {
    return "\n"
        + color::BLUE + color::BOLD + "  rterm\n"
        + color::RESET + color::DIM + "  remote terminal console v" + version
        + color::RESET + "\n\n"
        + rule();
}

// Section header: blank line before title, blank line after
inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Status indicators ───────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string info(const std::string& msg) {
    return color::BLUE + "    ~ " + color::RESET + msg + "\n";
}

inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Key-value row for the status panel
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<12}", key) + color::RESET + value + "\n";
}

// ── Transcript ──────────────────────────────────────────

// Echo of a user submission
inline std::string user_line(const std::string& text) {
    return color::BLUE + color::BOLD + "$ " + color::RESET + color::BLUE + text + color::RESET + "\n";
}

// Server text; errors in red. Not newline-terminated: streamed output may
// continue on the same line.
inline std::string server_text(const std::string& text, bool is_error) {
    return is_error ? red(text) : text;
}

} // namespace theme
