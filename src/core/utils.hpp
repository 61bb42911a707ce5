#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Split "user@host:port" into its parts. Missing parts are left untouched.
// Returns false if the target is empty or the port is not a number.
bool parse_ssh_target(const std::string& target, std::string& user,
                      std::string& host, int& port);
