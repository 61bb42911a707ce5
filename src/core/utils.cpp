#include "utils.hpp"
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int value = std::stoi(s, &used);
        return used == s.size() ? value : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

bool parse_ssh_target(const std::string& target, std::string& user,
                      std::string& host, int& port) {
    std::string rest = target;
    trim(rest);
    if (rest.empty()) return false;

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        user = rest.substr(0, at);
        rest = rest.substr(at + 1);
    }

    auto colon = rest.rfind(':');
    if (colon != std::string::npos) {
        int parsed = safe_stoi(rest.substr(colon + 1), -1);
        if (parsed <= 0 || parsed > 65535) return false;
        port = parsed;
        rest = rest.substr(0, colon);
    }

    if (!rest.empty()) host = rest;
    return true;
}
