#pragma once

#include <string>
#include <vector>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Configuration structures
struct ConnectionConfig {
    std::string host;
    int port = 22;
    std::string user;
    int timeout = 10;                            // TCP connect / handshake timeout (seconds)
};

struct SessionConfig {
    int connect_timeout = 15;                    // watchdog for connection_result (seconds)
    bool merge_messages = true;
};

struct PromptConfig {
    std::vector<std::string> extra_patterns;     // additional password-prompt regexes
};

struct LogConfig {
    bool enabled = true;
    std::string path;                            // empty = <tmp>/rterm_debug.log
};
