#pragma once

#include <string>
#include <variant>

// Outbound commands issued by the controller to the transport.

struct ConnectCommand {
    std::string host;
    int port = 22;
    std::string username;
    std::string password;
};

struct DisconnectCommand {};

struct RunCommand {
    std::string command;
};

// stdin for the running one-shot command
struct CommandInput {
    std::string data;
};

struct ShellStart {};
struct ShellStop {};

struct ShellInput {
    std::string data;
};

using Command = std::variant<
    ConnectCommand,
    DisconnectCommand,
    RunCommand,
    CommandInput,
    ShellStart,
    ShellStop,
    ShellInput>;

// Short label for logs ("connect user@host:22", "shell_input"). Never
// includes passwords or input data.
std::string describe(const Command& command);
