#pragma once

#include <optional>
#include <string>
#include <variant>
#include <core/constants.hpp>

enum class ConnectionState {
    Disconnected,
    Connecting,
    Connected,
};

const char* to_string(ConnectionState state);

// ── Inbound transport events ────────────────────────────────

struct ConnectionResult {
    bool ok = false;
    std::optional<std::string> message;
};

enum class CommandPhase {
    Started,
    InputError,
    Stream,
    Finished,
};

struct CommandOutput {
    bool ok = false;
    std::optional<CommandPhase> state;
    std::optional<std::string> output;
    std::optional<std::string> error_output;
    std::optional<std::string> command;
    std::optional<std::string> message;
    std::optional<int> exit_status;
};

struct Disconnected {
    std::optional<std::string> message;
};

struct ShellOutput {
    std::optional<std::string> output;
    bool is_error = false;
};

struct ShellEvent {
    bool ok = false;
    std::optional<bool> active;
    std::optional<std::string> message;
};

// ── User actions ────────────────────────────────────────────

struct ConnectForm {
    std::string host;
    int port = DEFAULT_SSH_PORT;
    std::string username;
    std::string password;
};

struct ConnectRequest {
    ConnectForm form;
};

struct DisconnectRequest {};

// A line entered at the input: a new command, stdin for the running
// command, or shell input, depending on the session state.
struct SubmitInput {
    std::string text;
};

struct ToggleShell {};

struct HistoryPrevious {};
struct HistoryNext {};
struct InputEdited {};

// Synthesized by the controller when the connect watchdog expires.
struct ConnectTimeout {};

using Event = std::variant<
    ConnectionResult,
    CommandOutput,
    Disconnected,
    ShellOutput,
    ShellEvent,
    ConnectRequest,
    DisconnectRequest,
    SubmitInput,
    ToggleShell,
    HistoryPrevious,
    HistoryNext,
    InputEdited,
    ConnectTimeout>;

// Short label for logs. Never includes user input or output.
std::string describe(const Event& event);
