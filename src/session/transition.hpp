#pragma once

#include <chrono>
#include <string>
#include <variant>
#include <vector>
#include <core/constants.hpp>
#include <session/commands.hpp>
#include <session/events.hpp>
#include <session/message_log.hpp>
#include <session/password_prompt.hpp>
#include <session/session_state.hpp>

// ── Effects ─────────────────────────────────────────────────

struct AppendMessage {
    Role role = Role::Server;
    std::string content;
    bool is_error = false;
    // Sanitized channel output rather than a self-contained message.
    bool stream = false;
};

struct SendCommand {
    Command command;
};

struct StartWatchdog {
    std::chrono::seconds timeout{CONNECT_WATCHDOG_SECS};
};

struct CancelWatchdog {};

// Replace the contents of the input line.
struct SetInput {
    std::string text;
};

using Effect = std::variant<AppendMessage, SendCommand, StartWatchdog, CancelWatchdog, SetInput>;

struct SessionOptions {
    std::chrono::seconds connect_timeout{CONNECT_WATCHDOG_SECS};
    PasswordPromptDetector prompts;
};

struct Transition {
    SessionState state;
    std::vector<Effect> effects;
};

// The whole session state machine. Pure: all I/O is described by the
// returned effects.
Transition transition(SessionState state, const Event& event, const SessionOptions& options);

// Fixed user-facing texts
namespace SessionText {
constexpr const char* MISSING_TARGET =
    "Enter a host and username to open an SSH connection.";
constexpr const char* CONNECT_TIMEOUT =
    "Connection timed out. Check the network or server status and try again.";
}
