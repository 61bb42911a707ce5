#include "events.hpp"
#include "commands.hpp"
#include <fmt/format.h>

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

namespace {

const char* phase_name(const std::optional<CommandPhase>& phase) {
    if (!phase) return "none";
    switch (*phase) {
        case CommandPhase::Started:    return "started";
        case CommandPhase::InputError: return "input_error";
        case CommandPhase::Stream:     return "stream";
        case CommandPhase::Finished:   return "finished";
    }
    return "unknown";
}

struct EventLabel {
    std::string operator()(const ConnectionResult& e) const {
        return fmt::format("connection_result ok={}", e.ok);
    }
    std::string operator()(const CommandOutput& e) const {
        return fmt::format("command_output ok={} state={}", e.ok, phase_name(e.state));
    }
    std::string operator()(const Disconnected&) const { return "disconnected"; }
    std::string operator()(const ShellOutput& e) const {
        return fmt::format("shell_output is_error={}", e.is_error);
    }
    std::string operator()(const ShellEvent& e) const {
        return fmt::format("shell_event ok={} active={}", e.ok,
                           e.active ? (*e.active ? "true" : "false") : "none");
    }
    std::string operator()(const ConnectRequest& e) const {
        return fmt::format("connect_request {}@{}:{}", e.form.username, e.form.host, e.form.port);
    }
    std::string operator()(const DisconnectRequest&) const { return "disconnect_request"; }
    std::string operator()(const SubmitInput&) const { return "submit_input"; }
    std::string operator()(const ToggleShell&) const { return "toggle_shell"; }
    std::string operator()(const HistoryPrevious&) const { return "history_previous"; }
    std::string operator()(const HistoryNext&) const { return "history_next"; }
    std::string operator()(const InputEdited&) const { return "input_edited"; }
    std::string operator()(const ConnectTimeout&) const { return "connect_timeout"; }
};

struct CommandLabel {
    std::string operator()(const ConnectCommand& c) const {
        return fmt::format("connect {}@{}:{}", c.username, c.host, c.port);
    }
    std::string operator()(const DisconnectCommand&) const { return "disconnect"; }
    std::string operator()(const RunCommand&) const { return "run_command"; }
    std::string operator()(const CommandInput&) const { return "command_input"; }
    std::string operator()(const ShellStart&) const { return "shell_start"; }
    std::string operator()(const ShellStop&) const { return "shell_stop"; }
    std::string operator()(const ShellInput&) const { return "shell_input"; }
};

} // namespace

std::string describe(const Event& event) {
    return std::visit(EventLabel{}, event);
}

std::string describe(const Command& command) {
    return std::visit(CommandLabel{}, command);
}
