#include "transition.hpp"
#include <util/string_utils.hpp>
#include <fmt/format.h>

namespace {

// Applies one event to the state, collecting effects.
class Reducer {
public:
    Reducer(SessionState& state, std::vector<Effect>& effects, const SessionOptions& options)
        : s_(state), fx_(effects), opts_(options) {}

    // ── Transport events ───────────────────────────────────

    void operator()(const ConnectionResult& e) {
        s_.connection = e.ok ? ConnectionState::Connected : ConnectionState::Disconnected;
        s_.shell_toggling = false;
        s_.command_running = false;
        s_.mask_next_input = false;
        s_.shell_active = false;
        if (e.ok) s_.form.password.clear();
        s_.reset_channels();
        fx_.push_back(CancelWatchdog{});
        if (e.message) append_server_once(*e.message, !e.ok, false);
    }

    void operator()(const CommandOutput& e) {
        if (e.state == CommandPhase::Started) {
            s_.command_running = true;
            s_.mask_next_input = false;
            s_.command_channel.reset();
            if (e.message) append_server_once(*e.message, !e.ok, false);
            return;
        }

        if (e.state == CommandPhase::InputError) {
            s_.command_running = false;
            s_.mask_next_input = false;
            if (e.message) append_server_once(*e.message, true, false);
            return;
        }

        if (!e.state && e.command && !e.command->empty()) {
            append_user(*e.command);
        }

        if (e.message && e.state != CommandPhase::Stream) {
            append_server_once(*e.message, !e.ok, true);
        }

        if (e.output && !e.output->empty()) {
            append_server_stream(*e.output, s_.command_channel, false);
        }
        if (e.error_output && !e.error_output->empty()) {
            append_server_stream(*e.error_output, s_.command_channel, true);
        }

        if (e.state == CommandPhase::Finished || (!e.state && e.message)) {
            s_.command_running = false;
            s_.mask_next_input = false;
        }
    }

    void operator()(const Disconnected& e) {
        s_.connection = ConnectionState::Disconnected;
        s_.command_running = false;
        s_.shell_active = false;
        s_.shell_toggling = false;
        s_.mask_next_input = false;
        s_.reset_channels();
        fx_.push_back(CancelWatchdog{});
        if (e.message) append_server_once(*e.message, true, false);
    }

    void operator()(const ShellOutput& e) {
        if (!e.output || e.output->empty()) return;
        append_server_stream(*e.output, s_.shell_channel, e.is_error);
    }

    void operator()(const ShellEvent& e) {
        if (e.active) {
            if (*e.active && !s_.shell_active) s_.shell_channel.reset();
            s_.shell_active = *e.active;
            if (!*e.active) s_.mask_next_input = false;
        } else if (!e.ok) {
            s_.shell_active = false;
            s_.mask_next_input = false;
        }
        s_.shell_toggling = false;
        if (e.message) append_server_once(*e.message, !e.ok, false);
    }

    // ── User actions ───────────────────────────────────────

    void operator()(const ConnectRequest& e) {
        if (s_.connection == ConnectionState::Connecting) return;

        ConnectForm form = e.form;
        form.host = StringUtils::trim(form.host);
        form.username = StringUtils::trim(form.username);
        if (form.host.empty() || form.username.empty()) {
            fx_.push_back(AppendMessage{Role::Server, SessionText::MISSING_TARGET, true});
            return;
        }

        s_.form = form;
        s_.connection = ConnectionState::Connecting;
        fx_.push_back(AppendMessage{
            Role::Server,
            fmt::format("Connecting to {}@{}:{}...", form.username, form.host, form.port),
            false});
        fx_.push_back(SendCommand{ConnectCommand{form.host, form.port, form.username, form.password}});
        fx_.push_back(StartWatchdog{opts_.connect_timeout});
    }

    void operator()(const DisconnectRequest&) {
        if (s_.connection == ConnectionState::Disconnected) return;
        s_.reset_channels();
        fx_.push_back(SendCommand{DisconnectCommand{}});
    }

    void operator()(const SubmitInput& e) {
        if (s_.connection != ConnectionState::Connected) return;
        if (s_.shell_active) {
            submit_shell(e.text);
        } else if (s_.command_running) {
            submit_command_input(e.text);
        } else {
            submit_command(e.text);
        }
    }

    void operator()(const ToggleShell&) {
        if (s_.connection != ConnectionState::Connected || s_.shell_toggling) return;
        s_.shell_toggling = true;
        if (s_.shell_active) {
            fx_.push_back(SendCommand{ShellStop{}});
        } else {
            fx_.push_back(SendCommand{ShellStart{}});
        }
    }

    void operator()(const HistoryPrevious&) {
        if (auto text = s_.history.previous()) fx_.push_back(SetInput{*text});
    }

    void operator()(const HistoryNext&) {
        if (auto text = s_.history.next()) fx_.push_back(SetInput{*text});
    }

    void operator()(const InputEdited&) {
        s_.history.reset_cursor();
    }

    void operator()(const ConnectTimeout&) {
        if (s_.connection != ConnectionState::Connecting) return;
        s_.connection = ConnectionState::Disconnected;
        s_.command_running = false;
        fx_.push_back(AppendMessage{Role::Server, SessionText::CONNECT_TIMEOUT, true});
    }

private:
    // ── Submissions ────────────────────────────────────────

    void submit_command(const std::string& text) {
        std::string command = StringUtils::trim(text);
        if (command.empty()) return;

        s_.mask_next_input = false;
        s_.history.record(command);
        s_.history.reset_cursor();
        append_user(command);
        s_.command_running = true;
        fx_.push_back(SendCommand{RunCommand{command}});
        fx_.push_back(SetInput{""});
    }

    void submit_command_input(const std::string& text) {
        s_.history.reset_cursor();
        if (text.empty()) {
            append_user(EMPTY_INPUT_TEXT);
        } else if (s_.mask_next_input) {
            append_user(MASKED_INPUT_TEXT);
        } else {
            s_.history.record(text);
            append_user(text);
        }
        s_.mask_next_input = false;
        fx_.push_back(SendCommand{CommandInput{text + "\n"}});
        fx_.push_back(SetInput{""});
    }

    void submit_shell(const std::string& text) {
        s_.history.reset_cursor();
        if (text.empty()) {
            append_user(EMPTY_INPUT_TEXT);
        } else if (s_.mask_next_input) {
            append_user(MASKED_INPUT_TEXT);
        } else {
            s_.history.record(text);
            append_user(text);
        }
        s_.mask_next_input = false;
        fx_.push_back(SendCommand{ShellInput{text + "\n"}});
        fx_.push_back(SetInput{""});
    }

    // ── Transcript ─────────────────────────────────────────

    void append_user(const std::string& text) {
        fx_.push_back(AppendMessage{Role::User, text, false});
    }

    // Self-contained status text from the transport.
    void append_server_once(const std::string& raw, bool is_error, bool scan) {
        std::string text = StreamSanitizer::sanitize_once(raw);
        if (text.empty()) return;
        fx_.push_back(AppendMessage{Role::Server, text, is_error});
        if (scan && opts_.prompts.matches(text)) s_.mask_next_input = true;
    }

    // Channel output: sanitized with the channel's persistent state. The
    // prompt scan also looks at the whole open line, since a prompt can
    // arrive split over several chunks.
    void append_server_stream(const std::string& raw, StreamSanitizer::State& channel, bool is_error) {
        std::string text = StreamSanitizer::sanitize_chunk(raw, channel);
        if (text.empty()) return;
        fx_.push_back(AppendMessage{Role::Server, text, is_error, true});
        if (opts_.prompts.matches(text) ||
            (!channel.current_line.empty() && opts_.prompts.is_prompt_line(channel.current_line))) {
            s_.mask_next_input = true;
        }
    }

    SessionState& s_;
    std::vector<Effect>& fx_;
    const SessionOptions& opts_;
};

} // namespace

Transition transition(SessionState state, const Event& event, const SessionOptions& options) {
    std::vector<Effect> effects;
    Reducer reducer(state, effects, options);
    std::visit(reducer, event);
    return {std::move(state), std::move(effects)};
}
