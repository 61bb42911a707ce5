#include "ssh_transport.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <libssh2.h>
#include <fmt/format.h>
#include <cstring>

namespace {

constexpr const char* MSG_NOT_CONNECTED       = "No SSH connection has been established.";
constexpr const char* MSG_CANCELLED           = "Connection request cancelled.";
constexpr const char* MSG_CLOSED              = "SSH connection closed.";
constexpr const char* MSG_TERMINATED_BY_CLOSE = "Command terminated because the connection was closed.";
constexpr const char* MSG_SHELL_NOT_RUNNING   = "Interactive shell is not running.";

struct KbdAuthData {
    std::string password;
    int prompt_round = 0;
};

// Answers every keyboard-interactive prompt with the password.
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        rterm_log(fmt::format("ssh: kbd-interactive prompt round {}: '{}'", data->prompt_round, prompt_text));
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

std::string last_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    if (!msg || len <= 0) return "unknown error";
    return std::string(msg, len);
}

std::string hex_fingerprint(const char* hash, std::size_t len) {
    std::string out;
    for (std::size_t i = 0; i < len; i++) {
        if (i) out += ':';
        out += fmt::format("{:02x}", static_cast<unsigned char>(hash[i]));
    }
    return out;
}

} // namespace

// ── Construction / Destruction ──────────────────────────────

SshTransport::SshTransport(EventSink sink, int connect_timeout_secs)
    : sink_(std::move(sink)),
      connect_timeout_secs_(connect_timeout_secs > 0 ? connect_timeout_secs : SSH_CONNECT_TIMEOUT_SECS) {}

SshTransport::~SshTransport() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

Result<void> SshTransport::start() {
    if (running_) return Result<void>::Ok();

    platform::ignore_sigpipe();
    int rc = libssh2_init(0);
    if (rc != 0) {
        return Result<void>::Err(fmt::format("Failed to initialize libssh2 ({})", rc));
    }

    running_ = true;
    thread_ = std::thread(&SshTransport::worker_loop, this);
    rterm_log("ssh: transport started");
    return Result<void>::Ok();
}

void SshTransport::stop() {
    if (!running_) return;

    running_ = false;
    cancel_connect_ = true;
    queue_cv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }

    // Silent teardown: nobody is listening any more.
    if (command_) {
        free_channel(command_->channel);
        command_.reset();
    }
    close_shell();
    close_session();
    libssh2_exit();
    rterm_log("ssh: transport stopped");
}

void SshTransport::send(const Command& command) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        // A disconnect cancels a connect that is queued or in progress;
        // a new connect starts uncancelled.
        if (std::holds_alternative<ConnectCommand>(command)) {
            cancel_connect_ = false;
        } else if (std::holds_alternative<DisconnectCommand>(command)) {
            cancel_connect_ = true;
        }
        queue_.push_back(command);
    }
    queue_cv_.notify_one();
}

void SshTransport::emit(Event event) {
    if (sink_) sink_(std::move(event));
}

// ── Worker loop ─────────────────────────────────────────────

void SshTransport::worker_loop() {
    while (running_) {
        std::deque<Command> batch;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            if (queue_.empty() && !connected()) {
                queue_cv_.wait_for(lock, std::chrono::milliseconds(SSH_IO_POLL_MS),
                                   [this] { return !queue_.empty() || !running_; });
            }
            batch.swap(queue_);
        }

        for (const auto& cmd : batch) {
            if (!running_) break;
            handle(cmd);
        }

        if (!running_ || !connected()) continue;

        pump_command();
        pump_shell();
        check_alive();

        if (connected()) {
            bool idle;
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                idle = queue_.empty();
            }
            if (idle) platform::poll_socket(sock_, POLLIN, SSH_EAGAIN_SLEEP_MS);
        }
    }
}

void SshTransport::handle(const Command& command) {
    if (auto* c = std::get_if<ConnectCommand>(&command)) {
        do_connect(*c);
    } else if (std::holds_alternative<DisconnectCommand>(command)) {
        do_disconnect();
    } else if (auto* r = std::get_if<RunCommand>(&command)) {
        do_run_command(*r);
    } else if (auto* i = std::get_if<CommandInput>(&command)) {
        do_command_input(*i);
    } else if (std::holds_alternative<ShellStart>(command)) {
        do_shell_start();
    } else if (std::holds_alternative<ShellStop>(command)) {
        do_shell_stop();
    } else if (auto* s = std::get_if<ShellInput>(&command)) {
        do_shell_input(*s);
    }
}

// ── Connection ──────────────────────────────────────────────

bool SshTransport::wait_connect(Clock::time_point deadline) {
    if (cancel_connect_ || !running_ || Clock::now() >= deadline) return false;
    platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    return true;
}

void SshTransport::do_connect(const ConnectCommand& cmd) {
    // Replacing a live session: close it without a disconnected event.
    if (connected()) {
        finish_command(std::string(MSG_TERMINATED_BY_CLOSE), true);
        close_shell();
        close_session();
    }

    rterm_log(fmt::format("ssh: connecting to {}@{}:{}", cmd.username, cmd.host, cmd.port));
    auto result = establish(cmd);

    if (cancel_connect_) {
        close_session();
        rterm_log("ssh: connection attempt cancelled");
        emit(ConnectionResult{false, std::string(MSG_CANCELLED)});
        return;
    }

    if (result.is_err()) {
        close_session();
        rterm_log("ssh: connect failed: " + result.error);
        emit(ConnectionResult{false, fmt::format("Connection failed: {}", result.error)});
        return;
    }

    target_ = fmt::format("{}@{}:{}", cmd.username, cmd.host, cmd.port);
    next_keepalive_ = Clock::now() + std::chrono::seconds(SSH_KEEPALIVE_SECS);
    rterm_log("ssh: connected to " + target_);
    emit(ConnectionResult{true, fmt::format("Connected to {}", target_)});
}

Result<void> SshTransport::establish(const ConnectCommand& cmd) {
    auto deadline = Clock::now() + std::chrono::seconds(connect_timeout_secs_);

    auto sock = platform::connect_tcp(cmd.host, cmd.port, connect_timeout_secs_ * 1000, &cancel_connect_);
    if (sock.is_err()) {
        return Result<void>::Err(sock.error);
    }
    sock_ = sock.value;
    rterm_log("ssh: TCP connected, starting SSH handshake");

    session_ = libssh2_session_init();
    if (!session_) {
        return Result<void>::Err("Failed to create SSH session");
    }
    libssh2_session_set_blocking(session_, 0);

    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        if (!wait_connect(deadline)) return Result<void>::Err("SSH handshake timed out");
    }
    if (rc != 0) {
        return Result<void>::Err(fmt::format("SSH handshake failed: {}", last_error(session_)));
    }

    // Host keys are accepted unconditionally; the fingerprint goes to the log.
    if (const char* hash = libssh2_hostkey_hash(session_, LIBSSH2_HOSTKEY_HASH_SHA256)) {
        rterm_log("ssh: host key SHA256 " + hex_fingerprint(hash, 32));
    }

    platform::enable_keepalive(sock_);
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);

    return authenticate(cmd, deadline);
}

Result<void> SshTransport::authenticate(const ConnectCommand& cmd, Clock::time_point deadline) {
    int rc;
    const auto user_len = static_cast<unsigned int>(cmd.username.length());

    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, cmd.username.c_str(), user_len)) == nullptr) {
        if (libssh2_userauth_authenticated(session_)) {
            rterm_log("ssh: server accepted 'none' authentication");
            return Result<void>::Ok();
        }
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (!wait_connect(deadline)) return Result<void>::Err("Authentication timed out");
    }

    std::string methods = auth_list ? auth_list : "";
    rterm_log("ssh: auth methods: " + methods);

    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data;
        kbd_data.password = cmd.password;
        *libssh2_session_abstract(session_) = &kbd_data;

        while ((rc = libssh2_userauth_keyboard_interactive(session_, cmd.username.c_str(),
                                                           kbd_callback)) == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_connect(deadline)) {
                *libssh2_session_abstract(session_) = nullptr;
                return Result<void>::Err("Authentication timed out");
            }
        }
        *libssh2_session_abstract(session_) = nullptr;

        if (rc == 0) return Result<void>::Ok();
        rterm_log("ssh: keyboard-interactive failed, trying password");
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        while ((rc = libssh2_userauth_password(session_, cmd.username.c_str(),
                                               cmd.password.c_str())) == LIBSSH2_ERROR_EAGAIN) {
            if (!wait_connect(deadline)) return Result<void>::Err("Authentication timed out");
        }
        if (rc == 0) return Result<void>::Ok();
    }

    return Result<void>::Err("Authentication failed (check username/password)");
}

void SshTransport::do_disconnect() {
    // A cancelled connect already reported itself.
    if (!connected()) return;

    finish_command(std::string(MSG_TERMINATED_BY_CLOSE), true);
    close_shell();
    close_session();
    rterm_log("ssh: disconnected from " + target_);
    emit(Disconnected{std::string(MSG_CLOSED)});
}

void SshTransport::connection_lost(const std::string& reason) {
    rterm_log("ssh: connection lost: " + reason);
    finish_command(std::string(MSG_TERMINATED_BY_CLOSE), true);
    close_shell();
    close_session();
    emit(Disconnected{fmt::format("SSH connection lost: {}", reason)});
}

void SshTransport::close_session() {
    if (session_) {
        libssh2_session_disconnect(session_, "Normal disconnection");
        libssh2_session_free(session_);
        session_ = nullptr;
    }
    if (sock_ != RTERM_INVALID_SOCKET) {
        platform::close_socket(sock_);
        sock_ = RTERM_INVALID_SOCKET;
    }
}

void SshTransport::check_alive() {
    if (!connected() || Clock::now() < next_keepalive_) return;

    int seconds_to_next = SSH_KEEPALIVE_SECS;
    int rc = libssh2_keepalive_send(session_, &seconds_to_next);
    if (rc != 0 && rc != LIBSSH2_ERROR_EAGAIN) {
        connection_lost(last_error(session_));
        return;
    }

    int revents = platform::poll_socket(sock_, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        connection_lost("socket closed");
        return;
    }

    if (seconds_to_next <= 0) seconds_to_next = SSH_KEEPALIVE_SECS;
    next_keepalive_ = Clock::now() + std::chrono::seconds(seconds_to_next);
}

// ── Channels ────────────────────────────────────────────────

Result<LIBSSH2_CHANNEL*> SshTransport::open_pty_channel() {
    auto deadline = Clock::now() + std::chrono::seconds(connect_timeout_secs_);

    LIBSSH2_CHANNEL* ch;
    while ((ch = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN || Clock::now() >= deadline) {
            return Result<LIBSSH2_CHANNEL*>::Err(fmt::format("could not open channel: {}", last_error(session_)));
        }
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }

    platform::TermSize size = platform::term_size();
    int rc;
    while ((rc = libssh2_channel_request_pty_ex(
                ch, PTY_TERM_TYPE, static_cast<unsigned int>(std::strlen(PTY_TERM_TYPE)),
                nullptr, 0, size.cols, size.rows, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        if (Clock::now() >= deadline) break;
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        std::string err = last_error(session_);
        free_channel(ch);
        return Result<LIBSSH2_CHANNEL*>::Err(fmt::format("PTY request failed: {}", err));
    }
    return Result<LIBSSH2_CHANNEL*>::Ok(ch);
}

Result<void> SshTransport::write_all(LIBSSH2_CHANNEL* channel, const std::string& data) {
    std::size_t sent = 0;
    int write_retries = 0;
    while (sent < data.size()) {
        ssize_t w = libssh2_channel_write(channel, data.data() + sent, data.size() - sent);
        if (w == LIBSSH2_ERROR_EAGAIN) {
            if (++write_retries > 100) {
                return Result<void>::Err("write stalled");
            }
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(fmt::format("channel write error: {}", last_error(session_)));
        }
        write_retries = 0;
        sent += static_cast<std::size_t>(w);
    }
    return Result<void>::Ok();
}

void SshTransport::free_channel(LIBSSH2_CHANNEL* channel) {
    if (!channel) return;
    int retries = 0;
    while (libssh2_channel_close(channel) == LIBSSH2_ERROR_EAGAIN && ++retries < 100) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    retries = 0;
    while (libssh2_channel_free(channel) == LIBSSH2_ERROR_EAGAIN && ++retries < 100) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
}

// ── One-shot commands ───────────────────────────────────────

void SshTransport::do_run_command(const RunCommand& cmd) {
    CommandOutput reply;
    reply.ok = false;

    if (cmd.command.empty()) {
        reply.message = "No command was provided.";
        emit(reply);
        return;
    }
    reply.command = cmd.command;
    if (!connected()) {
        reply.message = std::string(MSG_NOT_CONNECTED);
        emit(reply);
        return;
    }
    if (command_) {
        reply.message = "The previous command is still running. Try again when it finishes.";
        emit(reply);
        return;
    }

    auto channel = open_pty_channel();
    if (channel.is_err()) {
        reply.message = fmt::format("Failed to run command: {}", channel.error);
        emit(reply);
        return;
    }

    int rc;
    while ((rc = libssh2_channel_exec(channel.value, cmd.command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        reply.message = fmt::format("Failed to run command: {}", last_error(session_));
        free_channel(channel.value);
        emit(reply);
        return;
    }

    command_ = ActiveCommand{cmd.command, channel.value};
    rterm_log("ssh: command started");

    CommandOutput started;
    started.ok = true;
    started.state = CommandPhase::Started;
    started.command = cmd.command;
    emit(started);
}

void SshTransport::do_command_input(const CommandInput& cmd) {
    CommandOutput reply;
    reply.ok = false;
    reply.state = CommandPhase::InputError;

    if (!connected()) {
        reply.message = std::string(MSG_NOT_CONNECTED);
        emit(reply);
        return;
    }
    if (!command_) {
        reply.message = "No command is currently running.";
        emit(reply);
        return;
    }

    auto written = write_all(command_->channel, cmd.data);
    if (written.is_err()) {
        rterm_log("ssh: command input failed: " + written.error);
        finish_command(std::string("Sending input to the command failed; the command was terminated."), true);
    }
}

void SshTransport::pump_command() {
    if (!command_) return;

    char buf[SSH_READ_BUF_SIZE];
    auto drain = [&](bool is_stderr) -> bool {
        std::string data;
        while (true) {
            ssize_t n = is_stderr
                ? libssh2_channel_read_stderr(command_->channel, buf, sizeof(buf))
                : libssh2_channel_read(command_->channel, buf, sizeof(buf));
            if (n > 0) {
                data.append(buf, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) break;
            rterm_log(fmt::format("ssh: command channel read error {}", n));
            return false;
        }
        if (!data.empty()) {
            CommandOutput out;
            out.ok = !is_stderr;
            out.state = CommandPhase::Stream;
            out.command = command_->command;
            if (is_stderr) out.error_output = std::move(data);
            else out.output = std::move(data);
            emit(std::move(out));
        }
        return true;
    };

    if (!drain(false) || !drain(true)) {
        finish_command(std::string("An unexpected error occurred while running the command."), true);
        return;
    }

    if (libssh2_channel_eof(command_->channel)) {
        finish_command(std::nullopt, false);
    }
}

void SshTransport::finish_command(std::optional<std::string> termination_message, bool error) {
    if (!command_) return;

    CommandOutput out;
    out.state = CommandPhase::Finished;
    out.command = command_->command;

    if (termination_message) {
        out.ok = !error;
        out.message = std::move(termination_message);
        free_channel(command_->channel);
    } else {
        LIBSSH2_CHANNEL* ch = command_->channel;
        int retries = 0;
        while (libssh2_channel_close(ch) == LIBSSH2_ERROR_EAGAIN && ++retries < 200) {
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        retries = 0;
        while (libssh2_channel_wait_closed(ch) == LIBSSH2_ERROR_EAGAIN && ++retries < 200) {
            platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
        }
        int exit_status = libssh2_channel_get_exit_status(ch);
        free_channel(ch);

        out.ok = exit_status == 0;
        out.exit_status = exit_status;
        out.message = exit_status == 0
            ? std::string("Command finished.")
            : fmt::format("Command finished with exit status {}.", exit_status);
    }

    rterm_log(fmt::format("ssh: command finished ok={}", out.ok));
    command_.reset();
    emit(std::move(out));
}

// ── Interactive shell ───────────────────────────────────────

void SshTransport::do_shell_start() {
    if (!connected()) {
        emit(ShellEvent{false, false, std::string(MSG_NOT_CONNECTED)});
        return;
    }
    if (shell_) {
        emit(ShellEvent{true, true, std::string("Interactive shell is ready.")});
        return;
    }

    auto channel = open_pty_channel();
    if (channel.is_err()) {
        emit(ShellEvent{false, false, fmt::format("Failed to start interactive shell: {}", channel.error)});
        return;
    }

    int rc;
    while ((rc = libssh2_channel_shell(channel.value)) == LIBSSH2_ERROR_EAGAIN) {
        platform::sleep_ms(SSH_EAGAIN_SLEEP_MS);
    }
    if (rc != 0) {
        std::string err = last_error(session_);
        free_channel(channel.value);
        emit(ShellEvent{false, false, fmt::format("Failed to start interactive shell: {}", err)});
        return;
    }

    shell_ = channel.value;
    rterm_log("ssh: shell started");
    emit(ShellEvent{true, true, std::string("Interactive shell started.")});
}

void SshTransport::do_shell_input(const ShellInput& cmd) {
    if (!connected()) {
        emit(ShellEvent{false, false, std::string(MSG_NOT_CONNECTED)});
        return;
    }
    if (!shell_) {
        emit(ShellEvent{false, false, std::string(MSG_SHELL_NOT_RUNNING)});
        return;
    }

    auto written = write_all(shell_, cmd.data);
    if (written.is_err()) {
        rterm_log("ssh: shell input failed: " + written.error);
        close_shell();
        emit(ShellEvent{false, false,
                        std::string("Sending data to the interactive shell failed; the shell was closed.")});
    }
}

void SshTransport::do_shell_stop() {
    if (!connected()) return;
    close_shell();
    emit(ShellEvent{true, false, std::string("Interactive shell stopped.")});
}

void SshTransport::pump_shell() {
    if (!shell_) return;

    char buf[SSH_READ_BUF_SIZE];
    for (bool is_stderr : {false, true}) {
        std::string data;
        while (true) {
            ssize_t n = is_stderr
                ? libssh2_channel_read_stderr(shell_, buf, sizeof(buf))
                : libssh2_channel_read(shell_, buf, sizeof(buf));
            if (n > 0) {
                data.append(buf, static_cast<std::size_t>(n));
                continue;
            }
            if (n == 0 || n == LIBSSH2_ERROR_EAGAIN) break;

            rterm_log(fmt::format("ssh: shell channel read error {}", n));
            close_shell();
            emit(ShellEvent{false, false, std::string("Error while reading interactive shell output.")});
            return;
        }
        if (!data.empty()) {
            emit(ShellOutput{std::move(data), is_stderr});
        }
    }

    if (libssh2_channel_eof(shell_)) {
        close_shell();
        rterm_log("ssh: remote shell exited");
        emit(ShellEvent{false, false, std::string("Interactive shell ended.")});
    }
}

void SshTransport::close_shell() {
    if (!shell_) return;
    free_channel(shell_);
    shell_ = nullptr;
}
