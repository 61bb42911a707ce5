#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>
#include "transport.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// libssh2 transport. One worker thread owns the SSH session and both
// channels; send() only queues. Events are posted to the sink in the order
// the worker produces them.
class SshTransport : public Transport {
public:
    SshTransport(EventSink sink, int connect_timeout_secs = SSH_CONNECT_TIMEOUT_SECS);
    ~SshTransport() override;

    SshTransport(const SshTransport&) = delete;
    SshTransport& operator=(const SshTransport&) = delete;

    Result<void> start();

    // Joins the worker and closes the session without reporting events.
    void stop();

    void send(const Command& command) override;

private:
    // A one-shot command and its exec channel
    struct ActiveCommand {
        std::string command;
        LIBSSH2_CHANNEL* channel = nullptr;
    };

    using Clock = std::chrono::steady_clock;

    void worker_loop();
    void handle(const Command& command);

    // ── Connection ─────────────────────────────────────────
    void do_connect(const ConnectCommand& cmd);
    Result<void> establish(const ConnectCommand& cmd);
    Result<void> authenticate(const ConnectCommand& cmd, Clock::time_point deadline);
    void do_disconnect();
    void close_session();
    void check_alive();
    void connection_lost(const std::string& reason);
    bool connected() const { return session_ != nullptr; }

    // ── Channels ───────────────────────────────────────────
    Result<LIBSSH2_CHANNEL*> open_pty_channel();
    Result<void> write_all(LIBSSH2_CHANNEL* channel, const std::string& data);
    void free_channel(LIBSSH2_CHANNEL* channel);

    void do_run_command(const RunCommand& cmd);
    void do_command_input(const CommandInput& cmd);
    void pump_command();
    void finish_command(std::optional<std::string> termination_message, bool error);

    void do_shell_start();
    void do_shell_input(const ShellInput& cmd);
    void do_shell_stop();
    void pump_shell();
    void close_shell();

    // EAGAIN back-off during connect; false once cancelled or past deadline
    bool wait_connect(Clock::time_point deadline);

    void emit(Event event);

    EventSink sink_;
    int connect_timeout_secs_;

    std::atomic<bool> running_{false};
    std::thread thread_;

    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::deque<Command> queue_;

    // Set by a disconnect queued behind a connect
    std::atomic<bool> cancel_connect_{false};

    // Worker-thread state
    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = RTERM_INVALID_SOCKET;
    std::string target_;
    std::optional<ActiveCommand> command_;
    LIBSSH2_CHANNEL* shell_ = nullptr;
    Clock::time_point next_keepalive_{};
};
