#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <session/event_queue.hpp>
#include <session/message_log.hpp>
#include <session/transition.hpp>
#include <ssh/transport.hpp>

// Owns one remote session: state, transcript, connect watchdog and the
// inbound event queue. All methods except post() must be called from the
// owner thread.
class SessionController {
public:
    using Clock = std::chrono::steady_clock;
    using ClockFn = std::function<Clock::time_point()>;
    using InputCallback = std::function<void(const std::string&)>;

    SessionController(Transport& transport, SessionOptions options,
                      bool merge_messages = true, ClockFn clock = nullptr);

    // Destroying the controller does not disconnect.
    ~SessionController() = default;

    SessionController(const SessionController&) = delete;
    SessionController& operator=(const SessionController&) = delete;

    // Thread-safe: queue a transport event for the next pump().
    void post(Event event);

    // Dispatch every queued event. Returns how many were handled.
    std::size_t pump();

    // Fire the watchdog if its deadline has passed.
    void poll();
    void poll(Clock::time_point now);

    void dispatch(const Event& event);

    // ── User actions ───────────────────────────────────────
    void connect(const ConnectForm& form) { dispatch(ConnectRequest{form}); }
    void disconnect() { dispatch(DisconnectRequest{}); }
    void submit(const std::string& text) { dispatch(SubmitInput{text}); }
    void toggle_shell() { dispatch(ToggleShell{}); }
    void history_previous() { dispatch(HistoryPrevious{}); }
    void history_next() { dispatch(HistoryNext{}); }
    void input_edited() { dispatch(InputEdited{}); }

    // Receives SetInput effects (history recall, clearing after submit).
    void set_input_callback(InputCallback cb) { on_input_ = std::move(cb); }

    // ── Accessors ──────────────────────────────────────────
    const SessionState& state() const { return state_; }
    ConnectionState connection() const { return state_.connection; }
    const MessageLog& transcript() const { return transcript_; }
    const SessionOptions& options() const { return options_; }
    std::optional<Clock::time_point> watchdog_deadline() const { return deadline_; }

private:
    void apply(const Effect& effect);

    Transport& transport_;
    SessionOptions options_;
    ClockFn clock_;
    InputCallback on_input_;

    SessionState state_;
    MessageLog transcript_;
    EventQueue inbound_;
    std::optional<Clock::time_point> deadline_;
};
