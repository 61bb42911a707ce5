#include "session_controller.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

SessionController::SessionController(Transport& transport, SessionOptions options,
                                     bool merge_messages, ClockFn clock)
    : transport_(transport),
      options_(std::move(options)),
      clock_(clock ? std::move(clock) : ClockFn([] { return Clock::now(); })),
      transcript_(merge_messages) {}

void SessionController::post(Event event) {
    inbound_.push(std::move(event));
}

std::size_t SessionController::pump() {
    auto events = inbound_.drain();
    for (const auto& event : events) {
        dispatch(event);
    }
    return events.size();
}

void SessionController::poll() {
    poll(clock_());
}

void SessionController::poll(Clock::time_point now) {
    if (!deadline_ || now < *deadline_) return;
    deadline_.reset();
    rterm_log("session: connect watchdog expired");
    dispatch(ConnectTimeout{});
}

void SessionController::dispatch(const Event& event) {
    ConnectionState before = state_.connection;

    Transition result = transition(std::move(state_), event, options_);
    state_ = std::move(result.state);

    if (state_.connection != before) {
        rterm_log(fmt::format("session: {} -> {} ({})", to_string(before),
                              to_string(state_.connection), describe(event)));
    }

    for (const auto& effect : result.effects) {
        apply(effect);
    }

    // The watchdog only guards the connecting state.
    if (state_.connection != ConnectionState::Connecting) {
        deadline_.reset();
    }
}

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

void SessionController::apply(const Effect& effect) {
    std::visit(overloaded{
        [this](const AppendMessage& e) {
            transcript_.append(e.role, e.content, e.is_error, e.stream);
        },
        [this](const SendCommand& e) {
            rterm_log(fmt::format("session: send {}", describe(e.command)));
            transport_.send(e.command);
        },
        [this](const StartWatchdog& e) {
            deadline_ = clock_() + e.timeout;
        },
        [this](const CancelWatchdog&) {
            deadline_.reset();
        },
        [this](const SetInput& e) {
            if (on_input_) on_input_(e.text);
        },
    }, effect);
}
