#include <gtest/gtest.h>
#include <session/session_controller.hpp>
#include "fake_transport.hpp"
#include <thread>

using namespace std::chrono_literals;

namespace {

struct Harness {
    FakeTransport transport;
    SessionController::Clock::time_point now{};
    SessionController controller{transport, SessionOptions{}, true,
                                 [this] { return now; }};
};

ConnectForm form() {
    return ConnectForm{"example.org", 22, "alice", "pw"};
}

} // namespace

TEST(SessionController, ConnectArmsWatchdog) {
    Harness h;
    h.controller.connect(form());
    EXPECT_EQ(h.controller.connection(), ConnectionState::Connecting);
    EXPECT_EQ(h.transport.count<ConnectCommand>(), 1u);
    ASSERT_TRUE(h.controller.watchdog_deadline().has_value());
    EXPECT_EQ(*h.controller.watchdog_deadline(), h.now + 15s);
}

TEST(SessionController, WatchdogFiresWhileConnecting) {
    Harness h;
    h.controller.connect(form());

    h.now += 14s;
    h.controller.poll();
    EXPECT_EQ(h.controller.connection(), ConnectionState::Connecting);

    h.now += 1s;
    h.controller.poll();
    EXPECT_EQ(h.controller.connection(), ConnectionState::Disconnected);
    EXPECT_FALSE(h.controller.watchdog_deadline().has_value());

    const auto& last = h.controller.transcript().messages().back();
    EXPECT_TRUE(last.is_error);
    EXPECT_EQ(last.content, SessionText::CONNECT_TIMEOUT);
    EXPECT_EQ(h.transport.count<DisconnectCommand>(), 0u);
}

TEST(SessionController, ResultBeforeDeadlineCancelsWatchdog) {
    Harness h;
    h.controller.connect(form());
    h.now += 5s;
    h.controller.post(ConnectionResult{true, std::string("Connected to alice@example.org:22")});
    EXPECT_EQ(h.controller.pump(), 1u);
    EXPECT_EQ(h.controller.connection(), ConnectionState::Connected);
    EXPECT_FALSE(h.controller.watchdog_deadline().has_value());

    std::size_t before = h.controller.transcript().size();
    h.now += 60s;
    h.controller.poll();
    EXPECT_EQ(h.controller.connection(), ConnectionState::Connected);
    EXPECT_EQ(h.controller.transcript().size(), before);
}

TEST(SessionController, DisconnectedEventCancelsWatchdog) {
    Harness h;
    h.controller.connect(form());
    h.controller.dispatch(Disconnected{std::string("SSH connection lost: reset")});
    EXPECT_FALSE(h.controller.watchdog_deadline().has_value());
}

TEST(SessionController, ReconnectRestartsWatchdog) {
    Harness h;
    h.controller.connect(form());
    h.controller.dispatch(ConnectionResult{false, std::string("Connection failed: refused")});
    h.now += 100s;
    h.controller.connect(form());
    ASSERT_TRUE(h.controller.watchdog_deadline().has_value());
    EXPECT_EQ(*h.controller.watchdog_deadline(), h.now + 15s);
}

TEST(SessionController, ConfiguredTimeoutIsUsed) {
    FakeTransport transport;
    SessionController::Clock::time_point now{};
    SessionOptions options;
    options.connect_timeout = 2s;
    SessionController controller(transport, std::move(options), true, [&] { return now; });
    controller.connect(form());
    now += 2s;
    controller.poll();
    EXPECT_EQ(controller.connection(), ConnectionState::Disconnected);
}

TEST(SessionController, PumpDispatchesInOrder) {
    Harness h;
    h.controller.connect(form());
    h.controller.post(ConnectionResult{true, std::string("Connected")});
    h.controller.post(ShellOutput{std::string("motd"), false});
    h.controller.post(Disconnected{std::string("SSH connection closed.")});
    EXPECT_EQ(h.controller.pump(), 3u);
    EXPECT_EQ(h.controller.connection(), ConnectionState::Disconnected);
    EXPECT_EQ(h.controller.pump(), 0u);
}

TEST(SessionController, PostFromAnotherThread) {
    Harness h;
    h.controller.connect(form());
    std::thread worker([&] {
        h.controller.post(ConnectionResult{true, std::string("Connected")});
    });
    worker.join();
    h.controller.pump();
    EXPECT_EQ(h.controller.connection(), ConnectionState::Connected);
}

TEST(SessionController, CommandTranscriptMergesOutput) {
    Harness h;
    h.controller.connect(form());
    h.controller.dispatch(ConnectionResult{true, std::string("Connected")});
    h.controller.submit("ls");
    EXPECT_EQ(h.transport.count<RunCommand>(), 1u);

    CommandOutput out;
    out.ok = true;
    out.state = CommandPhase::Stream;
    out.output = "a.txt\r\n";
    h.controller.dispatch(out);
    out.output = "b.txt\r\n";
    h.controller.dispatch(out);

    const auto& messages = h.controller.transcript().messages();
    ASSERT_EQ(messages.size(), 3u);
    EXPECT_EQ(messages[0].content, "Connecting to alice@example.org:22...\nConnected");
    EXPECT_EQ(messages[1].role, Role::User);
    EXPECT_EQ(messages[1].content, "ls");
    EXPECT_EQ(messages[2].content, "a.txt\nb.txt\n");
}

TEST(SessionController, SetInputReachesCallback) {
    Harness h;
    std::vector<std::string> inputs;
    h.controller.set_input_callback([&](const std::string& text) { inputs.push_back(text); });

    h.controller.connect(form());
    h.controller.dispatch(ConnectionResult{true, std::string("Connected")});
    h.controller.submit("uptime");
    h.controller.history_previous();
    h.controller.history_next();

    ASSERT_EQ(inputs.size(), 3u);
    EXPECT_EQ(inputs[0], "");
    EXPECT_EQ(inputs[1], "uptime");
    EXPECT_EQ(inputs[2], "");
}

TEST(SessionController, ToggleShellSendsStartOnce) {
    Harness h;
    h.controller.connect(form());
    h.controller.dispatch(ConnectionResult{true, std::string("Connected")});
    h.controller.toggle_shell();
    h.controller.toggle_shell();
    EXPECT_EQ(h.transport.count<ShellStart>(), 1u);

    h.controller.dispatch(ShellEvent{true, true, std::string("Interactive shell started.")});
    EXPECT_TRUE(h.controller.state().shell_active);
    h.controller.toggle_shell();
    EXPECT_EQ(h.transport.count<ShellStop>(), 1u);
}

TEST(SessionController, DestructionDoesNotDisconnect) {
    FakeTransport transport;
    {
        SessionController controller(transport, SessionOptions{});
        controller.connect(form());
        controller.dispatch(ConnectionResult{true, std::string("Connected")});
    }
    EXPECT_EQ(transport.count<DisconnectCommand>(), 0u);
}

TEST(SessionController, SplitShellOutputKeepsTranscriptIntact) {
    Harness h;
    h.controller.connect(form());
    h.controller.dispatch(ConnectionResult{true, std::string("Connected")});
    h.controller.dispatch(ShellEvent{true, true, std::string("Interactive shell started.")});
    for (const char* chunk : {"50%", "\r", "60%", "\r", "\n", "[sudo] Pass", "word: "}) {
        h.controller.dispatch(ShellOutput{std::string(chunk), false});
    }
    EXPECT_EQ(h.controller.transcript().messages().back().content,
              "Connecting to alice@example.org:22...\nConnected\nInteractive shell started.\n"
              "50%\n60%\n[sudo] Password: ");
    EXPECT_TRUE(h.controller.state().mask_next_input);
}
