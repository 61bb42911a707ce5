#pragma once

#include <session/command_history.hpp>
#include <session/events.hpp>
#include <terminal/stream_sanitizer.hpp>

struct SessionState {
    ConnectionState connection = ConnectionState::Disconnected;
    bool command_running = false;
    bool shell_active = false;
    bool shell_toggling = false;
    bool mask_next_input = false;

    CommandHistory history;
    ConnectForm form;

    StreamSanitizer::State command_channel;
    StreamSanitizer::State shell_channel;

    void reset_channels() {
        command_channel.reset();
        shell_channel.reset();
    }
};
