#pragma once

#include <functional>
#include <session/commands.hpp>
#include <session/events.hpp>

// Carries outbound commands to the remote side. Implementations report
// results asynchronously through the EventSink they were built with;
// send() itself never blocks on the network.
class Transport {
public:
    using EventSink = std::function<void(Event)>;

    virtual ~Transport() = default;
    virtual void send(const Command& command) = 0;
};
