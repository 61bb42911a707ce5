#pragma once

#include <ssh/transport.hpp>
#include <vector>

// Records every outbound command instead of talking to a server.
class FakeTransport : public Transport {
public:
    void send(const Command& command) override { sent.push_back(command); }

    template <typename T>
    std::size_t count() const {
        std::size_t n = 0;
        for (const auto& c : sent) {
            if (std::holds_alternative<T>(c)) ++n;
        }
        return n;
    }

    std::vector<Command> sent;
};
