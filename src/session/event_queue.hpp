#pragma once

#include <deque>
#include <mutex>
#include <session/events.hpp>

// Hand-off from transport threads to the session owner thread.
class EventQueue {
public:
    void push(Event event) {
        std::lock_guard<std::mutex> lock(mutex_);
        events_.push_back(std::move(event));
    }

    // Takes everything queued so far, in arrival order.
    std::deque<Event> drain() {
        std::deque<Event> out;
        std::lock_guard<std::mutex> lock(mutex_);
        out.swap(events_);
        return out;
    }

private:
    std::mutex mutex_;
    std::deque<Event> events_;
};
