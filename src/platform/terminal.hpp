#pragma once

namespace platform {

struct TermSize {
    int cols = 80;
    int rows = 24;
};

// Size of the controlling terminal, or 80x24 when stdout is not a tty.
TermSize term_size();

// Turns off echo on stdin for the guard's lifetime. Line editing stays
// on, so getline() still works. Used for password entry.
class EchoOffGuard {
public:
    EchoOffGuard();
    ~EchoOffGuard();

    EchoOffGuard(const EchoOffGuard&) = delete;
    EchoOffGuard& operator=(const EchoOffGuard&) = delete;

private:
    struct Saved;
    Saved* saved_ = nullptr;
};

// True if stdin becomes readable within timeout_ms.
bool poll_stdin(int timeout_ms);

} // namespace platform
