#include "terminal.hpp"
#include <poll.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>

namespace platform {

TermSize term_size() {
    TermSize size;
    struct winsize ws;
    if (ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0) {
        if (ws.ws_col > 0) size.cols = ws.ws_col;
        if (ws.ws_row > 0) size.rows = ws.ws_row;
    }
    return size;
}

// ── EchoOffGuard ─────────────────────────────────────────────

struct EchoOffGuard::Saved {
    struct termios term;
};

EchoOffGuard::EchoOffGuard() {
    struct termios current;
    if (tcgetattr(STDIN_FILENO, &current) != 0) return;  // not a tty

    saved_ = new Saved{current};
    current.c_lflag &= ~(ECHO | ECHOE | ECHOK | ECHONL);
    current.c_lflag |= ICANON;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &current);
}

EchoOffGuard::~EchoOffGuard() {
    if (!saved_) return;
    tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved_->term);
    delete saved_;
}

bool poll_stdin(int timeout_ms) {
    struct pollfd pfd = {STDIN_FILENO, POLLIN, 0};
    if (poll(&pfd, 1, timeout_ms) <= 0) return false;
    return (pfd.revents & (POLLIN | POLLHUP)) != 0;
}

} // namespace platform
