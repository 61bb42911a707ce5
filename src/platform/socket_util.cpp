#include "socket_util.hpp"

#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <netdb.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fmt/format.h>

namespace platform {

void ignore_sigpipe() {
    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = SIG_IGN;
    sigaction(SIGPIPE, &sa, nullptr);
}

void set_nonblocking(socket_t sock) {
    int flags = fcntl(sock, F_GETFL, 0);
    if (flags >= 0) fcntl(sock, F_SETFL, flags | O_NONBLOCK);
}

void enable_keepalive(socket_t sock) {
    int on = 1;
    setsockopt(sock, SOL_SOCKET, SO_KEEPALIVE, &on, sizeof(on));
    int idle = 60, interval = 15, probes = 4;
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPIDLE, &idle, sizeof(idle));
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPINTVL, &interval, sizeof(interval));
    setsockopt(sock, IPPROTO_TCP, TCP_KEEPCNT, &probes, sizeof(probes));
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
    struct pollfd pfd = {sock, events, 0};
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
}

Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms,
                             const std::atomic<bool>* cancel) {
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* res = nullptr;
    std::string port_str = std::to_string(port);
    int gai = getaddrinfo(host.c_str(), port_str.c_str(), &hints, &res);
    if (gai != 0 || !res) {
        return Result<socket_t>::Err(fmt::format("Failed to resolve host {}: {}",
                                                 host, gai_strerror(gai)));
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string last_error = "no usable address";

    for (auto* ai = res; ai != nullptr; ai = ai->ai_next) {
        socket_t sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock == RTERM_INVALID_SOCKET) {
            last_error = std::strerror(errno);
            continue;
        }
        set_nonblocking(sock);

        int ret = connect(sock, ai->ai_addr, ai->ai_addrlen);
        if (ret < 0 && errno != EINPROGRESS) {
            last_error = std::strerror(errno);
            close_socket(sock);
            continue;
        }

        // Wait for non-blocking connect to complete, in short slices so a
        // cancel request is noticed promptly.
        bool connected = (ret == 0);
        while (!connected) {
            if (cancel && cancel->load()) {
                close_socket(sock);
                freeaddrinfo(res);
                return Result<socket_t>::Err("Connection request cancelled.");
            }
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (remaining <= 0) {
                last_error = "timed out";
                break;
            }
            int revents = poll_socket(sock, POLLOUT, static_cast<int>(std::min<long long>(remaining, 100)));
            if (revents == 0) continue;

            int sock_err = 0;
            socklen_t err_len = sizeof(sock_err);
            getsockopt(sock, SOL_SOCKET, SO_ERROR, &sock_err, &err_len);
            if (sock_err != 0) {
                last_error = std::strerror(sock_err);
                break;
            }
            connected = true;
        }

        if (connected) {
            freeaddrinfo(res);
            return Result<socket_t>::Ok(sock);
        }
        close_socket(sock);
    }

    freeaddrinfo(res);
    return Result<socket_t>::Err(fmt::format("Failed to connect to {}:{}: {}",
                                             host, port, last_error));
}

void close_socket(socket_t sock) {
    if (sock != RTERM_INVALID_SOCKET) close(sock);
}

} // namespace platform
