#pragma once

// POSIX socket helpers for the SSH transport.

#include <poll.h>
#include <atomic>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define RTERM_INVALID_SOCKET (-1)

namespace platform {

// Writes to a peer-closed socket report EPIPE instead of killing the process.
void ignore_sigpipe();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Enable TCP keepalive probing on a connected socket.
void enable_keepalive(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and open a non-blocking TCP connection, trying every
// resolved address. Gives up after timeout_ms, or early when *cancel
// becomes true.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_ms,
                             const std::atomic<bool>* cancel = nullptr);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
