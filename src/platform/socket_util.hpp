#pragma once

// Socket helpers for the SSH transport.

#include <poll.h>
#include <string>

using socket_t = int;
#define FORAGER_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Resolve host and open a TCP connection, waiting at most timeout_secs.
// Returns the socket, or FORAGER_INVALID_SOCKET with err filled.
socket_t connect_tcp(const std::string& host, int port, int timeout_secs, std::string& err);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
