#pragma once

#include <string>
#include <poll.h>

using socket_t = int;
#define TERMHOP_INVALID_SOCKET (-1)

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Resolve host (name, IPv4 or IPv6 literal) and open a non-blocking TCP
// connection within timeout_ms. Returns TERMHOP_INVALID_SOCKET on failure
// and fills `error` with the reason.
socket_t connect_tcp(const std::string& host, int port, int timeout_ms, std::string& error);

} // namespace platform
