#pragma once

#include <string>
#include <poll.h>
#include <core/types.hpp>

namespace platform {

// Set a socket to non-blocking mode.
void set_nonblocking(int sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(int sock, short events, int timeout_ms);

// Resolve host and open a non-blocking TCP connection, waiting up to
// timeout_ms for the handshake. Enables TCP keepalive.
Result<int> connect_tcp(const std::string& host, int port, int timeout_ms);

// Close a socket.
void close_socket(int sock);

} // namespace platform
