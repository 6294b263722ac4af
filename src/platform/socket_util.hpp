#pragma once

// Cross-platform socket utilities.

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SSHFAKE_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SSHFAKE_INVALID_SOCKET (-1)
#endif

#include <string>
#include <core/types.hpp>

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Switch a socket between blocking and non-blocking mode.
void set_blocking(socket_t sock, bool blocking);

// Resolve host and open a TCP connection, giving up after timeout_secs.
// Returns the connected socket (left non-blocking) or an error message.
Result<socket_t> connect_tcp(const std::string& host, int port, int timeout_secs);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
