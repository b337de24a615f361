#pragma once

// Cross-platform socket utilities.

#include <string>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SOLO_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
#  include <netinet/in.h>
   using socket_t = int;
#  define SOLO_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// IPv4 loopback address for the given port (0 lets the OS pick on bind).
sockaddr_in loopback_address(int port);

// Port a bound socket is listening on, or -1.
int bound_port(socket_t sock);

// True if the last failed connect() on a non-blocking socket is still pending.
bool connect_in_progress();

// Pending error on a socket (SO_ERROR), 0 when the socket is healthy.
int socket_error(socket_t sock);

// recv() without flags. Returns bytes read, 0 on orderly close, -1 on error.
int recv_some(socket_t sock, char* buf, int len);

// Write the whole buffer. Never raises SIGPIPE. Returns false on any error.
bool send_all(socket_t sock, const std::string& data);

} // namespace platform
