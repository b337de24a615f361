#include "socket_util.hpp"
#include <core/constants.hpp>
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <arpa/inet.h>
#  include <cerrno>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

sockaddr_in loopback_address(int port) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<unsigned short>(port));
    inet_pton(AF_INET, LOOPBACK_ADDRESS, &addr.sin_addr);
    return addr;
}

int bound_port(socket_t sock) {
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return -1;
    }
    return ntohs(addr.sin_port);
}

bool connect_in_progress() {
#ifdef _WIN32
    return WSAGetLastError() == WSAEWOULDBLOCK;
#else
    return errno == EINPROGRESS;
#endif
}

int socket_error(socket_t sock) {
    int err = 0;
    socklen_t len = sizeof(err);
#ifdef _WIN32
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&err), &len) != 0) {
        return WSAGetLastError();
    }
#else
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &len) != 0) {
        return errno;
    }
#endif
    return err;
}

int recv_some(socket_t sock, char* buf, int len) {
#ifdef _WIN32
    int n = recv(sock, buf, len, 0);
    return n == SOCKET_ERROR ? -1 : n;
#else
    ssize_t n = recv(sock, buf, static_cast<size_t>(len), 0);
    return n < 0 ? -1 : static_cast<int>(n);
#endif
}

bool send_all(socket_t sock, const std::string& data) {
#if defined(_WIN32)
    const int flags = 0;
#elif defined(MSG_NOSIGNAL)
    const int flags = MSG_NOSIGNAL;
#else
    const int flags = 0;
#endif
    size_t sent = 0;
    while (sent < data.size()) {
#ifdef _WIN32
        int w = send(sock, data.data() + sent, static_cast<int>(data.size() - sent), flags);
        if (w == SOCKET_ERROR) {
            if (WSAGetLastError() != WSAEWOULDBLOCK) return false;
            if (!(poll_socket(sock, POLLOUT, DEFAULT_CONNECT_TIMEOUT_MS) & POLLOUT)) return false;
            continue;
        }
#else
        ssize_t w = send(sock, data.data() + sent, data.size() - sent, flags);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) return false;
            if (!(poll_socket(sock, POLLOUT, DEFAULT_CONNECT_TIMEOUT_MS) & POLLOUT)) return false;
            continue;
        }
#endif
        sent += static_cast<size_t>(w);
    }
    return true;
}

} // namespace platform
