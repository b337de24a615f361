#include "activation_client.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>
#include <chrono>
#include <string>
#ifndef _WIN32
#  include <sys/socket.h>
#  include <netinet/in.h>
#endif

using Clock = std::chrono::steady_clock;

static int ms_until(Clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - Clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

// Non-blocking connect bounded by the deadline. Returns an open socket or
// SOLO_INVALID_SOCKET.
static socket_t connect_loopback(int port, Clock::time_point deadline) {
    platform::init_networking();
    socket_t sock = socket(AF_INET, SOCK_STREAM, 0);
    if (sock == SOLO_INVALID_SOCKET) return SOLO_INVALID_SOCKET;
    platform::set_nonblocking(sock);

    sockaddr_in addr = platform::loopback_address(port);
    int rc = connect(sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (rc == 0) return sock;

    if (!platform::connect_in_progress()) {
        platform::close_socket(sock);
        return SOLO_INVALID_SOCKET;
    }

    int rev = platform::poll_socket(sock, POLLOUT, ms_until(deadline));
    if (!(rev & POLLOUT) || platform::socket_error(sock) != 0) {
        platform::close_socket(sock);
        return SOLO_INVALID_SOCKET;
    }
    return sock;
}

bool ActivationClient::send_activation(int port, int timeout_ms) {
    if (port <= 0 || port > 65535) {
        solo_log(fmt::format("ActivationClient: refusing invalid port {}", port));
        return false;
    }

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    socket_t sock = connect_loopback(port, deadline);
    if (sock == SOLO_INVALID_SOCKET) {
        solo_log(fmt::format("ActivationClient: nothing answered on port {}", port));
        return false;
    }

    if (!platform::send_all(sock, ACTIVATE_REQUEST)) {
        solo_log(fmt::format("ActivationClient: send to port {} failed", port));
        platform::close_socket(sock);
        return false;
    }

    // Server replies then closes; read until close or deadline
    std::string reply;
    char buf[ACTIVATION_REPLY_BUF_SIZE];
    while (reply.size() < sizeof(buf)) {
        int wait_ms = ms_until(deadline);
        if (wait_ms == 0) break;
        if (platform::poll_socket(sock, POLLIN, wait_ms) == 0) break;

        int n = platform::recv_some(sock, buf, static_cast<int>(sizeof(buf) - reply.size()));
        if (n <= 0) break;
        reply.append(buf, static_cast<size_t>(n));
    }
    platform::close_socket(sock);

    if (trimmed(reply) != ACTIVATE_ACK) {
        solo_log(fmt::format("ActivationClient: port {} gave no acknowledgement", port));
        return false;
    }

    solo_log(fmt::format("ActivationClient: instance on port {} acknowledged activation", port));
    return true;
}

bool ActivationClient::is_listening(int port, int timeout_ms) {
    if (port <= 0 || port > 65535) return false;

    auto deadline = Clock::now() + std::chrono::milliseconds(timeout_ms);
    socket_t sock = connect_loopback(port, deadline);
    if (sock == SOLO_INVALID_SOCKET) return false;
    platform::close_socket(sock);
    return true;
}
