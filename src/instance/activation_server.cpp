#include "activation_server.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <string>
#include <system_error>
#ifndef _WIN32
#  include <sys/socket.h>
#  include <netinet/in.h>
#endif

// ── Construction / Destruction ──────────────────────────────

ActivationServer::ActivationServer(int poll_interval_ms, int read_timeout_ms)
    : poll_interval_ms_(poll_interval_ms), read_timeout_ms_(read_timeout_ms) {}

ActivationServer::~ActivationServer() {
    stop();
}

// ── Lifecycle ───────────────────────────────────────────────

Result<int> ActivationServer::start(ActivationCallback callback) {
    if (thread_.joinable()) {
        return Result<int>::Err("activation server already running");
    }

    platform::init_networking();
    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == SOLO_INVALID_SOCKET) {
        solo_log("ActivationServer: socket() failed");
        return Result<int>::Err("socket() failed");
    }

    sockaddr_in addr = platform::loopback_address(0);
    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        solo_log("ActivationServer: bind() on loopback failed");
        platform::close_socket(fd);
        return Result<int>::Err("bind() failed");
    }

    if (listen(fd, ACTIVATION_BACKLOG) != 0) {
        solo_log("ActivationServer: listen() failed");
        platform::close_socket(fd);
        return Result<int>::Err("listen() failed");
    }

    int port = platform::bound_port(fd);
    if (port <= 0) {
        solo_log("ActivationServer: getsockname() failed");
        platform::close_socket(fd);
        return Result<int>::Err("could not determine listening port");
    }

    listen_fd_ = fd;
    port_ = port;
    callback_ = std::move(callback);
    stop_.store(false);
    serving_.store(true);

    try {
        thread_ = std::thread(&ActivationServer::accept_loop, this);
    } catch (const std::system_error& e) {
        solo_log(fmt::format("ActivationServer: cannot start accept thread: {}", e.what()));
        platform::close_socket(listen_fd_);
        listen_fd_ = SOLO_INVALID_SOCKET;
        port_ = 0;
        serving_.store(false);
        return Result<int>::Err(std::string("cannot start accept thread: ") + e.what());
    }

    solo_log(fmt::format("ActivationServer: listening on {}:{}", LOOPBACK_ADDRESS, port_));
    return Result<int>::Ok(port_);
}

void ActivationServer::stop() {
    stop_.store(true);

    if (thread_.joinable()) {
        if (thread_.get_id() == std::this_thread::get_id()) {
            solo_log("ActivationServer: stop() called from the accept loop, deferring join");
            return;
        }
        thread_.join();
    }

    if (listen_fd_ != SOLO_INVALID_SOCKET) {
        platform::close_socket(listen_fd_);
        listen_fd_ = SOLO_INVALID_SOCKET;
        solo_log(fmt::format("ActivationServer: stopped listening on port {}", port_));
    }
    port_ = 0;
}

// ── Accept loop ─────────────────────────────────────────────

void ActivationServer::accept_loop() {
    bool accept_failing = false;
    while (!stop_.load()) {
        // Accept with timeout so we can check stop flag
        int rev = platform::poll_socket(listen_fd_, POLLIN, poll_interval_ms_);
        if (rev == 0) continue;
        if (rev & (POLLERR | POLLHUP | POLLNVAL)) {
            solo_log(fmt::format("ActivationServer: listening socket on port {} failed, "
                                 "accept loop exiting", port_));
            break;
        }

        socket_t client = accept(listen_fd_, nullptr, nullptr);
        if (client == SOLO_INVALID_SOCKET) {
            // A pending connection keeps the socket readable (e.g. out of fds),
            // so back off instead of polling again right away
            if (!accept_failing) {
                solo_log("ActivationServer: accept() failed, backing off");
                accept_failing = true;
            }
            platform::sleep_ms(poll_interval_ms_);
            continue;
        }
        accept_failing = false;

        serve_connection(client);
        platform::close_socket(client);
    }
    serving_.store(false);
}

void ActivationServer::serve_connection(socket_t client) {
    const std::string expected = ACTIVATE_REQUEST;
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(read_timeout_ms_);

    std::string request;
    char buf[ACTIVATION_READ_BUF_SIZE];
    while (!stop_.load() && request.size() < sizeof(buf)) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) break;

        int wait_ms = static_cast<int>(std::min<long long>(remaining, poll_interval_ms_));
        if (platform::poll_socket(client, POLLIN, wait_ms) == 0) continue;

        int n = platform::recv_some(client, buf, static_cast<int>(sizeof(buf) - request.size()));
        if (n <= 0) break;  // client closed or error
        request.append(buf, static_cast<size_t>(n));

        // Enough bytes to decide
        if (trimmed(request).size() >= expected.size()) break;
    }

    if (trimmed(request) != expected) {
        if (!request.empty()) {
            solo_log(fmt::format("ActivationServer: ignored unexpected request ({} bytes)",
                                 request.size()));
        }
        return;
    }

    solo_log("ActivationServer: activation requested");
    if (callback_) {
        try {
            callback_();
        } catch (const std::exception& e) {
            solo_log(fmt::format("ActivationServer: activation callback threw: {}", e.what()));
        } catch (...) {
            solo_log("ActivationServer: activation callback threw a non-standard exception");
        }
    }

    if (!platform::send_all(client, ACTIVATE_ACK)) {
        solo_log("ActivationServer: could not send acknowledgement");
    }
}
