#pragma once

#include <atomic>
#include <thread>
#include <core/constants.hpp>
#include <core/types.hpp>
#include <platform/socket_util.hpp>

// Loopback listener owned by the primary instance.
// One accept-loop thread polls the listening socket so stop() never has to
// tear the socket down from another thread.
class ActivationServer {
public:
    explicit ActivationServer(int poll_interval_ms = DEFAULT_POLL_INTERVAL_MS,
                              int read_timeout_ms = DEFAULT_READ_TIMEOUT_MS);
    ~ActivationServer();

    // Non-copyable, non-movable (thread + atomic)
    ActivationServer(const ActivationServer&) = delete;
    ActivationServer& operator=(const ActivationServer&) = delete;

    // Bind 127.0.0.1 on an OS-assigned port, start the accept loop, return the port.
    // Never throws; socket failures come back as Err.
    // The callback runs on the accept-loop thread and should only hand off work.
    Result<int> start(ActivationCallback callback);

    // Signal the loop, join it (at most one poll interval plus any request in
    // flight), close the socket. Idempotent. From inside the callback it only
    // signals; the next stop() from another thread finishes the job.
    void stop();

    // True while the accept loop serves. Turns false on stop() or when the
    // listening socket fails; stop() is still needed to release it then.
    bool running() const { return serving_.load(); }
    int port() const { return port_; }

private:
    void accept_loop();
    void serve_connection(socket_t client);

    int poll_interval_ms_;
    int read_timeout_ms_;
    ActivationCallback callback_;
    socket_t listen_fd_ = SOLO_INVALID_SOCKET;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::atomic<bool> serving_{false};
    std::thread thread_;
};
