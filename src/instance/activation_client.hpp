#pragma once

#include <core/constants.hpp>

// Talks to whichever process owns the activation listener.
class ActivationClient {
public:
    // Connect to 127.0.0.1:port, send the request word and wait for the ack.
    // True only if the reply is exactly the ack. Refused, timed out or garbled
    // exchanges return false; nothing here throws.
    static bool send_activation(int port, int timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS);

    // Check if something accepts TCP connections on 127.0.0.1:port.
    static bool is_listening(int port, int timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS);
};
