#pragma once

#include <string>
#include <optional>
#include <functional>
#include <filesystem>
#include "constants.hpp"

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Settings for one InstanceCoordinator
struct InstanceOptions {
    std::string app_id;
    std::filesystem::path runtime_dir;   // holds {app_id}.lock and {app_id}.port
    int poll_interval_ms = DEFAULT_POLL_INTERVAL_MS;      // accept-loop poll timeout
    int connect_timeout_ms = DEFAULT_CONNECT_TIMEOUT_MS;  // activation client deadline
    int read_timeout_ms = DEFAULT_READ_TIMEOUT_MS;        // per-connection server read deadline
    std::optional<int> port;             // fixed port for activate_existing, skips the registry
};

// Invoked on the accept-loop thread when another process asks us to come forward
using ActivationCallback = std::function<void()>;
