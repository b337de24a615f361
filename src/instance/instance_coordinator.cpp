#include "instance_coordinator.hpp"
#include "activation_client.hpp"
#include <core/instance_paths.hpp>
#include <core/log.hpp>
#include <fmt/format.h>

const char* to_string(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Idle:      return "idle";
        case CoordinatorState::Acquiring: return "acquiring";
        case CoordinatorState::Primary:   return "primary";
        case CoordinatorState::Releasing: return "releasing";
        case CoordinatorState::Released:  return "released";
    }
    return "unknown";
}

const char* to_string(LaunchOutcome outcome) {
    switch (outcome) {
        case LaunchOutcome::Primary:     return "primary";
        case LaunchOutcome::Forwarded:   return "forwarded";
        case LaunchOutcome::Unreachable: return "unreachable";
    }
    return "unknown";
}

static InstanceOptions with_runtime_dir(InstanceOptions options) {
    if (options.runtime_dir.empty()) {
        options.runtime_dir = default_runtime_dir();
    }
    return options;
}

// ── Construction / Destruction ──────────────────────────────

InstanceCoordinator::InstanceCoordinator(InstanceOptions options)
    : options_(with_runtime_dir(std::move(options))),
      lock_(lock_file_path(options_.runtime_dir, options_.app_id)),
      registry_(port_file_path(options_.runtime_dir, options_.app_id)),
      server_(options_.poll_interval_ms, options_.read_timeout_ms) {}

InstanceCoordinator::~InstanceCoordinator() {
    release();
}

// ── Primary lifecycle ───────────────────────────────────────

bool InstanceCoordinator::acquire(ActivationCallback on_activation_requested) {
    if (state_ == CoordinatorState::Primary) {
        if (server_.running()) return true;

        // Listener died under us: withdraw its port, then bring up a new one
        solo_log(fmt::format("InstanceCoordinator: listener for '{}' is gone, restarting it",
                             options_.app_id));
        registry_.clear();
        server_.stop();
        state_ = CoordinatorState::Acquiring;
        if (!start_listener(std::move(on_activation_requested))) {
            lock_.release();
            state_ = CoordinatorState::Idle;
            return false;
        }
        state_ = CoordinatorState::Primary;
        return true;
    }

    if (!is_valid_app_id(options_.app_id)) {
        solo_log(fmt::format("InstanceCoordinator: invalid app id '{}'", options_.app_id));
        return false;
    }
    try {
        ensure_runtime_dir(options_.runtime_dir);
    } catch (const fs::filesystem_error& e) {
        solo_log(fmt::format("InstanceCoordinator: cannot create runtime dir: {}", e.what()));
        return false;
    }

    state_ = CoordinatorState::Acquiring;
    if (!lock_.acquire()) {
        state_ = CoordinatorState::Idle;
        solo_log(fmt::format("InstanceCoordinator: '{}' already has a primary", options_.app_id));
        return false;
    }

    if (!start_listener(std::move(on_activation_requested))) {
        lock_.release();
        state_ = CoordinatorState::Idle;
        return false;
    }

    state_ = CoordinatorState::Primary;
    return true;
}

// Start the listener and publish its port. On failure nothing is left running
// or published; the lock is the caller's to give back.
bool InstanceCoordinator::start_listener(ActivationCallback on_activation_requested) {
    auto started = server_.start(std::move(on_activation_requested));
    if (started.is_err()) {
        solo_log(fmt::format("InstanceCoordinator: listener failed ({}), giving up the lock",
                             started.error));
        return false;
    }

    auto published = registry_.publish(started.value);
    if (published.is_err()) {
        solo_log(fmt::format("InstanceCoordinator: {}, giving up the lock", published.error));
        server_.stop();
        return false;
    }

    solo_log(fmt::format("InstanceCoordinator: primary for '{}' on port {}",
                         options_.app_id, started.value));
    return true;
}

void InstanceCoordinator::release() {
    if (state_ != CoordinatorState::Primary) return;

    state_ = CoordinatorState::Releasing;
    // Port file goes first so nobody reads a port that is about to close
    registry_.clear();
    server_.stop();
    lock_.release();
    state_ = CoordinatorState::Released;
    solo_log(fmt::format("InstanceCoordinator: released '{}'", options_.app_id));
}

// ── Duplicate side ──────────────────────────────────────────

bool InstanceCoordinator::activate_existing() {
    if (!is_valid_app_id(options_.app_id)) {
        solo_log(fmt::format("InstanceCoordinator: invalid app id '{}'", options_.app_id));
        return false;
    }

    std::optional<int> port = options_.port ? options_.port : registry_.read();
    if (!port) {
        solo_log(fmt::format("InstanceCoordinator: no published port for '{}'", options_.app_id));
        return false;
    }
    return ActivationClient::send_activation(*port, options_.connect_timeout_ms);
}

LaunchOutcome InstanceCoordinator::claim_or_forward(ActivationCallback on_activation_requested) {
    if (acquire(on_activation_requested)) {
        return LaunchOutcome::Primary;
    }
    if (activate_existing()) {
        return LaunchOutcome::Forwarded;
    }

    // Stale port file or a primary mid-shutdown: the lock may be free by now
    solo_log("InstanceCoordinator: running instance did not answer, retrying the lock once");
    if (acquire(std::move(on_activation_requested))) {
        return LaunchOutcome::Primary;
    }
    return LaunchOutcome::Unreachable;
}
