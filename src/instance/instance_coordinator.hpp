#pragma once

#include <filesystem>
#include <core/types.hpp>
#include <platform/advisory_lock.hpp>
#include "activation_server.hpp"
#include "port_registry.hpp"

enum class CoordinatorState {
    Idle,
    Acquiring,
    Primary,     // lock held, listener running, port published
    Releasing,
    Released,
};

// What claim_or_forward() ended up doing
enum class LaunchOutcome {
    Primary,     // we hold the lock now
    Forwarded,   // the running instance acknowledged our activation
    Unreachable, // someone holds the lock but does not answer
};

const char* to_string(CoordinatorState state);
const char* to_string(LaunchOutcome outcome);

// Decides which process is the primary for an app id and relays activation
// requests to it. One per process; all methods are meant for the main thread.
class InstanceCoordinator {
public:
    explicit InstanceCoordinator(InstanceOptions options);
    ~InstanceCoordinator();

    InstanceCoordinator(const InstanceCoordinator&) = delete;
    InstanceCoordinator& operator=(const InstanceCoordinator&) = delete;

    // Try to become the primary: take the lock, start the listener, publish
    // the port. Returns false if another process holds the lock, or if any step
    // after taking the lock failed (everything is rolled back then).
    // Called again while primary, it only restarts a listener that has died.
    // The callback fires on the listener thread for each activation request.
    bool acquire(ActivationCallback on_activation_requested);

    // Ask the running primary to come forward. False if no port is known or the
    // primary did not acknowledge. Has no side effects either way.
    bool activate_existing();

    // Clear the port file, stop the listener, drop the lock. Safe to repeat.
    void release();

    // acquire(), else activate_existing(), else one more acquire() in case the
    // port file was left behind by a primary that died.
    LaunchOutcome claim_or_forward(ActivationCallback on_activation_requested);

    CoordinatorState state() const { return state_; }
    // Primary with a live listener. False after the listening socket failed.
    bool serving() const { return state_ == CoordinatorState::Primary && server_.running(); }
    int port() const { return server_.port(); }
    const InstanceOptions& options() const { return options_; }
    const std::filesystem::path& lock_path() const { return lock_.path(); }
    const std::filesystem::path& port_path() const { return registry_.path(); }

private:
    bool start_listener(ActivationCallback on_activation_requested);

    InstanceOptions options_;
    AdvisoryLock lock_;
    PortRegistry registry_;
    ActivationServer server_;
    CoordinatorState state_ = CoordinatorState::Idle;
};
