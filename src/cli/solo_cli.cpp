#include "solo_cli.hpp"
#include "theme.hpp"
#include <core/log.hpp>
#include <instance/activation_client.hpp>
#include <instance/instance_coordinator.hpp>
#include <instance/port_registry.hpp>
#include <platform/advisory_lock.hpp>
#include <fmt/format.h>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void on_signal(int) {
    g_stop_requested = 1;
}

// Activations arrive on the listener thread; the main loop drains them here.
class ActivationInbox {
public:
    void post() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++pending_;
        }
        cv_.notify_one();
    }

    int take(std::chrono::milliseconds wait) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, wait, [this] { return pending_ > 0; });
        int n = pending_;
        pending_ = 0;
        return n;
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    int pending_ = 0;
};

} // namespace

SoloCLI::SoloCLI(Config config) : config_(std::move(config)) {}

int SoloCLI::run() {
    InstanceOptions opts = config_.instance_options();
    ActivationInbox inbox;
    InstanceCoordinator coordinator(opts);

    // Before claiming, so an interrupt mid-launch still runs release()
    g_stop_requested = 0;
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    LaunchOutcome outcome = coordinator.claim_or_forward([&inbox] { inbox.post(); });
    solo_log(fmt::format("cli: launch outcome for '{}' is {}", opts.app_id, to_string(outcome)));

    if (outcome == LaunchOutcome::Forwarded) {
        std::cout << theme::ok(fmt::format("'{}' is already running, asked it to come forward",
                                           opts.app_id));
        return 0;
    }
    if (outcome == LaunchOutcome::Unreachable) {
        std::cout << theme::fail(fmt::format("'{}' is locked by another process that does not answer",
                                             opts.app_id));
        return 2;
    }

    std::cout << theme::banner();
    std::cout << theme::ok(fmt::format("Primary instance of '{}' on port {}",
                                       opts.app_id, coordinator.port()));
    std::cout << theme::info("Waiting for activation requests (Ctrl+C to exit)") << std::flush;

    int total = 0;
    while (!g_stop_requested) {
        int n = inbox.take(std::chrono::milliseconds(200));
        for (int i = 0; i < n; ++i) {
            ++total;
            std::cout << theme::info(fmt::format("Activation request #{}", total)) << std::flush;
        }

        if (!coordinator.serving() &&
            !coordinator.acquire([&inbox] { inbox.post(); })) {
            std::cout << theme::fail("Activation listener failed and could not be restarted");
            return 1;
        }
    }

    coordinator.release();
    std::cout << "\n" << theme::ok(fmt::format("Released '{}'", opts.app_id));
    return 0;
}

int SoloCLI::run_activate() {
    InstanceCoordinator coordinator(config_.instance_options());
    if (coordinator.activate_existing()) {
        std::cout << theme::ok("Running instance acknowledged");
        return 0;
    }
    std::cout << theme::fail(fmt::format("No running instance of '{}' answered",
                                         config_.app_id()));
    return 1;
}

int SoloCLI::run_status() {
    InstanceCoordinator coordinator(config_.instance_options());
    auto owner = read_lock_owner(coordinator.lock_path());
    auto port = PortRegistry(coordinator.port_path()).read();
    bool answering = port && ActivationClient::is_listening(*port, config_.connect_timeout_ms());

    std::cout << theme::section("Status");
    std::cout << theme::kv("app id", config_.app_id());
    std::cout << theme::kv("dir", coordinator.options().runtime_dir.string());
    std::cout << theme::kv("lock", owner ? fmt::format("pid {}", *owner) : std::string("free"));
    std::cout << theme::kv("port", port ? std::to_string(*port) : std::string("-"));
    if (port) {
        std::cout << theme::kv("listener", answering ? "answering" : "not answering");
    }
    std::cout << theme::kv("log", solo_log_path());
    std::cout << "\n";
    if (port && !answering) {
        std::cout << theme::warn("Published port does not answer (stale port file or hung owner)");
    }
    return answering ? 0 : 1;
}

int run_init_config() {
    fs::path path = get_config_path();
    bool existed = fs::exists(path);
    auto r = create_default_config(path);
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << (existed ? theme::info("Config already exists: " + path.string())
                          : theme::ok("Wrote " + path.string()));
    return 0;
}
