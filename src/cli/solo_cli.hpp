#pragma once

#include <core/config.hpp>

class SoloCLI {
public:
    explicit SoloCLI(Config config);

    // Become the primary and serve activations until SIGINT/SIGTERM, or hand
    // the launch over to the running instance.
    // Exit codes: 0 primary/forwarded, 2 running instance unreachable.
    int run();

    // Ask the running instance to come forward. 0 on acknowledgement, 1 otherwise.
    int run_activate();

    // Print lock owner, port record and whether the listener answers.
    int run_status();

private:
    Config config_;
};

// Write the default config file. 0 on success.
int run_init_config();
