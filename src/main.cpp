#include <iostream>
#include <optional>
#include <string>
#include "cli/solo_cli.hpp"
#include "cli/theme.hpp"
#include <core/config.hpp>
#include <core/constants.hpp>
#include <core/log.hpp>

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    std::cout << theme::color::BLUE << "    solo run"
              << theme::color::RESET << theme::color::DIM
              << "              Become the running instance, or activate it" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    solo activate"
              << theme::color::RESET << theme::color::DIM
              << "         Ask the running instance to come forward" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    solo status"
              << theme::color::RESET << theme::color::DIM
              << "           Show lock owner and published port" << theme::color::RESET << "\n";
    std::cout << theme::color::BLUE << "    solo init-config"
              << theme::color::RESET << theme::color::DIM
              << "      Write ~/.solo/config.yaml" << theme::color::RESET << "\n";
    std::cout << "\n";
    std::cout << theme::color::DIM
              << "    --config <path>       Use this config file\n"
              << "    --app-id <id>         Override the app id\n"
              << "    solo --version        Show version\n"
              << "    solo --help           Show this help"
              << theme::color::RESET << "\n\n";
}

int main(int argc, char** argv) {
    try {
        if (argc == 1) {
            print_usage();
            return 1;
        }

        std::string cmd = argv[1];
        if (cmd == "--version") {
            std::cout << theme::color::BLUE << theme::color::BOLD << "solo"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << SOLO_VERSION << theme::color::RESET << "\n";
            return 0;
        } else if (cmd == "--help") {
            print_usage();
            return 0;
        } else if (cmd == "init-config") {
            return run_init_config();
        } else if (cmd != "run" && cmd != "activate" && cmd != "status") {
            std::cout << theme::fail("Unknown command: " + cmd);
            print_usage();
            return 1;
        }

        std::optional<std::string> config_path;
        std::optional<std::string> app_id;
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--app-id" && i + 1 < argc) {
                app_id = argv[++i];
            } else {
                std::cout << theme::fail("Unexpected argument: " + arg);
                return 1;
            }
        }

        auto loaded = config_path ? Config::load(*config_path) : Config::load_default();
        if (loaded.is_err()) {
            std::cout << theme::fail(loaded.error);
            return 1;
        }
        Config config = loaded.value;
        if (app_id) {
            auto r = config.override_app_id(*app_id);
            if (r.is_err()) {
                std::cout << theme::fail(r.error);
                return 1;
            }
        }
        if (!config.log_file().empty()) {
            set_solo_log_path(config.log_file());
        }

        SoloCLI cli(config);
        if (cmd == "run") return cli.run();
        if (cmd == "activate") return cli.run_activate();
        return cli.run_status();
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
