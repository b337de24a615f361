#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file. Missing keys keep their defaults.
    static Result<Config> load(const fs::path& path);

    // Load ~/.solo/config.yaml, or built-in defaults when it does not exist
    static Result<Config> load_default();

    // Accessors
    const std::string& app_id() const { return app_id_; }
    const fs::path& runtime_dir() const { return runtime_dir_; }
    int poll_interval_ms() const { return poll_interval_ms_; }
    int connect_timeout_ms() const { return connect_timeout_ms_; }
    int read_timeout_ms() const { return read_timeout_ms_; }
    std::optional<int> port() const { return port_; }
    const std::string& log_file() const { return log_file_; }

    // Command-line override of app_id; rejected if it cannot name a file
    Result<void> override_app_id(const std::string& app_id);

    // Settings for an InstanceCoordinator (runtime_dir resolved to temp if unset)
    InstanceOptions instance_options() const;

    Config();

private:
    std::string app_id_;
    fs::path runtime_dir_;
    int poll_interval_ms_;
    int connect_timeout_ms_;
    int read_timeout_ms_;
    std::optional<int> port_;
    std::string log_file_;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();

// Write a commented default config. Leaves an existing file alone.
Result<void> create_default_config(const fs::path& path = get_config_path());
