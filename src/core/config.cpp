#include "config.hpp"
#include "constants.hpp"
#include "instance_paths.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

// Read an optional integer key and check it against [lo, hi].
static Result<void> read_bounded_int(const YAML::Node& root, const char* key,
                                     int lo, int hi, int& out) {
    if (!root[key]) return Result<void>::Ok();
    if (!root[key].IsScalar()) {
        return Result<void>::Err(fmt::format("'{}' must be a number", key));
    }
    int value = root[key].as<int>();
    if (value < lo || value > hi) {
        return Result<void>::Err(fmt::format("'{}' must be between {} and {} (got {})",
                                             key, lo, hi, value));
    }
    out = value;
    return Result<void>::Ok();
}

Config::Config()
    : app_id_(DEFAULT_APP_ID),
      poll_interval_ms_(DEFAULT_POLL_INTERVAL_MS),
      connect_timeout_ms_(DEFAULT_CONNECT_TIMEOUT_MS),
      read_timeout_ms_(DEFAULT_READ_TIMEOUT_MS) {}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Err("Config file not found: " + path.string());
    }

    Config config;
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        if (root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(fmt::format("{}: top level must be a mapping", path.string()));
        }

        if (root["app_id"]) {
            auto r = config.override_app_id(root["app_id"].as<std::string>());
            if (r.is_err()) return Result<Config>::Err(fmt::format("{}: {}", path.string(), r.error));
        }

        std::string runtime_dir = root["runtime_dir"].as<std::string>("");
        if (!runtime_dir.empty()) {
            config.runtime_dir_ = fs::path(runtime_dir);
        }

        for (auto r : {
                 read_bounded_int(root, "poll_interval_ms", MIN_POLL_INTERVAL_MS,
                                  MAX_POLL_INTERVAL_MS, config.poll_interval_ms_),
                 read_bounded_int(root, "connect_timeout_ms", MIN_IO_TIMEOUT_MS,
                                  MAX_IO_TIMEOUT_MS, config.connect_timeout_ms_),
                 read_bounded_int(root, "read_timeout_ms", MIN_IO_TIMEOUT_MS,
                                  MAX_IO_TIMEOUT_MS, config.read_timeout_ms_)}) {
            if (r.is_err()) return Result<Config>::Err(fmt::format("{}: {}", path.string(), r.error));
        }

        int port = 0;
        auto pr = read_bounded_int(root, "port", 0, 65535, port);
        if (pr.is_err()) return Result<Config>::Err(fmt::format("{}: {}", path.string(), pr.error));
        if (port > 0) config.port_ = port;

        config.log_file_ = root["log_file"].as<std::string>("");
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(fmt::format("Invalid config {}: {}", path.string(), e.what()));
    }

    return Result<Config>::Ok(config);
}

Result<Config> Config::load_default() {
    if (!config_exists()) {
        return Result<Config>::Ok(Config{});
    }
    return load(get_config_path());
}

Result<void> Config::override_app_id(const std::string& app_id) {
    if (!is_valid_app_id(app_id)) {
        return Result<void>::Err(fmt::format("invalid app_id '{}'", app_id));
    }
    app_id_ = app_id;
    return Result<void>::Ok();
}

InstanceOptions Config::instance_options() const {
    InstanceOptions opts;
    opts.app_id = app_id_;
    opts.runtime_dir = runtime_dir_.empty() ? default_runtime_dir() : runtime_dir_;
    opts.poll_interval_ms = poll_interval_ms_;
    opts.connect_timeout_ms = connect_timeout_ms_;
    opts.read_timeout_ms = read_timeout_ms_;
    opts.port = port_;
    return opts;
}

fs::path get_config_dir() {
    return platform::home_dir() / ".solo";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    if (path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(path.parent_path(), ec);
        if (ec) {
            return Result<void>::Err(fmt::format("Cannot create {}: {}",
                                                 path.parent_path().string(), ec.message()));
        }
    }

    const char* default_config = R"(# solo single-instance configuration

# Identifier shared by every copy of the application. Names the lock and
# port files, so it must not contain path separators.
app_id: work-stack

# Where {app_id}.lock and {app_id}.port live. Empty = system temp directory.
runtime_dir: ""

# Accept-loop poll interval; also the worst-case shutdown latency.
poll_interval_ms: 500

# How long a duplicate waits for the running instance to answer.
connect_timeout_ms: 1000

# How long the running instance waits for a request on an accepted connection.
read_timeout_ms: 1000

# Fixed port to activate instead of reading the port file (0 = read the file).
port: 0

# Debug log. Empty = {temp}/solo_debug.log
log_file: ""
)";

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err("Cannot write " + path.string());
    }
    out << default_config;
    return Result<void>::Ok();
}
