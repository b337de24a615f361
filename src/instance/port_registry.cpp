#include "port_registry.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

PortRegistry::PortRegistry(fs::path port_path)
    : path_(std::move(port_path)) {}

Result<void> PortRegistry::publish(int port) {
    if (port <= 0 || port >= MAX_PORT_EXCLUSIVE) {
        return Result<void>::Err(fmt::format("port {} cannot be published", port));
    }

    std::ofstream out(path_, std::ios::trunc);
    if (!out) {
        solo_log(fmt::format("PortRegistry: cannot open {} for writing", path_.string()));
        return Result<void>::Err("Cannot write port file " + path_.string());
    }
    out << port;
    out.flush();
    if (!out) {
        solo_log(fmt::format("PortRegistry: write to {} failed", path_.string()));
        return Result<void>::Err("Cannot write port file " + path_.string());
    }

    solo_log(fmt::format("PortRegistry: published port {} to {}", port, path_.string()));
    return Result<void>::Ok();
}

std::optional<int> PortRegistry::read() const {
    std::ifstream in(path_);
    if (!in) return std::nullopt;

    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    auto value = parse_int_strict(content);
    if (!value) {
        solo_log(fmt::format("PortRegistry: ignoring unparsable port file {}", path_.string()));
        return std::nullopt;
    }
    if (*value <= 0 || *value >= MAX_PORT_EXCLUSIVE) {
        solo_log(fmt::format("PortRegistry: ignoring out-of-range port {} in {}",
                             *value, path_.string()));
        return std::nullopt;
    }
    return static_cast<int>(*value);
}

void PortRegistry::clear() {
    std::error_code ec;
    fs::remove(path_, ec);
    if (ec) {
        solo_log(fmt::format("PortRegistry: could not remove {}: {}", path_.string(), ec.message()));
    }
}
