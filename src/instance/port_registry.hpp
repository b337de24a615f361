#pragma once

#include <filesystem>
#include <optional>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Text file publishing the primary's listening port as decimal digits.
// Only the primary writes it; anyone may read it.
class PortRegistry {
public:
    explicit PortRegistry(fs::path port_path);

    // Overwrite the file with the port. Not atomic: a torn write reads back as absent.
    Result<void> publish(int port);

    // The published port, or nullopt if the file is missing, unparsable,
    // or outside the open interval (0, 65535).
    std::optional<int> read() const;

    // Delete the file. A missing file is not an error; other failures are logged.
    void clear();

    const fs::path& path() const { return path_; }

private:
    fs::path path_;
};
