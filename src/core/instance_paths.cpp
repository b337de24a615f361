#include "instance_paths.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>

fs::path default_runtime_dir() {
    return platform::temp_dir();
}

fs::path lock_file_path(const fs::path& runtime_dir, const std::string& app_id) {
    return runtime_dir / (app_id + LOCK_FILE_SUFFIX);
}

fs::path port_file_path(const fs::path& runtime_dir, const std::string& app_id) {
    return runtime_dir / (app_id + PORT_FILE_SUFFIX);
}

bool is_valid_app_id(const std::string& app_id) {
    if (app_id.empty() || app_id == "." || app_id == "..") return false;
    if (app_id.find("..") != std::string::npos) return false;
    return app_id.find_first_of("/\\:") == std::string::npos;
}

void ensure_runtime_dir(const fs::path& runtime_dir) {
    if (runtime_dir.empty()) return;
    fs::create_directories(runtime_dir);
}
