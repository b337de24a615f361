#pragma once

#include <filesystem>
#include <string>

namespace fs = std::filesystem;

// Directory holding lock and port files when none is configured (system temp).
fs::path default_runtime_dir();

// {dir}/{app_id}.lock
fs::path lock_file_path(const fs::path& runtime_dir, const std::string& app_id);

// {dir}/{app_id}.port
fs::path port_file_path(const fs::path& runtime_dir, const std::string& app_id);

// An app id becomes a file name stem: non-empty, no separators, no "..".
bool is_valid_app_id(const std::string& app_id);

// Create the runtime directory if missing. Throws fs::filesystem_error on failure.
void ensure_runtime_dir(const fs::path& runtime_dir);
