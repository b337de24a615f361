#pragma once

#include <string>

// Debug log shared by every component. Defaults to {temp}/solo_debug.log.
std::string solo_log_path();

// Redirect the debug log (empty string restores the default).
void set_solo_log_path(const std::string& path);

// Append a "[HH:MM:SS.mmm] msg" line. Safe from any thread, never throws.
void solo_log(const std::string& msg);
