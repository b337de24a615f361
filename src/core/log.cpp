#include "log.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <mutex>

namespace {

std::mutex& log_mutex() {
    static std::mutex m;
    return m;
}

std::string& log_path_override() {
    static std::string path;
    return path;
}

std::string default_log_path() {
    try {
        return (platform::temp_dir() / "solo_debug.log").string();
    } catch (const std::exception&) {
        return "solo_debug.log";
    }
}

} // namespace

std::string solo_log_path() {
    std::lock_guard<std::mutex> lock(log_mutex());
    const std::string& p = log_path_override();
    return p.empty() ? default_log_path() : p;
}

void set_solo_log_path(const std::string& path) {
    std::lock_guard<std::mutex> lock(log_mutex());
    log_path_override() = path;
}

void solo_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &t);
#else
    localtime_r(&t, &tm_buf);
#endif

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    std::lock_guard<std::mutex> lock(log_mutex());
    const std::string& p = log_path_override();
    std::ofstream out(p.empty() ? default_log_path() : p, std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}
