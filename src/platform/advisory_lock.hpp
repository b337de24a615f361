#pragma once

#include <filesystem>
#include <optional>

// Exclusive, non-blocking, process-scoped lock on a file.
// Uses flock() on Unix, LockFileEx() on Windows. Only other processes using
// the same call are excluded; two AdvisoryLock objects in one process on the
// same path also exclude each other.
// The OS drops the lock when the process exits (even on crash), but the file
// itself is only removed by release().
class AdvisoryLock {
public:
    explicit AdvisoryLock(std::filesystem::path lock_path);
    ~AdvisoryLock();

    AdvisoryLock(const AdvisoryLock&) = delete;
    AdvisoryLock& operator=(const AdvisoryLock&) = delete;

    // Single attempt. Returns true and keeps the handle if the lock was free,
    // false immediately if another holder has it. Never blocks or waits.
    // On success the file holds our pid (diagnostic only).
    bool acquire();

    // Unlock, close, delete the file. Deletion failure is logged only.
    // No-op when the lock is not held.
    void release();

    bool held() const { return fd_ >= 0; }
    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
    int fd_ = -1;
};

// Pid recorded by the current holder, if the file exists and is readable.
std::optional<long> read_lock_owner(const std::filesystem::path& lock_path);
