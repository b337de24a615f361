#include "advisory_lock.hpp"
#include "platform.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <string>
#include <system_error>

#ifndef WIN32_LEAN_AND_MEAN
#  define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#include <io.h>
#include <fcntl.h>
#include <sys/stat.h>

bool AdvisoryLock::acquire() {
    if (held()) return true;

    const std::string path = path_.string();
    int fd = _open(path.c_str(), _O_CREAT | _O_RDWR | _O_BINARY | _O_NOINHERIT,
                   _S_IREAD | _S_IWRITE);
    if (fd < 0) {
        solo_log(fmt::format("AdvisoryLock: cannot open {}", path));
        return false;
    }

    HANDLE h = (HANDLE)_get_osfhandle(fd);
    OVERLAPPED ov = {};
    if (!LockFileEx(h, LOCKFILE_EXCLUSIVE_LOCK | LOCKFILE_FAIL_IMMEDIATELY,
                    0, 1, 0, &ov)) {
        DWORD err = GetLastError();
        _close(fd);
        if (err == ERROR_LOCK_VIOLATION) {
            solo_log(fmt::format("AdvisoryLock: {} is held by another process", path));
        } else {
            solo_log(fmt::format("AdvisoryLock: LockFileEx({}) failed: {}", path, err));
        }
        return false;
    }

    fd_ = fd;
    std::string pid = std::to_string(platform::current_pid());
    if (_chsize(fd_, 0) != 0 || _lseek(fd_, 0, SEEK_SET) != 0 ||
        _write(fd_, pid.data(), static_cast<unsigned>(pid.size())) != static_cast<int>(pid.size())) {
        solo_log(fmt::format("AdvisoryLock: could not record pid in {}", path));
    }
    solo_log(fmt::format("AdvisoryLock: acquired {} (pid {})", path, platform::current_pid()));
    return true;
}

void AdvisoryLock::release() {
    if (fd_ < 0) return;

    const std::string path = path_.string();
    HANDLE h = (HANDLE)_get_osfhandle(fd_);
    OVERLAPPED ov = {};
    if (!UnlockFileEx(h, 0, 1, 0, &ov)) {
        solo_log(fmt::format("AdvisoryLock: unlock of {} failed: {}", path, GetLastError()));
    }
    _close(fd_);
    fd_ = -1;

    // An open handle blocks deletion on Windows, so remove after closing
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    if (ec) {
        solo_log(fmt::format("AdvisoryLock: could not remove {}: {}", path, ec.message()));
    }
    solo_log(fmt::format("AdvisoryLock: released {}", path));
}
