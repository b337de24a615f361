#include "advisory_lock.hpp"
#include "platform.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <cerrno>
#include <cstring>
#include <string>
#include <sys/file.h>
#include <sys/stat.h>
#include <fcntl.h>
#include <unistd.h>

namespace {

// flock() attaches to the inode. If a previous holder unlinked the file between
// our open() and flock(), we hold a lock nobody else can see.
bool still_linked(int fd, const std::string& path) {
    struct stat by_fd;
    struct stat by_path;
    if (fstat(fd, &by_fd) != 0 || stat(path.c_str(), &by_path) != 0) {
        return false;
    }
    return by_fd.st_dev == by_path.st_dev && by_fd.st_ino == by_path.st_ino;
}

void write_owner_pid(int fd, const std::string& path) {
    std::string pid = std::to_string(platform::current_pid());
    if (ftruncate(fd, 0) != 0 ||
        pwrite(fd, pid.data(), pid.size(), 0) != static_cast<ssize_t>(pid.size())) {
        solo_log(fmt::format("AdvisoryLock: could not record pid in {}: {}",
                             path, std::strerror(errno)));
    }
}

} // namespace

bool AdvisoryLock::acquire() {
    if (held()) return true;

    const std::string path = path_.string();
    // A second attempt covers a holder that released between our open() and flock()
    for (int attempt = 0; attempt < 2; ++attempt) {
        int fd = open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
        if (fd < 0) {
            solo_log(fmt::format("AdvisoryLock: cannot open {}: {}", path, std::strerror(errno)));
            return false;
        }

        if (flock(fd, LOCK_EX | LOCK_NB) != 0) {
            int err = errno;
            close(fd);
            if (err == EWOULDBLOCK) {
                solo_log(fmt::format("AdvisoryLock: {} is held by another process", path));
            } else {
                solo_log(fmt::format("AdvisoryLock: flock({}) failed: {}", path, std::strerror(err)));
            }
            return false;
        }

        if (!still_linked(fd, path)) {
            solo_log(fmt::format("AdvisoryLock: {} was removed by its previous holder", path));
            flock(fd, LOCK_UN);
            close(fd);
            continue;
        }

        fd_ = fd;
        write_owner_pid(fd_, path);
        solo_log(fmt::format("AdvisoryLock: acquired {} (pid {})", path, platform::current_pid()));
        return true;
    }
    return false;
}

void AdvisoryLock::release() {
    if (fd_ < 0) return;

    // Unlink while still locked so a waiter on the old inode cannot win it
    const std::string path = path_.string();
    if (unlink(path.c_str()) != 0 && errno != ENOENT) {
        solo_log(fmt::format("AdvisoryLock: could not remove {}: {}", path, std::strerror(errno)));
    }

    if (flock(fd_, LOCK_UN) != 0) {
        solo_log(fmt::format("AdvisoryLock: unlock of {} failed: {}", path, std::strerror(errno)));
    }
    close(fd_);
    fd_ = -1;
    solo_log(fmt::format("AdvisoryLock: released {}", path));
}
