#include "daemon/core/pid_lock.h"

#include "core/error_codes.h"
#include "logging/logger.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <string>
#include <sys/file.h>
#include <unistd.h>

namespace segue::daemon_core {

namespace {

[[noreturn]] void failWithErrno(int fd, const std::string& what, const std::string& path) {
    const int err = errno;
    if (fd >= 0) {
        close(fd);
    }
    throw EngineError(ErrorCode::RESOURCE_PID_FILE,
                      what + " " + path + ": " + std::strerror(err));
}

}  // namespace

std::optional<pid_t> PidLock::recordedPid(const std::string& path) {
    std::ifstream pidfile(path);
    if (!pidfile.is_open()) {
        return std::nullopt;
    }
    long pid = 0;
    if (!(pidfile >> pid) || pid <= 0) {
        return std::nullopt;
    }
    return static_cast<pid_t>(pid);
}

bool PidLock::isProcessAlive(pid_t pid) {
    if (pid <= 0) {
        return false;
    }
    // EPERM: the process exists under another user.
    return kill(pid, 0) == 0 || errno == EPERM;
}

PidLock PidLock::acquire(const std::string& path, const Policy& policy) {
    const int fd = open(path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        failWithErrno(-1, "Cannot open PID file", path);
    }

    if (flock(fd, LOCK_EX | LOCK_NB) < 0) {
        if (errno != EWOULDBLOCK) {
            failWithErrno(fd, "Cannot lock PID file", path);
        }
        close(fd);
        const auto holder = recordedPid(path);
        throw EngineError(ErrorCode::RESOURCE_ALREADY_RUNNING,
                          holder ? "segue_daemon is already running (PID " +
                                       std::to_string(*holder) + ", lock " + path + ")"
                                 : "segue_daemon is already running (lock " + path + ")");
    }

    std::optional<pid_t> reclaimed;
    if (const auto previous = recordedPid(path); previous && *previous != getpid()) {
        if (isProcessAlive(*previous)) {
            // Holder of the PID without the lock: another instance started
            // before flock was in place, or the PID was reused.
            LOG_WARN("PID file {} names running process {}; taking the lock", path, *previous);
        } else if (!policy.reclaimStale) {
            close(fd);
            throw EngineError(ErrorCode::RESOURCE_PID_FILE,
                              "Stale PID file " + path + " (PID " + std::to_string(*previous) +
                                  " is gone); remove it or enable daemon.reclaimStalePidFile");
        } else {
            LOG_WARN("Reclaiming stale PID file {} (PID {} is gone)", path, *previous);
            reclaimed = *previous;
        }
    }

    if (ftruncate(fd, 0) < 0) {
        failWithErrno(fd, "Cannot truncate PID file", path);
    }
    const std::string contents = std::to_string(getpid()) + "\n";
    if (pwrite(fd, contents.data(), contents.size(), 0) !=
            static_cast<ssize_t>(contents.size()) ||
        fsync(fd) < 0) {
        failWithErrno(fd, "Cannot write PID file", path);
    }
    return PidLock(path, fd, reclaimed);
}

PidLock::PidLock(std::string path, int fd, std::optional<pid_t> reclaimedFrom)
    : path_(std::move(path)), fd_(fd), reclaimedFrom_(reclaimedFrom) {}

PidLock::PidLock(PidLock&& other) noexcept
    : path_(std::move(other.path_)), fd_(other.fd_), reclaimedFrom_(other.reclaimedFrom_) {
    other.fd_ = -1;
}

PidLock& PidLock::operator=(PidLock&& other) noexcept {
    if (this == &other) {
        return *this;
    }
    release();
    path_ = std::move(other.path_);
    fd_ = other.fd_;
    reclaimedFrom_ = other.reclaimedFrom_;
    other.fd_ = -1;
    return *this;
}

PidLock::~PidLock() {
    release();
}

void PidLock::release() noexcept {
    if (fd_ < 0) {
        return;
    }
    // Unlink while still holding the lock so a new instance never sees our PID.
    if (!path_.empty()) {
        unlink(path_.c_str());
    }
    flock(fd_, LOCK_UN);
    close(fd_);
    fd_ = -1;
}

}  // namespace segue::daemon_core
