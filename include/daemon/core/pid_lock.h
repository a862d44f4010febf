#pragma once

#include <optional>
#include <string>
#include <sys/types.h>

namespace segue::daemon_core {

/**
 * @brief Single-instance guard for the daemon: an exclusive flock on a PID file.
 *
 * acquire() throws EngineError with RESOURCE_ALREADY_RUNNING while another
 * live process holds the lock, and RESOURCE_PID_FILE when the file cannot be
 * opened or written. A file left behind by a process that no longer exists is
 * stale: it is taken over when the policy allows it, otherwise acquire()
 * refuses with RESOURCE_PID_FILE. The file is removed on release.
 */
class PidLock {
   public:
    struct Policy {
        bool reclaimStale = true;
    };

    static PidLock acquire(const std::string& path, const Policy& policy);
    static PidLock acquire(const std::string& path) {
        return acquire(path, Policy{});
    }

    // PID recorded in @p path, if the file holds one.
    static std::optional<pid_t> recordedPid(const std::string& path);

    static bool isProcessAlive(pid_t pid);

    PidLock(const PidLock&) = delete;
    PidLock& operator=(const PidLock&) = delete;

    PidLock(PidLock&& other) noexcept;
    PidLock& operator=(PidLock&& other) noexcept;

    ~PidLock();

    const std::string& path() const {
        return path_;
    }

    // PID of the dead process whose file was taken over.
    std::optional<pid_t> reclaimedFrom() const {
        return reclaimedFrom_;
    }

   private:
    PidLock(std::string path, int fd, std::optional<pid_t> reclaimedFrom);

    void release() noexcept;

    std::string path_;
    int fd_ = -1;
    std::optional<pid_t> reclaimedFrom_;
};

}  // namespace segue::daemon_core
