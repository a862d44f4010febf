#include "daemon/core/thread_priority.h"

#include "logging/logger.h"

#include <cstring>

#ifdef __linux__
#include <pthread.h>
#include <sched.h>
#endif

namespace segue::daemon_core {

ErrorCode applyRealtimePolicy(const RealtimePolicy& policy, const char* threadName) {
    if (!policy.enabled) {
        LOG_INFO("[RT] {} thread: realtime scheduling disabled by config", threadName);
        return ErrorCode::OK;
    }
    if (policy.priority < 1 || policy.priority > 99) {
        LOG_ERROR("[RT] {} thread: SCHED_FIFO priority {} outside 1..99", threadName,
                  policy.priority);
        return ErrorCode::VALIDATION_INVALID_CONFIG;
    }
#ifdef __linux__
    sched_param params{};
    params.sched_priority = policy.priority;
    const int ret = pthread_setschedparam(pthread_self(), SCHED_FIFO, &params);
    if (ret != 0) {
        LOG_WARN("[RT] Failed to set {} thread to SCHED_FIFO {} (errno={}): {}", threadName,
                 policy.priority, ret, std::strerror(ret));
        return ErrorCode::RESOURCE_RT_PRIORITY_DENIED;
    }
    LOG_INFO("[RT] {} thread priority set to SCHED_FIFO {}", threadName, policy.priority);
    return ErrorCode::OK;
#else
    LOG_WARN("[RT] {} thread: SCHED_FIFO not available on this platform", threadName);
    return ErrorCode::RESOURCE_RT_PRIORITY_DENIED;
#endif
}

}  // namespace segue::daemon_core
