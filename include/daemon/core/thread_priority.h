#pragma once

#include "core/error_codes.h"

namespace segue::daemon_core {

struct RealtimePolicy {
    bool enabled = true;
    int priority = 65;  // SCHED_FIFO, 1..99
};

/**
 * @brief Moves the calling thread to SCHED_FIFO at policy.priority.
 *
 * Returns OK when the policy is applied or disabled,
 * VALIDATION_INVALID_CONFIG for a priority outside 1..99 (nothing is
 * changed), and RESOURCE_RT_PRIORITY_DENIED when the kernel refuses,
 * typically for lack of CAP_SYS_NICE or an RLIMIT_RTPRIO of zero. The
 * thread keeps its current scheduler on any failure.
 */
ErrorCode applyRealtimePolicy(const RealtimePolicy& policy, const char* threadName);

}  // namespace segue::daemon_core
