#include "daemon/core/thread_priority.h"

#include <gtest/gtest.h>
#include <pthread.h>
#include <sched.h>
#include <thread>

using segue::ErrorCode;
using segue::daemon_core::applyRealtimePolicy;
using segue::daemon_core::RealtimePolicy;

namespace {

// Runs the policy on a fresh thread and reports its scheduler afterwards.
ErrorCode applyOnThread(const RealtimePolicy& policy, int& schedPolicy, int& schedPriority) {
    ErrorCode result = ErrorCode::INTERNAL_UNKNOWN;
    std::thread worker([&]() {
        result = applyRealtimePolicy(policy, "Test");
        sched_param params{};
        pthread_getschedparam(pthread_self(), &schedPolicy, &params);
        schedPriority = params.sched_priority;
    });
    worker.join();
    return result;
}

}  // namespace

TEST(ThreadPriority, DisabledPolicyLeavesSchedulerAlone) {
    RealtimePolicy policy;
    policy.enabled = false;
    int schedPolicy = -1;
    int schedPriority = -1;
    EXPECT_EQ(applyOnThread(policy, schedPolicy, schedPriority), ErrorCode::OK);
    EXPECT_EQ(schedPolicy, SCHED_OTHER);
}

TEST(ThreadPriority, OutOfRangePriorityIsConfigError) {
    for (int priority : {0, -5, 100}) {
        RealtimePolicy policy;
        policy.priority = priority;
        int schedPolicy = -1;
        int schedPriority = -1;
        EXPECT_EQ(applyOnThread(policy, schedPolicy, schedPriority),
                  ErrorCode::VALIDATION_INVALID_CONFIG)
            << "priority " << priority;
        EXPECT_EQ(schedPolicy, SCHED_OTHER);
    }
}

TEST(ThreadPriority, GrantedOrDeniedMatchesScheduler) {
    RealtimePolicy policy;
    policy.priority = 10;
    int schedPolicy = -1;
    int schedPriority = -1;
    const ErrorCode result = applyOnThread(policy, schedPolicy, schedPriority);
    // Depends on CAP_SYS_NICE in the test environment.
    if (result == ErrorCode::OK) {
        EXPECT_EQ(schedPolicy, SCHED_FIFO);
        EXPECT_EQ(schedPriority, 10);
    } else {
        EXPECT_EQ(result, ErrorCode::RESOURCE_RT_PRIORITY_DENIED);
        EXPECT_EQ(schedPolicy, SCHED_OTHER);
    }
}
