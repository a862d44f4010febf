#include "playback/callback_monitor.h"

#include <chrono>
#include <gtest/gtest.h>

using namespace segue::playback;
using std::chrono::microseconds;

namespace {

// 441 frames at 44.1 kHz: one 10 ms period.
constexpr size_t kPeriodFrames = 441;

CallbackMonitor::TimePoint at(long long us) {
    return CallbackMonitor::TimePoint(microseconds(us));
}

}  // namespace

TEST(CallbackMonitor, OnTimeCallbacksAreNotLate) {
    CallbackMonitor monitor(44100);
    for (int i = 0; i < 10; ++i) {
        monitor.record(at(i * 10000), kPeriodFrames);
    }
    const CallbackStats stats = monitor.stats();
    EXPECT_EQ(stats.callbacks, 10u);
    EXPECT_EQ(stats.lateCallbacks, 0u);
    EXPECT_EQ(stats.missedPeriods, 0u);
    EXPECT_EQ(stats.lastIntervalUs, 10000);
    EXPECT_EQ(stats.maxIntervalUs, 10000);
}

TEST(CallbackMonitor, JitterWithinToleranceIsAccepted) {
    CallbackMonitor monitor(44100, 20);
    monitor.record(at(0), kPeriodFrames);
    monitor.record(at(11500), kPeriodFrames);
    EXPECT_EQ(monitor.stats().lateCallbacks, 0u);
    monitor.record(at(11500 + 12500), kPeriodFrames);
    EXPECT_EQ(monitor.stats().lateCallbacks, 1u);
    EXPECT_EQ(monitor.stats().missedPeriods, 0u);
}

TEST(CallbackMonitor, LongGapCountsMissedPeriods) {
    CallbackMonitor monitor(44100);
    monitor.record(at(0), kPeriodFrames);
    monitor.record(at(35000), kPeriodFrames);
    const CallbackStats stats = monitor.stats();
    EXPECT_EQ(stats.lateCallbacks, 1u);
    EXPECT_EQ(stats.missedPeriods, 2u);
    EXPECT_EQ(stats.maxIntervalUs, 35000);
}

TEST(CallbackMonitor, ExpectedPeriodFollowsPreviousBlockSize) {
    CallbackMonitor monitor(44100);
    monitor.record(at(0), kPeriodFrames * 4);
    monitor.record(at(40000), kPeriodFrames);
    monitor.record(at(50000), kPeriodFrames);
    EXPECT_EQ(monitor.stats().lateCallbacks, 0u);
}

TEST(CallbackMonitor, RestartForgetsThePreviousCallback) {
    CallbackMonitor monitor(44100);
    monitor.record(at(0), kPeriodFrames);
    monitor.restart();
    monitor.record(at(5000000), kPeriodFrames);
    const CallbackStats stats = monitor.stats();
    EXPECT_EQ(stats.callbacks, 2u);
    EXPECT_EQ(stats.lateCallbacks, 0u);
    EXPECT_EQ(stats.maxIntervalUs, 0);
}
