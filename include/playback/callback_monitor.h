#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace segue::playback {

struct CallbackStats {
    std::uint64_t callbacks = 0;
    std::uint64_t lateCallbacks = 0;  // interval beyond period + tolerance
    std::uint64_t missedPeriods = 0;  // whole periods with no callback
    std::int64_t lastIntervalUs = 0;
    std::int64_t maxIntervalUs = 0;
};

/**
 * @brief Timing of render callbacks, for gap and stutter diagnosis.
 *
 * record() is called at the start of every render with the frames about to
 * be rendered; the expected interval is the previous call's period. Only
 * atomics are touched, so it is safe on the output thread.
 */
class CallbackMonitor {
   public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;

    // @p tolerancePercent of the period an interval may exceed it by.
    CallbackMonitor(int sampleRate, int tolerancePercent = 20);

    void record(TimePoint now, size_t frames);

    // Forget the previous callback, e.g. after a pause or device reopen.
    void restart();

    CallbackStats stats() const;

   private:
    const int sampleRate_;
    const int tolerancePercent_;
    std::atomic<std::int64_t> lastNs_{0};  // 0: no previous callback
    std::atomic<std::int64_t> lastPeriodNs_{0};
    std::atomic<std::uint64_t> callbacks_{0};
    std::atomic<std::uint64_t> late_{0};
    std::atomic<std::uint64_t> missed_{0};
    std::atomic<std::int64_t> lastIntervalNs_{0};
    std::atomic<std::int64_t> maxIntervalNs_{0};
};

}  // namespace segue::playback
