#include "playback/callback_monitor.h"

#include <algorithm>

namespace segue::playback {

CallbackMonitor::CallbackMonitor(int sampleRate, int tolerancePercent)
    : sampleRate_(std::max(1, sampleRate)), tolerancePercent_(std::max(0, tolerancePercent)) {}

void CallbackMonitor::record(TimePoint now, size_t frames) {
    // +1 keeps a timestamp at the clock's epoch distinct from "none".
    const std::int64_t nowNs =
        std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count() + 1;
    const std::int64_t previous = lastNs_.exchange(nowNs, std::memory_order_relaxed);
    const std::int64_t period = lastPeriodNs_.exchange(
        static_cast<std::int64_t>(frames) * 1'000'000'000 / sampleRate_,
        std::memory_order_relaxed);
    callbacks_.fetch_add(1, std::memory_order_relaxed);
    if (previous == 0 || period <= 0) {
        return;
    }

    const std::int64_t interval = nowNs - previous;
    lastIntervalNs_.store(interval, std::memory_order_relaxed);
    std::int64_t max = maxIntervalNs_.load(std::memory_order_relaxed);
    while (interval > max &&
           !maxIntervalNs_.compare_exchange_weak(max, interval, std::memory_order_relaxed)) {
    }

    if (interval > period + period * tolerancePercent_ / 100) {
        late_.fetch_add(1, std::memory_order_relaxed);
        if (interval >= 2 * period) {
            missed_.fetch_add(static_cast<std::uint64_t>(interval / period - 1),
                              std::memory_order_relaxed);
        }
    }
}

void CallbackMonitor::restart() {
    lastNs_.store(0, std::memory_order_relaxed);
}

CallbackStats CallbackMonitor::stats() const {
    CallbackStats stats;
    stats.callbacks = callbacks_.load(std::memory_order_relaxed);
    stats.lateCallbacks = late_.load(std::memory_order_relaxed);
    stats.missedPeriods = missed_.load(std::memory_order_relaxed);
    stats.lastIntervalUs = lastIntervalNs_.load(std::memory_order_relaxed) / 1000;
    stats.maxIntervalUs = maxIntervalNs_.load(std::memory_order_relaxed) / 1000;
    return stats;
}

}  // namespace segue::playback
