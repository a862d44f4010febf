#pragma once

#include <chrono>
#include <mutex>
#include <string>
#include <unordered_map>

namespace segue::playback {

// Entries whose completion was already handled, kept for a short window so
// duplicate completion signals (marker + end of file + watchdog) are ignored.
class CompletionRecord {
   public:
    using Clock = std::chrono::steady_clock;

    explicit CompletionRecord(std::chrono::milliseconds window) : window_(window) {}

    // true when @p entryId was not recorded within the window (now recorded).
    bool tryRecord(const std::string& entryId, Clock::time_point now = Clock::now());

    bool contains(const std::string& entryId, Clock::time_point now = Clock::now()) const;

    // Drops entries older than the window. Returns how many were dropped.
    size_t purge(Clock::time_point now = Clock::now());

    size_t size() const;

    std::chrono::milliseconds window() const {
        return window_;
    }

   private:
    const std::chrono::milliseconds window_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Clock::time_point> firstSeen_;
};

}  // namespace segue::playback
