#include "playback/completion_record.h"

namespace segue::playback {

bool CompletionRecord::tryRecord(const std::string& entryId, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = firstSeen_.find(entryId);
    if (it != firstSeen_.end() && now - it->second < window_) {
        return false;
    }
    firstSeen_[entryId] = now;
    return true;
}

bool CompletionRecord::contains(const std::string& entryId, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = firstSeen_.find(entryId);
    return it != firstSeen_.end() && now - it->second < window_;
}

size_t CompletionRecord::purge(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t dropped = 0;
    for (auto it = firstSeen_.begin(); it != firstSeen_.end();) {
        if (now - it->second >= window_) {
            it = firstSeen_.erase(it);
            ++dropped;
        } else {
            ++it;
        }
    }
    return dropped;
}

size_t CompletionRecord::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return firstSeen_.size();
}

}  // namespace segue::playback
