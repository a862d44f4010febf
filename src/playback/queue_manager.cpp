#include "playback/queue_manager.h"

#include "logging/logger.h"
#include "playback/passage_timing.h"

#include <algorithm>

namespace segue::playback {

namespace {

PositionInfo positionForIndex(size_t index) {
    PositionInfo info;
    if (index == 0) {
        info.kind = QueuePosition::Current;
    } else if (index == 1) {
        info.kind = QueuePosition::Next;
    } else {
        info.kind = QueuePosition::Queued;
        info.queuedIndex = index - 2;
    }
    return info;
}

}  // namespace

// Caller holds mutex_.
std::optional<std::string> QueueManager::idAt(size_t index) const {
    if (index < entries_.size()) {
        return entries_[index].queueEntryId;
    }
    return std::nullopt;
}

// Caller holds mutex_.
std::vector<std::string> QueueManager::promotedSince(const std::optional<std::string>& oldCurrent,
                                                     const std::optional<std::string>& oldNext) const {
    std::vector<std::string> promoted;
    auto newCurrent = idAt(0);
    auto newNext = idAt(1);
    if (newCurrent && newCurrent != oldCurrent) {
        promoted.push_back(*newCurrent);
    }
    if (newNext && newNext != oldNext && newNext != oldCurrent) {
        promoted.push_back(*newNext);
    }
    return promoted;
}

QueuePosition QueueManager::enqueue(const QueueEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    QueueEntry copy = entry;
    if (copy.playOrder <= lastPlayOrder_) {
        copy.playOrder = lastPlayOrder_ + 1;
    }
    lastPlayOrder_ = copy.playOrder;
    entries_.push_back(std::move(copy));
    return positionForIndex(entries_.size() - 1).kind;
}

bool QueueManager::remove(const std::string& id, std::vector<std::string>* promoted) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const QueueEntry& e) { return e.queueEntryId == id; });
    if (it == entries_.end()) {
        return false;
    }
    const auto oldCurrent = idAt(0);
    const auto oldNext = idAt(1);
    entries_.erase(it);
    if (promoted) {
        *promoted = promotedSince(oldCurrent, oldNext);
    }
    return true;
}

std::vector<std::string> QueueManager::advance() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return {};
    }
    const auto oldCurrent = idAt(0);
    const auto oldNext = idAt(1);
    entries_.pop_front();
    return promotedSince(oldCurrent, oldNext);
}

void QueueManager::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

std::optional<QueueEntry> QueueManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.empty()) {
        return std::nullopt;
    }
    return entries_[0];
}

std::optional<QueueEntry> QueueManager::next() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() < 2) {
        return std::nullopt;
    }
    return entries_[1];
}

std::vector<QueueEntry> QueueManager::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (entries_.size() <= 2) {
        return {};
    }
    return std::vector<QueueEntry>(entries_.begin() + 2, entries_.end());
}

std::optional<QueueEntry> QueueManager::find(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : entries_) {
        if (entry.queueEntryId == id) {
            return entry;
        }
    }
    return std::nullopt;
}

PositionInfo QueueManager::positionOf(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (entries_[i].queueEntryId == id) {
            return positionForIndex(i);
        }
    }
    return PositionInfo{};
}

size_t QueueManager::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

bool QueueManager::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.empty();
}

std::vector<QueueEntry> QueueManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::vector<QueueEntry>(entries_.begin(), entries_.end());
}

bool QueueManager::setDiscoveredEndpoint(const std::string& id, Ticks end) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : entries_) {
        if (entry.queueEntryId == id) {
            entry.discoveredEnd = end;
            return true;
        }
    }
    return false;
}

size_t QueueManager::restore(std::vector<QueueEntry> rows) {
    std::stable_sort(rows.begin(), rows.end(), [](const QueueEntry& a, const QueueEntry& b) {
        return a.playOrder < b.playOrder;
    });

    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
    lastPlayOrder_ = 0;
    for (auto& row : rows) {
        if (auto problem = validateTiming(row.timing)) {
            LOG_WARN("Dropping queue row {}: {}", row.queueEntryId, *problem);
            continue;
        }
        lastPlayOrder_ = std::max(lastPlayOrder_, row.playOrder);
        entries_.push_back(std::move(row));
    }
    return entries_.size();
}

std::int64_t QueueManager::nextPlayOrder() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastPlayOrder_ + 1;
}

}  // namespace segue::playback
