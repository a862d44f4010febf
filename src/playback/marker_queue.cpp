#include "playback/marker_queue.h"

#include <stdexcept>

namespace segue::playback {

MarkerQueue::MarkerQueue(size_t capacity, size_t idCapacity) {
    if (capacity == 0) {
        throw std::invalid_argument("MarkerQueue capacity must be > 0");
    }
    slots_.resize(capacity + 1);
    for (auto& slot : slots_) {
        slot.entryId.reserve(idCapacity);
    }
    scratch_.entryId.reserve(idCapacity);
}

bool MarkerQueue::push(const std::string& entryId, MarkerKind kind, Ticks tick,
                       std::int64_t positionMs) {
    const size_t tail = tail_.load(std::memory_order_relaxed);
    const size_t next = (tail + 1) % slots_.size();
    if (next == head_.load(std::memory_order_acquire)) {
        dropped_.fetch_add(1, std::memory_order_relaxed);
        return false;
    }
    MarkerEvent& slot = slots_[tail];
    slot.entryId.assign(entryId);
    slot.kind = kind;
    slot.tick = tick;
    slot.positionMs = positionMs;
    tail_.store(next, std::memory_order_release);
    return true;
}

bool MarkerQueue::pop(MarkerEvent& out) {
    const size_t head = head_.load(std::memory_order_relaxed);
    if (head == tail_.load(std::memory_order_acquire)) {
        return false;
    }
    const MarkerEvent& slot = slots_[head];
    out.entryId.assign(slot.entryId);
    out.kind = slot.kind;
    out.tick = slot.tick;
    out.positionMs = slot.positionMs;
    head_.store((head + 1) % slots_.size(), std::memory_order_release);
    return true;
}

bool MarkerQueue::empty() const {
    return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire);
}

}  // namespace segue::playback
