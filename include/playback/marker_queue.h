#pragma once

#include "playback/events.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace segue::playback {

/**
 * @brief Preallocated single-producer/single-consumer queue of marker events.
 *
 * The output thread pushes, a non-real-time thread pops and forwards to the
 * EventBus. Slots keep their entry id strings at a reserved capacity, so a
 * push neither locks nor allocates for ids up to idCapacity characters. A
 * push into a full queue drops the marker and counts it.
 *
 * Same memory ordering as io::PlayoutBuffer: the producer owns tail_, the
 * consumer head_; each publishes its index with release.
 */
class MarkerQueue {
   public:
    explicit MarkerQueue(size_t capacity, size_t idCapacity = 64);

    MarkerQueue(const MarkerQueue&) = delete;
    MarkerQueue& operator=(const MarkerQueue&) = delete;

    // Producer.
    bool push(const std::string& entryId, MarkerKind kind, Ticks tick, std::int64_t positionMs);

    // Consumer: copies the oldest marker into @p out. false when empty.
    bool pop(MarkerEvent& out);

    // Consumer: pops everything queued and hands each marker to @p fn.
    template <typename Fn>
    size_t drain(Fn&& fn) {
        size_t count = 0;
        while (pop(scratch_)) {
            fn(static_cast<const MarkerEvent&>(scratch_));
            ++count;
        }
        return count;
    }

    size_t capacity() const {
        return slots_.size() - 1;
    }
    bool empty() const;
    std::uint64_t dropped() const {
        return dropped_.load(std::memory_order_relaxed);
    }

   private:
    std::vector<MarkerEvent> slots_;  // one slot stays free to tell full from empty
    std::atomic<size_t> head_{0};
    std::atomic<size_t> tail_{0};
    std::atomic<std::uint64_t> dropped_{0};
    MarkerEvent scratch_;
};

}  // namespace segue::playback
