#pragma once

#include "playback/types.h"

#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace segue::playback {

/**
 * @brief Three-tier playback queue: Current, Next, then Queued in order.
 *
 * Positions are derived from order, never stored. Every mutation reports
 * which entries moved into Current or Next so the caller can request
 * decode at the new priority.
 */
class QueueManager {
   public:
    QueuePosition enqueue(const QueueEntry& entry);

    // false when @p id is not queued. @p promoted receives ids that moved
    // into Current or Next.
    bool remove(const std::string& id, std::vector<std::string>* promoted = nullptr);

    // Drops Current and returns the promoted ids.
    std::vector<std::string> advance();

    void clear();

    std::optional<QueueEntry> current() const;
    std::optional<QueueEntry> next() const;
    std::vector<QueueEntry> queued() const;
    std::optional<QueueEntry> find(const std::string& id) const;
    PositionInfo positionOf(const std::string& id) const;

    size_t size() const;
    bool empty() const;

    // All entries in play order.
    std::vector<QueueEntry> snapshot() const;

    bool setDiscoveredEndpoint(const std::string& id, Ticks end);

    // Replaces the queue with @p rows sorted by play order. Rows with invalid
    // timing are dropped. Returns the number kept.
    size_t restore(std::vector<QueueEntry> rows);

    std::int64_t nextPlayOrder() const;

   private:
    std::vector<std::string> promotedSince(const std::optional<std::string>& oldCurrent,
                                           const std::optional<std::string>& oldNext) const;
    std::optional<std::string> idAt(size_t index) const;

    mutable std::mutex mutex_;
    std::deque<QueueEntry> entries_;
    std::int64_t lastPlayOrder_ = 0;
};

}  // namespace segue::playback
