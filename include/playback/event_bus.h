#pragma once

#include "playback/events.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <variant>
#include <vector>

namespace segue::playback {

/**
 * @brief Queued fan-out of engine events.
 *
 * publish() only enqueues; handlers run on the dispatch thread (start()) or
 * on the caller of drain(). Delivery is FIFO across all families, so events
 * from a single source keep their order.
 */
class EventBus {
   public:
    using MarkerHandler = std::function<void(const MarkerEvent&)>;
    using BufferHandler = std::function<void(const BufferEvent&)>;
    using PlaybackHandler = std::function<void(const PlaybackEvent&)>;

    EventBus() = default;
    ~EventBus();

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    void subscribe(const MarkerHandler& handler);
    void subscribe(const BufferHandler& handler);
    void subscribe(const PlaybackHandler& handler);

    void publish(const MarkerEvent& event);
    void publish(const BufferEvent& event);
    void publish(const PlaybackEvent& event);

    void start();
    void stop();
    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    // Delivers everything queued so far on the calling thread.
    size_t drain();

    size_t pendingCount() const;

   private:
    using Event = std::variant<MarkerEvent, BufferEvent, PlaybackEvent>;

    template <typename E, typename Handler>
    void publishImpl(const E& event, const std::vector<Handler>& handlers) const;

    void enqueue(Event event);
    void dispatch(const Event& event) const;
    void run();

    mutable std::mutex handlerMutex_;
    std::vector<MarkerHandler> markerHandlers_;
    std::vector<BufferHandler> bufferHandlers_;
    std::vector<PlaybackHandler> playbackHandlers_;

    mutable std::mutex queueMutex_;
    std::condition_variable queueCv_;
    std::deque<Event> queue_;

    // Serializes delivery between the dispatch thread and drain().
    std::mutex deliveryMutex_;

    std::atomic<bool> running_{false};
    std::thread thread_;
};

}  // namespace segue::playback
