#include "playback/event_bus.h"

#include "logging/logger.h"

#include <exception>

namespace segue::playback {

const char* toString(MarkerKind kind) {
    switch (kind) {
    case MarkerKind::PositionUpdate:
        return "position_update";
    case MarkerKind::StartCrossfade:
        return "start_crossfade";
    case MarkerKind::PassageComplete:
        return "passage_complete";
    case MarkerKind::EndOfFile:
        return "end_of_file";
    case MarkerKind::EndOfFileBeforeLeadOut:
        return "end_of_file_before_lead_out";
    }
    return "unknown";
}

const char* toString(BufferEventKind kind) {
    switch (kind) {
    case BufferEventKind::ReadyForStart:
        return "ready_for_start";
    case BufferEventKind::BufferLow:
        return "buffer_low";
    case BufferEventKind::DecodeFinished:
        return "decode_finished";
    case BufferEventKind::DecodeFailed:
        return "decode_failed";
    case BufferEventKind::EndpointDiscovered:
        return "endpoint_discovered";
    }
    return "unknown";
}

const char* toString(PlaybackEventKind kind) {
    switch (kind) {
    case PlaybackEventKind::Enqueued:
        return "enqueued";
    case PlaybackEventKind::QueueChanged:
        return "queue_changed";
    case PlaybackEventKind::PassageStarted:
        return "passage_started";
    case PlaybackEventKind::CrossfadeStarted:
        return "crossfade_started";
    case PlaybackEventKind::PositionUpdate:
        return "position_update";
    case PlaybackEventKind::PassageComplete:
        return "passage_complete";
    case PlaybackEventKind::PlaybackStateChanged:
        return "playback_state_changed";
    case PlaybackEventKind::VolumeChanged:
        return "volume_changed";
    case PlaybackEventKind::WatchdogIntervention:
        return "watchdog_intervention";
    case PlaybackEventKind::Error:
        return "error";
    }
    return "unknown";
}

EventBus::~EventBus() {
    stop();
}

void EventBus::subscribe(const MarkerHandler& handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    markerHandlers_.push_back(handler);
}

void EventBus::subscribe(const BufferHandler& handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    bufferHandlers_.push_back(handler);
}

void EventBus::subscribe(const PlaybackHandler& handler) {
    std::lock_guard<std::mutex> lock(handlerMutex_);
    playbackHandlers_.push_back(handler);
}

void EventBus::publish(const MarkerEvent& event) {
    enqueue(event);
}

void EventBus::publish(const BufferEvent& event) {
    enqueue(event);
}

void EventBus::publish(const PlaybackEvent& event) {
    enqueue(event);
}

void EventBus::enqueue(Event event) {
    {
        std::lock_guard<std::mutex> lock(queueMutex_);
        queue_.push_back(std::move(event));
    }
    queueCv_.notify_one();
}

template <typename E, typename Handler>
void EventBus::publishImpl(const E& event, const std::vector<Handler>& handlers) const {
    std::vector<Handler> copy;
    {
        std::lock_guard<std::mutex> lock(handlerMutex_);
        copy = handlers;
    }
    for (const auto& handler : copy) {
        if (!handler) {
            continue;
        }
        try {
            handler(event);
        } catch (const std::exception& e) {
            LOG_ERROR("Event handler threw: {}", e.what());
        }
    }
}

void EventBus::dispatch(const Event& event) const {
    if (const auto* marker = std::get_if<MarkerEvent>(&event)) {
        publishImpl(*marker, markerHandlers_);
    } else if (const auto* buffer = std::get_if<BufferEvent>(&event)) {
        publishImpl(*buffer, bufferHandlers_);
    } else if (const auto* playback = std::get_if<PlaybackEvent>(&event)) {
        publishImpl(*playback, playbackHandlers_);
    }
}

size_t EventBus::drain() {
    std::lock_guard<std::mutex> delivery(deliveryMutex_);
    size_t delivered = 0;
    while (true) {
        Event event;
        {
            std::lock_guard<std::mutex> lock(queueMutex_);
            if (queue_.empty()) {
                break;
            }
            event = std::move(queue_.front());
            queue_.pop_front();
        }
        dispatch(event);
        ++delivered;
    }
    return delivered;
}

size_t EventBus::pendingCount() const {
    std::lock_guard<std::mutex> lock(queueMutex_);
    return queue_.size();
}

void EventBus::start() {
    if (running_.exchange(true)) {
        return;
    }
    thread_ = std::thread(&EventBus::run, this);
    LOG_DEBUG("Event bus dispatch thread started");
}

void EventBus::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    queueCv_.notify_all();
    if (thread_.joinable()) {
        thread_.join();
    }
    LOG_DEBUG("Event bus dispatch thread stopped ({} undelivered)", pendingCount());
}

void EventBus::run() {
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(queueMutex_);
            queueCv_.wait(lock, [this] {
                return !queue_.empty() || !running_.load(std::memory_order_acquire);
            });
        }
        if (!running_.load(std::memory_order_acquire)) {
            break;
        }
        drain();
    }
}

}  // namespace segue::playback
