#include "playback/buffer_manager.h"

#include "logging/logger.h"

#include <algorithm>
#include <stdexcept>

namespace segue::playback {

const char* toString(BufferState state) {
    switch (state) {
    case BufferState::Empty:
        return "empty";
    case BufferState::Filling:
        return "filling";
    case BufferState::Ready:
        return "ready";
    case BufferState::Playing:
        return "playing";
    case BufferState::Finished:
        return "finished";
    }
    return "unknown";
}

BufferManager::BufferManager(EventBus& bus, const Config& config) : bus_(bus), config_(config) {
    if (config.outputRate <= 0) {
        throw std::invalid_argument("BufferManager output rate must be > 0");
    }
}

void BufferManager::registerBuffer(const std::string& entryId, io::PlayoutBuffer* ring) {
    if (!ring) {
        throw std::invalid_argument("registerBuffer requires a ring");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    Record record;
    record.ring = ring;
    records_[entryId] = record;
}

bool BufferManager::remove(const std::string& entryId) {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.erase(entryId) > 0;
}

bool BufferManager::isManaged(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_.count(entryId) > 0;
}

size_t BufferManager::occupancyFrames(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(entryId);
    return it == records_.end() ? 0 : it->second.ring->availableFrames();
}

Ticks BufferManager::occupancyTicks(const std::string& entryId) const {
    return timing::samplesToTicks(static_cast<std::int64_t>(occupancyFrames(entryId)),
                                  config_.outputRate);
}

std::optional<BufferState> BufferManager::state(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(entryId);
    if (it == records_.end()) {
        return std::nullopt;
    }
    return it->second.state;
}

void BufferManager::markPlaying(const std::string& entryId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(entryId);
    if (it == records_.end()) {
        return;
    }
    it->second.state = it->second.decodeComplete ? BufferState::Finished : BufferState::Playing;
    firstPassageStarted_ = true;
}

size_t BufferManager::thresholdFrames(const io::PlayoutBuffer& ring) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return thresholdFramesLocked(ring);
}

size_t BufferManager::thresholdFramesLocked(const io::PlayoutBuffer& ring) const {
    int ms = config_.minBufferThresholdMs;
    if (!firstPassageStarted_) {
        ms = std::min(ms, config_.firstPassageThresholdMs);
    }
    const size_t frames = static_cast<size_t>(static_cast<long long>(ms) * config_.outputRate / 1000);
    // The producer stops at capacity - headroom; never wait for more than that.
    return std::max<size_t>(1, std::min(frames, ring.capacityFrames() - ring.headroomFrames()));
}

void BufferManager::notifySamplesAppended(const std::string& entryId) {
    size_t occupancy = 0;
    bool fireReady = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(entryId);
        if (it == records_.end()) {
            return;
        }
        Record& record = it->second;
        occupancy = record.ring->availableFrames();
        if (record.state == BufferState::Empty && occupancy > 0) {
            record.state = BufferState::Filling;
        }
        const size_t threshold = thresholdFramesLocked(*record.ring);
        if (occupancy >= threshold) {
            record.lowFired = false;
            if (!record.readyFired) {
                record.readyFired = true;
                record.readyAt = std::chrono::steady_clock::now();
                if (record.state == BufferState::Filling) {
                    record.state = BufferState::Ready;
                }
                fireReady = true;
            }
        }
    }
    if (fireReady) {
        emit(BufferEventKind::ReadyForStart, entryId, occupancy);
    }
}

void BufferManager::notifyDecodeComplete(const std::string& entryId) {
    size_t occupancy = 0;
    bool fireReady = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(entryId);
        if (it == records_.end()) {
            return;
        }
        Record& record = it->second;
        occupancy = record.ring->availableFrames();
        record.decodeComplete = true;
        if (record.state == BufferState::Playing) {
            record.state = BufferState::Finished;
        } else if (record.state == BufferState::Empty || record.state == BufferState::Filling) {
            record.state = BufferState::Ready;
        }
        // Short passage: the whole decode fit below the threshold.
        if (!record.readyFired) {
            record.readyFired = true;
            record.readyAt = std::chrono::steady_clock::now();
            fireReady = true;
        }
    }
    if (fireReady) {
        emit(BufferEventKind::ReadyForStart, entryId, occupancy);
    }
    emit(BufferEventKind::DecodeFinished, entryId, occupancy);
}

void BufferManager::checkFallingThreshold(const std::string& entryId) {
    size_t occupancy = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = records_.find(entryId);
        if (it == records_.end()) {
            return;
        }
        Record& record = it->second;
        if (record.state != BufferState::Playing || record.decodeComplete || record.lowFired) {
            return;
        }
        occupancy = record.ring->availableFrames();
        if (occupancy >= thresholdFramesLocked(*record.ring)) {
            return;
        }
        record.lowFired = true;
    }
    LOG_WARN("Buffer low for {}: {} frames", entryId, occupancy);
    emit(BufferEventKind::BufferLow, entryId, occupancy);
}

bool BufferManager::hasMinimumPlaybackBuffer(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(entryId);
    if (it == records_.end()) {
        return false;
    }
    const Record& record = it->second;
    switch (record.state) {
    case BufferState::Ready:
    case BufferState::Playing:
        return true;
    case BufferState::Finished:
        return record.ring->availableFrames() > 0;
    default:
        return record.decodeComplete && record.ring->availableFrames() > 0;
    }
}

std::vector<BufferSnapshot> BufferManager::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BufferSnapshot> result;
    result.reserve(records_.size());
    for (const auto& [id, record] : records_) {
        BufferSnapshot snap;
        snap.entryId = id;
        snap.state = record.state;
        snap.occupancyFrames = record.ring->availableFrames();
        snap.occupancyMs = static_cast<std::int64_t>(snap.occupancyFrames) * 1000 /
                           config_.outputRate;
        snap.capacityFrames = record.ring->capacityFrames();
        snap.decodeComplete = record.decodeComplete;
        result.push_back(std::move(snap));
    }
    std::sort(result.begin(), result.end(),
              [](const BufferSnapshot& a, const BufferSnapshot& b) { return a.entryId < b.entryId; });
    return result;
}

void BufferManager::emit(BufferEventKind kind, const std::string& entryId, size_t occupancy) {
    BufferEvent event;
    event.kind = kind;
    event.entryId = entryId;
    event.occupancyFrames = occupancy;
    LOG_DEBUG("Buffer event {} for {} ({} frames)", toString(kind), entryId, occupancy);
    bus_.publish(event);
}

}  // namespace segue::playback
