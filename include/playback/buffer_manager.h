#pragma once

#include "io/playout_buffer.h"
#include "playback/event_bus.h"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace segue::playback {

enum class BufferState { Empty, Filling, Ready, Playing, Finished };

const char* toString(BufferState state);

struct BufferSnapshot {
    std::string entryId;
    BufferState state = BufferState::Empty;
    size_t occupancyFrames = 0;
    std::int64_t occupancyMs = 0;
    size_t capacityFrames = 0;
    bool decodeComplete = false;
};

/**
 * @brief Tracks fill state of every managed ring and raises threshold events.
 *
 * Observes rings only through their atomic counters, so it never contends
 * with the mixer's read path. ReadyForStart and BufferLow are edge
 * triggered: each fires once per crossing.
 */
class BufferManager {
   public:
    struct Config {
        int outputRate = 44100;
        int minBufferThresholdMs = 3000;
        int firstPassageThresholdMs = 500;
    };

    BufferManager(EventBus& bus, const Config& config);

    void registerBuffer(const std::string& entryId, io::PlayoutBuffer* ring);
    bool remove(const std::string& entryId);
    bool isManaged(const std::string& entryId) const;

    Ticks occupancyTicks(const std::string& entryId) const;
    size_t occupancyFrames(const std::string& entryId) const;
    std::optional<BufferState> state(const std::string& entryId) const;

    void markPlaying(const std::string& entryId);

    void notifySamplesAppended(const std::string& entryId);
    void notifyDecodeComplete(const std::string& entryId);
    void checkFallingThreshold(const std::string& entryId);

    // Ready, playing, or a finished decode with at least one frame.
    bool hasMinimumPlaybackBuffer(const std::string& entryId) const;

    // Threshold in frames that the next ReadyForStart check will use.
    size_t thresholdFrames(const io::PlayoutBuffer& ring) const;

    std::vector<BufferSnapshot> snapshot() const;

   private:
    struct Record {
        io::PlayoutBuffer* ring = nullptr;
        BufferState state = BufferState::Empty;
        bool readyFired = false;
        bool lowFired = false;
        bool decodeComplete = false;
        std::optional<std::chrono::steady_clock::time_point> readyAt;
    };

    size_t thresholdFramesLocked(const io::PlayoutBuffer& ring) const;
    void emit(BufferEventKind kind, const std::string& entryId, size_t occupancy);

    EventBus& bus_;
    const Config config_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Record> records_;
    bool firstPassageStarted_ = false;
};

}  // namespace segue::playback
