#pragma once

#include "audio/pause_ramp.h"
#include "io/playout_buffer.h"
#include "playback/events.h"
#include "playback/marker_queue.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace segue::playback {

enum class MixerMode { Idle, SinglePassage, Crossfading };

const char* toString(MixerMode mode);

struct Marker {
    Ticks tick = 0;  // relative to passage start
    MarkerKind kind = MarkerKind::PassageComplete;
};

/**
 * @brief Real-time mixer over pre-faded passage rings.
 *
 * Fades are already baked into the rings, so a crossfade is a plain sum.
 * Master volume and the clip ceiling are applied after summing, then the
 * pause ramp.
 *
 * A block is mixed in segments that end on marker ticks, so every marker
 * fires at its own frame. An armed passage starts at the frame where the
 * current passage crosses its StartCrossfade marker.
 *
 * Commands come from the orchestrator and share one mutex with mix(); the
 * critical sections are short and allocation free on the mix side. Status
 * getters read atomics and never take the mix lock.
 */
class Mixer {
   public:
    struct Config {
        int outputRate = 44100;
        float volume = 0.5f;
        int positionIntervalMs = 1000;
        float clipCeiling = 1.0f;
        audio::PauseRamp::Params pause;
    };

    explicit Mixer(const Config& config);

    Mixer(const Mixer&) = delete;
    Mixer& operator=(const Mixer&) = delete;

    // Plays @p entryId alone from @p initialTick (relative to passage start).
    // Replaces whatever was playing.
    void startPassage(const std::string& entryId, io::PlayoutBuffer* ring,
                      std::vector<Marker> markers, Ticks initialTick = 0);

    // Adds @p entryId as the incoming passage. Only valid in SinglePassage.
    bool startCrossfade(const std::string& entryId, io::PlayoutBuffer* ring,
                        std::vector<Marker> markers);

    // Arms @p entryId to enter as the incoming passage at the current
    // passage's StartCrossfade marker, if its ring then holds at least
    // @p minFrames or the rest of a finished decode. Replaces an earlier arm.
    void armCrossfade(const std::string& entryId, io::PlayoutBuffer* ring,
                      std::vector<Marker> markers, size_t minFrames);
    // Drops the armed passage when it is @p entryId.
    bool disarmCrossfade(const std::string& entryId);
    std::optional<std::string> armedEntry() const;

    // Crossfading + outgoing: the incoming passage continues alone.
    // Crossfading + incoming: the incoming passage is dropped.
    // SinglePassage + current: back to Idle.
    bool finishPassage(const std::string& entryId);

    void clear();

    bool addMarker(const std::string& entryId, const Marker& marker);

    // Replaces the StartCrossfade marker of @p entryId; nullopt removes it.
    bool setCrossfadeMarker(const std::string& entryId, std::optional<Ticks> tick);

    void pause();
    void resume();
    bool isPaused() const;
    // Resume ramp running, or paused with an audible tail.
    bool isFading() const;

    void setVolume(float volume);
    float volume() const {
        return volume_.load(std::memory_order_relaxed);
    }

    void setPauseParams(const audio::PauseRamp::Params& params);

    // Fills @p out with @p frames stereo frames and queues crossed markers.
    void mix(float* out, size_t frames, MarkerQueue& events);

    MixerMode mode() const {
        return mode_.load(std::memory_order_acquire);
    }
    bool isIdle() const {
        return mode() == MixerMode::Idle;
    }

    // Current (outgoing while crossfading) passage.
    std::optional<std::string> currentEntry() const;
    std::optional<std::string> incomingEntry() const;
    bool isPlaying(const std::string& entryId) const;

    // Position of the current passage, relative to its start.
    Ticks positionTicks() const {
        return position_.load(std::memory_order_relaxed);
    }
    std::int64_t positionMs() const {
        return timing::ticksToMs(positionTicks());
    }

    std::uint64_t underrunCount() const {
        return underruns_.load(std::memory_order_relaxed);
    }

    int outputRate() const {
        return config_.outputRate;
    }

   private:
    struct Slot {
        bool active = false;
        std::string entryId;
        io::PlayoutBuffer* ring = nullptr;
        std::vector<Marker> markers;  // min-heap on tick
        Ticks position = 0;
        Ticks nextPositionUpdate = 0;
        bool endReported = false;
    };

    void resetSlot(Slot& slot, const std::string& entryId, io::PlayoutBuffer* ring,
                   std::vector<Marker> markers, Ticks initialTick);
    Slot* findSlot(const std::string& entryId);
    void pushMarker(Slot& slot, const Marker& marker);
    size_t framesToNextMarker(const Slot& slot, size_t limit) const;
    void mixSegment(float* out, size_t frames, bool& starved);
    size_t readSlot(Slot& slot, float* dst, size_t frames);
    void collectMarkers(Slot& slot, MarkerQueue& events);
    bool startArmedCrossfade();
    void publishIds();

    const Config config_;
    const Ticks ticksPerFrame_;
    const Ticks positionInterval_;

    mutable std::mutex mutex_;
    Slot current_;
    Slot incoming_;
    Slot armed_;
    size_t armedMinFrames_ = 0;
    std::vector<float> scratch_;
    audio::PauseRamp ramp_;

    std::atomic<MixerMode> mode_{MixerMode::Idle};
    std::atomic<Ticks> position_{0};
    std::atomic<float> volume_;
    std::atomic<std::uint64_t> underruns_{0};

    mutable std::mutex idMutex_;
    std::string currentId_;
    std::string incomingId_;
    std::string armedId_;
};

}  // namespace segue::playback
