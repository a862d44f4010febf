#pragma once

#include "audio/audio_decoder.h"
#include "core/error_codes.h"
#include "playback/buffer_manager.h"
#include "playback/callback_monitor.h"
#include "playback/chain_pool.h"
#include "playback/completion_record.h"
#include "playback/decode_scheduler.h"
#include "playback/event_bus.h"
#include "playback/mixer.h"
#include "playback/passage_catalog.h"
#include "playback/queue_manager.h"
#include "playback/queue_store.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>

namespace segue::playback {

struct EnqueueRequest {
    std::optional<std::string> passageId;  // resolved through the catalog
    std::optional<std::string> filePath;   // ephemeral entry
    std::optional<PassageTiming> timing;   // overrides catalog/default timing
};

struct EnqueueResult {
    CommandResult result;
    std::string queueEntryId;
    QueuePosition position = QueuePosition::None;
};

struct EngineStatus {
    MixerMode mode = MixerMode::Idle;
    bool paused = false;
    float volume = 0.0f;
    std::optional<std::string> currentEntry;
    std::optional<std::string> nextEntry;
    std::optional<std::string> mixingEntry;  // incoming passage during a crossfade
    std::int64_t positionMs = 0;
    size_t queueLength = 0;
    std::vector<BufferSnapshot> buffers;
    std::uint64_t watchdogInterventions = 0;
    std::uint64_t underruns = 0;
    std::uint64_t frameAudits = 0;
    std::uint64_t frameMismatches = 0;
    std::uint64_t droppedMarkers = 0;
    CallbackStats callbacks;
};

/**
 * @brief Drives each queue entry from enqueue to removal.
 *
 * Reacts to buffer and marker events (subscribed on the EventBus), executes
 * commands, and runs a watchdog that repairs missed transitions. Commands,
 * event handlers and watchdog passes are serialized by one mutex, so every
 * handler observes removal and promotion as one step.
 */
class Orchestrator {
   public:
    struct Config {
        int watchdogIntervalMs = 100;
        int completionDedupWindowMs = 5000;
        // Slack allowed between frames handed to a ring and frames it holds.
        int frameAuditToleranceFrames = 8192;
    };

    Orchestrator(const Config& config, QueueManager& queue, QueueStore& store,
                 const PassageCatalog* catalog, ChainPool& pool, DecodeScheduler& scheduler,
                 BufferManager& buffers, Mixer& mixer, EventBus& bus,
                 audio::DecoderFactory decoderFactory);
    ~Orchestrator();

    Orchestrator(const Orchestrator&) = delete;
    Orchestrator& operator=(const Orchestrator&) = delete;

    // Commands
    EnqueueResult enqueue(const EnqueueRequest& request);
    // Idempotent: an absent id succeeds with *removed = false.
    CommandResult removeEntry(const std::string& queueEntryId, bool* removed = nullptr);
    CommandResult skip();
    CommandResult pause();
    CommandResult play();
    CommandResult seek(std::int64_t positionMs);
    CommandResult setVolume(float volume);
    CommandResult clearQueue();
    size_t restoreQueue();

    // Output device gave up: stop audible playback and report.
    void reportOutputFailure(ErrorCode code, const std::string& message);

    // Event handlers (normally invoked by the EventBus).
    void onMarker(const MarkerEvent& event);
    void onBufferEvent(const BufferEvent& event);

    // true only when this call started the mixer.
    bool startMixerForCurrent();

    // One watchdog pass. Returns the number of interventions performed.
    size_t watchdogCheck();

    void startWatchdog();
    void stopWatchdog();

    EngineStatus status() const;
    std::vector<QueueEntry> queueSnapshot() const;

    std::uint64_t watchdogInterventions() const {
        return interventions_.load(std::memory_order_relaxed);
    }

   private:
    // All helpers below expect opMutex_ to be held.
    bool ensureDecode(const QueueEntry& entry, DecodePriority priority,
                      Ticks startOffset = 0);
    std::optional<size_t> acquireChain(const QueueEntry& entry, DecodePriority priority);
    void releaseChainFor(const std::string& entryId);
    void assignPendingEntries();
    std::vector<Marker> buildMarkers(const QueueEntry& entry,
                                     const std::optional<QueueEntry>& next) const;
    void refreshCrossfadeMarker();
    void armNextPassage(bool crossfadeScheduled);
    void auditFrames();
    void handleStartCrossfade(const std::string& outgoingId);
    void handleCompletion(const std::string& entryId, const char* reason);
    bool removeEntryLocked(const std::string& entryId, const char* reason, bool completed);
    bool startMixerForCurrentLocked();
    void recordIntervention(const std::string& what, const std::string& entryId);
    void publish(PlaybackEventKind kind, const std::string& entryId = {},
                 const std::string& detail = {});
    void watchdogLoop();

    const Config config_;
    QueueManager& queue_;
    QueueStore& store_;
    const PassageCatalog* catalog_;
    ChainPool& pool_;
    DecodeScheduler& scheduler_;
    BufferManager& buffers_;
    Mixer& mixer_;
    EventBus& bus_;
    audio::DecoderFactory decoderFactory_;

    mutable std::mutex opMutex_;
    CompletionRecord completed_;
    std::set<std::string> suspects_;  // violations seen on the previous pass
    bool paused_ = false;

    std::set<std::string> mismatchReported_;

    std::atomic<std::uint64_t> interventions_{0};
    std::atomic<std::uint64_t> frameAudits_{0};
    std::atomic<std::uint64_t> frameMismatches_{0};

    std::atomic<bool> watchdogRunning_{false};
    std::mutex watchdogWaitMutex_;
    std::condition_variable watchdogCv_;
    std::thread watchdogThread_;
};

}  // namespace segue::playback
