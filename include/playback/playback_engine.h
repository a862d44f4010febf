#pragma once

#include "audio/audio_decoder.h"
#include "core/config_loader.h"
#include "playback/buffer_manager.h"
#include "playback/callback_monitor.h"
#include "playback/chain_pool.h"
#include "playback/decode_scheduler.h"
#include "playback/event_bus.h"
#include "playback/marker_queue.h"
#include "playback/mixer.h"
#include "playback/orchestrator.h"
#include "playback/passage_catalog.h"
#include "playback/queue_manager.h"
#include "playback/queue_store.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace segue::playback {

/**
 * @brief Owns and wires every playback component.
 *
 * Construction order follows the dependency chain (bus, buffers, pool,
 * scheduler, queue, mixer, orchestrator); destruction runs in reverse after
 * stop(). renderBlock() is the only entry point for the output thread; it
 * neither locks the bus nor allocates. Markers it produces wait in a
 * MarkerQueue until the marker pump thread forwards them to the EventBus.
 */
class PlaybackEngine {
   public:
    // @p store defaults to MemoryQueueStore. @p catalog may be null.
    PlaybackEngine(const AppConfig& config, audio::DecoderFactory decoderFactory,
                   std::unique_ptr<QueueStore> store = nullptr,
                   std::unique_ptr<PassageCatalog> catalog = nullptr);
    ~PlaybackEngine();

    PlaybackEngine(const PlaybackEngine&) = delete;
    PlaybackEngine& operator=(const PlaybackEngine&) = delete;

    // Builds stores from config.storage (JSON files when paths are set).
    // Without a queue file, @p carried seeds the in-memory queue (reload).
    // Throws EngineError when the configured passage catalog cannot be read.
    static std::unique_ptr<PlaybackEngine> create(const AppConfig& config,
                                                  audio::DecoderFactory decoderFactory,
                                                  const std::vector<QueueEntry>& carried = {});

    // Restores the persisted queue, then starts the bus, scheduler and watchdog.
    void start();
    void stop();
    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    // Output thread: mixes @p frames interleaved stereo frames into @p out and
    // queues the markers that fired.
    void renderBlock(float* out, size_t frames);

    // Forwards queued markers to the bus. Returns how many were forwarded.
    // Single consumer: the marker pump owns this between start() and stop().
    size_t drainMarkers();

    // Orchestrator status plus output callback timing and marker drops.
    EngineStatus status() const;

    CallbackStats callbackStats() const {
        return callbackMonitor_.stats();
    }
    std::uint64_t droppedMarkers() const {
        return markerQueue_.dropped();
    }

    Orchestrator& orchestrator() {
        return *orchestrator_;
    }
    Mixer& mixer() {
        return mixer_;
    }
    EventBus& bus() {
        return bus_;
    }
    QueueManager& queue() {
        return queue_;
    }
    BufferManager& buffers() {
        return buffers_;
    }
    DecodeScheduler& scheduler() {
        return scheduler_;
    }
    ChainPool& pool() {
        return pool_;
    }
    int outputRate() const {
        return outputRate_;
    }

   private:
    const int outputRate_;
    EventBus bus_;
    BufferManager buffers_;
    ChainPool pool_;
    DecodeScheduler scheduler_;
    QueueManager queue_;
    std::unique_ptr<QueueStore> store_;
    std::unique_ptr<PassageCatalog> catalog_;
    Mixer mixer_;
    std::unique_ptr<Orchestrator> orchestrator_;

    void markerPumpLoop();

    MarkerQueue markerQueue_;
    CallbackMonitor callbackMonitor_;
    const int markerPollMs_;
    std::mutex markerPumpMutex_;
    std::condition_variable markerPumpCv_;
    std::thread markerPumpThread_;
    std::atomic<bool> running_{false};
};

}  // namespace segue::playback
