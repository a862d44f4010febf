#include "playback/playback_engine.h"

#include "logging/logger.h"

#include <chrono>
#include <stdexcept>

namespace segue::playback {

namespace {

DecoderChain::Config chainConfigFrom(const AppConfig& config) {
    DecoderChain::Config chain;
    chain.outputRate = config.audio.sampleRate;
    chain.chunkMs = config.engine.decodeChunkMs;
    chain.resampleQuality = config.audio.resampleQuality;
    chain.buffer.capacityFrames = config.buffer.capacityFrames;
    chain.buffer.headroomFrames = config.buffer.headroomFrames;
    chain.buffer.resumeHysteresisFrames = config.buffer.resumeHysteresisFrames;
    return chain;
}

audio::PauseRamp::Params pauseParamsFrom(const AppConfig::MixerConfig& mixer, int outputRate) {
    audio::PauseRamp::Params params;
    params.sampleRate = outputRate;
    params.decayFactor = mixer.pauseDecayFactor;
    params.decayFloor = mixer.pauseDecayFloor;
    params.resumeFadeMs = mixer.resumeFadeMs;
    params.resumeCurve = mixer.resumeFadeCurve;
    return params;
}

Mixer::Config mixerConfigFrom(const AppConfig& config) {
    Mixer::Config mixer;
    mixer.outputRate = config.audio.sampleRate;
    mixer.volume = config.mixer.volume;
    mixer.positionIntervalMs = config.engine.positionIntervalMs;
    mixer.clipCeiling = config.mixer.clipCeiling;
    mixer.pause = pauseParamsFrom(config.mixer, config.audio.sampleRate);
    return mixer;
}

}  // namespace

PlaybackEngine::PlaybackEngine(const AppConfig& config, audio::DecoderFactory decoderFactory,
                               std::unique_ptr<QueueStore> store,
                               std::unique_ptr<PassageCatalog> catalog)
    : outputRate_(config.audio.sampleRate),
      buffers_(bus_, BufferManager::Config{config.audio.sampleRate,
                                           config.engine.minBufferThresholdMs,
                                           config.engine.firstPassageThresholdMs}),
      pool_(static_cast<size_t>(config.engine.maxDecodeStreams), chainConfigFrom(config)),
      scheduler_(buffers_, bus_, DecodeScheduler::Config{config.engine.decodeWorkPeriodMs}),
      store_(store ? std::move(store) : std::make_unique<MemoryQueueStore>()),
      catalog_(std::move(catalog)),
      mixer_(mixerConfigFrom(config)),
      markerQueue_(static_cast<size_t>(config.engine.markerQueueCapacity)),
      callbackMonitor_(config.audio.sampleRate),
      markerPollMs_(config.engine.markerPollMs) {
    pool_.setResumeHandler([this](size_t chainIndex) { scheduler_.notifyResume(chainIndex); });

    Orchestrator::Config orchestratorConfig;
    orchestratorConfig.watchdogIntervalMs = config.engine.watchdogIntervalMs;
    orchestratorConfig.completionDedupWindowMs = config.engine.completionDedupWindowMs;
    orchestratorConfig.frameAuditToleranceFrames = config.engine.frameAuditToleranceFrames;
    orchestrator_ = std::make_unique<Orchestrator>(orchestratorConfig, queue_, *store_,
                                                   catalog_.get(), pool_, scheduler_, buffers_,
                                                   mixer_, bus_, std::move(decoderFactory));

    LOG_INFO("Playback engine: {} Hz, {} decoder chains, {} ms minimum buffer", outputRate_,
             pool_.size(), config.engine.minBufferThresholdMs);
}

PlaybackEngine::~PlaybackEngine() {
    stop();
}

std::unique_ptr<PlaybackEngine> PlaybackEngine::create(const AppConfig& config,
                                                       audio::DecoderFactory decoderFactory,
                                                       const std::vector<QueueEntry>& carried) {
    std::unique_ptr<QueueStore> store;
    if (!config.storage.queueFile.empty()) {
        store = std::make_unique<JsonQueueStore>(config.storage.queueFile);
    } else {
        auto memory = std::make_unique<MemoryQueueStore>();
        for (const auto& entry : carried) {
            if (memory->insert(entry) != StoreResult::Ok) {
                LOG_WARN("Dropping carried queue entry {}", entry.queueEntryId);
            }
        }
        store = std::move(memory);
    }
    std::unique_ptr<PassageCatalog> catalog;
    if (!config.storage.passageCatalog.empty()) {
        catalog = std::make_unique<JsonPassageCatalog>(config.storage.passageCatalog);
    }
    return std::make_unique<PlaybackEngine>(config, std::move(decoderFactory), std::move(store),
                                            std::move(catalog));
}

void PlaybackEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    bus_.start();
    callbackMonitor_.restart();
    markerPumpThread_ = std::thread(&PlaybackEngine::markerPumpLoop, this);
    scheduler_.start();
    orchestrator_->restoreQueue();
    orchestrator_->startWatchdog();
}

void PlaybackEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    orchestrator_->stopWatchdog();
    scheduler_.stop();
    markerPumpCv_.notify_all();
    if (markerPumpThread_.joinable()) {
        markerPumpThread_.join();
    }
    drainMarkers();
    bus_.stop();
    LOG_INFO("Playback engine stopped");
}

void PlaybackEngine::renderBlock(float* out, size_t frames) {
    callbackMonitor_.record(CallbackMonitor::Clock::now(), frames);
    mixer_.mix(out, frames, markerQueue_);
}

EngineStatus PlaybackEngine::status() const {
    EngineStatus status = orchestrator_->status();
    status.callbacks = callbackMonitor_.stats();
    status.droppedMarkers = markerQueue_.dropped();
    return status;
}

size_t PlaybackEngine::drainMarkers() {
    return markerQueue_.drain([this](const MarkerEvent& event) { bus_.publish(event); });
}

void PlaybackEngine::markerPumpLoop() {
    const auto interval = std::chrono::milliseconds(markerPollMs_);
    std::uint64_t reportedDrops = 0;
    while (running_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(markerPumpMutex_);
            markerPumpCv_.wait_for(lock, interval, [this] {
                return !running_.load(std::memory_order_acquire);
            });
        }
        drainMarkers();
        const std::uint64_t drops = markerQueue_.dropped();
        if (drops != reportedDrops) {
            LOG_WARN("Marker queue full: {} markers dropped", drops - reportedDrops);
            reportedDrops = drops;
        }
    }
}

}  // namespace segue::playback
