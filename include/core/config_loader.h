#ifndef SEGUE_CONFIG_LOADER_H
#define SEGUE_CONFIG_LOADER_H

#include "audio/fade_curve.h"
#include "audio/resample_quality.h"
#include "core/engine_constants.h"
#include "logging/logger.h"

#include <cstddef>
#include <filesystem>
#include <string>

namespace segue {

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct AppConfig {
    struct AudioConfig {
        std::string device = "default";
        int sampleRate = EngineConstants::DEFAULT_OUTPUT_SAMPLE_RATE;
        int periodFrames = 1024;
        int bufferFrames = 4096;
        audio::ResampleQuality resampleQuality = audio::ResampleQuality::SincMedium;
    } audio;

    struct EngineConfig {
        int maxDecodeStreams = EngineConstants::DEFAULT_MAX_DECODE_STREAMS;
        int decodeChunkMs = EngineConstants::DEFAULT_DECODE_CHUNK_MS;
        int decodeWorkPeriodMs = EngineConstants::DEFAULT_DECODE_WORK_PERIOD_MS;
        int minBufferThresholdMs = EngineConstants::DEFAULT_MIN_BUFFER_THRESHOLD_MS;
        int firstPassageThresholdMs = EngineConstants::DEFAULT_FIRST_PASSAGE_THRESHOLD_MS;
        int watchdogIntervalMs = EngineConstants::DEFAULT_WATCHDOG_INTERVAL_MS;
        int completionDedupWindowMs = EngineConstants::DEFAULT_COMPLETION_DEDUP_WINDOW_MS;
        int positionIntervalMs = EngineConstants::DEFAULT_POSITION_INTERVAL_MS;
        int frameAuditToleranceFrames = EngineConstants::DEFAULT_FRAME_AUDIT_TOLERANCE_FRAMES;
        int markerQueueCapacity = EngineConstants::DEFAULT_MARKER_QUEUE_CAPACITY;
        int markerPollMs = EngineConstants::DEFAULT_MARKER_POLL_MS;
    } engine;

    struct BufferConfig {
        size_t capacityFrames = EngineConstants::DEFAULT_PLAYOUT_CAPACITY_FRAMES;
        size_t headroomFrames = EngineConstants::DEFAULT_PLAYOUT_HEADROOM_FRAMES;
        size_t resumeHysteresisFrames = EngineConstants::DEFAULT_RESUME_HYSTERESIS_FRAMES;
    } buffer;

    struct MixerConfig {
        float volume = EngineConstants::DEFAULT_MASTER_VOLUME;
        float pauseDecayFactor = EngineConstants::DEFAULT_PAUSE_DECAY_FACTOR;
        float pauseDecayFloor = EngineConstants::DEFAULT_PAUSE_DECAY_FLOOR;
        int resumeFadeMs = EngineConstants::DEFAULT_RESUME_FADE_MS;
        audio::FadeCurve resumeFadeCurve = audio::FadeCurve::Exponential;
        float clipCeiling = EngineConstants::DEFAULT_CLIP_CEILING;
    } mixer;

    struct OutputConfig {
        int retryAttempts = EngineConstants::DEFAULT_OUTPUT_RETRY_ATTEMPTS;
        int retryDelayMs = EngineConstants::DEFAULT_OUTPUT_RETRY_DELAY_MS;
    } output;

    struct DaemonConfig {
        std::string pidFile = EngineConstants::DEFAULT_PID_FILE;
        // Take over a PID file whose recorded process is gone; false refuses.
        bool reclaimStalePidFile = true;
        bool realtime = true;
        int realtimePriority = EngineConstants::DEFAULT_OUTPUT_RT_PRIORITY;
    } daemon;

    struct IpcConfig {
        std::string endpoint = EngineConstants::ZEROMQ_IPC_PATH;
    } ipc;

    struct StorageConfig {
        std::string queueFile;       // empty: queue kept in memory only
        std::string passageCatalog;  // empty: enqueue by file path only
    } storage;

    logging::LogConfig logging;
};

// Loads @p configPath into @p outConfig. Missing file: defaults, returns
// false. A section with wrongly typed values falls back to its defaults with a
// warning; numeric values are clamped to their valid ranges.
bool loadAppConfig(const std::filesystem::path& configPath, AppConfig& outConfig,
                   bool verbose = true);

// Same rules, from JSON text. Returns false on a parse error.
bool parseAppConfig(const std::string& jsonText, AppConfig& outConfig, bool verbose = true);

}  // namespace segue

#endif  // SEGUE_CONFIG_LOADER_H
