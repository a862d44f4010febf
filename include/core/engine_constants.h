#ifndef SEGUE_ENGINE_CONSTANTS_H
#define SEGUE_ENGINE_CONSTANTS_H

#include <cstddef>
#include <cstdint>

// Defaults shared across engine and daemon components.

namespace segue::EngineConstants {

// Output format
constexpr int DEFAULT_OUTPUT_SAMPLE_RATE = 44100;
constexpr int CHANNELS = 2;

// Decoder chain pool
constexpr int DEFAULT_MAX_DECODE_STREAMS = 12;
constexpr int MIN_DECODE_STREAMS = 1;
constexpr int MAX_DECODE_STREAMS = 32;
constexpr int DEFAULT_DECODE_CHUNK_MS = 1000;
constexpr int DEFAULT_DECODE_WORK_PERIOD_MS = 5000;

// Playout ring (frames at the output rate)
constexpr size_t DEFAULT_PLAYOUT_CAPACITY_FRAMES = 661941;  // ~15 s at 44.1 kHz
constexpr size_t DEFAULT_PLAYOUT_HEADROOM_FRAMES = 4410;    // 100 ms
constexpr size_t DEFAULT_RESUME_HYSTERESIS_FRAMES = 44100;  // 1 s

// Buffer readiness
constexpr int DEFAULT_MIN_BUFFER_THRESHOLD_MS = 3000;
constexpr int DEFAULT_FIRST_PASSAGE_THRESHOLD_MS = 500;

// Orchestration
constexpr int DEFAULT_WATCHDOG_INTERVAL_MS = 100;
constexpr int DEFAULT_COMPLETION_DEDUP_WINDOW_MS = 5000;
constexpr int DEFAULT_POSITION_INTERVAL_MS = 1000;
constexpr int DEFAULT_FRAME_AUDIT_TOLERANCE_FRAMES = 8192;

// Marker delivery from the output thread
constexpr int DEFAULT_MARKER_QUEUE_CAPACITY = 256;
constexpr int DEFAULT_MARKER_POLL_MS = 2;

// Mixer
constexpr float DEFAULT_MASTER_VOLUME = 0.5f;
constexpr float DEFAULT_PAUSE_DECAY_FACTOR = 0.95f;
constexpr float DEFAULT_PAUSE_DECAY_FLOOR = 0.0001778f;  // -75 dBFS
constexpr int DEFAULT_RESUME_FADE_MS = 500;
constexpr float DEFAULT_CLIP_CEILING = 1.0f;
constexpr int SHUTDOWN_FADE_MS = 50;

// Output device recovery
constexpr int DEFAULT_OUTPUT_RETRY_ATTEMPTS = 5;
constexpr int DEFAULT_OUTPUT_RETRY_DELAY_MS = 500;

// Process
constexpr const char* DEFAULT_PID_FILE = "/tmp/segue_daemon.pid";
constexpr int DEFAULT_OUTPUT_RT_PRIORITY = 65;

// ZeroMQ endpoints
constexpr const char* ZEROMQ_IPC_PATH = "ipc:///tmp/segue.sock";
constexpr const char* ZEROMQ_PUB_SUFFIX = ".pub";

}  // namespace segue::EngineConstants

#endif  // SEGUE_ENGINE_CONSTANTS_H
