#pragma once

#include "core/error_codes.h"
#include "playback/types.h"

#include <cstdint>
#include <optional>
#include <string>

namespace segue::playback {

enum class MarkerKind {
    PositionUpdate,
    StartCrossfade,
    PassageComplete,
    EndOfFile,
    EndOfFileBeforeLeadOut
};

// Emitted by the mixer when a passage position crosses a marker.
struct MarkerEvent {
    std::string entryId;
    MarkerKind kind = MarkerKind::PositionUpdate;
    Ticks tick = 0;  // relative to passage start
    std::int64_t positionMs = 0;
};

enum class BufferEventKind {
    ReadyForStart,
    BufferLow,
    DecodeFinished,
    DecodeFailed,
    EndpointDiscovered
};

struct BufferEvent {
    BufferEventKind kind = BufferEventKind::ReadyForStart;
    std::string entryId;
    size_t occupancyFrames = 0;
    std::optional<Ticks> endpoint;  // EndpointDiscovered
    ErrorCode error = ErrorCode::OK;  // DecodeFailed
    std::string message;
};

enum class PlaybackEventKind {
    Enqueued,
    QueueChanged,
    PassageStarted,
    CrossfadeStarted,
    PositionUpdate,
    PassageComplete,
    PlaybackStateChanged,
    VolumeChanged,
    WatchdogIntervention,
    Error
};

// Outward-facing notifications, forwarded to control-plane subscribers.
struct PlaybackEvent {
    PlaybackEventKind kind = PlaybackEventKind::QueueChanged;
    std::string entryId;
    std::int64_t positionMs = 0;
    bool paused = false;
    float volume = 0.0f;
    ErrorCode error = ErrorCode::OK;
    std::string detail;
};

const char* toString(MarkerKind kind);
const char* toString(BufferEventKind kind);
const char* toString(PlaybackEventKind kind);

}  // namespace segue::playback
