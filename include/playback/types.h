#pragma once

#include "audio/fade_curve.h"
#include "core/tick_clock.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace segue::playback {

using timing::Ticks;

// Passage points, absolute ticks from the start of the audio file.
// Fade points shape the volume envelope; lead points only decide when the
// next passage may start overlapping.
struct PassageTiming {
    Ticks start = 0;
    std::optional<Ticks> end;  // nullopt: play to end of file
    Ticks fadeInPoint = 0;
    Ticks leadInPoint = 0;
    std::optional<Ticks> fadeOutPoint;
    std::optional<Ticks> leadOutPoint;
    audio::FadeCurve fadeInCurve = audio::FadeCurve::Exponential;
    audio::FadeCurve fadeOutCurve = audio::FadeCurve::Exponential;
};

struct QueueEntry {
    std::string queueEntryId;
    std::optional<std::string> passageId;  // nullopt: ephemeral entry
    std::string filePath;
    PassageTiming timing;
    std::int64_t playOrder = 0;
    std::optional<Ticks> discoveredEnd;  // set when the decoder finds the real end
};

enum class QueuePosition { Current, Next, Queued, None };

struct PositionInfo {
    QueuePosition kind = QueuePosition::None;
    size_t queuedIndex = 0;  // valid for Queued
};

// Lower value runs first.
enum class DecodePriority : int { Immediate = 0, Next = 1, Prefetch = 2 };

inline DecodePriority priorityFor(QueuePosition position) {
    switch (position) {
    case QueuePosition::Current:
        return DecodePriority::Immediate;
    case QueuePosition::Next:
        return DecodePriority::Next;
    default:
        return DecodePriority::Prefetch;
    }
}

inline const char* toString(QueuePosition position) {
    switch (position) {
    case QueuePosition::Current:
        return "current";
    case QueuePosition::Next:
        return "next";
    case QueuePosition::Queued:
        return "queued";
    case QueuePosition::None:
        return "none";
    }
    return "none";
}

inline const char* toString(DecodePriority priority) {
    switch (priority) {
    case DecodePriority::Immediate:
        return "immediate";
    case DecodePriority::Next:
        return "next";
    case DecodePriority::Prefetch:
        return "prefetch";
    }
    return "prefetch";
}

}  // namespace segue::playback
