#pragma once

#include "playback/types.h"

#include <optional>
#include <string>

namespace segue::playback {

// Returns a description of the first violated constraint, or nullopt if valid.
std::optional<std::string> validateTiming(const PassageTiming& timing);

// Declared end, else the end discovered while decoding.
std::optional<Ticks> effectiveEnd(const QueueEntry& entry);

// Envelope gain at an absolute file position: fade-in over
// [start, fadeInPoint], fade-out over [fadeOutPoint, end].
float envelopeGain(const PassageTiming& timing, std::optional<Ticks> end, Ticks position);

// Overlap between @p current and @p next:
//   min(current.end - current.leadOut, next.leadIn - next.start)
// where current.leadOut defaults to current.end. Zero when current.end is
// unknown or either side leaves no room.
Ticks crossfadeOverlap(const QueueEntry& current, const QueueEntry& next);

// Tick, relative to current.start, at which @p next should begin; nullopt
// when the passages do not overlap.
std::optional<Ticks> crossfadeStartTick(const QueueEntry& current, const QueueEntry& next);

}  // namespace segue::playback
