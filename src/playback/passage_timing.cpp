#include "playback/passage_timing.h"

#include <algorithm>

namespace segue::playback {

namespace {

bool within(Ticks value, Ticks lo, std::optional<Ticks> hi) {
    return value >= lo && (!hi || value <= *hi);
}

}  // namespace

std::optional<std::string> validateTiming(const PassageTiming& timing) {
    if (timing.start < 0) {
        return std::string("start must not be negative");
    }
    if (timing.end && *timing.end <= timing.start) {
        return std::string("end must be after start");
    }
    if (!within(timing.fadeInPoint, timing.start, timing.end)) {
        return std::string("fade-in point outside [start, end]");
    }
    if (!within(timing.leadInPoint, timing.start, timing.end)) {
        return std::string("lead-in point outside [start, end]");
    }
    if (timing.fadeOutPoint && !within(*timing.fadeOutPoint, timing.start, timing.end)) {
        return std::string("fade-out point outside [start, end]");
    }
    if (timing.leadOutPoint && !within(*timing.leadOutPoint, timing.start, timing.end)) {
        return std::string("lead-out point outside [start, end]");
    }
    if (timing.fadeOutPoint && timing.fadeInPoint > *timing.fadeOutPoint) {
        return std::string("fade-in point after fade-out point");
    }
    return std::nullopt;
}

std::optional<Ticks> effectiveEnd(const QueueEntry& entry) {
    if (entry.timing.end) {
        return entry.timing.end;
    }
    return entry.discoveredEnd;
}

float envelopeGain(const PassageTiming& timing, std::optional<Ticks> end, Ticks position) {
    float gain = 1.0f;

    if (position < timing.fadeInPoint) {
        const Ticks span = timing.fadeInPoint - timing.start;
        if (span > 0) {
            const double t = static_cast<double>(position - timing.start) / span;
            gain *= audio::fadeInGain(timing.fadeInCurve, t);
        }
    }

    if (timing.fadeOutPoint && end && position >= *timing.fadeOutPoint) {
        const Ticks span = *end - *timing.fadeOutPoint;
        if (span > 0) {
            const double t = static_cast<double>(position - *timing.fadeOutPoint) / span;
            gain *= audio::fadeOutGain(timing.fadeOutCurve, t);
        } else {
            gain = 0.0f;
        }
    }

    return gain;
}

Ticks crossfadeOverlap(const QueueEntry& current, const QueueEntry& next) {
    const auto currentEnd = effectiveEnd(current);
    if (!currentEnd) {
        return 0;
    }
    const Ticks leadOut = current.timing.leadOutPoint.value_or(*currentEnd);
    const Ticks outgoing = *currentEnd - std::min(leadOut, *currentEnd);
    const Ticks incoming = next.timing.leadInPoint - next.timing.start;
    return std::max<Ticks>(0, std::min(outgoing, incoming));
}

std::optional<Ticks> crossfadeStartTick(const QueueEntry& current, const QueueEntry& next) {
    const Ticks overlap = crossfadeOverlap(current, next);
    if (overlap <= 0) {
        return std::nullopt;
    }
    return *effectiveEnd(current) - overlap - current.timing.start;
}

}  // namespace segue::playback
