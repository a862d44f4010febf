#pragma once

#include <array>
#include <cstdint>
#include <limits>

/**
 * @file tick_clock.h
 * @brief Integer timebase shared by every timing value in the engine.
 *
 * One tick is 1/28,224,000 s, the least common multiple of all supported
 * sample rates, so one sample at any supported rate is a whole number of
 * ticks. Internal positions, markers and passage points are ticks; seconds
 * and milliseconds appear only at the user-facing edges.
 */

namespace segue::timing {

using Ticks = std::int64_t;

inline constexpr Ticks TICK_RATE = 28'224'000;
inline constexpr Ticks TICKS_PER_MS = TICK_RATE / 1000;

// Largest millisecond value msToTicks() can represent (about 10.3 years).
inline constexpr std::int64_t MAX_TICK_MS = std::numeric_limits<Ticks>::max() / TICKS_PER_MS;

inline constexpr std::array<int, 11> SUPPORTED_SAMPLE_RATES = {
    8000, 11025, 16000, 22050, 32000, 44100, 48000, 88200, 96000, 176400, 192000};

constexpr bool isSupportedRate(int sampleRate) {
    for (int rate : SUPPORTED_SAMPLE_RATES) {
        if (rate == sampleRate) {
            return true;
        }
    }
    return false;
}

// All conversions below throw std::invalid_argument for sampleRate <= 0.

/// Exact for supported rates; truncated once otherwise.
Ticks ticksPerSample(int sampleRate);

Ticks samplesToTicks(std::int64_t samples, int sampleRate);

/// Floor of the sample index containing @p ticks.
std::int64_t ticksToSamples(Ticks ticks, int sampleRate);

/// @p ms must lie within [-MAX_TICK_MS, MAX_TICK_MS]; see msFitsInTicks().
constexpr Ticks msToTicks(std::int64_t ms) {
    return ms * TICKS_PER_MS;
}

constexpr bool msFitsInTicks(std::int64_t ms) {
    return ms >= -MAX_TICK_MS && ms <= MAX_TICK_MS;
}

/// Truncates toward zero.
constexpr std::int64_t ticksToMs(Ticks ticks) {
    return ticks / TICKS_PER_MS;
}

/// Rounds to the nearest tick.
Ticks secondsToTicks(double seconds);

double ticksToSeconds(Ticks ticks);

}  // namespace segue::timing
