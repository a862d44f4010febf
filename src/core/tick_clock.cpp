#include "core/tick_clock.h"

#include <cmath>
#include <stdexcept>
#include <string>

namespace segue::timing {

namespace {

void requirePositiveRate(int sampleRate) {
    if (sampleRate <= 0) {
        throw std::invalid_argument("sample rate must be positive, got " +
                                    std::to_string(sampleRate));
    }
}

}  // namespace

Ticks ticksPerSample(int sampleRate) {
    requirePositiveRate(sampleRate);
    return TICK_RATE / sampleRate;
}

Ticks samplesToTicks(std::int64_t samples, int sampleRate) {
    requirePositiveRate(sampleRate);
    // Split so the multiply stays well inside int64 for day-long passages.
    const std::int64_t whole = samples / sampleRate;
    const std::int64_t rem = samples % sampleRate;
    return whole * TICK_RATE + (rem * TICK_RATE) / sampleRate;
}

std::int64_t ticksToSamples(Ticks ticks, int sampleRate) {
    requirePositiveRate(sampleRate);
    const std::int64_t whole = ticks / TICK_RATE;
    const std::int64_t rem = ticks % TICK_RATE;
    return whole * sampleRate + (rem * sampleRate) / TICK_RATE;
}

Ticks secondsToTicks(double seconds) {
    return static_cast<Ticks>(std::llround(seconds * static_cast<double>(TICK_RATE)));
}

double ticksToSeconds(Ticks ticks) {
    return static_cast<double>(ticks) / static_cast<double>(TICK_RATE);
}

}  // namespace segue::timing
