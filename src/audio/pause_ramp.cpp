#include "audio/pause_ramp.h"

#include <algorithm>
#include <cmath>

namespace segue::audio {

PauseRamp::PauseRamp() : PauseRamp(Params{}) {}

PauseRamp::PauseRamp(const Params& params) {
    setParams(params);
}

void PauseRamp::startPause() {
    RampState current = state_.load(std::memory_order_acquire);
    if (current == RampState::Playing || current == RampState::Resuming) {
        state_.store(RampState::Paused, std::memory_order_release);
    }
}

void PauseRamp::startResume() {
    if (state_.load(std::memory_order_acquire) != RampState::Paused) {
        return;
    }
    fadePosition_.store(0, std::memory_order_relaxed);
    if (resumeFadeMs_.load(std::memory_order_relaxed) <= 0) {
        currentGain_.store(1.0f, std::memory_order_relaxed);
        state_.store(RampState::Playing, std::memory_order_release);
        return;
    }
    currentGain_.store(0.0f, std::memory_order_relaxed);
    state_.store(RampState::Resuming, std::memory_order_release);
}

void PauseRamp::setPlaying() {
    fadePosition_.store(0, std::memory_order_relaxed);
    currentGain_.store(1.0f, std::memory_order_relaxed);
    state_.store(RampState::Playing, std::memory_order_release);
}

void PauseRamp::setSilent() {
    tailLeft_.store(0.0f, std::memory_order_relaxed);
    tailRight_.store(0.0f, std::memory_order_relaxed);
    currentGain_.store(0.0f, std::memory_order_relaxed);
    state_.store(RampState::Paused, std::memory_order_release);
}

void PauseRamp::applyResumeGain(float* interleaved, size_t frames) {
    if (interleaved == nullptr || frames == 0) {
        return;
    }

    if (state_.load(std::memory_order_acquire) == RampState::Resuming) {
        const size_t total = fadeFrames_.load(std::memory_order_relaxed);
        const FadeCurve curve = resumeCurve_.load(std::memory_order_relaxed);
        size_t pos = fadePosition_.load(std::memory_order_relaxed);
        for (size_t frame = 0; frame < frames; ++frame) {
            float gain = 1.0f;
            if (pos < total) {
                gain = fadeInGain(curve, static_cast<double>(pos) / static_cast<double>(total));
                ++pos;
            }
            interleaved[frame * 2] *= gain;
            interleaved[frame * 2 + 1] *= gain;
            currentGain_.store(gain, std::memory_order_relaxed);
        }
        fadePosition_.store(pos, std::memory_order_relaxed);
        if (pos >= total) {
            RampState expected = RampState::Resuming;
            state_.compare_exchange_strong(expected, RampState::Playing,
                                           std::memory_order_acq_rel);
            currentGain_.store(1.0f, std::memory_order_relaxed);
        }
    }

    tailLeft_.store(interleaved[(frames - 1) * 2], std::memory_order_relaxed);
    tailRight_.store(interleaved[(frames - 1) * 2 + 1], std::memory_order_relaxed);
}

void PauseRamp::fillDecay(float* interleaved, size_t frames) {
    if (interleaved == nullptr || frames == 0) {
        return;
    }
    const float factor = decayFactor_.load(std::memory_order_relaxed);
    const float floor = decayFloor_.load(std::memory_order_relaxed);
    float left = tailLeft_.load(std::memory_order_relaxed);
    float right = tailRight_.load(std::memory_order_relaxed);

    for (size_t frame = 0; frame < frames; ++frame) {
        left *= factor;
        right *= factor;
        if (std::fabs(left) < floor) {
            left = 0.0f;
        }
        if (std::fabs(right) < floor) {
            right = 0.0f;
        }
        interleaved[frame * 2] = left;
        interleaved[frame * 2 + 1] = right;
    }

    tailLeft_.store(left, std::memory_order_relaxed);
    tailRight_.store(right, std::memory_order_relaxed);
    currentGain_.store(0.0f, std::memory_order_relaxed);
}

RampState PauseRamp::state() const {
    return state_.load(std::memory_order_acquire);
}

bool PauseRamp::isPaused() const {
    return state() == RampState::Paused;
}

bool PauseRamp::isTransitioning() const {
    RampState s = state();
    if (s == RampState::Resuming) {
        return true;
    }
    return s == RampState::Paused && (tailLeft_.load(std::memory_order_relaxed) != 0.0f ||
                                      tailRight_.load(std::memory_order_relaxed) != 0.0f);
}

float PauseRamp::currentGain() const {
    return currentGain_.load(std::memory_order_relaxed);
}

void PauseRamp::setParams(const Params& params) {
    sampleRate_.store(std::max(1, params.sampleRate), std::memory_order_relaxed);
    decayFactor_.store(std::clamp(params.decayFactor, 0.0f, 0.9999f), std::memory_order_relaxed);
    decayFloor_.store(std::max(0.0f, params.decayFloor), std::memory_order_relaxed);
    resumeFadeMs_.store(std::max(0, params.resumeFadeMs), std::memory_order_relaxed);
    resumeCurve_.store(params.resumeCurve, std::memory_order_relaxed);
    updateFadeFrames();
}

PauseRamp::Params PauseRamp::params() const {
    Params p;
    p.sampleRate = sampleRate_.load(std::memory_order_relaxed);
    p.decayFactor = decayFactor_.load(std::memory_order_relaxed);
    p.decayFloor = decayFloor_.load(std::memory_order_relaxed);
    p.resumeFadeMs = resumeFadeMs_.load(std::memory_order_relaxed);
    p.resumeCurve = resumeCurve_.load(std::memory_order_relaxed);
    return p;
}

void PauseRamp::updateFadeFrames() {
    size_t frames = calculateFadeFrames(resumeFadeMs_.load(std::memory_order_relaxed),
                                        sampleRate_.load(std::memory_order_relaxed));
    fadeFrames_.store(std::max<size_t>(frames, 1), std::memory_order_release);
}

}  // namespace segue::audio
