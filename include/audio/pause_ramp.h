#ifndef SEGUE_PAUSE_RAMP_H
#define SEGUE_PAUSE_RAMP_H

#include "audio/fade_curve.h"

#include <atomic>
#include <cstddef>

namespace segue::audio {

enum class RampState {
    Playing,   // pass-through, gain 1.0
    Paused,    // source not consumed; last frame decays toward silence
    Resuming   // source consumed again under a fade-in envelope
};

// Click-free pause/resume for the mixer output.
//
// Pausing freezes the source and lets the last emitted frame decay by a
// constant factor per sample until it drops below the floor. Resuming ramps
// the mixed signal back in with a fade-in curve.
//
// Thread safety: startPause/startResume/setPlaying/setters may be called from
// any thread; applyResumeGain/fillDecay only from the mixer thread.
class PauseRamp {
   public:
    struct Params {
        int sampleRate = 44100;
        float decayFactor = 0.95f;
        float decayFloor = 0.0001778f;
        int resumeFadeMs = 500;
        FadeCurve resumeCurve = FadeCurve::Exponential;
    };

    PauseRamp();
    explicit PauseRamp(const Params& params);

    void startPause();
    void startResume();

    // Immediate transitions, no envelope.
    void setPlaying();
    void setSilent();

    // Playing/Resuming: scale @p interleaved (stereo) by the resume envelope and
    // remember the last frame as the decay seed.
    void applyResumeGain(float* interleaved, size_t frames);

    // Paused: write the decaying tail into @p interleaved.
    void fillDecay(float* interleaved, size_t frames);

    RampState state() const;
    bool isPaused() const;
    bool isTransitioning() const;  // resuming, or paused with an audible tail
    float currentGain() const;

    void setParams(const Params& params);
    Params params() const;

   private:
    void updateFadeFrames();

    std::atomic<RampState> state_{RampState::Playing};
    std::atomic<float> currentGain_{1.0f};
    std::atomic<size_t> fadePosition_{0};
    std::atomic<size_t> fadeFrames_{1};

    std::atomic<float> tailLeft_{0.0f};
    std::atomic<float> tailRight_{0.0f};

    std::atomic<int> sampleRate_{44100};
    std::atomic<float> decayFactor_{0.95f};
    std::atomic<float> decayFloor_{0.0001778f};
    std::atomic<int> resumeFadeMs_{500};
    std::atomic<FadeCurve> resumeCurve_{FadeCurve::Exponential};
};

inline size_t calculateFadeFrames(int durationMs, int sampleRate) {
    if (durationMs <= 0 || sampleRate <= 0) {
        return 0;
    }
    return static_cast<size_t>(static_cast<long long>(durationMs) * sampleRate / 1000);
}

}  // namespace segue::audio

#endif  // SEGUE_PAUSE_RAMP_H
