#pragma once

#include "audio/pause_ramp.h"
#include "core/error_codes.h"
#include "daemon/core/thread_priority.h"
#include "daemon/output/audio_sink.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>
#include <vector>

namespace segue::daemon_output {

enum class OutputState { Stopped, Running, Recovering, Halted };

const char* toString(OutputState state);

// Converts interleaved float samples to S32, clamping to [-1, 1].
void floatToS32(const float* in, std::int32_t* out, size_t samples);

/**
 * @brief Pulls periods from the engine and writes them to an AudioSink.
 *
 * When a write fails the rendered period is kept and the device is reopened
 * up to retryAttempts times, retryDelayMs apart, while output stays muted.
 * A successful reopen writes the kept period under the resume ramp. When all
 * attempts fail the failure handler runs once and the loop keeps probing the
 * device at the retry cadence without rendering.
 */
class OutputLoop {
   public:
    struct Config {
        int sampleRate = 44100;
        size_t periodFrames = 1024;
        int retryAttempts = 5;
        int retryDelayMs = 500;
        audio::PauseRamp::Params resumeRamp;
        daemon_core::RealtimePolicy realtime;
    };

    using RenderFn = std::function<void(float* interleaved, size_t frames)>;
    using FailureFn = std::function<void(ErrorCode code, const std::string& message)>;

    OutputLoop(AudioSink& sink, const Config& config, RenderFn render, FailureFn onFailure);
    ~OutputLoop();

    OutputLoop(const OutputLoop&) = delete;
    OutputLoop& operator=(const OutputLoop&) = delete;

    // Opens the sink; a failure enters recovery.
    void open();

    // open() plus the output thread.
    void start();
    void stop();

    // One iteration of the thread body: render and write a period, or one
    // recovery attempt.
    void runOnce();

    OutputState state() const {
        return state_.load(std::memory_order_acquire);
    }
    std::uint64_t periodsWritten() const {
        return periodsWritten_.load(std::memory_order_relaxed);
    }
    std::uint64_t recoveries() const {
        return recoveries_.load(std::memory_order_relaxed);
    }
    // Outcome of the realtime request made when the output thread started.
    ErrorCode realtimeStatus() const {
        return realtimeStatus_.load(std::memory_order_acquire);
    }

   private:
    void run();
    void renderPeriod();
    void writePending();
    void enterRecovery(long error);
    bool reopen();
    void sleepRetryDelay();

    AudioSink& sink_;
    Config config_;
    RenderFn render_;
    FailureFn onFailure_;

    audio::PauseRamp ramp_;
    std::vector<float> floatBuffer_;
    std::vector<std::int32_t> pending_;
    bool hasPending_ = false;
    int attemptsLeft_ = 0;

    std::atomic<OutputState> state_{OutputState::Stopped};
    std::atomic<bool> running_{false};
    std::atomic<std::uint64_t> periodsWritten_{0};
    std::atomic<std::uint64_t> recoveries_{0};
    std::atomic<ErrorCode> realtimeStatus_{ErrorCode::OK};
    std::thread thread_;
};

}  // namespace segue::daemon_output
