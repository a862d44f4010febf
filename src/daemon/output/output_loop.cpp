#include "daemon/output/output_loop.h"

#include "core/engine_constants.h"
#include "daemon/core/thread_priority.h"
#include "logging/logger.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <stdexcept>

namespace segue::daemon_output {

namespace {

constexpr unsigned int kChannels = EngineConstants::CHANNELS;

}  // namespace

const char* toString(OutputState state) {
    switch (state) {
    case OutputState::Stopped:
        return "stopped";
    case OutputState::Running:
        return "running";
    case OutputState::Recovering:
        return "recovering";
    case OutputState::Halted:
        return "halted";
    }
    return "unknown";
}

void floatToS32(const float* in, std::int32_t* out, size_t samples) {
    for (size_t i = 0; i < samples; ++i) {
        const float sample = std::clamp(in[i], -1.0f, 1.0f);
        // 1.0f * INT32_MAX rounds to 2^31, which does not fit.
        const double scaled = static_cast<double>(sample) * 2147483647.0;
        out[i] = static_cast<std::int32_t>(std::lround(scaled));
    }
}

OutputLoop::OutputLoop(AudioSink& sink, const Config& config, RenderFn render,
                       FailureFn onFailure)
    : sink_(sink),
      config_(config),
      render_(std::move(render)),
      onFailure_(std::move(onFailure)),
      ramp_(config.resumeRamp) {
    if (!render_) {
        throw std::invalid_argument("OutputLoop requires a render function");
    }
    if (config_.periodFrames == 0) {
        throw std::invalid_argument("OutputLoop period must be > 0");
    }
    config_.retryAttempts = std::max(1, config_.retryAttempts);
    config_.resumeRamp.sampleRate = config_.sampleRate;
    ramp_.setParams(config_.resumeRamp);
    floatBuffer_.assign(config_.periodFrames * kChannels, 0.0f);
    pending_.assign(config_.periodFrames * kChannels, 0);
}

OutputLoop::~OutputLoop() {
    stop();
}

void OutputLoop::open() {
    if (sink_.open(config_.sampleRate, kChannels)) {
        state_.store(OutputState::Running, std::memory_order_release);
        return;
    }
    LOG_WARN("[Output] Cannot open {}, retrying", sink_.device());
    attemptsLeft_ = config_.retryAttempts;
    state_.store(OutputState::Recovering, std::memory_order_release);
}

void OutputLoop::start() {
    if (running_.exchange(true)) {
        return;
    }
    open();
    thread_ = std::thread(&OutputLoop::run, this);
}

void OutputLoop::stop() {
    if (running_.exchange(false)) {
        if (thread_.joinable()) {
            thread_.join();
        }
        LOG_INFO("[Output] Output thread terminated ({} periods written)", periodsWritten());
    }
    sink_.close();
    state_.store(OutputState::Stopped, std::memory_order_release);
}

void OutputLoop::run() {
    realtimeStatus_.store(daemon_core::applyRealtimePolicy(config_.realtime, "Output"),
                          std::memory_order_release);
    while (running_.load(std::memory_order_acquire)) {
        runOnce();
    }
}

void OutputLoop::runOnce() {
    switch (state_.load(std::memory_order_acquire)) {
    case OutputState::Stopped:
        return;

    case OutputState::Running:
        if (!hasPending_) {
            renderPeriod();
        }
        writePending();
        return;

    case OutputState::Recovering:
        sleepRetryDelay();
        if (reopen()) {
            // The kept period goes out first, faded in.
            if (hasPending_) {
                ramp_.applyResumeGain(floatBuffer_.data(), config_.periodFrames);
                floatToS32(floatBuffer_.data(), pending_.data(), pending_.size());
            }
            writePending();
            return;
        }
        if (--attemptsLeft_ > 0) {
            return;
        }
        state_.store(OutputState::Halted, std::memory_order_release);
        hasPending_ = false;
        LOG_ERROR("[Output] {} lost after {} attempts", sink_.device(), config_.retryAttempts);
        if (onFailure_) {
            onFailure_(ErrorCode::DAC_DEVICE_LOST,
                       "Output device " + sink_.device() + " lost after " +
                           std::to_string(config_.retryAttempts) + " reopen attempts");
        }
        return;

    case OutputState::Halted:
        sleepRetryDelay();
        if (reopen()) {
            LOG_INFO("[Output] {} is back; playback stays paused until resumed", sink_.device());
        }
        return;
    }
}

void OutputLoop::renderPeriod() {
    render_(floatBuffer_.data(), config_.periodFrames);
    ramp_.applyResumeGain(floatBuffer_.data(), config_.periodFrames);
    floatToS32(floatBuffer_.data(), pending_.data(), pending_.size());
    hasPending_ = true;
}

void OutputLoop::writePending() {
    if (!hasPending_) {
        return;
    }
    const long written = sink_.write(pending_.data(), config_.periodFrames);
    if (written < 0) {
        enterRecovery(written);
        return;
    }
    hasPending_ = false;
    periodsWritten_.fetch_add(1, std::memory_order_relaxed);
}

void OutputLoop::enterRecovery(long error) {
    LOG_WARN("[Output] Write to {} failed ({}), reopening up to {} times", sink_.device(), error,
             config_.retryAttempts);
    sink_.close();
    attemptsLeft_ = config_.retryAttempts;
    state_.store(OutputState::Recovering, std::memory_order_release);
}

bool OutputLoop::reopen() {
    sink_.close();
    if (!sink_.open(config_.sampleRate, kChannels)) {
        return false;
    }
    ramp_.setSilent();
    ramp_.startResume();
    recoveries_.fetch_add(1, std::memory_order_relaxed);
    state_.store(OutputState::Running, std::memory_order_release);
    LOG_INFO("[Output] Reopened {}", sink_.device());
    return true;
}

void OutputLoop::sleepRetryDelay() {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(config_.retryDelayMs);
    while (running_.load(std::memory_order_acquire) &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

}  // namespace segue::daemon_output
