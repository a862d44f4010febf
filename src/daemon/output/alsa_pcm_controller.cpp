#include "daemon/output/alsa_pcm_controller.h"

#include "logging/logger.h"

#include <algorithm>
#include <alsa/asoundlib.h>
#include <cerrno>
#include <chrono>
#include <thread>

namespace segue::daemon_output {

AlsaPcmController::AlsaPcmController(Config config, const std::atomic<bool>* running)
    : config_(std::move(config)), running_(running) {}

AlsaPcmController::~AlsaPcmController() {
    close();
}

bool AlsaPcmController::running() const {
    return !running_ || running_->load(std::memory_order_acquire);
}

void AlsaPcmController::close() {
    if (!pcmHandle_) {
        return;
    }
    auto* pcm = static_cast<snd_pcm_t*>(pcmHandle_);
    snd_pcm_drop(pcm);
    snd_pcm_close(pcm);
    pcmHandle_ = nullptr;
    periodFrames_ = 0;
    LOG_INFO("[ALSA] Closed {}", config_.device);
}

bool AlsaPcmController::open(int sampleRate, unsigned int channels) {
    if (config_.device.empty()) {
        LOG_ERROR("[ALSA] Cannot open PCM: empty device");
        return false;
    }
    if (sampleRate <= 0 || channels == 0) {
        LOG_ERROR("[ALSA] Cannot open PCM: invalid format {} Hz / {} ch", sampleRate, channels);
        return false;
    }

    snd_pcm_t* pcm = nullptr;
    int err = snd_pcm_open(&pcm, config_.device.c_str(), SND_PCM_STREAM_PLAYBACK, 0);
    if (err < 0) {
        LOG_ERROR("[ALSA] Cannot open device {}: {}", config_.device, snd_strerror(err));
        return false;
    }

    snd_pcm_hw_params_t* hwParams;
    snd_pcm_hw_params_alloca(&hwParams);
    snd_pcm_hw_params_any(pcm, hwParams);

    if ((err = snd_pcm_hw_params_set_access(pcm, hwParams, SND_PCM_ACCESS_RW_INTERLEAVED)) < 0 ||
        (err = snd_pcm_hw_params_set_format(pcm, hwParams, SND_PCM_FORMAT_S32_LE)) < 0) {
        LOG_ERROR("[ALSA] Cannot set access/format: {}", snd_strerror(err));
        snd_pcm_close(pcm);
        return false;
    }

    auto rate = static_cast<unsigned int>(sampleRate);
    if ((err = snd_pcm_hw_params_set_rate_near(pcm, hwParams, &rate, nullptr)) < 0) {
        LOG_ERROR("[ALSA] Cannot set sample rate: {}", snd_strerror(err));
        snd_pcm_close(pcm);
        return false;
    }
    if (rate != static_cast<unsigned int>(sampleRate)) {
        LOG_ERROR("[ALSA] Requested sample rate {} not supported (got {})", sampleRate, rate);
        snd_pcm_close(pcm);
        return false;
    }

    if ((err = snd_pcm_hw_params_set_channels(pcm, hwParams, channels)) < 0) {
        LOG_ERROR("[ALSA] Cannot set channel count {}: {}", channels, snd_strerror(err));
        snd_pcm_close(pcm);
        return false;
    }

    auto periodSize = static_cast<snd_pcm_uframes_t>(config_.periodFrames);
    if ((err = snd_pcm_hw_params_set_period_size_near(pcm, hwParams, &periodSize, nullptr)) < 0) {
        LOG_ERROR("[ALSA] Cannot set period size: {}", snd_strerror(err));
        snd_pcm_close(pcm);
        return false;
    }
    auto bufferSize = std::max<snd_pcm_uframes_t>(
        static_cast<snd_pcm_uframes_t>(config_.bufferFrames), periodSize * 2);
    if ((err = snd_pcm_hw_params_set_buffer_size_near(pcm, hwParams, &bufferSize)) < 0) {
        LOG_ERROR("[ALSA] Cannot set buffer size: {}", snd_strerror(err));
        snd_pcm_close(pcm);
        return false;
    }

    if ((err = snd_pcm_hw_params(pcm, hwParams)) < 0) {
        LOG_ERROR("[ALSA] Cannot set hardware parameters: {}", snd_strerror(err));
        snd_pcm_close(pcm);
        return false;
    }
    snd_pcm_hw_params_get_period_size(hwParams, &periodSize, nullptr);
    snd_pcm_hw_params_get_buffer_size(hwParams, &bufferSize);

    if ((err = snd_pcm_prepare(pcm)) < 0) {
        LOG_ERROR("[ALSA] Cannot prepare device: {}", snd_strerror(err));
        snd_pcm_close(pcm);
        return false;
    }

    snd_pcm_sw_params_t* swParams;
    snd_pcm_sw_params_alloca(&swParams);
    if (snd_pcm_sw_params_current(pcm, swParams) == 0) {
        snd_pcm_sw_params_set_start_threshold(pcm, swParams, periodSize);
        snd_pcm_sw_params_set_avail_min(pcm, swParams, periodSize);
        if (snd_pcm_sw_params(pcm, swParams) < 0) {
            LOG_WARN("[ALSA] Failed to set software parameters");
        }
    }

    close();
    pcmHandle_ = pcm;
    channels_ = channels;
    periodFrames_ = static_cast<size_t>(periodSize);

    LOG_INFO("[ALSA] {} configured ({} Hz, S32_LE, {}ch) buffer {} frames, period {} frames",
             config_.device, rate, channels_, bufferSize, periodSize);
    return true;
}

bool AlsaPcmController::alive() const {
    if (!pcmHandle_) {
        return false;
    }
    auto* pcm = static_cast<snd_pcm_t*>(pcmHandle_);
    snd_pcm_status_t* status;
    snd_pcm_status_alloca(&status);
    if (snd_pcm_status(pcm, status) < 0) {
        return false;
    }
    snd_pcm_state_t st = snd_pcm_status_get_state(status);
    return st != SND_PCM_STATE_DISCONNECTED && st != SND_PCM_STATE_SUSPENDED;
}

long AlsaPcmController::write(const std::int32_t* interleaved, size_t frames) {
    if (!pcmHandle_) {
        return -ENODEV;
    }
    if (!interleaved || frames == 0) {
        return 0;
    }
    auto* pcm = static_cast<snd_pcm_t*>(pcmHandle_);

    size_t written = 0;
    while (written < frames && running()) {
        const std::int32_t* ptr = interleaved + written * channels_;
        const snd_pcm_sframes_t result =
            snd_pcm_writei(pcm, ptr, static_cast<snd_pcm_uframes_t>(frames - written));
        if (result > 0) {
            written += static_cast<size_t>(result);
            continue;
        }
        if (result == 0 || result == -EAGAIN) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            continue;
        }
        if (result == -EPIPE) {
            xruns_.fetch_add(1, std::memory_order_relaxed);
            LOG_EVERY_N(WARN, 10, "[ALSA] XRUN on {} ({} total)", config_.device,
                        xruns_.load(std::memory_order_relaxed));
        }
        const int recovered = snd_pcm_recover(pcm, static_cast<int>(result), 1);
        if (recovered < 0) {
            LOG_ERROR("[ALSA] Write on {} failed: {}", config_.device,
                      snd_strerror(static_cast<int>(result)));
            return static_cast<long>(result);
        }
    }
    return static_cast<long>(written);
}

}  // namespace segue::daemon_output
