#pragma once

#include "daemon/output/audio_sink.h"

#include <atomic>
#include <cstdint>
#include <string>

namespace segue::daemon_output {

// ALSA playback PCM (S32_LE, interleaved) implementing AudioSink.
class AlsaPcmController : public AudioSink {
   public:
    struct Config {
        std::string device = "default";
        size_t periodFrames = 1024;
        size_t bufferFrames = 4096;
    };

    // @p running (optional) aborts blocking writes during shutdown.
    explicit AlsaPcmController(Config config, const std::atomic<bool>* running = nullptr);
    ~AlsaPcmController() override;

    AlsaPcmController(const AlsaPcmController&) = delete;
    AlsaPcmController& operator=(const AlsaPcmController&) = delete;

    bool open(int sampleRate, unsigned int channels) override;
    void close() override;
    bool isOpen() const override {
        return pcmHandle_ != nullptr;
    }
    bool alive() const override;
    long write(const std::int32_t* interleaved, size_t frames) override;

    size_t periodFrames() const override {
        return periodFrames_;
    }
    const std::string& device() const override {
        return config_.device;
    }
    std::uint64_t xrunCount() const {
        return xruns_.load(std::memory_order_relaxed);
    }

   private:
    bool running() const;

    Config config_;
    const std::atomic<bool>* running_;
    void* pcmHandle_{nullptr};
    unsigned int channels_{2};
    size_t periodFrames_{0};
    std::atomic<std::uint64_t> xruns_{0};
};

}  // namespace segue::daemon_output
