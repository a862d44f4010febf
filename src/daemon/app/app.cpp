#include "daemon/app/app.h"

#include "audio/sndfile_decoder.h"
#include "core/config_loader.h"
#include "core/error_codes.h"
#include "daemon/control/control_plane.h"
#include "daemon/output/alsa_pcm_controller.h"
#include "daemon/output/output_loop.h"
#include "daemon/shutdown_manager.h"
#include "logging/logger.h"
#include "playback/playback_engine.h"

#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace segue::daemon_app {
namespace {

void applyOverrides(AppConfig& config, const AppOverrides& overrides) {
    if (overrides.device) {
        config.audio.device = *overrides.device;
        LOG_INFO("Config: output device override: {}", config.audio.device);
    }
    if (overrides.endpoint) {
        config.ipc.endpoint = *overrides.endpoint;
        LOG_INFO("Config: IPC endpoint override: {}", config.ipc.endpoint);
    }
}

daemon_output::OutputLoop::Config outputConfigFrom(const AppConfig& config) {
    daemon_output::OutputLoop::Config out;
    out.sampleRate = config.audio.sampleRate;
    out.periodFrames = static_cast<size_t>(config.audio.periodFrames);
    out.retryAttempts = config.output.retryAttempts;
    out.retryDelayMs = config.output.retryDelayMs;
    out.resumeRamp.sampleRate = config.audio.sampleRate;
    out.resumeRamp.decayFactor = config.mixer.pauseDecayFactor;
    out.resumeRamp.decayFloor = config.mixer.pauseDecayFloor;
    out.resumeRamp.resumeFadeMs = config.mixer.resumeFadeMs;
    out.resumeRamp.resumeCurve = config.mixer.resumeFadeCurve;
    out.realtime.enabled = config.daemon.realtime;
    out.realtime.priority = config.daemon.realtimePriority;
    return out;
}

}  // namespace

App::App(std::string configFilePath) : configFilePath_(std::move(configFilePath)) {}

int App::run(const AppOverrides& overrides) {
    shutdown_manager::ShutdownManager shutdownManager(shutdown_manager::ShutdownManager::Dependencies{
        {}, {}, nullptr, EngineConstants::SHUTDOWN_FADE_MS * 2});
    shutdownManager.installSignalHandlers();

    int exitCode = 0;
    std::vector<playback::QueueEntry> carried;

    do {
        shutdownManager.reset();

        AppConfig config;
        if (!loadAppConfig(configFilePath_, config)) {
            LOG_WARN("Config: {} not usable, running with defaults", configFilePath_);
        }
        if (!logging::initialize(config.logging)) {
            LOG_WARN("Logging: configured sinks unavailable, keeping the current logger");
        }
        applyOverrides(config, overrides);

        std::unique_ptr<playback::PlaybackEngine> engine;
        try {
            engine = playback::PlaybackEngine::create(config, audio::makeSndfileDecoderFactory(),
                                                      carried);
        } catch (const EngineError& e) {
            LOG_CRITICAL("Cannot build playback engine: {} ({})", e.what(),
                         errorCodeToString(e.code()));
            exitCode = 1;
            break;
        }
        carried.clear();
        engine->start();

        daemon_control::ControlPlane controlPlane(
            daemon_control::ControlPlaneDependencies{engine.get(), config.ipc.endpoint});
        if (!controlPlane.start()) {
            LOG_CRITICAL("Startup aborted: cannot bind {}", config.ipc.endpoint);
            engine->stop();
            exitCode = 1;
            break;
        }

        std::atomic<bool> outputRunning{true};
        daemon_output::AlsaPcmController sink(
            daemon_output::AlsaPcmController::Config{
                config.audio.device, static_cast<size_t>(config.audio.periodFrames),
                static_cast<size_t>(config.audio.bufferFrames)},
            &outputRunning);
        playback::PlaybackEngine& live = *engine;
        daemon_output::OutputLoop output(
            sink, outputConfigFrom(config),
            [&live](float* interleaved, size_t frames) { live.renderBlock(interleaved, frames); },
            [&live](ErrorCode code, const std::string& message) {
                live.orchestrator().reportOutputFailure(code, message);
            });
        output.start();

        shutdownManager.setFadeHooks([&live]() { live.mixer().pause(); },
                                     [&live]() { return live.mixer().isFading(); });

        LOG_INFO("segue ready: {} @ {} Hz, control on {}", config.audio.device,
                 config.audio.sampleRate, config.ipc.endpoint);

        while (shutdownManager.isRunning()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            shutdownManager.tick();
        }

        shutdownManager.runShutdownSequence();
        controlPlane.stop();
        outputRunning.store(false, std::memory_order_release);
        output.stop();
        if (shutdownManager.isReloadRequested() && config.storage.queueFile.empty()) {
            carried = engine->orchestrator().queueSnapshot();
        }
        shutdownManager.setFadeHooks({}, {});
        engine->stop();

        if (shutdownManager.isReloadRequested()) {
            LOG_INFO("Reload requested, restarting with updated config ({} entries carried)",
                     carried.size());
        }
    } while (shutdownManager.isReloadRequested());

    LOG_INFO("segue stopped");
    return exitCode;
}

}  // namespace segue::daemon_app
