#include "daemon/shutdown_manager.h"

#include "logging/logger.h"

#include <chrono>
#include <thread>
#include <utility>

namespace segue::shutdown_manager {

namespace {

SignalState g_signalState;

}  // namespace

SignalState& globalSignalState() {
    return g_signalState;
}

void signalHandler(int sig) {
    g_signalState.received = sig;
    if (sig == SIGHUP) {
        g_signalState.reload = 1;
    } else {
        g_signalState.shutdown = 1;
    }
}

ShutdownManager::ShutdownManager(Dependencies deps) : deps_(std::move(deps)) {
    if (!deps_.signals) {
        deps_.signals = &globalSignalState();
    }
}

void ShutdownManager::installSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
}

void ShutdownManager::setFadeHooks(std::function<void()> startFadeOut,
                                   std::function<bool()> isFading) {
    deps_.startFadeOut = std::move(startFadeOut);
    deps_.isFading = std::move(isFading);
}

Action ShutdownManager::tick() {
    SignalState& signals = *deps_.signals;

    if (signals.shutdown) {
        signals.shutdown = 0;
        signals.reload = 0;
        lastSignal_ = signals.received;
        LOG_INFO("Received signal {}, shutting down", lastSignal_);
        reloadRequested_.store(false, std::memory_order_release);
        running_.store(false, std::memory_order_release);
        if (deps_.startFadeOut) {
            deps_.startFadeOut();
        }
        return Action::Shutdown;
    }

    if (signals.reload) {
        signals.reload = 0;
        lastSignal_ = signals.received;
        LOG_INFO("Received SIGHUP (signal {}), reloading configuration", lastSignal_);
        reloadRequested_.store(true, std::memory_order_release);
        running_.store(false, std::memory_order_release);
        if (deps_.startFadeOut) {
            deps_.startFadeOut();
        }
        return Action::Reload;
    }

    return Action::None;
}

void ShutdownManager::runShutdownSequence() {
    if (sequenceRan_) {
        return;
    }
    sequenceRan_ = true;

    if (!deps_.isFading || !deps_.isFading()) {
        return;
    }
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(deps_.fadeTimeoutMs);
    while (deps_.isFading()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            LOG_WARN("Fade-out did not settle within {} ms, stopping anyway", deps_.fadeTimeoutMs);
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
}

void ShutdownManager::reset() {
    sequenceRan_ = false;
    running_.store(true, std::memory_order_release);
    reloadRequested_.store(false, std::memory_order_release);
}

}  // namespace segue::shutdown_manager
