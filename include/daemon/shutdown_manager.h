#pragma once

#include <atomic>
#include <csignal>
#include <functional>

namespace segue::shutdown_manager {

// Flags written by the signal handler and polled by the main loop.
struct SignalState {
    volatile sig_atomic_t shutdown = 0;  // SIGTERM, SIGINT
    volatile sig_atomic_t reload = 0;    // SIGHUP
    volatile sig_atomic_t received = 0;  // last signal number

    void reset() {
        shutdown = 0;
        reload = 0;
        received = 0;
    }
};

SignalState& globalSignalState();

// Async-signal-safe: only sets flags.
void signalHandler(int sig);

enum class Action { None, Shutdown, Reload };

/**
 * @brief Turns pending signals into a shutdown or reload of the daemon.
 *
 * Shutdown takes priority over a reload pending in the same tick. Both start
 * the output fade-out; runShutdownSequence() waits for it to settle.
 */
class ShutdownManager {
   public:
    struct Dependencies {
        std::function<void()> startFadeOut;
        std::function<bool()> isFading;
        SignalState* signals = nullptr;  // defaults to globalSignalState()
        int fadeTimeoutMs = 100;
    };

    explicit ShutdownManager(Dependencies deps);

    void installSignalHandlers();

    // Called from the main loop.
    Action tick();

    // Rebinds the fade hooks to a rebuilt engine.
    void setFadeHooks(std::function<void()> startFadeOut, std::function<bool()> isFading);

    void runShutdownSequence();

    // Back to running before the next reload cycle.
    void reset();

    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }
    bool isReloadRequested() const {
        return reloadRequested_.load(std::memory_order_acquire);
    }
    int lastSignal() const {
        return lastSignal_;
    }

   private:
    Dependencies deps_;
    std::atomic<bool> running_{true};
    std::atomic<bool> reloadRequested_{false};
    bool sequenceRan_ = false;
    int lastSignal_ = 0;
};

}  // namespace segue::shutdown_manager
