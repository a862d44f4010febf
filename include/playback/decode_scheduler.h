#pragma once

#include "playback/buffer_manager.h"
#include "playback/decoder_chain.h"
#include "playback/event_bus.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace segue::playback {

/**
 * @brief Runs decode work for all chains, one chunk at a time, on one worker.
 *
 * Only one chain decodes at any moment. Each step picks the eligible chain
 * with the lowest priority class, ties broken by submission order. A chain
 * that reports BufferFull is parked until its ring's resume callback calls
 * notifyResume(); parked chains are never polled.
 *
 * A chain that keeps the worker for longer than the work period is moved to
 * the back of its priority class so that peers of the same class progress.
 */
class DecodeScheduler {
   public:
    struct Config {
        int workPeriodMs = 5000;
    };

    static constexpr size_t kMaxChains = 32;

    DecodeScheduler(BufferManager& buffers, EventBus& bus, const Config& config);
    ~DecodeScheduler();

    DecodeScheduler(const DecodeScheduler&) = delete;
    DecodeScheduler& operator=(const DecodeScheduler&) = delete;

    // Queues decode work for the entry currently assigned to @p chain.
    // Resubmitting an entry updates its chain and priority.
    void submit(DecoderChain& chain, DecodePriority priority);

    bool setPriority(const std::string& entryId, DecodePriority priority);

    // Drops the entry's work. An in-flight chunk finishes on the chain but its
    // outcome is discarded.
    bool cancel(const std::string& entryId);

    // Safe from the real-time thread: sets a bit and signals the worker.
    void notifyResume(size_t chainIndex);

    std::optional<DecodePriority> priorityOf(const std::string& entryId) const;
    bool isYielded(const std::string& entryId) const;
    bool hasTask(const std::string& entryId) const;
    std::optional<std::string> activeEntry() const;

    // Tasks eligible to run (not parked).
    size_t pendingCount() const;
    size_t taskCount() const;

    void start();
    void stop();
    bool isRunning() const {
        return running_.load(std::memory_order_acquire);
    }

    // Executes one scheduling step on the calling thread. Returns false when
    // nothing was eligible.
    bool runOnce();

   private:
    struct Task {
        std::string entryId;
        DecoderChain* chain = nullptr;
        DecodePriority priority = DecodePriority::Prefetch;
        std::uint64_t sequence = 0;
        std::uint64_t token = 0;
        bool yielded = false;
    };

    void applyResumeMask();
    Task* findTask(const std::string& entryId);
    const Task* findTask(const std::string& entryId) const;
    Task* findToken(std::uint64_t token);
    void wake();
    void run();

    BufferManager& buffers_;
    EventBus& bus_;
    const Config config_;

    mutable std::mutex mutex_;
    std::vector<Task> tasks_;
    std::uint64_t nextSequence_ = 0;
    std::uint64_t nextToken_ = 1;
    std::optional<std::string> active_;
    std::uint64_t sliceToken_ = 0;
    std::chrono::steady_clock::time_point sliceStart_;

    // Serializes runOnce() between the worker and direct callers.
    std::mutex stepMutex_;

    std::atomic<std::uint32_t> resumeMask_{0};
    std::atomic<bool> wakeRequested_{false};
    std::condition_variable cv_;
    std::mutex waitMutex_;

    std::atomic<bool> running_{false};
    std::thread worker_;
};

}  // namespace segue::playback
