#include "playback/decode_scheduler.h"

#include "logging/logger.h"

#include <algorithm>
#include <stdexcept>

namespace segue::playback {

namespace {

// Upper bound on a lost notify between the mask update and the wait.
constexpr auto kIdleWait = std::chrono::milliseconds(100);

}  // namespace

DecodeScheduler::DecodeScheduler(BufferManager& buffers, EventBus& bus, const Config& config)
    : buffers_(buffers), bus_(bus), config_(config) {}

DecodeScheduler::~DecodeScheduler() {
    stop();
}

void DecodeScheduler::submit(DecoderChain& chain, DecodePriority priority) {
    if (chain.index() >= kMaxChains) {
        throw std::invalid_argument("DecodeScheduler supports at most 32 chains");
    }
    const std::string entryId = chain.entryId();
    if (entryId.empty()) {
        throw std::invalid_argument("DecodeScheduler::submit on an unassigned chain");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (Task* task = findTask(entryId)) {
            task->chain = &chain;
            task->priority = priority;
            task->yielded = false;
            task->token = nextToken_++;
        } else {
            Task task;
            task.entryId = entryId;
            task.chain = &chain;
            task.priority = priority;
            task.sequence = nextSequence_++;
            task.token = nextToken_++;
            tasks_.push_back(std::move(task));
        }
    }
    LOG_DEBUG("Decode submitted: {} on chain {} ({})", entryId, chain.index(), toString(priority));
    wake();
}

bool DecodeScheduler::setPriority(const std::string& entryId, DecodePriority priority) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        Task* task = findTask(entryId);
        if (!task) {
            return false;
        }
        if (task->priority == priority) {
            return true;
        }
        task->priority = priority;
    }
    LOG_DEBUG("Decode priority of {} -> {}", entryId, toString(priority));
    wake();
    return true;
}

bool DecodeScheduler::cancel(const std::string& entryId) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(tasks_.begin(), tasks_.end(),
                           [&](const Task& t) { return t.entryId == entryId; });
    if (it == tasks_.end()) {
        return false;
    }
    tasks_.erase(it);
    LOG_DEBUG("Decode cancelled: {}", entryId);
    return true;
}

void DecodeScheduler::notifyResume(size_t chainIndex) {
    if (chainIndex >= kMaxChains) {
        return;
    }
    resumeMask_.fetch_or(std::uint32_t{1} << chainIndex, std::memory_order_acq_rel);
    wakeRequested_.store(true, std::memory_order_release);
    cv_.notify_one();
}

std::optional<DecodePriority> DecodeScheduler::priorityOf(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Task* task = findTask(entryId);
    if (!task) {
        return std::nullopt;
    }
    return task->priority;
}

bool DecodeScheduler::isYielded(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Task* task = findTask(entryId);
    return task && task->yielded;
}

bool DecodeScheduler::hasTask(const std::string& entryId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return findTask(entryId) != nullptr;
}

std::optional<std::string> DecodeScheduler::activeEntry() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return active_;
}

size_t DecodeScheduler::pendingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<size_t>(
        std::count_if(tasks_.begin(), tasks_.end(), [](const Task& t) { return !t.yielded; }));
}

size_t DecodeScheduler::taskCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tasks_.size();
}

DecodeScheduler::Task* DecodeScheduler::findTask(const std::string& entryId) {
    for (auto& task : tasks_) {
        if (task.entryId == entryId) {
            return &task;
        }
    }
    return nullptr;
}

const DecodeScheduler::Task* DecodeScheduler::findTask(const std::string& entryId) const {
    for (const auto& task : tasks_) {
        if (task.entryId == entryId) {
            return &task;
        }
    }
    return nullptr;
}

DecodeScheduler::Task* DecodeScheduler::findToken(std::uint64_t token) {
    for (auto& task : tasks_) {
        if (task.token == token) {
            return &task;
        }
    }
    return nullptr;
}

// Caller holds mutex_.
void DecodeScheduler::applyResumeMask() {
    const std::uint32_t mask = resumeMask_.exchange(0, std::memory_order_acq_rel);
    if (mask == 0) {
        return;
    }
    for (auto& task : tasks_) {
        if (task.yielded && (mask & (std::uint32_t{1} << task.chain->index()))) {
            task.yielded = false;
        }
    }
}

bool DecodeScheduler::runOnce() {
    std::lock_guard<std::mutex> step(stepMutex_);

    std::string entryId;
    DecoderChain* chain = nullptr;
    std::uint64_t token = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        applyResumeMask();
        const Task* best = nullptr;
        for (const auto& task : tasks_) {
            if (task.yielded) {
                continue;
            }
            if (!best || task.priority < best->priority ||
                (task.priority == best->priority && task.sequence < best->sequence)) {
                best = &task;
            }
        }
        if (!best) {
            active_.reset();
            return false;
        }
        entryId = best->entryId;
        chain = best->chain;
        token = best->token;
        active_ = entryId;
        if (token != sliceToken_) {
            sliceToken_ = token;
            sliceStart_ = std::chrono::steady_clock::now();
        }
    }

    const ChunkResult result = chain->processChunk();

    std::optional<Ticks> discovered;
    bool stillOwned = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        active_.reset();
        Task* task = findToken(token);
        stillOwned = task != nullptr;
        if (task) {
            switch (result) {
            case ChunkResult::BufferFull:
                task->yielded = true;
                break;
            case ChunkResult::Finished:
            case ChunkResult::Failed:
            case ChunkResult::Cancelled:
                tasks_.erase(tasks_.begin() + (task - tasks_.data()));
                task = nullptr;
                break;
            case ChunkResult::Processed:
                break;
            }
        }
        if (task && result == ChunkResult::Processed &&
            std::chrono::steady_clock::now() - sliceStart_ >=
                std::chrono::milliseconds(config_.workPeriodMs)) {
            // Work period used up: go behind peers of the same class.
            task->sequence = nextSequence_++;
            sliceToken_ = 0;
        }
    }
    if (!stillOwned) {
        LOG_TRACE("Discarding {} outcome for cancelled entry {}", toString(result), entryId);
        return true;
    }

    discovered = chain->takeDiscoveredEnd();
    if (discovered) {
        BufferEvent event;
        event.kind = BufferEventKind::EndpointDiscovered;
        event.entryId = entryId;
        event.endpoint = discovered;
        bus_.publish(event);
    }

    switch (result) {
    case ChunkResult::Processed:
    case ChunkResult::BufferFull:
        buffers_.notifySamplesAppended(entryId);
        if (result == ChunkResult::BufferFull) {
            LOG_TRACE("Chain {} yielded ({})", chain->index(), entryId);
        }
        break;
    case ChunkResult::Finished:
        buffers_.notifySamplesAppended(entryId);
        buffers_.notifyDecodeComplete(entryId);
        break;
    case ChunkResult::Failed: {
        BufferEvent event;
        event.kind = BufferEventKind::DecodeFailed;
        event.entryId = entryId;
        event.error = chain->lastErrorCode();
        event.message = chain->lastError();
        bus_.publish(event);
        break;
    }
    case ChunkResult::Cancelled:
        break;
    }
    return true;
}

void DecodeScheduler::wake() {
    wakeRequested_.store(true, std::memory_order_release);
    cv_.notify_one();
}

void DecodeScheduler::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread(&DecodeScheduler::run, this);
    LOG_INFO("Decode scheduler started (work period {} ms)", config_.workPeriodMs);
}

void DecodeScheduler::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    wake();
    if (worker_.joinable()) {
        worker_.join();
    }
    LOG_INFO("Decode scheduler stopped");
}

void DecodeScheduler::run() {
    while (running_.load(std::memory_order_acquire)) {
        wakeRequested_.store(false, std::memory_order_release);
        if (runOnce()) {
            continue;
        }
        std::unique_lock<std::mutex> lock(waitMutex_);
        cv_.wait_for(lock, kIdleWait, [this] {
            return wakeRequested_.load(std::memory_order_acquire) ||
                   !running_.load(std::memory_order_acquire);
        });
    }
}

}  // namespace segue::playback
