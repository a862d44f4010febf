#include "playback/orchestrator.h"

#include "logging/logger.h"
#include "playback/passage_timing.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>

namespace segue::playback {

namespace {

constexpr const char* kDecodeViolation = "decode:";
constexpr const char* kMixerViolation = "mixer:";

// Random 128-bit id in the 8-4-4-4-12 hex layout.
std::string makeQueueEntryId() {
    static std::mutex mutex;
    static std::mt19937_64 rng{std::random_device{}()};
    std::uint64_t hi = 0;
    std::uint64_t lo = 0;
    {
        std::lock_guard<std::mutex> lock(mutex);
        hi = rng();
        lo = rng();
    }
    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08llx-%04llx-%04llx-%04llx-%012llx",
                  static_cast<unsigned long long>(hi >> 32),
                  static_cast<unsigned long long>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned long long>(hi & 0xFFFF),
                  static_cast<unsigned long long>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

bool startsWith(const std::string& text, const char* prefix) {
    return text.rfind(prefix, 0) == 0;
}

}  // namespace

Orchestrator::Orchestrator(const Config& config, QueueManager& queue, QueueStore& store,
                           const PassageCatalog* catalog, ChainPool& pool,
                           DecodeScheduler& scheduler, BufferManager& buffers, Mixer& mixer,
                           EventBus& bus, audio::DecoderFactory decoderFactory)
    : config_(config),
      queue_(queue),
      store_(store),
      catalog_(catalog),
      pool_(pool),
      scheduler_(scheduler),
      buffers_(buffers),
      mixer_(mixer),
      bus_(bus),
      decoderFactory_(std::move(decoderFactory)),
      completed_(std::chrono::milliseconds(config.completionDedupWindowMs)) {
    if (!decoderFactory_) {
        throw std::invalid_argument("Orchestrator requires a decoder factory");
    }
    bus_.subscribe(EventBus::MarkerHandler([this](const MarkerEvent& event) { onMarker(event); }));
    bus_.subscribe(
        EventBus::BufferHandler([this](const BufferEvent& event) { onBufferEvent(event); }));
}

Orchestrator::~Orchestrator() {
    stopWatchdog();
}

// ---------------------------------------------------------------------------
// Commands
// ---------------------------------------------------------------------------

EnqueueResult Orchestrator::enqueue(const EnqueueRequest& request) {
    EnqueueResult out;
    QueueEntry entry;

    if (request.passageId) {
        if (!catalog_) {
            out.result = CommandResult::failure(ErrorCode::VALIDATION_PASSAGE_NOT_FOUND,
                                                "No passage catalog configured");
            return out;
        }
        auto record = catalog_->find(*request.passageId);
        if (!record) {
            out.result = CommandResult::failure(ErrorCode::VALIDATION_PASSAGE_NOT_FOUND,
                                                "Unknown passage: " + *request.passageId);
            return out;
        }
        entry.passageId = record->passageId;
        entry.filePath = record->filePath;
        entry.timing = record->timing;
    } else if (request.filePath && !request.filePath->empty()) {
        entry.filePath = *request.filePath;
    } else {
        out.result = CommandResult::failure(ErrorCode::IPC_INVALID_PARAMS,
                                            "enqueue needs a passage id or a file path");
        return out;
    }
    if (request.timing) {
        entry.timing = *request.timing;
    }
    if (auto problem = validateTiming(entry.timing)) {
        out.result = CommandResult::failure(ErrorCode::VALIDATION_INVALID_TIMING, *problem);
        return out;
    }

    std::lock_guard<std::mutex> lock(opMutex_);
    entry.queueEntryId = makeQueueEntryId();
    entry.playOrder = queue_.nextPlayOrder();

    if (store_.insert(entry) == StoreResult::Failed) {
        LOG_ERROR("Failed to persist queue entry {}", entry.queueEntryId);
    }
    const QueuePosition position = queue_.enqueue(entry);
    LOG_INFO("Enqueued {} ({}) as {}", entry.queueEntryId, entry.filePath, toString(position));

    publish(PlaybackEventKind::Enqueued, entry.queueEntryId, toString(position));
    publish(PlaybackEventKind::QueueChanged, entry.queueEntryId, "enqueued");

    ensureDecode(entry, priorityFor(position));
    // A new entry after the next one changes the armed passage's markers.
    refreshCrossfadeMarker();

    out.result = CommandResult::success();
    out.queueEntryId = entry.queueEntryId;
    out.position = position;
    return out;
}

CommandResult Orchestrator::removeEntry(const std::string& queueEntryId, bool* removed) {
    std::lock_guard<std::mutex> lock(opMutex_);
    const bool didRemove = removeEntryLocked(queueEntryId, "removed", false);
    if (removed) {
        *removed = didRemove;
    }
    if (!didRemove) {
        LOG_DEBUG("Remove {}: already absent", queueEntryId);
        return CommandResult::success("already absent");
    }
    return CommandResult::success();
}

CommandResult Orchestrator::skip() {
    std::lock_guard<std::mutex> lock(opMutex_);
    auto current = queue_.current();
    if (!current) {
        return CommandResult::failure(ErrorCode::QUEUE_EMPTY, "Queue is empty");
    }
    LOG_INFO("Skipping {}", current->queueEntryId);
    removeEntryLocked(current->queueEntryId, "skipped", false);
    return CommandResult::success();
}

CommandResult Orchestrator::pause() {
    std::lock_guard<std::mutex> lock(opMutex_);
    paused_ = true;
    mixer_.pause();
    publish(PlaybackEventKind::PlaybackStateChanged, {}, "paused");
    return CommandResult::success();
}

CommandResult Orchestrator::play() {
    std::lock_guard<std::mutex> lock(opMutex_);
    paused_ = false;
    mixer_.resume();
    startMixerForCurrentLocked();
    publish(PlaybackEventKind::PlaybackStateChanged, {}, "playing");
    return CommandResult::success();
}

CommandResult Orchestrator::seek(std::int64_t positionMs) {
    std::lock_guard<std::mutex> lock(opMutex_);
    auto current = queue_.current();
    if (!current) {
        return CommandResult::failure(ErrorCode::PLAYBACK_NOT_ACTIVE, "Nothing is playing");
    }
    const auto end = effectiveEnd(*current);
    const bool representable = positionMs >= 0 && timing::msFitsInTicks(positionMs);
    const Ticks offset = representable ? timing::msToTicks(positionMs) : 0;
    if (!representable || (end && offset >= *end - current->timing.start)) {
        return CommandResult::failure(ErrorCode::PLAYBACK_SEEK_OUT_OF_RANGE,
                                      "Seek position " + std::to_string(positionMs) +
                                          " ms is outside the passage");
    }

    // A crossfade in progress has already consumed part of the incoming ring.
    const auto incoming = mixer_.incomingEntry();
    mixer_.clear();
    if (incoming) {
        releaseChainFor(*incoming);
    }
    releaseChainFor(current->queueEntryId);

    if (!ensureDecode(*current, DecodePriority::Immediate, offset)) {
        return CommandResult::failure(ErrorCode::AUDIO_DECODE_FAILED,
                                      "Could not restart decode for " + current->queueEntryId);
    }
    if (incoming) {
        if (auto entry = queue_.find(*incoming)) {
            ensureDecode(*entry, priorityFor(queue_.positionOf(*incoming).kind));
        }
    }
    LOG_INFO("Seek {} to {} ms", current->queueEntryId, positionMs);

    PlaybackEvent event;
    event.kind = PlaybackEventKind::PositionUpdate;
    event.entryId = current->queueEntryId;
    event.positionMs = positionMs;
    event.paused = paused_;
    event.volume = mixer_.volume();
    event.detail = "seek";
    bus_.publish(event);
    return CommandResult::success();
}

CommandResult Orchestrator::setVolume(float volume) {
    if (std::isnan(volume)) {
        return CommandResult::failure(ErrorCode::IPC_INVALID_PARAMS, "Volume is not a number");
    }
    std::lock_guard<std::mutex> lock(opMutex_);
    mixer_.setVolume(volume);
    publish(PlaybackEventKind::VolumeChanged);
    return CommandResult::success();
}

CommandResult Orchestrator::clearQueue() {
    std::lock_guard<std::mutex> lock(opMutex_);
    mixer_.clear();
    for (const auto& entry : queue_.snapshot()) {
        releaseChainFor(entry.queueEntryId);
    }
    if (store_.clear() == StoreResult::Failed) {
        LOG_ERROR("Failed to clear persisted queue");
    }
    queue_.clear();
    LOG_INFO("Queue cleared");
    publish(PlaybackEventKind::QueueChanged, {}, "cleared");
    return CommandResult::success();
}

size_t Orchestrator::restoreQueue() {
    std::lock_guard<std::mutex> lock(opMutex_);
    const size_t kept = queue_.restore(store_.loadAll());
    LOG_INFO("Restored {} queue entries", kept);
    assignPendingEntries();
    if (kept > 0) {
        publish(PlaybackEventKind::QueueChanged, {}, "restored");
    }
    return kept;
}

void Orchestrator::reportOutputFailure(ErrorCode code, const std::string& message) {
    std::lock_guard<std::mutex> lock(opMutex_);
    paused_ = true;
    mixer_.pause();
    LOG_ERROR("Playback halted: {} ({})", message, errorCodeToString(code));
    PlaybackEvent event;
    event.kind = PlaybackEventKind::Error;
    event.error = code;
    event.detail = message;
    event.paused = true;
    event.volume = mixer_.volume();
    bus_.publish(event);
    publish(PlaybackEventKind::PlaybackStateChanged, {}, "halted");
}

// ---------------------------------------------------------------------------
// Event handling
// ---------------------------------------------------------------------------

void Orchestrator::onMarker(const MarkerEvent& event) {
    switch (event.kind) {
    case MarkerKind::PositionUpdate: {
        if (mixer_.currentEntry() == event.entryId) {
            PlaybackEvent update;
            update.kind = PlaybackEventKind::PositionUpdate;
            update.entryId = event.entryId;
            update.positionMs = event.positionMs;
            update.volume = mixer_.volume();
            update.paused = mixer_.isPaused();
            bus_.publish(update);
        }
        buffers_.checkFallingThreshold(event.entryId);
        return;
    }
    case MarkerKind::StartCrossfade: {
        std::lock_guard<std::mutex> lock(opMutex_);
        handleStartCrossfade(event.entryId);
        return;
    }
    case MarkerKind::PassageComplete:
    case MarkerKind::EndOfFile:
    case MarkerKind::EndOfFileBeforeLeadOut: {
        std::lock_guard<std::mutex> lock(opMutex_);
        handleCompletion(event.entryId, toString(event.kind));
        return;
    }
    }
}

void Orchestrator::onBufferEvent(const BufferEvent& event) {
    std::lock_guard<std::mutex> lock(opMutex_);
    switch (event.kind) {
    case BufferEventKind::ReadyForStart: {
        auto current = queue_.current();
        if (current && current->queueEntryId == event.entryId) {
            startMixerForCurrentLocked();
        }
        break;
    }
    case BufferEventKind::BufferLow:
        scheduler_.setPriority(event.entryId, DecodePriority::Immediate);
        break;
    case BufferEventKind::DecodeFinished:
        LOG_DEBUG("Decode finished for {}", event.entryId);
        break;
    case BufferEventKind::DecodeFailed: {
        LOG_ERROR("Decode failed for {}: {} ({})", event.entryId, event.message,
                  errorCodeToString(event.error));
        if (event.error == ErrorCode::RESOURCE_DECODER_HANDLES) {
            pool_.lowerLimit();
        }
        PlaybackEvent error;
        error.kind = PlaybackEventKind::Error;
        error.entryId = event.entryId;
        error.error = event.error;
        error.detail = event.message;
        bus_.publish(error);
        handleCompletion(event.entryId, "decode_failed");
        break;
    }
    case BufferEventKind::EndpointDiscovered: {
        if (!event.endpoint || !queue_.setDiscoveredEndpoint(event.entryId, *event.endpoint)) {
            break;
        }
        auto entry = queue_.find(event.entryId);
        if (!entry) {
            break;
        }
        LOG_DEBUG("Endpoint of {} discovered at {} ms", event.entryId,
                  timing::ticksToMs(*event.endpoint));
        if (store_.update(*entry) == StoreResult::Failed) {
            LOG_ERROR("Failed to persist discovered endpoint for {}", event.entryId);
        }
        if (!entry->timing.end && mixer_.isPlaying(event.entryId)) {
            mixer_.addMarker(event.entryId, Marker{*event.endpoint - entry->timing.start,
                                                   MarkerKind::PassageComplete});
        }
        refreshCrossfadeMarker();
        break;
    }
    }
}

bool Orchestrator::startMixerForCurrent() {
    std::lock_guard<std::mutex> lock(opMutex_);
    return startMixerForCurrentLocked();
}

bool Orchestrator::startMixerForCurrentLocked() {
    auto current = queue_.current();
    if (!current || !mixer_.isIdle()) {
        return false;
    }
    const std::string& id = current->queueEntryId;
    if (!buffers_.hasMinimumPlaybackBuffer(id)) {
        return false;
    }
    DecoderChain* chain = pool_.chainFor(id);
    if (!chain) {
        return false;
    }
    mixer_.startPassage(id, &chain->buffer(), buildMarkers(*current, queue_.next()),
                        chain->startOffset());
    buffers_.markPlaying(id);
    scheduler_.setPriority(id, DecodePriority::Immediate);
    publish(PlaybackEventKind::PassageStarted, id);
    refreshCrossfadeMarker();
    return true;
}

void Orchestrator::handleStartCrossfade(const std::string& outgoingId) {
    auto current = queue_.current();
    auto next = queue_.next();
    if (!current || current->queueEntryId != outgoingId || !next) {
        return;
    }
    if (mixer_.currentEntry() != outgoingId) {
        return;
    }
    // The mixer started the armed passage on the marker frame itself.
    if (mixer_.mode() == MixerMode::Crossfading) {
        if (mixer_.incomingEntry() == next->queueEntryId) {
            buffers_.markPlaying(next->queueEntryId);
            scheduler_.setPriority(next->queueEntryId, DecodePriority::Immediate);
            publish(PlaybackEventKind::CrossfadeStarted, next->queueEntryId, outgoingId);
        }
        return;
    }
    if (mixer_.mode() != MixerMode::SinglePassage) {
        return;
    }
    if (!buffers_.hasMinimumPlaybackBuffer(next->queueEntryId)) {
        LOG_WARN("Crossfade point reached but {} is not buffered; playing out {}",
                 next->queueEntryId, outgoingId);
        return;
    }
    DecoderChain* chain = pool_.chainFor(next->queueEntryId);
    if (!chain) {
        return;
    }
    std::optional<QueueEntry> following;
    auto queued = queue_.queued();
    if (!queued.empty()) {
        following = queued.front();
    }
    if (mixer_.startCrossfade(next->queueEntryId, &chain->buffer(),
                             buildMarkers(*next, following))) {
        buffers_.markPlaying(next->queueEntryId);
        scheduler_.setPriority(next->queueEntryId, DecodePriority::Immediate);
        publish(PlaybackEventKind::CrossfadeStarted, next->queueEntryId, outgoingId);
    }
}

void Orchestrator::handleCompletion(const std::string& entryId, const char* reason) {
    completed_.purge();
    if (!completed_.tryRecord(entryId)) {
        LOG_DEBUG("Duplicate completion for {} ({}) ignored", entryId, reason);
        return;
    }
    LOG_INFO("Passage {} complete ({})", entryId, reason);
    if (!removeEntryLocked(entryId, reason, true)) {
        LOG_DEBUG("Completion for {}: entry already removed", entryId);
    }
}

// Fixed order: chain, mixer, store, memory, events, promotions, chain reuse.
bool Orchestrator::removeEntryLocked(const std::string& entryId, const char* reason,
                                     bool completed) {
    releaseChainFor(entryId);

    if (mixer_.isPlaying(entryId)) {
        if (mixer_.mode() == MixerMode::Crossfading) {
            mixer_.finishPassage(entryId);
        } else {
            mixer_.clear();
        }
    }

    const StoreResult stored = store_.remove(entryId);
    if (stored == StoreResult::Failed) {
        LOG_ERROR("Failed to delete persisted queue entry {}", entryId);
    }

    std::vector<std::string> promoted;
    if (!queue_.remove(entryId, &promoted)) {
        return false;
    }

    if (completed) {
        publish(PlaybackEventKind::PassageComplete, entryId, reason);
    }
    publish(PlaybackEventKind::QueueChanged, entryId, reason);

    for (const auto& id : promoted) {
        auto entry = queue_.find(id);
        if (!entry) {
            continue;
        }
        const QueuePosition position = queue_.positionOf(id).kind;
        LOG_DEBUG("{} promoted to {}", id, toString(position));
        ensureDecode(*entry, priorityFor(position));
    }
    assignPendingEntries();

    if (mixer_.isIdle()) {
        startMixerForCurrentLocked();
    } else {
        refreshCrossfadeMarker();
    }
    return true;
}

// ---------------------------------------------------------------------------
// Chains and decode
// ---------------------------------------------------------------------------

bool Orchestrator::ensureDecode(const QueueEntry& entry, DecodePriority priority,
                                Ticks startOffset) {
    const std::string& id = entry.queueEntryId;
    if (scheduler_.hasTask(id)) {
        scheduler_.setPriority(id, priority);
        return true;
    }
    if (pool_.indexOf(id)) {
        return true;
    }
    auto index = acquireChain(entry, priority);
    if (!index) {
        LOG_DEBUG("No decoder chain free for {}", id);
        return false;
    }

    DecoderChain& chain = pool_.chain(*index);
    try {
        chain.assign(entry, decoderFactory_(entry.filePath), startOffset);
    } catch (const audio::DecodeError& e) {
        pool_.release(id);
        if (e.code() == ErrorCode::RESOURCE_DECODER_HANDLES) {
            LOG_WARN("Out of decoder handles opening {}: {}", entry.filePath, e.what());
            pool_.lowerLimit();
            return false;
        }
        BufferEvent failed;
        failed.kind = BufferEventKind::DecodeFailed;
        failed.entryId = id;
        failed.error = e.code();
        failed.message = e.what();
        bus_.publish(failed);
        return false;
    }

    buffers_.registerBuffer(id, &chain.buffer());
    scheduler_.submit(chain, priority);
    if (auto next = queue_.next(); next && next->queueEntryId == id) {
        refreshCrossfadeMarker();
    }
    return true;
}

std::optional<size_t> Orchestrator::acquireChain(const QueueEntry& entry,
                                                 DecodePriority priority) {
    if (auto index = pool_.acquire(entry.queueEntryId)) {
        return index;
    }
    if (priority != DecodePriority::Immediate) {
        return std::nullopt;
    }
    // Reclaim from the entry farthest from playback.
    const auto entries = queue_.snapshot();
    for (auto it = entries.rbegin(); it != entries.rend(); ++it) {
        if (it->queueEntryId == entry.queueEntryId) {
            break;
        }
        if (mixer_.isPlaying(it->queueEntryId) || !pool_.indexOf(it->queueEntryId)) {
            continue;
        }
        LOG_WARN("Reclaiming decoder chain from {} for {}", it->queueEntryId,
                 entry.queueEntryId);
        releaseChainFor(it->queueEntryId);
        return pool_.acquire(entry.queueEntryId);
    }
    return std::nullopt;
}

void Orchestrator::releaseChainFor(const std::string& entryId) {
    mixer_.disarmCrossfade(entryId);
    scheduler_.cancel(entryId);
    buffers_.remove(entryId);
    pool_.release(entryId);
}

void Orchestrator::assignPendingEntries() {
    const auto entries = queue_.snapshot();
    for (size_t i = 0; i < entries.size(); ++i) {
        const auto& entry = entries[i];
        if (pool_.indexOf(entry.queueEntryId)) {
            continue;
        }
        if (!pool_.hasFree()) {
            break;
        }
        const QueuePosition position = i == 0   ? QueuePosition::Current
                                       : i == 1 ? QueuePosition::Next
                                                : QueuePosition::Queued;
        ensureDecode(entry, priorityFor(position));
    }
}

std::vector<Marker> Orchestrator::buildMarkers(const QueueEntry& entry,
                                               const std::optional<QueueEntry>& next) const {
    std::vector<Marker> markers;
    if (auto end = effectiveEnd(entry)) {
        markers.push_back(Marker{*end - entry.timing.start, MarkerKind::PassageComplete});
    }
    if (next) {
        if (auto tick = crossfadeStartTick(entry, *next)) {
            markers.push_back(Marker{*tick, MarkerKind::StartCrossfade});
        }
    }
    return markers;
}

void Orchestrator::refreshCrossfadeMarker() {
    auto current = queue_.current();
    if (!current || mixer_.mode() != MixerMode::SinglePassage ||
        mixer_.currentEntry() != current->queueEntryId) {
        return;
    }
    std::optional<Ticks> tick;
    if (auto next = queue_.next()) {
        tick = crossfadeStartTick(*current, *next);
    }
    // Too late to overlap: let the passage play out.
    if (tick && *tick <= mixer_.positionTicks()) {
        tick.reset();
    }
    mixer_.setCrossfadeMarker(current->queueEntryId, tick);
    armNextPassage(tick.has_value());
}

// The mixer starts the armed passage on the StartCrossfade frame when its
// ring holds the start threshold; otherwise handleStartCrossfade retries.
void Orchestrator::armNextPassage(bool crossfadeScheduled) {
    auto next = queue_.next();
    DecoderChain* chain = next ? pool_.chainFor(next->queueEntryId) : nullptr;
    if (!crossfadeScheduled || !chain) {
        if (auto armed = mixer_.armedEntry()) {
            mixer_.disarmCrossfade(*armed);
        }
        return;
    }
    std::optional<QueueEntry> following;
    auto queued = queue_.queued();
    if (!queued.empty()) {
        following = queued.front();
    }
    mixer_.armCrossfade(next->queueEntryId, &chain->buffer(), buildMarkers(*next, following),
                        buffers_.thresholdFrames(chain->buffer()));
}

// ---------------------------------------------------------------------------
// Watchdog
// ---------------------------------------------------------------------------

size_t Orchestrator::watchdogCheck() {
    std::lock_guard<std::mutex> lock(opMutex_);
    completed_.purge();
    auditFrames();

    const auto entries = queue_.snapshot();
    if (entries.empty()) {
        suspects_.clear();
        return 0;
    }

    std::set<std::string> found;
    const std::string& currentId = entries.front().queueEntryId;
    buffers_.checkFallingThreshold(currentId);
    if (!buffers_.isManaged(currentId)) {
        if (!completed_.contains(currentId)) {
            found.insert(kDecodeViolation + currentId);
        }
    } else if (mixer_.isIdle() && buffers_.hasMinimumPlaybackBuffer(currentId)) {
        found.insert(kMixerViolation + currentId);
    }
    if (pool_.hasFree()) {
        for (size_t i = 1; i < entries.size(); ++i) {
            const std::string& id = entries[i].queueEntryId;
            if (!buffers_.isManaged(id) && !completed_.contains(id)) {
                found.insert(kDecodeViolation + id);
            }
        }
    }

    // Act only on violations that persisted since the previous pass.
    std::set<std::string> pending;
    size_t acted = 0;
    for (const auto& key : found) {
        if (suspects_.count(key) == 0) {
            pending.insert(key);
            continue;
        }
        if (startsWith(key, kMixerViolation)) {
            const std::string id = key.substr(std::char_traits<char>::length(kMixerViolation));
            if (startMixerForCurrentLocked()) {
                recordIntervention("mixer_start", id);
                ++acted;
            }
            continue;
        }
        const std::string id = key.substr(std::char_traits<char>::length(kDecodeViolation));
        auto entry = queue_.find(id);
        if (!entry) {
            continue;
        }
        if (ensureDecode(*entry, priorityFor(queue_.positionOf(id).kind))) {
            recordIntervention("decode", id);
            ++acted;
        } else {
            pending.insert(key);
        }
    }
    suspects_ = std::move(pending);
    return acted;
}

// Every frame a decoder produced is either staged or written to the ring,
// and every written frame is either read by the mixer or still buffered.
void Orchestrator::auditFrames() {
    const auto tolerance =
        static_cast<std::uint64_t>(std::max(0, config_.frameAuditToleranceFrames));
    std::set<std::string> live;
    for (const auto& id : pool_.assignedEntries()) {
        live.insert(id);
        DecoderChain* chain = pool_.chainFor(id);
        if (!chain) {
            continue;
        }
        const auto audit = chain->tryAudit();
        if (!audit) {
            continue;
        }
        frameAudits_.fetch_add(1, std::memory_order_relaxed);

        std::string problem;
        if (audit->produced != audit->written + audit->staged) {
            problem = "produced " + std::to_string(audit->produced) + " != written " +
                      std::to_string(audit->written) + " + staged " +
                      std::to_string(audit->staged);
        } else if (audit->read > audit->written) {
            problem = "read " + std::to_string(audit->read) + " > written " +
                      std::to_string(audit->written);
        } else {
            const std::uint64_t held = audit->written - audit->read;
            const std::uint64_t drift =
                held > audit->buffered ? held - audit->buffered : audit->buffered - held;
            if (drift > tolerance) {
                problem = "written - read " + std::to_string(held) + " vs buffered " +
                          std::to_string(audit->buffered);
            }
        }
        if (problem.empty()) {
            continue;
        }
        frameMismatches_.fetch_add(1, std::memory_order_relaxed);
        if (!mismatchReported_.insert(id).second) {
            continue;
        }
        LOG_ERROR("Frame accounting mismatch for {}: {}", id, problem);
        PlaybackEvent error;
        error.kind = PlaybackEventKind::Error;
        error.entryId = id;
        error.error = ErrorCode::INTERNAL_FRAME_MISMATCH;
        error.detail = problem;
        bus_.publish(error);
    }
    for (auto it = mismatchReported_.begin(); it != mismatchReported_.end();) {
        it = live.count(*it) ? std::next(it) : mismatchReported_.erase(it);
    }
}

void Orchestrator::recordIntervention(const std::string& what, const std::string& entryId) {
    const auto total = interventions_.fetch_add(1, std::memory_order_relaxed) + 1;
    LOG_WARN("Watchdog intervention: {} for {} (total {})", what, entryId, total);
    publish(PlaybackEventKind::WatchdogIntervention, entryId, what);
}

void Orchestrator::startWatchdog() {
    if (watchdogRunning_.exchange(true)) {
        return;
    }
    watchdogThread_ = std::thread(&Orchestrator::watchdogLoop, this);
    LOG_INFO("Watchdog started ({} ms interval)", config_.watchdogIntervalMs);
}

void Orchestrator::stopWatchdog() {
    if (!watchdogRunning_.exchange(false)) {
        return;
    }
    watchdogCv_.notify_all();
    if (watchdogThread_.joinable()) {
        watchdogThread_.join();
    }
}

void Orchestrator::watchdogLoop() {
    const auto interval = std::chrono::milliseconds(config_.watchdogIntervalMs);
    while (watchdogRunning_.load(std::memory_order_acquire)) {
        {
            std::unique_lock<std::mutex> lock(watchdogWaitMutex_);
            watchdogCv_.wait_for(lock, interval, [this] {
                return !watchdogRunning_.load(std::memory_order_acquire);
            });
        }
        if (!watchdogRunning_.load(std::memory_order_acquire)) {
            break;
        }
        watchdogCheck();
    }
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

EngineStatus Orchestrator::status() const {
    std::lock_guard<std::mutex> lock(opMutex_);
    EngineStatus status;
    status.mode = mixer_.mode();
    status.paused = paused_;
    status.volume = mixer_.volume();
    if (auto current = queue_.current()) {
        status.currentEntry = current->queueEntryId;
    }
    if (auto next = queue_.next()) {
        status.nextEntry = next->queueEntryId;
    }
    status.mixingEntry = mixer_.incomingEntry();
    status.positionMs = mixer_.positionMs();
    status.queueLength = queue_.size();
    status.buffers = buffers_.snapshot();
    status.watchdogInterventions = interventions_.load(std::memory_order_relaxed);
    status.underruns = mixer_.underrunCount();
    status.frameAudits = frameAudits_.load(std::memory_order_relaxed);
    status.frameMismatches = frameMismatches_.load(std::memory_order_relaxed);
    return status;
}

std::vector<QueueEntry> Orchestrator::queueSnapshot() const {
    return queue_.snapshot();
}

void Orchestrator::publish(PlaybackEventKind kind, const std::string& entryId,
                           const std::string& detail) {
    PlaybackEvent event;
    event.kind = kind;
    event.entryId = entryId;
    event.detail = detail;
    event.paused = paused_;
    event.volume = mixer_.volume();
    if (!entryId.empty() && mixer_.currentEntry() == entryId) {
        event.positionMs = mixer_.positionMs();
    }
    bus_.publish(event);
}

}  // namespace segue::playback
