#include "playback/mixer.h"

#include "logging/logger.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace segue::playback {

namespace {

constexpr size_t kScratchFrames = 8192;

bool laterMarker(const Marker& a, const Marker& b) {
    return a.tick > b.tick;
}

}  // namespace

const char* toString(MixerMode mode) {
    switch (mode) {
    case MixerMode::Idle:
        return "idle";
    case MixerMode::SinglePassage:
        return "single";
    case MixerMode::Crossfading:
        return "crossfading";
    }
    return "unknown";
}

Mixer::Mixer(const Config& config)
    : config_(config),
      ticksPerFrame_(timing::ticksPerSample(config.outputRate)),
      positionInterval_(timing::msToTicks(std::max(1, config.positionIntervalMs))),
      scratch_(kScratchFrames * 2, 0.0f),
      volume_(std::clamp(config.volume, 0.0f, 1.0f)) {
    currentId_.reserve(64);
    incomingId_.reserve(64);
    armedId_.reserve(64);
    audio::PauseRamp::Params pause = config.pause;
    pause.sampleRate = config.outputRate;
    ramp_.setParams(pause);
}

void Mixer::resetSlot(Slot& slot, const std::string& entryId, io::PlayoutBuffer* ring,
                      std::vector<Marker> markers, Ticks initialTick) {
    slot.active = true;
    slot.entryId = entryId;
    slot.ring = ring;
    slot.markers = std::move(markers);
    std::make_heap(slot.markers.begin(), slot.markers.end(), laterMarker);
    slot.position = initialTick;
    slot.nextPositionUpdate = initialTick + positionInterval_;
    slot.endReported = false;

    // Markers already behind the start position are retired without firing.
    while (!slot.markers.empty() && slot.markers.front().tick < initialTick) {
        std::pop_heap(slot.markers.begin(), slot.markers.end(), laterMarker);
        slot.markers.pop_back();
    }
}

Mixer::Slot* Mixer::findSlot(const std::string& entryId) {
    if (current_.active && current_.entryId == entryId) {
        return &current_;
    }
    if (incoming_.active && incoming_.entryId == entryId) {
        return &incoming_;
    }
    return nullptr;
}

void Mixer::publishIds() {
    std::lock_guard<std::mutex> ids(idMutex_);
    currentId_.assign(current_.active ? current_.entryId : std::string());
    incomingId_.assign(incoming_.active ? incoming_.entryId : std::string());
    armedId_.assign(armed_.active ? armed_.entryId : std::string());
}

void Mixer::startPassage(const std::string& entryId, io::PlayoutBuffer* ring,
                         std::vector<Marker> markers, Ticks initialTick) {
    if (!ring) {
        throw std::invalid_argument("Mixer::startPassage requires a ring");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        resetSlot(current_, entryId, ring, std::move(markers), initialTick);
        incoming_ = Slot{};
        armed_ = Slot{};
        position_.store(initialTick, std::memory_order_relaxed);
        mode_.store(MixerMode::SinglePassage, std::memory_order_release);
        publishIds();
    }
    LOG_INFO("Mixer: playing {} from {} ms", entryId, timing::ticksToMs(initialTick));
}

bool Mixer::startCrossfade(const std::string& entryId, io::PlayoutBuffer* ring,
                           std::vector<Marker> markers) {
    if (!ring) {
        throw std::invalid_argument("Mixer::startCrossfade requires a ring");
    }
    std::string outgoing;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (mode_.load(std::memory_order_relaxed) != MixerMode::SinglePassage ||
            current_.entryId == entryId) {
            return false;
        }
        resetSlot(incoming_, entryId, ring, std::move(markers), 0);
        armed_ = Slot{};
        mode_.store(MixerMode::Crossfading, std::memory_order_release);
        publishIds();
        outgoing = current_.entryId;
    }
    LOG_INFO("Mixer: crossfade {} -> {}", outgoing, entryId);
    return true;
}

void Mixer::armCrossfade(const std::string& entryId, io::PlayoutBuffer* ring,
                         std::vector<Marker> markers, size_t minFrames) {
    if (!ring) {
        throw std::invalid_argument("Mixer::armCrossfade requires a ring");
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (findSlot(entryId)) {
            return;
        }
        resetSlot(armed_, entryId, ring, std::move(markers), 0);
        armedMinFrames_ = minFrames;
        publishIds();
    }
    LOG_DEBUG("Mixer: {} armed for crossfade ({} frames required)", entryId, minFrames);
}

bool Mixer::disarmCrossfade(const std::string& entryId) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!armed_.active || armed_.entryId != entryId) {
        return false;
    }
    armed_ = Slot{};
    publishIds();
    return true;
}

bool Mixer::finishPassage(const std::string& entryId) {
    MixerMode now = MixerMode::Idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const MixerMode mode = mode_.load(std::memory_order_relaxed);
        if (mode == MixerMode::Crossfading) {
            if (current_.entryId == entryId) {
                current_ = std::move(incoming_);
                incoming_ = Slot{};
                position_.store(current_.position, std::memory_order_relaxed);
            } else if (incoming_.entryId == entryId) {
                incoming_ = Slot{};
            } else {
                return false;
            }
            mode_.store(MixerMode::SinglePassage, std::memory_order_release);
        } else if (mode == MixerMode::SinglePassage && current_.entryId == entryId) {
            current_ = Slot{};
            armed_ = Slot{};
            position_.store(0, std::memory_order_relaxed);
            mode_.store(MixerMode::Idle, std::memory_order_release);
        } else {
            return false;
        }
        publishIds();
        now = mode_.load(std::memory_order_relaxed);
    }
    LOG_DEBUG("Mixer: finished {} (now {})", entryId, toString(now));
    return true;
}

void Mixer::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    current_ = Slot{};
    incoming_ = Slot{};
    armed_ = Slot{};
    position_.store(0, std::memory_order_relaxed);
    mode_.store(MixerMode::Idle, std::memory_order_release);
    publishIds();
}

void Mixer::pushMarker(Slot& slot, const Marker& marker) {
    slot.markers.push_back(marker);
    std::push_heap(slot.markers.begin(), slot.markers.end(), laterMarker);
}

bool Mixer::addMarker(const std::string& entryId, const Marker& marker) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = findSlot(entryId);
    if (!slot) {
        return false;
    }
    pushMarker(*slot, marker);
    return true;
}

bool Mixer::setCrossfadeMarker(const std::string& entryId, std::optional<Ticks> tick) {
    std::lock_guard<std::mutex> lock(mutex_);
    Slot* slot = findSlot(entryId);
    if (!slot) {
        return false;
    }
    auto& markers = slot->markers;
    markers.erase(std::remove_if(markers.begin(), markers.end(),
                                 [](const Marker& m) { return m.kind == MarkerKind::StartCrossfade; }),
                  markers.end());
    std::make_heap(markers.begin(), markers.end(), laterMarker);
    if (tick) {
        pushMarker(*slot, Marker{*tick, MarkerKind::StartCrossfade});
    }
    return true;
}

void Mixer::pause() {
    ramp_.startPause();
}

void Mixer::resume() {
    ramp_.startResume();
}

bool Mixer::isPaused() const {
    return ramp_.isPaused();
}

bool Mixer::isFading() const {
    return ramp_.isTransitioning();
}

void Mixer::setVolume(float volume) {
    volume_.store(std::clamp(volume, 0.0f, 1.0f), std::memory_order_relaxed);
}

void Mixer::setPauseParams(const audio::PauseRamp::Params& params) {
    audio::PauseRamp::Params copy = params;
    copy.sampleRate = config_.outputRate;
    ramp_.setParams(copy);
}

std::optional<std::string> Mixer::currentEntry() const {
    std::lock_guard<std::mutex> ids(idMutex_);
    if (currentId_.empty()) {
        return std::nullopt;
    }
    return currentId_;
}

std::optional<std::string> Mixer::incomingEntry() const {
    std::lock_guard<std::mutex> ids(idMutex_);
    if (incomingId_.empty()) {
        return std::nullopt;
    }
    return incomingId_;
}

std::optional<std::string> Mixer::armedEntry() const {
    std::lock_guard<std::mutex> ids(idMutex_);
    if (armedId_.empty()) {
        return std::nullopt;
    }
    return armedId_;
}

bool Mixer::isPlaying(const std::string& entryId) const {
    std::lock_guard<std::mutex> ids(idMutex_);
    return !entryId.empty() && (currentId_ == entryId || incomingId_ == entryId);
}

// Frames until the next marker of @p slot is crossed, capped at @p limit.
// A marker already behind the position fires at the end of the segment.
size_t Mixer::framesToNextMarker(const Slot& slot, size_t limit) const {
    if (slot.markers.empty()) {
        return limit;
    }
    const Ticks ahead = slot.markers.front().tick - slot.position;
    if (ahead <= 0) {
        return limit;
    }
    const Ticks frames = (ahead + ticksPerFrame_ - 1) / ticksPerFrame_;
    return static_cast<size_t>(std::min<Ticks>(frames, static_cast<Ticks>(limit)));
}

size_t Mixer::readSlot(Slot& slot, float* dst, size_t frames) {
    const size_t got = slot.ring->readFrames(dst, frames);
    if (got < frames) {
        std::memset(dst + got * 2, 0, (frames - got) * 2 * sizeof(float));
    }
    slot.position += static_cast<Ticks>(got) * ticksPerFrame_;
    return got;
}

void Mixer::mixSegment(float* out, size_t frames, bool& starved) {
    if (readSlot(current_, out, frames) < frames && !current_.ring->isDecodeComplete()) {
        starved = true;
    }
    if (mode_.load(std::memory_order_relaxed) != MixerMode::Crossfading) {
        return;
    }
    size_t done = 0;
    while (done < frames) {
        const size_t chunk = std::min(frames - done, kScratchFrames);
        if (readSlot(incoming_, scratch_.data(), chunk) < chunk &&
            !incoming_.ring->isDecodeComplete()) {
            starved = true;
        }
        float* dst = out + done * 2;
        for (size_t i = 0; i < chunk * 2; ++i) {
            dst[i] += scratch_[i];
        }
        done += chunk;
    }
}

bool Mixer::startArmedCrossfade() {
    if (!armed_.active || mode_.load(std::memory_order_relaxed) != MixerMode::SinglePassage ||
        armed_.entryId == current_.entryId) {
        return false;
    }
    const size_t available = armed_.ring->availableFrames();
    const bool ready = available >= armedMinFrames_ ||
                       (armed_.ring->isDecodeComplete() && available > 0);
    if (!ready) {
        return false;
    }
    incoming_ = std::move(armed_);
    armed_ = Slot{};
    mode_.store(MixerMode::Crossfading, std::memory_order_release);
    publishIds();
    return true;
}

void Mixer::collectMarkers(Slot& slot, MarkerQueue& events) {
    while (!slot.markers.empty() && slot.markers.front().tick <= slot.position) {
        std::pop_heap(slot.markers.begin(), slot.markers.end(), laterMarker);
        const Marker marker = slot.markers.back();
        slot.markers.pop_back();
        events.push(slot.entryId, marker.kind, marker.tick, timing::ticksToMs(marker.tick));
        if (marker.kind == MarkerKind::StartCrossfade && &slot == &current_) {
            startArmedCrossfade();
        }
    }

    if (slot.position >= slot.nextPositionUpdate) {
        events.push(slot.entryId, MarkerKind::PositionUpdate, slot.position,
                    timing::ticksToMs(slot.position));
        while (slot.nextPositionUpdate <= slot.position) {
            slot.nextPositionUpdate += positionInterval_;
        }
    }

    if (!slot.endReported && slot.ring->isExhausted()) {
        slot.endReported = true;
        const bool crossfadePending =
            std::any_of(slot.markers.begin(), slot.markers.end(),
                        [](const Marker& m) { return m.kind == MarkerKind::StartCrossfade; });
        const MarkerKind kind =
            crossfadePending ? MarkerKind::EndOfFileBeforeLeadOut : MarkerKind::EndOfFile;
        events.push(slot.entryId, kind, slot.position, timing::ticksToMs(slot.position));
    }
}

void Mixer::mix(float* out, size_t frames, MarkerQueue& events) {
    if (out == nullptr || frames == 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);

    if (ramp_.isPaused()) {
        // Source frozen: no reads, no position advance, no markers.
        ramp_.fillDecay(out, frames);
        return;
    }
    if (mode_.load(std::memory_order_relaxed) == MixerMode::Idle) {
        std::memset(out, 0, frames * 2 * sizeof(float));
        ramp_.applyResumeGain(out, frames);
        return;
    }

    bool starved = false;
    size_t done = 0;
    while (done < frames) {
        size_t segment = framesToNextMarker(current_, frames - done);
        if (mode_.load(std::memory_order_relaxed) == MixerMode::Crossfading) {
            segment = framesToNextMarker(incoming_, segment);
        }
        mixSegment(out + done * 2, segment, starved);
        done += segment;

        collectMarkers(current_, events);
        if (mode_.load(std::memory_order_relaxed) == MixerMode::Crossfading) {
            collectMarkers(incoming_, events);
        }
    }
    if (starved) {
        underruns_.fetch_add(1, std::memory_order_relaxed);
    }

    const float gain = volume_.load(std::memory_order_relaxed);
    const float ceiling = config_.clipCeiling;
    for (size_t i = 0; i < frames * 2; ++i) {
        out[i] = std::clamp(out[i] * gain, -ceiling, ceiling);
    }
    ramp_.applyResumeGain(out, frames);

    position_.store(current_.position, std::memory_order_relaxed);
}

}  // namespace segue::playback
