#include "playback/decoder_chain.h"

#include "audio/channel_mapper.h"
#include "logging/logger.h"
#include "playback/passage_timing.h"

#include <algorithm>
#include <stdexcept>

namespace segue::playback {

const char* toString(ChainState state) {
    switch (state) {
    case ChainState::Unassigned:
        return "unassigned";
    case ChainState::Assigned:
        return "assigned";
    case ChainState::Decoding:
        return "decoding";
    case ChainState::Yielded:
        return "yielded";
    case ChainState::Exhausted:
        return "exhausted";
    case ChainState::Failed:
        return "failed";
    case ChainState::Released:
        return "released";
    }
    return "unknown";
}

const char* toString(ChunkResult result) {
    switch (result) {
    case ChunkResult::Processed:
        return "processed";
    case ChunkResult::BufferFull:
        return "buffer_full";
    case ChunkResult::Finished:
        return "finished";
    case ChunkResult::Failed:
        return "failed";
    case ChunkResult::Cancelled:
        return "cancelled";
    }
    return "unknown";
}

DecoderChain::DecoderChain(size_t index, const Config& config)
    : index_(index), config_(config), ring_(config.buffer) {}

void DecoderChain::assign(const QueueEntry& entry, std::unique_ptr<audio::AudioDecoder> decoder,
                          Ticks startOffset) {
    if (!decoder) {
        throw std::invalid_argument("DecoderChain::assign requires a decoder");
    }
    Assignment next;
    next.resampler = std::make_unique<audio::SampleRateConverter>(
        decoder->sampleRate(), config_.outputRate, config_.resampleQuality);
    next.entry = entry;
    next.decoder = std::move(decoder);
    next.startOffset = std::max<Ticks>(0, startOffset);
    {
        std::lock_guard<std::mutex> info(infoMutex_);
        entryId_ = entry.queueEntryId;
    }

    std::unique_lock<std::mutex> work(workMutex_, std::try_to_lock);
    if (!work.owns_lock()) {
        std::lock_guard<std::mutex> pending(pendingMutex_);
        pending_ = std::move(next);
        LOG_DEBUG("Chain {} busy, assignment of {} handed to the worker", index_,
                  entry.queueEntryId);
        return;
    }
    {
        std::lock_guard<std::mutex> pending(pendingMutex_);
        pending_.reset();
    }
    applyAssignment(std::move(next));
}

bool DecoderChain::hasPendingAssignment() const {
    std::lock_guard<std::mutex> pending(pendingMutex_);
    return pending_.has_value();
}

void DecoderChain::applyPendingAssignment() {
    std::optional<Assignment> next;
    {
        std::lock_guard<std::mutex> pending(pendingMutex_);
        next.swap(pending_);
    }
    if (next) {
        applyAssignment(std::move(*next));
    }
}

void DecoderChain::applyAssignment(Assignment next) {
    entry_ = std::move(next.entry);
    decoder_ = std::move(next.decoder);
    resampler_ = std::move(next.resampler);
    const QueueEntry& entry = entry_;
    const Ticks startOffset = next.startOffset;
    const int sourceRate = decoder_->sampleRate();
    const Ticks startTick = entry.timing.start + startOffset;
    sourcePos_ = timing::ticksToSamples(startTick, sourceRate);
    needsSeek_ = sourcePos_ > 0;
    endReached_ = false;
    staged_.clear();
    stagedOffset_ = 0;

    std::optional<Ticks> discovered;
    endFrame_.reset();
    knownEnd_.reset();
    if (entry.timing.end) {
        endFrame_ = timing::ticksToSamples(*entry.timing.end, sourceRate);
        knownEnd_ = entry.timing.end;
    } else if (auto total = decoder_->totalFrames()) {
        endFrame_ = *total;
        knownEnd_ = timing::samplesToTicks(*total, sourceRate);
        discovered = knownEnd_;
    } else if (entry.discoveredEnd) {
        knownEnd_ = entry.discoveredEnd;
    }

    const size_t chunkFrames =
        std::max<size_t>(1, static_cast<size_t>(static_cast<long long>(sourceRate) *
                                                config_.chunkMs / 1000));
    readBuffer_.assign(chunkFrames * static_cast<size_t>(decoder_->channels()), 0.0f);
    stereoBuffer_.assign(chunkFrames * 2, 0.0f);

    ring_.reset();
    framesProduced_.store(0, std::memory_order_relaxed);
    startOffset_.store(startOffset, std::memory_order_release);
    {
        std::lock_guard<std::mutex> info(infoMutex_);
        entryId_ = entry.queueEntryId;
        lastError_.clear();
        lastErrorCode_ = ErrorCode::OK;
        pendingDiscoveredEnd_ = discovered;
    }
    cancelled_.store(false, std::memory_order_release);
    state_.store(ChainState::Assigned, std::memory_order_release);

    LOG_DEBUG("Chain {} assigned to {} ({} Hz -> {} Hz, {}, offset {} ms)", index_,
              entry.queueEntryId, sourceRate, config_.outputRate,
              audio::resampleQualityToString(resampler_->quality()),
              timing::ticksToMs(startOffset));
}

void DecoderChain::release() {
    cancelled_.store(true, std::memory_order_release);
    state_.store(ChainState::Released, std::memory_order_release);
    std::optional<Assignment> dropped;
    {
        std::lock_guard<std::mutex> pending(pendingMutex_);
        dropped.swap(pending_);
    }
    std::lock_guard<std::mutex> info(infoMutex_);
    entryId_.clear();
    pendingDiscoveredEnd_.reset();
}

std::string DecoderChain::entryId() const {
    std::lock_guard<std::mutex> info(infoMutex_);
    return entryId_;
}

std::string DecoderChain::lastError() const {
    std::lock_guard<std::mutex> info(infoMutex_);
    return lastError_;
}

ErrorCode DecoderChain::lastErrorCode() const {
    std::lock_guard<std::mutex> info(infoMutex_);
    return lastErrorCode_;
}

std::optional<Ticks> DecoderChain::takeDiscoveredEnd() {
    std::lock_guard<std::mutex> info(infoMutex_);
    auto value = pendingDiscoveredEnd_;
    pendingDiscoveredEnd_.reset();
    return value;
}

void DecoderChain::setState(ChainState next) {
    // A concurrent release() wins over worker-side transitions.
    ChainState current = state_.load(std::memory_order_acquire);
    while (current != ChainState::Released &&
           !state_.compare_exchange_weak(current, next, std::memory_order_acq_rel)) {
    }
}

std::optional<DecoderChain::FrameAudit> DecoderChain::tryAudit() {
    std::unique_lock<std::mutex> work(workMutex_, std::try_to_lock);
    if (!work.owns_lock() || hasPendingAssignment() ||
        cancelled_.load(std::memory_order_acquire)) {
        return std::nullopt;
    }
    switch (state_.load(std::memory_order_acquire)) {
    case ChainState::Unassigned:
    case ChainState::Failed:
    case ChainState::Released:
        return std::nullopt;
    default:
        break;
    }
    FrameAudit audit;
    audit.produced = framesProduced_.load(std::memory_order_relaxed);
    audit.staged = staged_.size() / 2 - stagedOffset_;
    // Consumer side first: it only ever makes written - read - buffered grow.
    audit.read = ring_.totalRead();
    audit.buffered = ring_.availableFrames();
    audit.written = ring_.totalWritten();
    return audit;
}

ChunkResult DecoderChain::fail(ErrorCode code, const std::string& message) {
    staged_.clear();
    stagedOffset_ = 0;
    {
        std::lock_guard<std::mutex> info(infoMutex_);
        lastError_ = message;
        lastErrorCode_ = code;
    }
    setState(ChainState::Failed);
    LOG_ERROR("Chain {} decode failed for {}: {}", index_, entry_.queueEntryId, message);
    return ChunkResult::Failed;
}

ChunkResult DecoderChain::finish() {
    ring_.markDecodeComplete();
    setState(ChainState::Exhausted);
    LOG_DEBUG("Chain {} finished {} ({} frames)", index_, entry_.queueEntryId,
              framesProduced_.load(std::memory_order_relaxed));
    return ChunkResult::Finished;
}

ChunkResult DecoderChain::commitStaged() {
    const size_t stagedFrames = staged_.size() / 2;
    if (stagedOffset_ < stagedFrames) {
        stagedOffset_ +=
            ring_.writeFrames(staged_.data() + stagedOffset_ * 2, stagedFrames - stagedOffset_);
    }
    if (stagedOffset_ < stagedFrames) {
        setState(ChainState::Yielded);
        return ChunkResult::BufferFull;
    }
    staged_.clear();
    stagedOffset_ = 0;
    if (endReached_) {
        return finish();
    }
    if (ring_.shouldPauseProducer()) {
        setState(ChainState::Yielded);
        return ChunkResult::BufferFull;
    }
    setState(ChainState::Decoding);
    return ChunkResult::Processed;
}

void DecoderChain::applyEnvelope(size_t firstFrame, size_t frames) {
    const Ticks base = entry_.timing.start + startOffset_.load(std::memory_order_relaxed);
    const std::uint64_t produced = framesProduced_.load(std::memory_order_relaxed);
    for (size_t i = 0; i < frames; ++i) {
        const Ticks position =
            base + timing::samplesToTicks(static_cast<std::int64_t>(produced + i),
                                          config_.outputRate);
        const float gain = envelopeGain(entry_.timing, knownEnd_, position);
        if (gain != 1.0f) {
            staged_[(firstFrame + i) * 2] *= gain;
            staged_[(firstFrame + i) * 2 + 1] *= gain;
        }
    }
}

ChunkResult DecoderChain::processChunk() {
    std::lock_guard<std::mutex> work(workMutex_);
    applyPendingAssignment();

    const ChainState current = state_.load(std::memory_order_acquire);
    if (cancelled_.load(std::memory_order_acquire) || current == ChainState::Released ||
        current == ChainState::Unassigned) {
        return ChunkResult::Cancelled;
    }
    if (current == ChainState::Exhausted) {
        return ChunkResult::Finished;
    }
    if (current == ChainState::Failed) {
        return ChunkResult::Failed;
    }
    setState(ChainState::Decoding);

    // Leftover from a chunk that did not fit last time.
    if (!staged_.empty()) {
        return commitStaged();
    }
    if (ring_.shouldPauseProducer()) {
        setState(ChainState::Yielded);
        return ChunkResult::BufferFull;
    }

    const int channels = decoder_->channels();
    size_t request = readBuffer_.size() / static_cast<size_t>(channels);
    if (endFrame_) {
        const std::int64_t remaining = std::max<std::int64_t>(0, *endFrame_ - sourcePos_);
        request = std::min<size_t>(request, static_cast<size_t>(remaining));
    }

    size_t got = 0;
    try {
        if (needsSeek_) {
            decoder_->seek(sourcePos_);
            needsSeek_ = false;
        }
        if (request > 0) {
            got = decoder_->read(readBuffer_.data(), request);
        }
    } catch (const audio::DecodeError& e) {
        return fail(e.code(), e.what());
    }

    if (cancelled_.load(std::memory_order_acquire)) {
        return ChunkResult::Cancelled;
    }

    sourcePos_ += static_cast<std::int64_t>(got);
    const bool endOfStream = got < request || request == 0 ||
                             (endFrame_ && sourcePos_ >= *endFrame_);

    audio::mapToStereo(readBuffer_.data(), channels, stereoBuffer_.data(), got);
    try {
        resampler_->process(stereoBuffer_.data(), got, staged_);
        if (endOfStream) {
            resampler_->flush(staged_);
        }
    } catch (const audio::DecodeError& e) {
        return fail(e.code(), e.what());
    }
    if (endOfStream) {
        const bool shortFile = !endFrame_ || sourcePos_ < *endFrame_;
        if (shortFile) {
            const Ticks actualEnd = timing::samplesToTicks(sourcePos_, decoder_->sampleRate());
            if (!knownEnd_ || *knownEnd_ != actualEnd) {
                knownEnd_ = actualEnd;
                std::lock_guard<std::mutex> info(infoMutex_);
                pendingDiscoveredEnd_ = actualEnd;
            }
        }
        endReached_ = true;
    }

    const size_t stagedFrames = staged_.size() / 2;
    applyEnvelope(0, stagedFrames);
    framesProduced_.fetch_add(stagedFrames, std::memory_order_relaxed);

    if (cancelled_.load(std::memory_order_acquire)) {
        staged_.clear();
        return ChunkResult::Cancelled;
    }
    return commitStaged();
}

}  // namespace segue::playback
