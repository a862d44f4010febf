#pragma once

#include "audio/audio_decoder.h"
#include "audio/sample_rate_converter.h"
#include "io/playout_buffer.h"
#include "playback/types.h"

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace segue::playback {

enum class ChainState { Unassigned, Assigned, Decoding, Yielded, Exhausted, Failed, Released };

enum class ChunkResult {
    Processed,   // chunk committed, more to decode
    BufferFull,  // ring reached its headroom; wait for the resume signal
    Finished,    // passage end reached and fully committed
    Failed,      // decoder error; staged audio discarded
    Cancelled    // chain released while the chunk was in flight
};

const char* toString(ChainState state);
const char* toString(ChunkResult result);

/**
 * @brief One queue entry's decode pipeline and its output ring.
 *
 * decode -> stereo mapping -> resample to the output rate -> fade envelope ->
 * staging -> ring. A chunk reaches the ring only after every stage succeeded,
 * so a failing decoder never leaves partial audio behind.
 *
 * Chains live in a fixed pool and are recycled: assign() rebinds a chain to a
 * new entry and resets its ring. The worker thread drives processChunk().
 * Neither assign() nor release() waits for the worker: an assignment that
 * arrives while a chunk is in flight is handed to the worker, which applies
 * it before its next chunk.
 */
class DecoderChain {
   public:
    struct Config {
        int outputRate = 44100;
        int chunkMs = 1000;
        audio::ResampleQuality resampleQuality = audio::ResampleQuality::SincMedium;
        io::PlayoutBuffer::Config buffer;
    };

    DecoderChain(size_t index, const Config& config);

    DecoderChain(const DecoderChain&) = delete;
    DecoderChain& operator=(const DecoderChain&) = delete;

    size_t index() const {
        return index_;
    }

    /**
     * @brief Bind to @p entry.
     *
     * entryId() reports the new entry immediately. The ring and decode state
     * are reset right away when the worker is idle, otherwise by the worker
     * before its next chunk (hasPendingAssignment() until then).
     *
     * @param startOffset ticks past entry.timing.start to begin decoding at
     *        (seek). The envelope is still evaluated at absolute positions.
     * @throws audio::DecodeError when the source rate cannot be converted.
     */
    void assign(const QueueEntry& entry, std::unique_ptr<audio::AudioDecoder> decoder,
                Ticks startOffset = 0);

    bool hasPendingAssignment() const;

    ChunkResult processChunk();

    // Cancels outstanding work and detaches the entry. Does not block.
    void release();

    ChainState state() const {
        return state_.load(std::memory_order_acquire);
    }
    bool isCancelled() const {
        return cancelled_.load(std::memory_order_acquire);
    }

    std::string entryId() const;
    std::string lastError() const;
    ErrorCode lastErrorCode() const;

    Ticks startOffset() const {
        return startOffset_.load(std::memory_order_acquire);
    }

    // End discovered while decoding (absolute ticks), reported once.
    std::optional<Ticks> takeDiscoveredEnd();

    std::uint64_t framesProduced() const {
        return framesProduced_.load(std::memory_order_relaxed);
    }

    // Frame counters of the current assignment.
    struct FrameAudit {
        std::uint64_t produced = 0;  // frames out of the envelope stage
        std::uint64_t staged = 0;    // produced, not yet in the ring
        std::uint64_t written = 0;
        std::uint64_t read = 0;
        std::uint64_t buffered = 0;
    };

    /**
     * @brief Snapshot for the frame conservation check.
     *
     * produced == written + staged holds exactly in the snapshot. read and
     * buffered race with the consumer, so written - read may exceed buffered
     * by what the mixer consumed while the snapshot was taken. nullopt while
     * a chunk is in flight, an assignment is pending, or no live entry is
     * bound. Never blocks.
     */
    std::optional<FrameAudit> tryAudit();

    io::PlayoutBuffer& buffer() {
        return ring_;
    }
    const io::PlayoutBuffer& buffer() const {
        return ring_;
    }

    int outputRate() const {
        return config_.outputRate;
    }

   private:
    struct Assignment {
        QueueEntry entry;
        std::unique_ptr<audio::AudioDecoder> decoder;
        std::unique_ptr<audio::SampleRateConverter> resampler;
        Ticks startOffset = 0;
    };

    // Caller holds workMutex_.
    void applyAssignment(Assignment next);
    void applyPendingAssignment();
    void setState(ChainState next);
    ChunkResult fail(ErrorCode code, const std::string& message);
    ChunkResult commitStaged();
    ChunkResult finish();
    void applyEnvelope(size_t firstFrame, size_t frames);

    const size_t index_;
    const Config config_;
    io::PlayoutBuffer ring_;

    // Held by the worker for a whole chunk; assign() only try-locks it.
    std::mutex workMutex_;
    mutable std::mutex pendingMutex_;
    std::optional<Assignment> pending_;
    std::atomic<ChainState> state_{ChainState::Unassigned};
    std::atomic<bool> cancelled_{false};
    std::atomic<Ticks> startOffset_{0};
    std::atomic<std::uint64_t> framesProduced_{0};

    // Worker-side state (workMutex_).
    QueueEntry entry_;
    std::unique_ptr<audio::AudioDecoder> decoder_;
    std::unique_ptr<audio::SampleRateConverter> resampler_;
    bool needsSeek_ = false;
    std::int64_t sourcePos_ = 0;
    std::optional<std::int64_t> endFrame_;
    std::optional<Ticks> knownEnd_;
    bool endReached_ = false;
    std::vector<float> readBuffer_;
    std::vector<float> stereoBuffer_;
    std::vector<float> staged_;
    size_t stagedOffset_ = 0;  // frames of staged_ already in the ring

    mutable std::mutex infoMutex_;
    std::string entryId_;
    std::string lastError_;
    ErrorCode lastErrorCode_ = ErrorCode::OK;
    std::optional<Ticks> pendingDiscoveredEnd_;
};

}  // namespace segue::playback
