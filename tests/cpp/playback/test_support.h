#pragma once

#include "audio/audio_decoder.h"
#include "core/error_codes.h"
#include "core/tick_clock.h"
#include "playback/decoder_chain.h"
#include "playback/types.h"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace segue::test {

// In-memory PCM source producing a constant level.
struct SyntheticSource {
    int sampleRate = 44100;
    int channels = 2;
    std::int64_t frames = 44100;
    float level = 0.5f;
    bool reportsLength = true;
    // Throw DecodeError once this many read() calls have succeeded (-1: never).
    int failAfterReads = -1;
};

inline SyntheticSource lengthMs(std::int64_t ms, int rate = 44100, int channels = 2) {
    SyntheticSource source;
    source.sampleRate = rate;
    source.channels = channels;
    source.frames = ms * rate / 1000;
    return source;
}

class SyntheticDecoder : public audio::AudioDecoder {
   public:
    explicit SyntheticDecoder(SyntheticSource source) : source_(source) {}

    int sampleRate() const override {
        return source_.sampleRate;
    }
    int channels() const override {
        return source_.channels;
    }
    std::optional<std::int64_t> totalFrames() const override {
        if (!source_.reportsLength) {
            return std::nullopt;
        }
        return source_.frames;
    }

    void seek(std::int64_t frame) override {
        position_ = std::clamp<std::int64_t>(frame, 0, source_.frames);
    }

    size_t read(float* interleaved, size_t frames) override {
        if (source_.failAfterReads >= 0 && reads_ >= source_.failAfterReads) {
            throw audio::DecodeError(ErrorCode::AUDIO_DECODE_FAILED, "synthetic corruption");
        }
        ++reads_;
        const std::int64_t remaining = source_.frames - position_;
        const size_t count = static_cast<size_t>(
            std::max<std::int64_t>(0, std::min<std::int64_t>(remaining, frames)));
        std::fill(interleaved, interleaved + count * static_cast<size_t>(source_.channels),
                  source_.level);
        position_ += static_cast<std::int64_t>(count);
        return count;
    }

   private:
    SyntheticSource source_;
    std::int64_t position_ = 0;
    int reads_ = 0;
};

// Factory resolving paths against registered synthetic sources. Unknown paths
// raise VALIDATION_FILE_NOT_FOUND like a real decoder would.
class SyntheticLibrary {
   public:
    void add(const std::string& path, SyntheticSource source) {
        sources_[path] = source;
    }

    audio::DecoderFactory factory() {
        return [this](const std::string& path) -> std::unique_ptr<audio::AudioDecoder> {
            ++opened_;
            auto it = sources_.find(path);
            if (it == sources_.end()) {
                throw audio::DecodeError(ErrorCode::VALIDATION_FILE_NOT_FOUND,
                                         "no such file: " + path);
            }
            return std::make_unique<SyntheticDecoder>(it->second);
        };
    }

    int opened() const {
        return opened_.load();
    }

   private:
    std::map<std::string, SyntheticSource> sources_;
    std::atomic<int> opened_{0};
};

inline playback::QueueEntry makeEntry(const std::string& id, const std::string& path,
                                      std::int64_t startMs = 0,
                                      std::optional<std::int64_t> endMs = std::nullopt) {
    playback::QueueEntry entry;
    entry.queueEntryId = id;
    entry.filePath = path;
    entry.timing.start = timing::msToTicks(startMs);
    entry.timing.fadeInPoint = entry.timing.start;
    entry.timing.leadInPoint = entry.timing.start;
    if (endMs) {
        entry.timing.end = timing::msToTicks(*endMs);
    }
    return entry;
}

inline playback::DecoderChain::Config smallChainConfig(int outputRate = 44100) {
    playback::DecoderChain::Config config;
    config.outputRate = outputRate;
    config.chunkMs = 100;
    config.buffer.capacityFrames = static_cast<size_t>(outputRate);  // 1 s
    config.buffer.headroomFrames = 441;
    config.buffer.resumeHysteresisFrames = 4410;
    return config;
}

}  // namespace segue::test
