#pragma once

#include "core/error_codes.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace segue::audio {

// Thrown by decoders for corrupt, unsupported or unreadable sources.
class DecodeError : public EngineError {
   public:
    using EngineError::EngineError;
};

// Pull-based PCM source. One instance per decoder chain; not thread-safe.
class AudioDecoder {
   public:
    virtual ~AudioDecoder() = default;

    virtual int sampleRate() const = 0;
    virtual int channels() const = 0;
    virtual std::optional<std::int64_t> totalFrames() const = 0;

    virtual void seek(std::int64_t frame) = 0;

    // Reads up to @p frames interleaved float frames. Returns 0 at end of stream.
    virtual size_t read(float* interleaved, size_t frames) = 0;
};

using DecoderFactory = std::function<std::unique_ptr<AudioDecoder>(const std::string& path)>;

}  // namespace segue::audio
