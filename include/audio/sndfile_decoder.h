#pragma once

#include "audio/audio_decoder.h"

#include <sndfile.h>
#include <string>

namespace segue::audio {

// File decoder on top of libsndfile (WAV, FLAC, Ogg/Vorbis, Opus, MP3 where the
// installed libsndfile was built with them).
class SndfileDecoder : public AudioDecoder {
   public:
    // Throws DecodeError (VALIDATION_FILE_NOT_FOUND, RESOURCE_DECODER_HANDLES or
    // AUDIO_UNSUPPORTED_FORMAT) when the file cannot be opened.
    explicit SndfileDecoder(const std::string& path);
    ~SndfileDecoder() override;

    SndfileDecoder(const SndfileDecoder&) = delete;
    SndfileDecoder& operator=(const SndfileDecoder&) = delete;

    int sampleRate() const override {
        return info_.samplerate;
    }
    int channels() const override {
        return info_.channels;
    }
    std::optional<std::int64_t> totalFrames() const override;

    void seek(std::int64_t frame) override;
    size_t read(float* interleaved, size_t frames) override;

    const std::string& path() const {
        return path_;
    }

   private:
    std::string path_;
    SNDFILE* file_ = nullptr;
    SF_INFO info_{};
};

// DecoderFactory that opens SndfileDecoder instances.
DecoderFactory makeSndfileDecoderFactory();

}  // namespace segue::audio
