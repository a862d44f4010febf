#pragma once

#include "audio/resample_quality.h"

#include <cstddef>
#include <vector>

#include <samplerate.h>

namespace segue::audio {

/**
 * @brief Streaming stereo sample-rate converter on top of libsamplerate.
 *
 * Holds one SRC_STATE for the lifetime of a decode, so filter history is
 * carried across blocks. Matching rates bypass libsamplerate and copy the
 * input unchanged. Failures are reported as DecodeError.
 */
class SampleRateConverter {
   public:
    SampleRateConverter(int inputRate, int outputRate,
                        ResampleQuality quality = ResampleQuality::SincMedium);
    ~SampleRateConverter();

    SampleRateConverter(const SampleRateConverter&) = delete;
    SampleRateConverter& operator=(const SampleRateConverter&) = delete;

    void reset();

    /// Appends converted interleaved stereo frames to @p out.
    void process(const float* input, size_t frames, std::vector<float>& out);

    /// Drains the filter tail at end of stream.
    void flush(std::vector<float>& out);

    bool isPassthrough() const {
        return state_ == nullptr;
    }
    int inputRate() const {
        return inputRate_;
    }
    int outputRate() const {
        return outputRate_;
    }
    ResampleQuality quality() const {
        return quality_;
    }

    /// Upper bound of frames produced by one process() call.
    static size_t maxOutputFrames(size_t inputFrames, int inputRate, int outputRate);

   private:
    struct Step {
        size_t used;
        size_t generated;
    };
    Step run(const float* input, size_t frames, bool endOfInput, std::vector<float>& out);

    int inputRate_;
    int outputRate_;
    ResampleQuality quality_;
    double ratio_;
    SRC_STATE* state_ = nullptr;
};

}  // namespace segue::audio
