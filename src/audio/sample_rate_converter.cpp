#include "audio/sample_rate_converter.h"

#include "audio/audio_decoder.h"
#include "logging/logger.h"

#include <string>

namespace segue::audio {

namespace {

constexpr int kStereo = 2;

int converterType(ResampleQuality quality) {
    switch (quality) {
    case ResampleQuality::SincBest:
        return SRC_SINC_BEST_QUALITY;
    case ResampleQuality::SincMedium:
        return SRC_SINC_MEDIUM_QUALITY;
    case ResampleQuality::SincFastest:
        return SRC_SINC_FASTEST;
    case ResampleQuality::ZeroOrderHold:
        return SRC_ZERO_ORDER_HOLD;
    case ResampleQuality::Linear:
        return SRC_LINEAR;
    }
    return SRC_SINC_MEDIUM_QUALITY;
}

}  // namespace

SampleRateConverter::SampleRateConverter(int inputRate, int outputRate, ResampleQuality quality)
    : inputRate_(inputRate), outputRate_(outputRate), quality_(quality), ratio_(1.0) {
    if (inputRate <= 0 || outputRate <= 0) {
        throw DecodeError(ErrorCode::AUDIO_INVALID_SAMPLE_RATE,
                          "Resampler rates must be positive (" + std::to_string(inputRate) +
                              " -> " + std::to_string(outputRate) + ")");
    }
    if (inputRate == outputRate) {
        return;
    }
    ratio_ = static_cast<double>(outputRate) / static_cast<double>(inputRate);
    if (!src_is_valid_ratio(ratio_)) {
        throw DecodeError(ErrorCode::AUDIO_INVALID_SAMPLE_RATE,
                          "Unsupported conversion " + std::to_string(inputRate) + " -> " +
                              std::to_string(outputRate) + " Hz");
    }
    int error = 0;
    state_ = src_new(converterType(quality), kStereo, &error);
    if (!state_) {
        throw DecodeError(ErrorCode::AUDIO_INVALID_SAMPLE_RATE,
                          std::string("libsamplerate init failed: ") + src_strerror(error));
    }
    LOG_DEBUG("Resampler {} Hz -> {} Hz ({})", inputRate, outputRate,
              src_get_name(converterType(quality)));
}

SampleRateConverter::~SampleRateConverter() {
    if (state_) {
        src_delete(state_);
        state_ = nullptr;
    }
}

void SampleRateConverter::reset() {
    if (state_) {
        src_reset(state_);
    }
}

size_t SampleRateConverter::maxOutputFrames(size_t inputFrames, int inputRate, int outputRate) {
    return static_cast<size_t>((static_cast<long long>(inputFrames) + 1) * outputRate /
                               inputRate) +
           2;
}

SampleRateConverter::Step SampleRateConverter::run(const float* input, size_t frames,
                                                   bool endOfInput, std::vector<float>& out) {
    const size_t base = out.size();
    const size_t room = maxOutputFrames(frames, inputRate_, outputRate_) + 64;
    out.resize(base + room * kStereo);

    SRC_DATA data{};
    data.data_in = input;
    data.input_frames = static_cast<long>(frames);
    data.data_out = out.data() + base;
    data.output_frames = static_cast<long>(room);
    data.end_of_input = endOfInput ? 1 : 0;
    data.src_ratio = ratio_;

    if (const int err = src_process(state_, &data); err != 0) {
        out.resize(base);
        throw DecodeError(ErrorCode::AUDIO_DECODE_FAILED,
                          std::string("libsamplerate: ") + src_strerror(err));
    }
    out.resize(base + static_cast<size_t>(data.output_frames_gen) * kStereo);
    return Step{static_cast<size_t>(data.input_frames_used),
                static_cast<size_t>(data.output_frames_gen)};
}

void SampleRateConverter::process(const float* input, size_t frames, std::vector<float>& out) {
    if (frames == 0) {
        return;
    }
    if (isPassthrough()) {
        out.insert(out.end(), input, input + frames * kStereo);
        return;
    }
    size_t consumed = 0;
    while (consumed < frames) {
        const Step step = run(input + consumed * kStereo, frames - consumed, false, out);
        if (step.used == 0 && step.generated == 0) {
            break;
        }
        consumed += step.used;
    }
}

void SampleRateConverter::flush(std::vector<float>& out) {
    if (isPassthrough()) {
        return;
    }
    // libsamplerate rejects a null input pointer on some versions.
    const float silence[kStereo] = {0.0f, 0.0f};
    while (true) {
        if (run(silence, 0, true, out).generated == 0) {
            break;
        }
    }
}

}  // namespace segue::audio
